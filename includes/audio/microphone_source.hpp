#pragma once
#include "audio/audio_sink.hpp"

#include <portaudio.h>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace soda {

struct AudioDevice {
    int index;
    std::string name;
    int maxInputChannels;
    double defaultSampleRate;
};

// Live PortAudio capture pushed to a sink as 16-bit PCM in fixed-size
// chunks. Pushes happen on the PortAudio callback thread.
class MicrophoneSource {
public:
    struct Params {
        int sampleRate = 16000;
        int channels = 1;
        unsigned long framesPerBuffer = 512;   // ~32 ms @ 16k
        std::optional<int> deviceIndex;        // if not set, use default input
        std::size_t chunkBytes = 2048;
    };

    MicrophoneSource();
    ~MicrophoneSource();
    MicrophoneSource(const MicrophoneSource&) = delete;
    MicrophoneSource& operator=(const MicrophoneSource&) = delete;

    std::vector<AudioDevice> listDevices() const;

    // The sink must outlive the capture; stop() before destroying it.
    void start(const Params& params, AudioSink& sink);

    // Stops capture and pushes any partial chunk still buffered.
    void stop();

    bool isRunning() const { return running_.load(); }

private:
    static int paCallback(const void* input, void* output,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo* timeInfo,
                          PaStreamCallbackFlags statusFlags,
                          void* userData);

    void handleSamples(const float* samples, std::size_t count);

    PaStream* stream_{nullptr};
    AudioSink* sink_{nullptr};
    std::size_t chunkBytes_{2048};
    int channels_{1};
    std::vector<char> pending_;
    std::mutex pendingMutex_;
    std::atomic<bool> running_{false};
};

} // namespace soda
