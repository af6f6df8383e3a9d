#include "audio/microphone_source.hpp"
#include "audio/pcm.hpp"

#include <iostream>
#include <stdexcept>

namespace soda {

MicrophoneSource::MicrophoneSource() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw std::runtime_error("Failed to initialize PortAudio: " +
                               std::string(Pa_GetErrorText(err)));
    }
}

MicrophoneSource::~MicrophoneSource() {
    if (stream_) {
        Pa_AbortStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
    Pa_Terminate();
}

std::vector<AudioDevice> MicrophoneSource::listDevices() const {
    std::vector<AudioDevice> devices;
    int numDevices = Pa_GetDeviceCount();

    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (deviceInfo && deviceInfo->maxInputChannels > 0) {
            AudioDevice device;
            device.index = i;
            device.name = deviceInfo->name;
            device.maxInputChannels = deviceInfo->maxInputChannels;
            device.defaultSampleRate = deviceInfo->defaultSampleRate;
            devices.push_back(device);
        }
    }

    return devices;
}

void MicrophoneSource::start(const Params& params, AudioSink& sink) {
    if (stream_) {
        throw std::runtime_error("Stream already open");
    }

    int device = params.deviceIndex.value_or(Pa_GetDefaultInputDevice());
    if (device == paNoDevice) {
        throw std::runtime_error("No default input device available");
    }
    const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(device);
    if (!deviceInfo) {
        throw std::runtime_error("Invalid input device index " + std::to_string(device));
    }

    sink_ = &sink;
    chunkBytes_ = params.chunkBytes > 0 ? params.chunkBytes : 2048;
    channels_ = params.channels > 0 ? params.channels : 1;
    pending_.clear();
    pending_.reserve(chunkBytes_ * 2);

    PaStreamParameters inputParams{};
    inputParams.device = device;
    inputParams.channelCount = channels_;
    inputParams.sampleFormat = paFloat32; // [-1,1]
    inputParams.suggestedLatency = deviceInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_IsFormatSupported(&inputParams, nullptr, params.sampleRate);
    if (err != paFormatIsSupported) {
        throw std::runtime_error(std::string("Sample format or rate not supported by ") +
                                 deviceInfo->name + ": " + Pa_GetErrorText(err));
    }

    err = Pa_OpenStream(&stream_,
                        &inputParams,
                        nullptr,
                        params.sampleRate,
                        params.framesPerBuffer,
                        paClipOff,
                        &MicrophoneSource::paCallback,
                        this);
    if (err != paNoError) {
        stream_ = nullptr;
        throw std::runtime_error(std::string("Pa_OpenStream failed: ") + Pa_GetErrorText(err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        throw std::runtime_error(std::string("Pa_StartStream failed: ") + Pa_GetErrorText(err));
    }
    running_.store(true);
}

void MicrophoneSource::stop() {
    if (!stream_) return;

    Pa_StopStream(stream_);
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    running_.store(false);

    std::lock_guard<std::mutex> lock(pendingMutex_);
    if (sink_ && !pending_.empty()) {
        sink_->pushAudio(pending_.data(), static_cast<int>(pending_.size()));
    }
    pending_.clear();
}

void MicrophoneSource::handleSamples(const float* samples, std::size_t count) {
    const std::vector<std::int16_t> pcm = to_pcm16(samples, count);
    const auto* bytes = reinterpret_cast<const char*>(pcm.data());

    std::lock_guard<std::mutex> lock(pendingMutex_);
    pending_.insert(pending_.end(), bytes, bytes + pcm.size() * sizeof(std::int16_t));

    std::size_t offset = 0;
    while (pending_.size() - offset >= chunkBytes_) {
        sink_->pushAudio(pending_.data() + offset, static_cast<int>(chunkBytes_));
        offset += chunkBytes_;
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
}

int MicrophoneSource::paCallback(const void* input,
                                 void* /*output*/,
                                 unsigned long frameCount,
                                 const PaStreamCallbackTimeInfo* /*timeInfo*/,
                                 PaStreamCallbackFlags /*statusFlags*/,
                                 void* userData) {
    auto* self = static_cast<MicrophoneSource*>(userData);
    if (!self || !self->sink_ || !input) return paContinue;

    try {
        // Interleaved frames; the engine expects the configured channel count.
        const auto* in = static_cast<const float*>(input);
        self->handleSamples(in, static_cast<std::size_t>(frameCount) *
                                    static_cast<std::size_t>(self->channels_));
    } catch (const std::exception& e) {
        std::cerr << "Error: microphone capture stopped: " << e.what() << std::endl;
        return paAbort;
    }
    return paContinue;
}

} // namespace soda
