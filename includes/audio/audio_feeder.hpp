#pragma once

#include "audio/audio_sink.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <istream>

namespace soda {

// Delay applied after every pushed chunk. The sleep function is injectable
// so tests can pace without wall-clock time.
class Pacer {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    static constexpr std::chrono::milliseconds DEFAULT_CHUNK_DELAY{20};

    static Pacer immediate();
    static Pacer realtime(std::chrono::milliseconds delay = DEFAULT_CHUNK_DELAY);

    Pacer(std::chrono::milliseconds delay, SleepFunction sleep);

    void pause() const;
    std::chrono::milliseconds delay() const { return delay_; }
    bool isImmediate() const { return delay_.count() <= 0; }

private:
    std::chrono::milliseconds delay_;
    SleepFunction sleep_;
};

struct FeedResult {
    std::size_t chunks{0};
    std::size_t bytes{0};
    bool readError{false};   // stream went bad; the feed stopped early
};

// Reads a byte stream in fixed-size chunks and pushes each non-empty chunk.
// Blocks the calling thread for the whole stream.
class AudioFeeder {
public:
    static constexpr std::size_t DEFAULT_CHUNK_SIZE = 2048;

    explicit AudioFeeder(AudioSink& sink,
                         Pacer pacer = Pacer::immediate(),
                         std::size_t chunkSize = DEFAULT_CHUNK_SIZE);

    FeedResult feed(std::istream& source);

private:
    AudioSink& sink_;
    Pacer pacer_;
    std::size_t chunkSize_;
};

} // namespace soda
