#include "audio/audio_feeder.hpp"

#include <iostream>
#include <thread>
#include <vector>

namespace soda {

Pacer Pacer::immediate() {
    return Pacer(std::chrono::milliseconds(0), nullptr);
}

Pacer Pacer::realtime(std::chrono::milliseconds delay) {
    return Pacer(delay, [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); });
}

Pacer::Pacer(std::chrono::milliseconds delay, SleepFunction sleep)
    : delay_(delay), sleep_(std::move(sleep)) {
}

void Pacer::pause() const {
    if (!isImmediate() && sleep_) {
        sleep_(delay_);
    }
}

AudioFeeder::AudioFeeder(AudioSink& sink, Pacer pacer, std::size_t chunkSize)
    : sink_(sink),
      pacer_(std::move(pacer)),
      chunkSize_(chunkSize > 0 ? chunkSize : DEFAULT_CHUNK_SIZE) {
}

FeedResult AudioFeeder::feed(std::istream& source) {
    FeedResult result;
    std::vector<char> chunk(chunkSize_);

    while (true) {
        source.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto len = static_cast<std::size_t>(source.gcount());

        if (source.bad()) {
            // Treated as end of stream; whatever was read is dropped.
            std::cerr << "Warning: audio source read failed after "
                      << result.bytes << " bytes, ending feed\n";
            result.readError = true;
            break;
        }
        if (len == 0) break;

        sink_.pushAudio(chunk.data(), static_cast<int>(len));
        ++result.chunks;
        result.bytes += len;

        // The engine only emits events for audio that arrives as a stream.
        pacer_.pause();

        if (!source) break;   // short read at end of stream
    }
    return result;
}

} // namespace soda
