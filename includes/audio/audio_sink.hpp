#pragma once

namespace soda {

// Anything that accepts raw audio bytes for one engine instance.
class AudioSink {
public:
    virtual ~AudioSink() = default;

    // `data` only needs to stay valid for the duration of the call.
    virtual void pushAudio(const char* data, int size) = 0;
};

} // namespace soda
