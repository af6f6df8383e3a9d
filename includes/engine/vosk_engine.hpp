#pragma once

#include "engine/engine_api.hpp"

namespace soda {

// In-process engine exposing the serialized interface on top of Vosk. The
// language pack directory is loaded as a Vosk model; audio must be mono
// 16-bit PCM at the configured sample rate.
//
// Events are reported from one worker thread per instance: partial and
// final recognition results (up to three ranked alternatives), an
// end-of-utterance endpoint after each final, audio levels per chunk, and an
// end-of-audio final when the stream goes quiet with a pending hypothesis.
// Destroying an instance joins its worker, so no callback runs afterwards.
EngineApiPtr voskEngineApi();

} // namespace soda
