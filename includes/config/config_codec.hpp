#pragma once

#include "config/soda_config.hpp"
#include "engine/soda_api.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace soda {

// Bumped only for incompatible layout changes. New optional keys are added
// without a bump; decoders ignore keys they do not know.
constexpr int CONFIG_SCHEMA_VERSION = 1;

// Encodes the config as a CBOR map for the serialized interface.
// Throws SodaError(Serialization) if a string field is not valid UTF-8.
std::vector<char> encodeConfig(const Config& config);

// Absent keys take the Config defaults. Returns nullopt for malformed
// input, mistyped fields or an unsupported schema version.
std::optional<Config> decodeConfig(const char* data, std::size_t size);

// Backing storage for the fixed-layout interface. The raw struct borrows
// the record's strings, so the record must outlive the create call.
class FlatConfigRecord {
public:
    // Throws SodaError(Serialization) if a string field contains NUL.
    explicit FlatConfigRecord(const Config& config);

    FlatConfigRecord(const FlatConfigRecord&) = delete;
    FlatConfigRecord& operator=(const FlatConfigRecord&) = delete;

    SodaConfig toRaw(RecognitionResultHandler callback, void* callbackHandle) const;

private:
    int channelCount_;
    int sampleRate_;
    std::string languagePackDirectory_;
    std::string apiKey_;
};

} // namespace soda
