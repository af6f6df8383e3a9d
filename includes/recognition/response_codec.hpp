#pragma once

#include "recognition/soda_response.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace soda {

// Decodes a serialized response of exactly `size` bytes. Returns nullopt for
// anything malformed; callers drop such events.
std::optional<SodaResponse> decodeResponse(const char* data, std::size_t size);

// Engine side of the same record.
std::vector<char> encodeResponse(const SodaResponse& response);

} // namespace soda
