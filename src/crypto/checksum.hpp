#pragma once

#include "core/result.hpp"
#include <string>
#include <string_view>

namespace larder::crypto {

// BLAKE2b output length used for queue payload checksums.
constexpr size_t CHECKSUM_BYTES = 16;

/**
 * Initialize libsodium. Must succeed before any Uuid is generated.
 * Safe to call more than once.
 */
[[nodiscard]] Result<void, Error> init();

/**
 * Hex-encoded keyless BLAKE2b digest of `data`.
 */
[[nodiscard]] std::string checksum(std::string_view data);

/**
 * Constant-time comparison of two hex checksums.
 */
[[nodiscard]] bool checksum_matches(std::string_view data, std::string_view expected);

} // namespace larder::crypto
