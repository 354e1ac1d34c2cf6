#include "crypto/checksum.hpp"

#include <sodium.h>
#include <array>

namespace larder::crypto {

Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

std::string checksum(std::string_view data) {
    std::array<unsigned char, CHECKSUM_BYTES> digest{};
    crypto_generichash(digest.data(), digest.size(),
                       reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                       nullptr, 0);

    std::array<char, CHECKSUM_BYTES * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    return std::string(hex.data(), CHECKSUM_BYTES * 2);
}

bool checksum_matches(std::string_view data, std::string_view expected) {
    const auto actual = checksum(data);
    if (actual.size() != expected.size()) {
        return false;
    }
    return sodium_memcmp(actual.data(), expected.data(), actual.size()) == 0;
}

} // namespace larder::crypto
