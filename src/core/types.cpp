#include "core/types.hpp"

#include <sodium.h>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace larder {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

Uuid Uuid::generate() {
    Bytes bytes;
    randombytes_buf(bytes.data(), bytes.size());

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return Uuid(bytes);
}

std::optional<Uuid> Uuid::parse(std::string_view str) {
    std::string clean;
    clean.reserve(32);
    for (char c : str) {
        if (c != '-') clean += c;
    }
    if (clean.size() != 32) return std::nullopt;

    Bytes bytes;
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        const char* first = clean.data() + i * 2;
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(first, first + 2, value, 16);
        if (ec != std::errc{} || ptr != first + 2) {
            return std::nullopt;
        }
        bytes[i] = static_cast<uint8_t>(value);
    }
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(hex[bytes_[i] >> 4]);
        out.push_back(hex[bytes_[i] & 0x0F]);
    }
    return out;
}

std::string Timestamp::to_iso_string() const {
    const auto seconds = static_cast<std::time_t>(millis_ / 1000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
    return oss.str();
}

} // namespace larder
