#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <array>
#include <cstdint>
#include <compare>
#include <functional>
#include <optional>

namespace larder {

/**
 * Uuid - 128-bit identifier used for operation ids (the idempotency key
 * sent to the backend), conflict ids and drain lease owners.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a random (version 4) UUID from the libsodium CSPRNG.
     */
    [[nodiscard]] static Uuid generate();

    /**
     * Parse hyphenated or plain 32-digit hex.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str);

    /**
     * Lowercase hyphenated form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Timestamp - milliseconds since the Unix epoch (the unit stored in SQLite).
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    /**
     * ISO 8601 in UTC with milliseconds, e.g. 2024-05-01T10:00:00.250Z
     */
    [[nodiscard]] std::string to_iso_string() const;

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

// Injected wherever wall-clock time drives behaviour (backoff, leases, retention).
using ClockFn = std::function<Timestamp()>;

[[nodiscard]] inline ClockFn system_clock() {
    return [] { return Timestamp::now(); };
}

} // namespace larder

namespace std {
    template<>
    struct hash<larder::Uuid> {
        size_t operator()(const larder::Uuid& uuid) const noexcept {
            size_t h = 0;
            for (auto b : uuid.bytes()) {
                h = h * 131 + b;
            }
            return h;
        }
    };
}
