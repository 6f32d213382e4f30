#pragma once

#include <tid/result.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace tid {

using UuidBytes = std::array<uint8_t, 16>;

// 128-bit value in big-endian byte order
struct Uuid {
    UuidBytes bytes{};

    // Time-ordered random value (RFC 9562 version 7). Values produced by one
    // process are strictly increasing, including within the same millisecond.
    static Uuid v7();
    static Uuid nil();
    static Uuid max();

    uint64_t timestamp_ms() const;
    int version() const;

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase
    std::string to_string() const;
    // Accepts upper or lower case hex digits
    static Result<Uuid> from_string(const std::string& s);

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
    bool operator<(const Uuid& other) const;
};

} // namespace tid
