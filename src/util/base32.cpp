#include <tid/base32.hpp>
#include <array>

namespace tid::base32 {

namespace {

constexpr int8_t kInvalid = -1;

constexpr std::array<int8_t, 256> make_decode_table() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = kInvalid;
    for (int i = 0; i < 32; ++i) {
        table[static_cast<unsigned char>(alphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr std::array<int8_t, 256> decode_table = make_decode_table();

// 128-bit register, big-endian halves
struct U128 {
    uint64_t hi = 0;
    uint64_t lo = 0;
};

U128 load(const UuidBytes& b) {
    U128 r;
    for (int i = 0; i < 8; ++i) {
        r.hi = (r.hi << 8) | b[i];
        r.lo = (r.lo << 8) | b[i + 8];
    }
    return r;
}

UuidBytes store(const U128& r) {
    UuidBytes b{};
    for (int i = 0; i < 8; ++i) {
        b[i] = static_cast<uint8_t>(r.hi >> (56 - 8 * i));
        b[i + 8] = static_cast<uint8_t>(r.lo >> (56 - 8 * i));
    }
    return b;
}

} // namespace

std::string encode(const UuidBytes& bytes) {
    U128 r = load(bytes);
    char buf[encoded_length];
    // Least significant group first. After 25 shifts only the top 3 bits
    // remain, which is what makes buf[0] land in '0'..'7'.
    for (int i = static_cast<int>(encoded_length) - 1; i >= 0; --i) {
        buf[i] = alphabet[r.lo & 0x1F];
        r.lo = (r.lo >> 5) | (r.hi << 59);
        r.hi >>= 5;
    }
    return std::string(buf, encoded_length);
}

Result<UuidBytes> decode(const std::string& text) {
    if (text.size() != encoded_length) {
        return TidError(TidError::InvalidSuffixLength,
            "Invalid length. Suffix should have 26 characters, got " +
                std::to_string(text.size()));
    }

    std::array<uint8_t, encoded_length> groups{};
    for (size_t i = 0; i < encoded_length; ++i) {
        int8_t v = decode_table[static_cast<unsigned char>(text[i])];
        if (v == kInvalid) {
            return TidError(TidError::InvalidSuffixAlphabet,
                "Invalid suffix. Character '" + std::string(1, text[i]) +
                    "' at position " + std::to_string(i) + " is not in the base32 alphabet",
                std::string("allowed: ") + alphabet);
        }
        groups[i] = static_cast<uint8_t>(v);
    }

    if (groups[0] > 7) {
        return TidError(TidError::InvalidSuffixRange,
            "Invalid suffix. First character must be in the range [0-7]",
            "the suffix encodes a value wider than 128 bits");
    }

    U128 r;
    for (size_t i = 0; i < encoded_length; ++i) {
        r.hi = (r.hi << 5) | (r.lo >> 59);
        r.lo = (r.lo << 5) | groups[i];
    }
    return Result<UuidBytes>::ok(store(r));
}

} // namespace tid::base32
