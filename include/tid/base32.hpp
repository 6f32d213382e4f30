#pragma once

#include <tid/result.hpp>
#include <tid/uuid.hpp>
#include <cstddef>
#include <string>

// Fixed-width Crockford-style base32 for 128-bit values.
//
// The 128 input bits are read most-significant first as if left-padded with
// two zero bits to 130 bits, then cut into 26 groups of 5 bits. The padding
// occupies the top of the first group, so a valid encoding always starts
// with one of '0'..'7'. Output is lowercase and canonical: decode followed by
// encode reproduces the input exactly.
namespace tid::base32 {

inline constexpr const char* alphabet = "0123456789abcdefghjkmnpqrstvwxyz";
inline constexpr size_t encoded_length = 26;

std::string encode(const UuidBytes& bytes);

// Errors, checked in this order:
//   InvalidSuffixLength    length != 26
//   InvalidSuffixAlphabet  character outside the alphabet (case-sensitive)
//   InvalidSuffixRange     first character above '7' (value exceeds 128 bits)
Result<UuidBytes> decode(const std::string& text);

} // namespace tid::base32
