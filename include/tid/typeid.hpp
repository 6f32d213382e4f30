#pragma once

#include <tid/result.hpp>
#include <tid/uuid.hpp>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace tid {

inline constexpr size_t max_prefix_length = 63;
inline constexpr char separator = '_';

// Prefix grammar: [a-z]{0,63}
Status validate_prefix(const std::string& prefix);

// Suffix grammar: [0-7][0-9a-hjkmnp-tv-z]{25}
// Checks length, then the first-character range, then decodes.
Status validate_suffix(const std::string& suffix);

struct TypeIdParts {
    std::string prefix;
    std::string suffix;

    bool operator==(const TypeIdParts& o) const;
    bool operator!=(const TypeIdParts& o) const;
};

// A type-prefixed, sortable identifier: "<prefix>_<suffix>", or just
// "<suffix>" when the prefix is empty. Instances are immutable and always
// hold a valid prefix and suffix; every factory validates both.
class TypeId {
public:
    // Empty suffix draws a fresh Uuid::v7()
    static Result<TypeId> make(const std::string& prefix, const std::string& suffix = "");
    static Result<TypeId> generate(const std::string& prefix = "");

    // Parse the canonical form. A string with no separator is a bare suffix;
    // a leading separator or more than one separator is rejected.
    // Parsing never generates: "" and "user_" fail with InvalidSuffixLength.
    static Result<TypeId> from_string(const std::string& text);
    // Same, and a prefix before the separator must equal expected_prefix.
    // A bare suffix is accepted as an unprefixed id.
    static Result<TypeId> from_string(const std::string& text,
                                      const std::string& expected_prefix);

    static Result<TypeId> from_bytes(const std::string& prefix, const UuidBytes& bytes);
    static Result<TypeId> from_uuid(const std::string& prefix, const Uuid& uuid);
    static Result<TypeId> from_uuid_string(const std::string& uuid,
                                           const std::string& prefix = "");

    const std::string& prefix() const { return prefix_; }
    const std::string& suffix() const { return suffix_; }
    bool has_prefix() const { return !prefix_.empty(); }

    std::string to_string() const;
    UuidBytes to_bytes() const;
    Uuid to_uuid() const;
    std::string to_uuid_string() const;

    bool operator==(const TypeId& o) const;
    bool operator!=(const TypeId& o) const;
    // Orders by prefix, then suffix; ids sharing a prefix sort by creation time
    bool operator<(const TypeId& o) const;

private:
    TypeId(std::string prefix, std::string suffix)
        : prefix_(std::move(prefix)), suffix_(std::move(suffix)) {}

    std::string prefix_;
    std::string suffix_;
};

std::ostream& operator<<(std::ostream& os, const TypeId& id);

// ---- Operations on canonical strings ----
// These split at the first separator and never validate.

TypeIdParts decompose(const std::string& id);
std::string get_prefix(const std::string& id);
std::string get_suffix(const std::string& id);

// Matches ^[a-z]{1,63}_[0-7][0-9a-hjkmnp-tv-z]{25}$ exactly. Note this is
// narrower than TypeId::from_string: a bare suffix without a prefix is a
// legal identifier but is NOT accepted here.
bool is_valid(const std::string& text);

// Decodes the suffix; the prefix is ignored
Result<UuidBytes> to_bytes(const std::string& id);
Result<std::string> to_uuid_string(const std::string& id);

} // namespace tid

namespace std {

template<>
struct hash<tid::TypeId> {
    size_t operator()(const tid::TypeId& id) const {
        return hash<std::string>()(id.to_string());
    }
};

} // namespace std
