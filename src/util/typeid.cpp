#include <tid/typeid.hpp>
#include <tid/base32.hpp>
#include <tid/log.hpp>

namespace tid {

static bool is_lower_alpha(char c) {
    return c >= 'a' && c <= 'z';
}

Status validate_prefix(const std::string& prefix) {
    if (prefix.size() > max_prefix_length) {
        return TidError{TidError::InvalidPrefix,
            "Invalid prefix. Must be at most 63 ascii letters [a-z]",
            "prefix has " + std::to_string(prefix.size()) + " characters"};
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (!is_lower_alpha(prefix[i])) {
            return TidError{TidError::InvalidPrefix,
                "Invalid prefix. Must be at most 63 ascii letters [a-z]",
                "invalid character at position " + std::to_string(i) +
                    " in prefix '" + prefix + "'"};
        }
    }
    return ok_status();
}

Status validate_suffix(const std::string& suffix) {
    if (suffix.size() != base32::encoded_length) {
        return TidError{TidError::InvalidSuffixLength,
            "Invalid length. Suffix should have 26 characters, got " +
                std::to_string(suffix.size())};
    }
    if (suffix[0] > '7') {
        return TidError{TidError::InvalidSuffixRange,
            "Invalid suffix. First character must be in the range [0-7]"};
    }
    // Decoding is the only check that covers every character
    TID_TRY(base32::decode(suffix));
    return ok_status();
}

bool TypeIdParts::operator==(const TypeIdParts& o) const {
    return prefix == o.prefix && suffix == o.suffix;
}

bool TypeIdParts::operator!=(const TypeIdParts& o) const {
    return !(*this == o);
}

// ---- TypeId ----

Result<TypeId> TypeId::make(const std::string& prefix, const std::string& suffix) {
    TID_TRY(validate_prefix(prefix));

    std::string final_suffix = suffix;
    if (final_suffix.empty()) {
        final_suffix = base32::encode(Uuid::v7().bytes);
        log::trace("generated suffix %s for prefix '%s'",
                   final_suffix.c_str(), prefix.c_str());
    }
    TID_TRY(validate_suffix(final_suffix));

    return Result<TypeId>::ok(TypeId(prefix, std::move(final_suffix)));
}

Result<TypeId> TypeId::generate(const std::string& prefix) {
    return make(prefix);
}

// Start -> split -> {no separator, one separator, several} -> parts | error
static Result<TypeIdParts> split_canonical(const std::string& text) {
    size_t sep = text.find(separator);
    if (sep == std::string::npos) {
        return Result<TypeIdParts>::ok(TypeIdParts{"", text});
    }
    if (text.find(separator, sep + 1) != std::string::npos) {
        return TidError{TidError::InvalidFormat,
            "Invalid TypeID format: " + text,
            "a TypeID contains at most one '_' separator"};
    }
    if (sep == 0) {
        return TidError{TidError::EmptyPrefixWithSeparator,
            "Invalid TypeID. Prefix cannot be empty when there's a separator: " + text};
    }
    return Result<TypeIdParts>::ok(TypeIdParts{text.substr(0, sep), text.substr(sep + 1)});
}

static Result<TypeId> make_parsed(const TypeIdParts& parts) {
    // Parsing never generates: an empty suffix is a length error here
    if (parts.suffix.empty()) {
        return TidError{TidError::InvalidSuffixLength,
            "Invalid length. Suffix should have 26 characters, got 0"};
    }
    return TypeId::make(parts.prefix, parts.suffix);
}

Result<TypeId> TypeId::from_string(const std::string& text) {
    TID_TRY_ASSIGN(parts, split_canonical(text));
    return make_parsed(parts);
}

Result<TypeId> TypeId::from_string(const std::string& text,
                                   const std::string& expected_prefix) {
    TID_TRY_ASSIGN(parts, split_canonical(text));
    // Only a present separator carries a prefix to compare; a bare suffix
    // is parsed as an unprefixed id whatever the caller expects
    if (!parts.prefix.empty() && parts.prefix != expected_prefix) {
        return TidError{TidError::PrefixMismatch,
            "Invalid TypeID. Prefix mismatch. Expected " + expected_prefix +
                ", got " + parts.prefix};
    }
    return make_parsed(parts);
}

Result<TypeId> TypeId::from_bytes(const std::string& prefix, const UuidBytes& bytes) {
    TID_TRY(validate_prefix(prefix));
    return Result<TypeId>::ok(TypeId(prefix, base32::encode(bytes)));
}

Result<TypeId> TypeId::from_uuid(const std::string& prefix, const Uuid& uuid) {
    return from_bytes(prefix, uuid.bytes);
}

Result<TypeId> TypeId::from_uuid_string(const std::string& uuid, const std::string& prefix) {
    TID_TRY_ASSIGN(parsed, Uuid::from_string(uuid));
    return from_uuid(prefix, parsed);
}

std::string TypeId::to_string() const {
    if (prefix_.empty()) {
        return suffix_;
    }
    std::string out;
    out.reserve(prefix_.size() + 1 + suffix_.size());
    out += prefix_;
    out += separator;
    out += suffix_;
    return out;
}

UuidBytes TypeId::to_bytes() const {
    // suffix_ was validated on construction
    return base32::decode(suffix_).value();
}

Uuid TypeId::to_uuid() const {
    Uuid u;
    u.bytes = to_bytes();
    return u;
}

std::string TypeId::to_uuid_string() const {
    return to_uuid().to_string();
}

bool TypeId::operator==(const TypeId& o) const {
    return prefix_ == o.prefix_ && suffix_ == o.suffix_;
}

bool TypeId::operator!=(const TypeId& o) const {
    return !(*this == o);
}

bool TypeId::operator<(const TypeId& o) const {
    if (prefix_ != o.prefix_) return prefix_ < o.prefix_;
    return suffix_ < o.suffix_;
}

std::ostream& operator<<(std::ostream& os, const TypeId& id) {
    return os << id.to_string();
}

// ---- Canonical string helpers ----

TypeIdParts decompose(const std::string& id) {
    size_t sep = id.find(separator);
    if (sep == std::string::npos) {
        return TypeIdParts{"", id};
    }
    return TypeIdParts{id.substr(0, sep), id.substr(sep + 1)};
}

std::string get_prefix(const std::string& id) {
    return decompose(id).prefix;
}

std::string get_suffix(const std::string& id) {
    return decompose(id).suffix;
}

static bool is_suffix_char(char c) {
    return (c >= '0' && c <= '9') ||
           (c >= 'a' && c <= 'z' && c != 'i' && c != 'l' && c != 'o' && c != 'u');
}

bool is_valid(const std::string& text) {
    size_t sep = text.find(separator);
    if (sep == std::string::npos || sep == 0 || sep > max_prefix_length) {
        return false;
    }
    for (size_t i = 0; i < sep; ++i) {
        if (!is_lower_alpha(text[i])) return false;
    }

    size_t suffix_len = text.size() - sep - 1;
    if (suffix_len != base32::encoded_length) {
        return false;
    }
    const char first = text[sep + 1];
    if (first < '0' || first > '7') {
        return false;
    }
    for (size_t i = sep + 2; i < text.size(); ++i) {
        if (!is_suffix_char(text[i])) return false;
    }
    return true;
}

Result<UuidBytes> to_bytes(const std::string& id) {
    return base32::decode(get_suffix(id));
}

Result<std::string> to_uuid_string(const std::string& id) {
    TID_TRY_ASSIGN(bytes, to_bytes(id));
    Uuid u;
    u.bytes = bytes;
    return Result<std::string>::ok(u.to_string());
}

} // namespace tid
