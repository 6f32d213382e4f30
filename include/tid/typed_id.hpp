#pragma once

#include <tid/typeid.hpp>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace tid {

constexpr bool is_valid_prefix_literal(const char* s) {
    size_t n = 0;
    for (; s[n] != '\0'; ++n) {
        if (s[n] < 'a' || s[n] > 'z') return false;
    }
    return n <= max_prefix_length;
}

// A TypeId whose prefix is fixed by Tag at compile time, so identifiers of
// different entity kinds cannot be mixed up. Tag supplies the prefix:
//
//     struct UserTag { static constexpr const char* prefix = "user"; };
//     using UserId = tid::TypedId<UserTag>;
//
// The wrapper has no behavior of its own beyond the prefix check.
template<typename Tag>
class TypedId {
    static_assert(is_valid_prefix_literal(Tag::prefix),
                  "TypedId tag prefix must be at most 63 ascii letters [a-z]");

public:
    static constexpr const char* prefix() { return Tag::prefix; }

    static Result<TypedId> generate() {
        return wrap(TypeId::generate(Tag::prefix));
    }

    // Unlike TypeId::from_string, a bare suffix is rejected unless the tag
    // prefix is empty
    static Result<TypedId> from_string(const std::string& text) {
        TID_TRY_ASSIGN(parsed, TypeId::from_string(text, Tag::prefix));
        if (parsed.prefix() != Tag::prefix) {
            return TidError{TidError::PrefixMismatch,
                std::string("Invalid TypeID. Prefix mismatch. Expected ") + Tag::prefix +
                    ", got " + parsed.prefix()};
        }
        return Result<TypedId>::ok(TypedId(std::move(parsed)));
    }

    static Result<TypedId> from_suffix(const std::string& suffix) {
        return wrap(TypeId::make(Tag::prefix, suffix));
    }

    static Result<TypedId> from_bytes(const UuidBytes& bytes) {
        return wrap(TypeId::from_bytes(Tag::prefix, bytes));
    }

    static Result<TypedId> from_uuid(const Uuid& uuid) {
        return wrap(TypeId::from_uuid(Tag::prefix, uuid));
    }

    static Result<TypedId> from_uuid_string(const std::string& uuid) {
        return wrap(TypeId::from_uuid_string(uuid, Tag::prefix));
    }

    const TypeId& id() const { return id_; }
    const std::string& suffix() const { return id_.suffix(); }
    std::string to_string() const { return id_.to_string(); }
    Uuid to_uuid() const { return id_.to_uuid(); }
    std::string to_uuid_string() const { return id_.to_uuid_string(); }

    bool operator==(const TypedId& o) const { return id_ == o.id_; }
    bool operator!=(const TypedId& o) const { return id_ != o.id_; }
    bool operator<(const TypedId& o) const { return id_ < o.id_; }

private:
    explicit TypedId(TypeId id) : id_(std::move(id)) {}

    static Result<TypedId> wrap(Result<TypeId> r) {
        if (r.is_err()) return std::move(r).error();
        return Result<TypedId>::ok(TypedId(std::move(r).value()));
    }

    TypeId id_;
};

template<typename Tag>
std::ostream& operator<<(std::ostream& os, const TypedId<Tag>& id) {
    return os << id.id();
}

} // namespace tid

namespace std {

template<typename Tag>
struct hash<tid::TypedId<Tag>> {
    size_t operator()(const tid::TypedId<Tag>& id) const {
        return hash<tid::TypeId>()(id.id());
    }
};

} // namespace std
