#include <catch2/catch.hpp>
#include <tid/typed_id.hpp>
#include <type_traits>
#include <unordered_set>

using namespace tid;

namespace {

struct UserTag { static constexpr const char* prefix = "user"; };
struct OrgTag { static constexpr const char* prefix = "org"; };
struct BareTag { static constexpr const char* prefix = ""; };

using UserId = TypedId<UserTag>;
using OrgId = TypedId<OrgTag>;
using BareId = TypedId<BareTag>;

} // namespace

static_assert(!std::is_same<UserId, OrgId>::value, "tags must produce distinct types");
static_assert(!std::is_convertible<UserId, OrgId>::value, "typed ids must not convert");
static_assert(is_valid_prefix_literal("user"), "");
static_assert(is_valid_prefix_literal(""), "");
static_assert(!is_valid_prefix_literal("User"), "");
static_assert(!is_valid_prefix_literal("us_er"), "");
static_assert(!is_valid_prefix_literal(
    "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"), "");

TEST_CASE("TypedId generate uses the tag prefix", "[typed_id]") {
    auto r = UserId::generate();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().id().prefix() == "user");
    REQUIRE(r.value().to_string().rfind("user_", 0) == 0);
    REQUIRE(std::string(UserId::prefix()) == "user");
}

TEST_CASE("TypedId from_string enforces the tag prefix", "[typed_id]") {
    auto ok = UserId::from_string("user_01h455vb4pex5vsknk084sn02q");
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().suffix() == "01h455vb4pex5vsknk084sn02q");

    auto wrong = UserId::from_string("org_01h455vb4pex5vsknk084sn02q");
    REQUIRE(wrong.is_err());
    REQUIRE(wrong.error().code == TidError::PrefixMismatch);

    auto bare = UserId::from_string("01h455vb4pex5vsknk084sn02q");
    REQUIRE(bare.is_err());
    REQUIRE(bare.error().code == TidError::PrefixMismatch);
}

TEST_CASE("TypedId with an empty tag prefix", "[typed_id]") {
    auto r = BareId::from_string("01h455vb4pex5vsknk084sn02q");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "01h455vb4pex5vsknk084sn02q");
}

TEST_CASE("TypedId from_suffix validates the suffix", "[typed_id]") {
    auto r = OrgId::from_suffix("abc");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TidError::InvalidSuffixLength);
}

TEST_CASE("TypedId UUID conversions", "[typed_id]") {
    const std::string uuid = "01890a5d-ac96-774b-bcce-b302099a8057";
    auto r = OrgId::from_uuid_string(uuid);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "org_01h455vb4pex5vsknk084sn02q");
    REQUIRE(r.value().to_uuid_string() == uuid);

    auto same = OrgId::from_uuid(r.value().to_uuid());
    REQUIRE(same.is_ok());
    REQUIRE(same.value() == r.value());

    auto from_b = OrgId::from_bytes(r.value().id().to_bytes());
    REQUIRE(from_b.is_ok());
    REQUIRE(from_b.value() == r.value());
}

TEST_CASE("TypedId ordering and hashing", "[typed_id]") {
    auto a = UserId::generate().value();
    auto b = UserId::generate().value();
    REQUIRE(a < b);
    REQUIRE(a != b);

    std::unordered_set<UserId> set{a, b, a};
    REQUIRE(set.size() == 2);
}
