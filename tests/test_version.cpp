#include <catch2/catch.hpp>
#include <trellis/version.hpp>

using namespace trellis;

static const char* REV_A = "645ef00459ed84a119197bfb8d8205042c6df63d";
static const char* REV_B = "42b84f9ec624953ecbf81a94feccb3f5935c5edf";

TEST_CASE("bare revisions", "[version]") {
    auto v = Version::revision(REV_A);
    REQUIRE(v.kind() == Version::Revision);
    REQUIRE(v.is_bound());
    REQUIRE(v.bound_revision() == std::string(REV_A));
    REQUIRE(v.to_string() == REV_A);
    REQUIRE(std::string(v.type_name()) == "revision");

    REQUIRE(v == Version::revision(REV_A));
    REQUIRE(v != Version::revision(REV_B));
}

TEST_CASE("binding keeps symbolic identity", "[version]") {
    auto tag = Version::tag("v0.8.0");
    REQUIRE_FALSE(tag.is_bound());
    REQUIRE_FALSE(tag.bound_revision().has_value());

    auto bound = tag.is(REV_A);
    REQUIRE(bound.kind() == Version::Tag);
    REQUIRE(bound.name() == "v0.8.0");
    REQUIRE(bound.is_bound());
    REQUIRE(bound.bound_revision() == std::string(REV_A));
    REQUIRE(bound.to_string() == "v0.8.0");

    REQUIRE(bound != tag);
    REQUIRE(bound.name() == tag.name());
    REQUIRE(bound == Version::tag("v0.8.0").is(REV_A));
    REQUIRE(bound != Version::tag("v0.8.0").is(REV_B));
}

TEST_CASE("equality is transitive across bindings", "[version]") {
    auto a = Version::tag("v1").is(REV_A);
    auto unbound = Version::tag("v1");
    auto b = Version::tag("v1").is(REV_B);

    REQUIRE(a != unbound);
    REQUIRE(unbound != b);
    REQUIRE(a != b);
    REQUIRE(unbound == Version::tag("v1"));
    REQUIRE(Version::branch("dev").is(REV_A) == Version::branch("dev").is(REV_A));
}

TEST_CASE("kinds never compare equal", "[version]") {
    auto branch = Version::branch("master").is(REV_A);
    auto tag = Version::tag("master").is(REV_A);
    REQUIRE(branch != tag);
    REQUIRE(branch != Version::revision(REV_A));
    REQUIRE(branch.same_revision(tag));
    REQUIRE(branch.same_revision(Version::revision(REV_A)));
    REQUIRE_FALSE(Version::branch("master").same_revision(tag));
}

TEST_CASE("binding a bare revision replaces it", "[version]") {
    auto v = Version::revision(REV_A).is(REV_B);
    REQUIRE(v.kind() == Version::Revision);
    REQUIRE(v == Version::revision(REV_B));
}

TEST_CASE("type names", "[version]") {
    REQUIRE(std::string(Version::branch("x").type_name()) == "branch");
    REQUIRE(std::string(Version::tag("v1.0.0").type_name()) == "version");
}
