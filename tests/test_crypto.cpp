#include <catch2/catch_test_macros.hpp>
#include "quorumsig/crypto.hpp"
#include "quorumsig/types.hpp"
#include <string>

using namespace quorumsig::crypto;

TEST_CASE("Base64 encoding/decoding", "[crypto]")
{
    std::string original = "Hello, quorum!";
    Bytes original_bytes(original.begin(), original.end());

    auto encoded = Base64::encode(original_bytes);
    REQUIRE(encoded == "SGVsbG8sIHF1b3J1bSE=");

    auto decoded = Base64::decode(encoded);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == original_bytes);

    REQUIRE_FALSE(Base64::decode("not base64!").has_value());
}

TEST_CASE("Secure random generation", "[crypto]")
{
    auto random1 = SecureRandom::generate_bytes(32);
    auto random2 = SecureRandom::generate_bytes(32);

    REQUIRE(random1.size() == 32);
    REQUIRE(random2.size() == 32);
    REQUIRE(random1 != random2); // Should be different
}

TEST_CASE("Ristretto point decoding", "[crypto]")
{
    auto p = Ristretto::base_mul(Ristretto::scalar_random());
    REQUIRE(p.has_value());
    REQUIRE(Ristretto::is_valid_point(*p));

    auto round = Ristretto::point_from_base64(Ristretto::point_to_base64(*p));
    REQUIRE(round.has_value());
    REQUIRE(*round == *p);

    REQUIRE_FALSE(Ristretto::point_from_bytes(Bytes(31, 1)).has_value());
    REQUIRE_FALSE(Ristretto::point_from_bytes(Bytes(32, 0xff)).has_value());
}

TEST_CASE("Ristretto group arithmetic", "[crypto]")
{
    auto a = Ristretto::scalar_random();
    auto b = Ristretto::scalar_random();

    // (a + b)G == aG + bG
    auto lhs = Ristretto::base_mul(Ristretto::scalar_add(a, b)).value();
    auto rhs = Ristretto::add(Ristretto::base_mul(a).value(), Ristretto::base_mul(b).value()).value();
    REQUIRE(lhs == rhs);

    // a(bG) == (ab)G
    auto nested = Ristretto::mul(a, Ristretto::base_mul(b).value()).value();
    REQUIRE(nested == Ristretto::base_mul(Ristretto::scalar_mul(a, b)).value());

    auto inv = Ristretto::scalar_invert(a);
    REQUIRE(inv.has_value());
    REQUIRE(Ristretto::scalar_mul(a, *inv) == Ristretto::scalar_from_uint(1));
    REQUIRE_FALSE(Ristretto::scalar_invert(Ristretto::scalar_from_uint(0)).has_value());

    REQUIRE_FALSE(Ristretto::base_mul(Ristretto::scalar_from_uint(0)).has_value());
}

TEST_CASE("Hashing onto the group is deterministic", "[crypto]")
{
    Bytes msg{'a', 'b', 'c'};
    auto h1 = Ristretto::hash_to_point(msg);
    auto h2 = Ristretto::hash_to_point(msg);
    REQUIRE(h1 == h2);
    REQUIRE(Ristretto::is_valid_point(h1));
    REQUIRE(h1 != Ristretto::hash_to_point(Bytes{'a', 'b', 'd'}));

    REQUIRE(Ristretto::scalar_from_hash(msg) == Ristretto::scalar_from_hash(msg));
}

TEST_CASE("Key version parsing", "[types]")
{
    using quorumsig::parse_key_version;
    REQUIRE(parse_key_version("3") == 3u);
    REQUIRE(parse_key_version("0") == 0u);
    REQUIRE_FALSE(parse_key_version("").has_value());
    REQUIRE_FALSE(parse_key_version("3a").has_value());
    REQUIRE_FALSE(parse_key_version("-1").has_value());
    REQUIRE_FALSE(parse_key_version(" 3").has_value());
    REQUIRE_FALSE(parse_key_version("99999999999").has_value());
}
