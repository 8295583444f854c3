#include <catch2/catch_test_macros.hpp>
#include "certvet/crypto.hpp"

using namespace certvet::crypto;

TEST_CASE("SHA-256 known answers", "[crypto]")
{
    REQUIRE(Hex::encode_upper(SHA256::hash(Bytes{})) ==
            "E3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855");
    REQUIRE(Hex::encode_upper(SHA256::hash(Bytes{'a', 'b', 'c'})) ==
            "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
}

TEST_CASE("Hex decoding", "[crypto]")
{
    auto bytes = Hex::decode("00ff7Fa0");
    REQUIRE(bytes.has_value());
    REQUIRE(*bytes == Bytes{0x00, 0xFF, 0x7F, 0xA0});
    REQUIRE(Hex::encode_upper(*bytes) == "00FF7FA0");

    REQUIRE_FALSE(Hex::decode("abc").has_value());
    REQUIRE_FALSE(Hex::decode("zz").has_value());
    REQUIRE(Hex::decode("").has_value());
}
