#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "jose/base64url.hpp"
#include <array>
#include <unordered_set>

using namespace jose;

TEST_CASE("Base64UrlEncode - Empty input") {
    std::vector<uint8_t> empty;
    std::string encoded = base64UrlEncode(empty);
    CHECK(encoded.empty());
}

TEST_CASE("Base64UrlEncode - Single byte") {
    std::vector<uint8_t> data = {0x4d}; // "M"
    std::string encoded = base64UrlEncode(data);
    CHECK(encoded == "TQ");
}

TEST_CASE("Base64UrlEncode - Four bytes") {
    std::vector<uint8_t> data = {0x4d, 0x61, 0x6e, 0x79}; // "Many"
    std::string encoded = base64UrlEncode(data);
    CHECK(encoded == "TWFueQ");
}

TEST_CASE("Base64UrlEncode - URL-safe characters") {
    std::vector<uint8_t> data = {0xfb, 0xff}; // '+' and '/' in standard base64
    CHECK(base64UrlEncode(data) == "-_8");
    CHECK(base64Encode(data) == "+/8=");
}

TEST_CASE("Base64UrlDecode - Invalid characters") {
    CHECK_THROWS_AS(base64UrlDecode("TW@u"), InvalidBase64Error);
    CHECK_THROWS_AS(base64UrlDecode("TW+u"), InvalidBase64Error); // Standard base64 chars not allowed
    CHECK_THROWS_AS(base64UrlDecode("TW/u"), InvalidBase64Error);
    CHECK_THROWS_AS(base64UrlDecode("TW u"), InvalidBase64Error); // Space not allowed
    CHECK_THROWS_AS(base64UrlDecode("TW\nu"), InvalidBase64Error);
}

TEST_CASE("Base64UrlDecode - Padding handling") {
    // Trailing padding is tolerated
    std::vector<uint8_t> expected1 = {0x4d, 0x61};
    CHECK(base64UrlDecode("TWE=") == expected1);

    std::vector<uint8_t> expected2 = {0x4d};
    CHECK(base64UrlDecode("TQ==") == expected2);

    // Padding in the middle is not
    CHECK_THROWS_AS(base64UrlDecode("TQ==TQ"), InvalidBase64Error);
}

TEST_CASE("Base64UrlEncode - Use std::array") {
    std::array<uint8_t, 3> arr = {0x4d, 0x61, 0x6e};
    CHECK(base64UrlEncode(arr) == "TWFu");
}

TEST_CASE("Base64Decode - Standard alphabet") {
    std::vector<uint8_t> expected = {0xfb, 0xff};
    CHECK(base64Decode("+/8=") == expected);
    CHECK_THROWS_AS(base64Decode("-_8"), InvalidBase64Error);
}

TEST_CASE("Base64URL: Encode string") {
    Base64URL value = Base64URL::encode("{\"alg\":\"none\"}");
    CHECK(value.toString() == "eyJhbGciOiJub25lIn0");
    CHECK(value.decodeToString() == "{\"alg\":\"none\"}");
}

TEST_CASE("Base64URL: Encode bytes") {
    std::vector<uint8_t> data = {0x00, 0x01, 0x02, 0x03, 0xff, 0xfe, 0xfd};
    Base64URL value = Base64URL::encode(data);
    CHECK(value.toString() == "AAECA__-_Q");
    CHECK(value.decode() == data);
}

TEST_CASE("Base64URL: Wraps encoded text verbatim") {
    Base64URL value(std::string("TWFu"));
    CHECK(value.toString() == "TWFu");
    CHECK(value.decodeToString() == "Man");
    CHECK_FALSE(value.empty());

    CHECK(Base64URL().empty());
    CHECK(Base64URL(std::string()).empty());
}

TEST_CASE("Base64URL: Rejects illegal characters") {
    CHECK_THROWS_AS(Base64URL(std::string("TW@u")), InvalidBase64Error);
    CHECK_THROWS_AS(Base64URL(std::string("a.b")), InvalidBase64Error);
    CHECK_THROWS_AS(Base64URL(std::string("TW+u")), ParseError);
}

TEST_CASE("Base64URL: Padding only at the end") {
    CHECK_THROWS_AS(Base64URL(std::string("ab=c")), InvalidBase64Error);
    CHECK_THROWS_AS(Base64URL(std::string("=abc")), InvalidBase64Error);
    CHECK_THROWS_AS(Base64URL(std::string("TQ===")), InvalidBase64Error);
    CHECK_THROWS_AS(Base64(std::string("TQ=Q")), InvalidBase64Error);

    // Trailing padding still decodes
    CHECK(Base64URL(std::string("TQ==")).decodeToString() == "M");
    CHECK(Base64(std::string("TWE=")).decode().size() == 2);
}

TEST_CASE("Base64URL: Equality and hashing by encoded text") {
    Base64URL a(std::string("TWFu"));
    Base64URL b = Base64URL::encode("Man");
    Base64URL c(std::string("TWE"));

    CHECK(a == b);
    CHECK_FALSE(a == c);

    std::unordered_set<Base64URL> values = {a, b, c};
    CHECK(values.size() == 2);
}

TEST_CASE("Base64: Certificate chain value") {
    Base64 value(std::string("TWFu"));
    std::vector<uint8_t> expected = {0x4d, 0x61, 0x6e};
    CHECK(value.decode() == expected);
    CHECK(value.toString() == "TWFu");
    CHECK_THROWS_AS(Base64(std::string("TW_u")), InvalidBase64Error);
}
