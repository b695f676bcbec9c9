#include <doctest/doctest.h>
#include "jose/jwk.hpp"

using namespace jose;

namespace {

// RFC 7517 appendix A.1 and A.2
const char* kECPublicJSON =
    R"({"kty":"EC","crv":"P-256",)"
    R"("x":"MKBCTNIcKUSDii11ySs3526iDZ8AiTo7Tu6KPAqv7D4",)"
    R"("y":"4Etl6SRW2YiLUrN5vfvVHuhp7x8PxltmWWlbbM4IFyM","use":"enc","kid":"1"})";

const char* kECPrivateD = "870MB6gfuTJ4HtUnUvYMyJpr5eUZNP4Bk43bVdj3eAE";

const char* kRSAModulus =
    "0vx7agoebGcQSuuPiLJXZptN9nndrQmbXEps2aiAFbWhM78LhWx4cbbfAAtVT86zwu1RK7aPFFxuhDR1L6tSoc_"
    "BJECPebWKRXjBZCiFV4n3oknjhMstn64tZ_2W-5JsGY4Hc5n9yBXArwl93lqt7_RN5w6Cf0h4QyQ5v-65YGjQR0_"
    "FDW2QvzqY368QQMicAtaSqzs8KJZgnYb9c7d0zgdAZHzu6qMQvRL5hajrn1n91CbOpbISD08qNLyrdkt-"
    "bFTWhAI4vMQFh6WeZu0fM4lFd2NcRwr3XPksINHaQ-G_xBniIqbw0Ls1jF44-csFCur-kEgU8awapJzKnqDKgw";

ECKey makeECKey() {
    return ECKey::Builder(Curve::P_256,
                          Base64URL(std::string("MKBCTNIcKUSDii11ySs3526iDZ8AiTo7Tu6KPAqv7D4")),
                          Base64URL(std::string("4Etl6SRW2YiLUrN5vfvVHuhp7x8PxltmWWlbbM4IFyM")))
        .d(Base64URL(std::string(kECPrivateD)))
        .keyUse(KeyUse::SIGNATURE)
        .keyID("ec-1")
        .build();
}

}  // namespace

TEST_CASE("KeyUse and KeyOperation identifiers") {
    CHECK(toIdentifier(KeyUse::SIGNATURE) == "sig");
    CHECK(toIdentifier(KeyUse::ENCRYPTION) == "enc");
    CHECK(parseKeyUse("enc") == KeyUse::ENCRYPTION);
    CHECK_THROWS_AS(parseKeyUse("signature"), ParseError);

    CHECK(toIdentifier(KeyOperation::WRAP_KEY) == "wrapKey");
    CHECK(parseKeyOperation("deriveBits") == KeyOperation::DERIVE_BITS);
    CHECK_THROWS_AS(parseKeyOperation("Sign"), ParseError);
}

TEST_CASE("KeyUse and KeyOperation consistency") {
    CHECK(isConsistent(KeyUse::SIGNATURE, {KeyOperation::SIGN, KeyOperation::VERIFY}));
    CHECK_FALSE(isConsistent(KeyUse::SIGNATURE, {KeyOperation::ENCRYPT}));
    CHECK(isConsistent(KeyUse::ENCRYPTION, {KeyOperation::WRAP_KEY, KeyOperation::DECRYPT}));
    CHECK_FALSE(isConsistent(KeyUse::ENCRYPTION, {KeyOperation::SIGN}));
    CHECK(isConsistent(KeyUse::ENCRYPTION, {}));
}

TEST_CASE("ECKey: Parse public key") {
    ECKey key = ECKey::parse(kECPublicJSON);

    CHECK(key.keyType() == KeyType::EC);
    CHECK(key.curve() == Curve::P_256);
    CHECK(key.x().toString() == "MKBCTNIcKUSDii11ySs3526iDZ8AiTo7Tu6KPAqv7D4");
    CHECK(key.keyUse() == KeyUse::ENCRYPTION);
    CHECK(key.keyID() == "1");
    CHECK_FALSE(key.isPrivate());
    CHECK(key.size() == 256);
}

TEST_CASE("ECKey: Private key and public projection") {
    ECKey key = makeECKey();
    CHECK(key.isPrivate());

    ECKey pub = key.toPublicJWK();
    CHECK_FALSE(pub.isPrivate());
    CHECK(pub.x() == key.x());
    CHECK(pub.keyID() == "ec-1");
    CHECK_FALSE(pub.toJSONObject().contains("d"));
}

TEST_CASE("ECKey: JSON round trip") {
    ECKey key = makeECKey();
    json object = key.toJSONObject();

    // "kty" is always emitted first
    CHECK(object.begin().key() == "kty");
    CHECK(object["d"] == kECPrivateD);

    ECKey parsed = ECKey::fromJSONObject(object);
    CHECK(parsed.toJSONObject() == object);
    CHECK(parsed.d() == key.d());
}

TEST_CASE("ECKey: Invalid members") {
    CHECK_THROWS_AS(ECKey::parse(R"({"kty":"EC","crv":"P-256","x":"AAAA"})"), ParseError);
    CHECK_THROWS_AS(ECKey::parse(R"({"kty":"EC","crv":"","x":"AA","y":"AA"})"), ParseError);
    CHECK_THROWS_AS(ECKey::parse(R"({"kty":"RSA","crv":"P-256","x":"AA","y":"AA"})"), ParseError);
    CHECK_THROWS_AS(ECKey::parse(R"({"kty":"EC","crv":"P-256","x":"A@","y":"AA"})"), ParseError);
    CHECK_THROWS_AS(ECKey::Builder(Curve::P_256, Base64URL(), Base64URL(std::string("AA"))).build(),
                    InvalidArgumentError);
}

TEST_CASE("RSAKey: Parse public key") {
    json object = {{"kty", "RSA"}, {"n", kRSAModulus}, {"e", "AQAB"},
                   {"alg", "RS256"}, {"kid", "2011-04-29"}};
    RSAKey key = RSAKey::fromJSONObject(object);

    CHECK(key.modulus().toString() == kRSAModulus);
    CHECK(key.publicExponent().toString() == "AQAB");
    CHECK(key.algorithm() == Algorithm("RS256"));
    CHECK(key.size() == 2048);
    CHECK_FALSE(key.isPrivate());
}

TEST_CASE("RSAKey: Second private representation is all or nothing") {
    Base64URL n{std::string(kRSAModulus)};
    Base64URL e(std::string("AQAB"));
    Base64URL v(std::string("AQAB"));

    CHECK_THROWS_AS(RSAKey::Builder(n, e).privateExponent(v).firstPrimeFactor(v).build(),
                    InvalidArgumentError);

    RSAKey full = RSAKey::Builder(n, e)
                      .privateExponent(v)
                      .firstPrimeFactor(v)
                      .secondPrimeFactor(v)
                      .firstFactorCRTExponent(v)
                      .secondFactorCRTExponent(v)
                      .firstCRTCoefficient(v)
                      .build();
    CHECK(full.isPrivate());
    CHECK(full.toPublicJWK().toJSONObject().size() == 3);

    // "oth" needs the prime factors
    CHECK_THROWS_AS(RSAKey::Builder(n, e).privateExponent(v).otherPrimes({{v, v, v}}).build(),
                    InvalidArgumentError);
}

TEST_CASE("RSAKey: Prime factors require the private exponent") {
    Base64URL n{std::string(kRSAModulus)};
    Base64URL e(std::string("AQAB"));
    Base64URL v(std::string("AQAB"));

    CHECK_THROWS_AS(RSAKey::Builder(n, e)
                        .firstPrimeFactor(v)
                        .secondPrimeFactor(v)
                        .firstFactorCRTExponent(v)
                        .secondFactorCRTExponent(v)
                        .firstCRTCoefficient(v)
                        .build(),
                    InvalidArgumentError);

    json object = {{"kty", "RSA"}, {"n", kRSAModulus}, {"e", "AQAB"},
                   {"p", "AQ"}, {"q", "Ag"}, {"dp", "Aw"}, {"dq", "BA"}, {"qi", "BQ"}};
    CHECK_THROWS_AS(RSAKey::fromJSONObject(object), ParseError);
    CHECK_THROWS_AS(JWK::fromJSONObject(object), ParseError);
}

TEST_CASE("RSAKey: Other primes round trip") {
    json object = {{"kty", "RSA"}, {"n", kRSAModulus}, {"e", "AQAB"}, {"d", "AQAB"},
                   {"p", "AQ"}, {"q", "Ag"}, {"dp", "Aw"}, {"dq", "BA"}, {"qi", "BQ"},
                   {"oth", json::array({{{"r", "Bg"}, {"d", "Bw"}, {"t", "CA"}}})}};
    RSAKey key = RSAKey::fromJSONObject(object);

    REQUIRE(key.otherPrimes().has_value());
    REQUIRE(key.otherPrimes()->size() == 1);
    CHECK(key.otherPrimes()->front().t.toString() == "CA");
    CHECK(RSAKey::fromJSONObject(key.toJSONObject()).otherPrimes() == key.otherPrimes());
}

TEST_CASE("OctetSequenceKey: Parse and serialize") {
    // RFC 7517 appendix A.3
    OctetSequenceKey key = OctetSequenceKey::parse(
        R"({"kty":"oct","alg":"A128KW","k":"GawgguFyGrWKav7AX4VKUg"})");

    CHECK(key.keyValue().toString() == "GawgguFyGrWKav7AX4VKUg");
    CHECK(key.toByteArray().size() == 16);
    CHECK(key.size() == 128);
    CHECK(key.isPrivate());
    CHECK(key.toJSONObject()["k"] == "GawgguFyGrWKav7AX4VKUg");

    CHECK_THROWS_AS(OctetSequenceKey::parse(R"({"kty":"oct","k":""})"), ParseError);
}

TEST_CASE("JWK: Metadata validation") {
    SecureBytes secret(32, 0x01);

    // Duplicate operations
    CHECK_THROWS_AS(OctetSequenceKey::Builder(secret)
                        .keyOperations({KeyOperation::SIGN, KeyOperation::SIGN})
                        .build(),
                    InvalidArgumentError);
    // Use inconsistent with operations
    CHECK_THROWS_AS(OctetSequenceKey::Builder(secret)
                        .keyUse(KeyUse::SIGNATURE)
                        .keyOperations({KeyOperation::ENCRYPT})
                        .build(),
                    InvalidArgumentError);
    CHECK_THROWS_AS(OctetSequenceKey::Builder(secret).keyID("").build(), InvalidArgumentError);
    CHECK_THROWS_AS(OctetSequenceKey::Builder(secret).x509CertURL("certs/a.pem").build(),
                    InvalidArgumentError);
    CHECK_THROWS_AS(OctetSequenceKey::Builder(secret).x509CertChain({}).build(),
                    InvalidArgumentError);

    // The same problems in parsed input are parse errors
    CHECK_THROWS_AS(JWK::parse(R"({"kty":"oct","k":"AQ","use":"sig","key_ops":["encrypt"]})"),
                    ParseError);
    CHECK_THROWS_AS(JWK::parse(R"({"kty":"oct","k":"AQ","key_ops":["sign","sign"]})"),
                    ParseError);
}

TEST_CASE("JWK: Metadata round trip") {
    OctetSequenceKey key = OctetSequenceKey::Builder(SecureBytes(32, 0x02))
                               .keyOperations({KeyOperation::SIGN, KeyOperation::VERIFY})
                               .algorithm(JWSAlgorithm::HS256)
                               .keyID("mac")
                               .x509CertURL("https://example.com/cert.pem")
                               .x509CertThumbprint(Base64URL::encode("thumb"))
                               .x509CertChain({Base64(std::string("TWFu"))})
                               .build();

    json object = key.toJSONObject();
    CHECK(object["key_ops"] == json::array({"sign", "verify"}));
    CHECK(object["x5c"] == json::array({"TWFu"}));

    OctetSequenceKey parsed = OctetSequenceKey::fromJSONObject(object);
    CHECK(parsed.keyOperations() == key.keyOperations());
    CHECK(parsed.x509CertURL() == "https://example.com/cert.pem");
    CHECK(parsed.x509CertChain() == key.x509CertChain());
    CHECK(parsed.toJSONObject() == object);
}

TEST_CASE("JWK: Dispatch on kty") {
    JWK ec = JWK::parse(kECPublicJSON);
    CHECK(ec.kind() == KeyKind::EC);
    CHECK(ec.is<ECKey>());
    CHECK(ec.get<ECKey>().curve() == Curve::P_256);
    CHECK_THROWS_AS(ec.get<RSAKey>(), KeyTypeError);

    JWK rsa = JWK::fromJSONObject(json{{"kty", "RSA"}, {"n", kRSAModulus}, {"e", "AQAB"}});
    CHECK(rsa.kind() == KeyKind::RSA);
    CHECK(rsa.is<RSAKey>());
    CHECK_FALSE(rsa.is<OctetSequenceKey>());

    JWK oct = JWK::parse(R"({"kty":"oct","k":"GawgguFyGrWKav7AX4VKUg","kid":"s"})");
    CHECK(oct.kind() == KeyKind::OCT);
    CHECK(oct.is<OctetSequenceKey>());
    CHECK(oct.keyID() == "s");
    CHECK(oct.size() == 128);

    CHECK_THROWS_AS(JWK::parse(R"({"kty":"OKP","crv":"Ed25519","x":"AA"})"), ParseError);
    CHECK_THROWS_AS(JWK::parse(R"({"kty":""})"), ParseError);
    CHECK_THROWS_AS(JWK::parse(R"({"k":"AA"})"), ParseError);
    CHECK_THROWS_AS(JWK::parse("[1,2]"), ParseError);
}

TEST_CASE("JWK: Public projection") {
    JWK ec = makeECKey();
    auto pub = ec.toPublicJWK();
    REQUIRE(pub.has_value());
    CHECK_FALSE(pub->isPrivate());

    // Symmetric keys have no public projection
    JWK oct = OctetSequenceKey::Builder(SecureBytes(16, 0x03)).build();
    CHECK_FALSE(oct.toPublicJWK().has_value());
}

TEST_CASE("JWK: JSON string") {
    JWK oct = OctetSequenceKey::Builder(Base64URL(std::string("AQID"))).keyID("k1").build();
    CHECK(oct.toJSONString() == R"({"kty":"oct","kid":"k1","k":"AQID"})");
}
