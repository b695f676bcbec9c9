#include <doctest/doctest.h>
#include <algorithm>
#include <stdexcept>
#include "jose/jose_object.hpp"

using namespace jose;

namespace {

// Collaborators with predictable output so the object model is tested on
// its own

class FakeSigner : public JWSSigner {
public:
    AlgorithmFamily<JWSAlgorithm> supportedAlgorithms() const override {
        return {JWSAlgorithm::HS256, JWSAlgorithm::HS384};
    }

    Base64URL sign(const JWSHeader&, std::span<const uint8_t> signingInput) const override {
        ++calls;
        // Reversed signing input
        std::vector<uint8_t> sig(signingInput.rbegin(), signingInput.rend());
        return Base64URL::encode(sig);
    }

    mutable int calls = 0;
};

class FakeVerifier : public JWSVerifier {
public:
    explicit FakeVerifier(std::optional<JWSHeaderFilter> filter = std::nullopt)
        : filter_(std::move(filter)) {}

    AlgorithmFamily<JWSAlgorithm> supportedAlgorithms() const override {
        return {JWSAlgorithm::HS256, JWSAlgorithm::HS384};
    }

    const JWSHeaderFilter* headerFilter() const override {
        return filter_ ? &*filter_ : nullptr;
    }

    bool verify(const JWSHeader& header, std::span<const uint8_t> signingInput,
                const Base64URL& signature) const override {
        std::vector<uint8_t> expected(signingInput.rbegin(), signingInput.rend());
        return signature == FakeSigner().sign(header, signingInput) &&
               signature.decode() == expected;
    }

private:
    std::optional<JWSHeaderFilter> filter_;
};

class ThrowingSigner : public JWSSigner {
public:
    AlgorithmFamily<JWSAlgorithm> supportedAlgorithms() const override {
        return {JWSAlgorithm::HS256};
    }

    Base64URL sign(const JWSHeader&, std::span<const uint8_t>) const override {
        throw std::runtime_error("device unavailable");
    }
};

class KeyLengthSigner : public JWSSigner {
public:
    AlgorithmFamily<JWSAlgorithm> supportedAlgorithms() const override {
        return {JWSAlgorithm::HS256};
    }

    Base64URL sign(const JWSHeader&, std::span<const uint8_t>) const override {
        throw KeyLengthError("secret too short");
    }
};

// XOR "cipher" with a fixed IV and tag
class FakeEncrypter : public JWEEncrypter {
public:
    AlgorithmFamily<JWEAlgorithm> supportedAlgorithms() const override {
        return {JWEAlgorithm::DIR};
    }

    AlgorithmFamily<EncryptionMethod> supportedEncryptionMethods() const override {
        return {EncryptionMethod::A128GCM};
    }

    JWECryptoParts encrypt(const JWEHeader&, std::span<const uint8_t> clearText) const override {
        std::vector<uint8_t> out(clearText.begin(), clearText.end());
        for (auto& b : out) {
            b ^= 0x5a;
        }
        return {std::nullopt, Base64URL::encode("iv-iv-iv-iv-"), Base64URL::encode(out),
                Base64URL::encode("tag")};
    }
};

class FakeDecrypter : public JWEDecrypter {
public:
    explicit FakeDecrypter(std::optional<JWEHeaderFilter> filter = std::nullopt)
        : filter_(std::move(filter)) {}

    AlgorithmFamily<JWEAlgorithm> supportedAlgorithms() const override {
        return {JWEAlgorithm::DIR};
    }

    AlgorithmFamily<EncryptionMethod> supportedEncryptionMethods() const override {
        return {EncryptionMethod::A128GCM};
    }

    const JWEHeaderFilter* headerFilter() const override {
        return filter_ ? &*filter_ : nullptr;
    }

    std::vector<uint8_t> decrypt(const JWEHeader&, const std::optional<Base64URL>& encryptedKey,
                                 const std::optional<Base64URL>& iv, const Base64URL& cipherText,
                                 const std::optional<Base64URL>& authTag) const override {
        if (encryptedKey || !iv || !authTag || authTag->decodeToString() != "tag") {
            throw CryptoError("unexpected JWE parts");
        }
        std::vector<uint8_t> out = cipherText.decode();
        for (auto& b : out) {
            b ^= 0x5a;
        }
        return out;
    }

private:
    std::optional<JWEHeaderFilter> filter_;
};

JWSObject signedObject(const std::string& payload = "In our village, folks say God crumbles up the old moon into stars.") {
    JWSObject object(JWSHeader::Builder(JWSAlgorithm::HS256).type(JOSEObjectType::JWT).build(),
                     Payload(payload));
    object.sign(FakeSigner());
    return object;
}

JWEObject encryptedObject() {
    JWEObject object(JWEHeader::Builder(JWEAlgorithm::DIR, EncryptionMethod::A128GCM).build(),
                     Payload("Live long and prosper."));
    object.encrypt(FakeEncrypter());
    return object;
}

}  // namespace

TEST_CASE("split - three parts") {
    auto parts = split("aaa.bbb.ccc");
    REQUIRE(parts.size() == 3);
    CHECK(parts[0].toString() == "aaa");
    CHECK(parts[1].toString() == "bbb");
    CHECK(parts[2].toString() == "ccc");

    auto empty = split("..");
    REQUIRE(empty.size() == 3);
    CHECK(empty[0].empty());
    CHECK(empty[2].empty());
}

TEST_CASE("split - five parts") {
    auto parts = split("a..c.d.");
    REQUIRE(parts.size() == 5);
    CHECK(parts[1].empty());
    CHECK(parts[3].toString() == "d");
    CHECK(parts[4].empty());
}

TEST_CASE("split - delimiter errors") {
    auto message = [](std::string_view s) {
        try {
            (void)split(s);
        } catch (const ParseError& e) {
            return std::string(e.what());
        }
        return std::string("no error");
    };

    CHECK(message("").find("Missing part delimiters") != std::string::npos);
    CHECK(message("abc").find("Missing part delimiters") != std::string::npos);
    CHECK(message("a.b").find("Missing second delimiter") != std::string::npos);
    CHECK(message("a.b.c.d").find("Missing fourth delimiter") != std::string::npos);
    CHECK(message("a.b.c.d.e.f").find("Too many part delimiters") != std::string::npos);

    CHECK_THROWS_AS(split("a.b@.c"), InvalidBase64Error);
    CHECK_THROWS_AS(split("e30.ab=c.sig"), ParseError);
    CHECK_THROWS_AS(split("e30.e30.e30.ab=c.e30"), ParseError);
}

TEST_CASE("JWSObject: Misplaced padding in the signature is a parse error") {
    std::string header = JWSHeader::Builder(JWSAlgorithm::HS256).build().toBase64URL().toString();
    CHECK_THROWS_AS(JWSObject::parse(header + ".e30.ab=c"), ParseError);
    CHECK_THROWS_AS(parseJOSEObject(header + ".e30.ab=c"), ParseError);
}

TEST_CASE("PlainObject: Serialize") {
    PlainObject object(Payload(json{{"iss", "joe"}}));
    CHECK(object.header().algorithm() == Algorithm::NONE);
    CHECK(object.serialize() == "eyJhbGciOiJub25lIn0.eyJpc3MiOiJqb2UifQ.");
    CHECK_FALSE(object.parsedParts().has_value());
    CHECK_FALSE(object.parsedString().has_value());
}

TEST_CASE("PlainObject: Parse") {
    std::string s = "eyJhbGciOiJub25lIn0.eyJpc3MiOiJqb2UifQ.";
    PlainObject object = PlainObject::parse(s);

    CHECK(object.payload().toString() == R"({"iss":"joe"})");
    CHECK(object.parsedString() == s);
    CHECK(object.serialize() == s);

    CHECK_THROWS_AS(PlainObject::parse("eyJhbGciOiJub25lIn0.eyJpc3MiOiJqb2UifQ.c2ln"), ParseError);
    CHECK_THROWS_AS(PlainObject::parse("eyJhbGciOiJIUzI1NiJ9.eyJpc3MiOiJqb2UifQ."), ParseError);
    CHECK_THROWS_AS(PlainObject::parse("eyJhbGciOiJub25lIn0.e.e.e."), ParseError);
}

TEST_CASE("JWSObject: Sign and serialize") {
    JWSHeader header = JWSHeader::Builder(JWSAlgorithm::HS256).build();
    JWSObject object(header, Payload("hello"));

    CHECK(object.state() == JWSObject::State::UNSIGNED);
    CHECK_FALSE(object.signature().has_value());
    std::string input = header.toBase64URL().toString() + "." + Base64URL::encode("hello").toString();
    CHECK(std::string(object.signingInput().begin(), object.signingInput().end()) == input);

    // Serializing before signing is a state error
    CHECK_THROWS_AS((void)object.serialize(), InvalidStateError);

    FakeSigner signer;
    object.sign(signer);
    CHECK(signer.calls == 1);
    CHECK(object.state() == JWSObject::State::SIGNED);
    REQUIRE(object.signature().has_value());
    CHECK(object.serialize() == input + "." + object.signature()->toString());

    // A second sign() is refused without calling the signer
    CHECK_THROWS_AS(object.sign(signer), InvalidStateError);
    CHECK(signer.calls == 1);
}

TEST_CASE("JWSObject: Unsupported algorithm") {
    JWSObject object(JWSHeader::Builder(JWSAlgorithm::RS256).build(), Payload("x"));
    CHECK_THROWS_AS(object.sign(FakeSigner()), AlgorithmNotSupportedError);
    CHECK(object.state() == JWSObject::State::UNSIGNED);
}

TEST_CASE("JWSObject: Signer failures") {
    JWSObject wrapped(JWSHeader::Builder(JWSAlgorithm::HS256).build(), Payload("x"));
    try {
        wrapped.sign(ThrowingSigner());
        FAIL("expected CryptoError");
    } catch (const CryptoError& e) {
        CHECK(std::string(e.what()).find("device unavailable") != std::string::npos);
    }
    CHECK(wrapped.state() == JWSObject::State::UNSIGNED);

    // Library errors keep their type
    JWSObject passed(JWSHeader::Builder(JWSAlgorithm::HS256).build(), Payload("x"));
    CHECK_THROWS_AS(passed.sign(KeyLengthSigner()), KeyLengthError);
}

TEST_CASE("JWSObject: Validate") {
    JWSObject object = JWSObject::parse(signedObject().serialize());
    CHECK(object.state() == JWSObject::State::SIGNED);

    FakeVerifier verifier;
    CHECK(object.validate(verifier));
    CHECK(object.state() == JWSObject::State::VALIDATED);

    // Repeated validation gives the same answer
    CHECK(object.validate(verifier));
    CHECK(object.state() == JWSObject::State::VALIDATED);

    // Still serializable once validated
    CHECK(object.serialize() == object.parsedString());
}

TEST_CASE("JWSObject: Invalid signature is not an error") {
    std::string s = signedObject().serialize();
    // Replace the signature
    s = s.substr(0, s.rfind('.') + 1) + "AAAA";

    JWSObject object = JWSObject::parse(s);
    FakeVerifier verifier;
    CHECK_FALSE(object.validate(verifier));
    CHECK(object.state() == JWSObject::State::SIGNED);
    CHECK_FALSE(object.validate(verifier));
}

TEST_CASE("JWSObject: Validate before signing") {
    JWSObject object(JWSHeader::Builder(JWSAlgorithm::HS256).build(), Payload("x"));
    CHECK_THROWS_AS(object.validate(FakeVerifier()), InvalidStateError);
}

TEST_CASE("JWSObject: Header filter") {
    JWSObject object = JWSObject::parse(signedObject().serialize());

    FakeVerifier rejectsAlg(JWSHeaderFilter::acceptAll({JWSAlgorithm::HS384}));
    CHECK_THROWS_AS(object.validate(rejectsAlg), AlgorithmNotAcceptedError);

    // "typ" is not in the accepted parameter list
    FakeVerifier rejectsTyp(JWSHeaderFilter({JWSAlgorithm::HS256}, std::vector<std::string>{"alg"}));
    CHECK_THROWS_AS(object.validate(rejectsTyp), ParamsNotAcceptedError);

    FakeVerifier registered(JWSHeaderFilter::registeredOnly({JWSAlgorithm::HS256}));
    CHECK(object.validate(registered));

    JWSObject custom(JWSHeader::Builder(JWSAlgorithm::HS256).customParam("x-debug", true).build(),
                     Payload("x"));
    custom.sign(FakeSigner());
    CHECK_THROWS_AS(custom.validate(registered), ParamsNotAcceptedError);
    CHECK(custom.state() == JWSObject::State::SIGNED);
}

TEST_CASE("JWSObject: Parse") {
    JWSObject original = signedObject("{\"sub\":\"alice\"}");
    std::string s = original.serialize();

    JWSObject parsed = JWSObject::parse(s);
    CHECK(parsed.header().algorithm() == JWSAlgorithm::HS256);
    CHECK(parsed.header().type() == JOSEObjectType::JWT);
    CHECK(parsed.payload().toString() == "{\"sub\":\"alice\"}");
    CHECK(parsed.signature() == original.signature());
    CHECK(parsed.signingInput() == original.signingInput());
    REQUIRE(parsed.parsedParts().has_value());
    CHECK(parsed.parsedParts()->size() == 3);
    CHECK(parsed.serialize() == s);
}

TEST_CASE("JWSObject: Parse errors") {
    // Empty signature part
    CHECK_THROWS_AS(JWSObject::parse("eyJhbGciOiJIUzI1NiJ9.eA."), ParseError);
    // Unsecured header
    CHECK_THROWS_AS(JWSObject::parse("eyJhbGciOiJub25lIn0.eA.c2ln"), ParseError);
    // Five parts
    CHECK_THROWS_AS(JWSObject::parse("eyJhbGciOiJIUzI1NiJ9.eA.a.b.c"), ParseError);
    // Header is not JSON
    CHECK_THROWS_AS(JWSObject::parse("bm90IGpzb24.eA.c2ln"), ParseError);
}

TEST_CASE("JWSObject: Signing input uses the parsed header segment") {
    // Header JSON with whitespace, not the canonical serialization
    Base64URL header = Base64URL::encode(std::string_view("{\"alg\": \"HS256\"}"));
    std::string s = header.toString() + ".eA.c2ln";

    JWSObject object = JWSObject::parse(s);
    std::string input(object.signingInput().begin(), object.signingInput().end());
    CHECK(input == header.toString() + ".eA");
    CHECK(object.serialize() == s);
}

TEST_CASE("JWEObject: Encrypt and decrypt") {
    JWEObject object(JWEHeader::Builder(JWEAlgorithm::DIR, EncryptionMethod::A128GCM).build(),
                     Payload("Live long and prosper."));
    CHECK(object.state() == JWEObject::State::UNENCRYPTED);
    CHECK_THROWS_AS((void)object.serialize(), InvalidStateError);

    object.encrypt(FakeEncrypter());
    CHECK(object.state() == JWEObject::State::ENCRYPTED);
    CHECK_FALSE(object.encryptedKey().has_value());
    REQUIRE(object.cipherText().has_value());

    std::string s = object.serialize();
    // Empty encrypted key between the first two delimiters
    CHECK(s.find("..") == object.header().toBase64URL().toString().size());
    CHECK(std::count(s.begin(), s.end(), '.') == 4);

    CHECK_THROWS_AS(object.encrypt(FakeEncrypter()), InvalidStateError);

    JWEObject parsed = JWEObject::parse(s);
    CHECK(parsed.state() == JWEObject::State::ENCRYPTED);
    CHECK_FALSE(parsed.payload().has_value());
    CHECK_FALSE(parsed.encryptedKey().has_value());
    CHECK(parsed.iv() == object.iv());

    parsed.decrypt(FakeDecrypter());
    CHECK(parsed.state() == JWEObject::State::DECRYPTED);
    REQUIRE(parsed.payload().has_value());
    CHECK(parsed.payload()->toString() == "Live long and prosper.");
    CHECK(parsed.payload()->origin() == Payload::Origin::BYTE_ARRAY);

    // Decrypted objects serialize to the same parts
    CHECK(parsed.serialize() == s);

    // Decrypting twice is a state error
    CHECK_THROWS_AS(parsed.decrypt(FakeDecrypter()), InvalidStateError);
}

TEST_CASE("JWEObject: Unsupported algorithm or method") {
    JWEObject wrongAlg(JWEHeader::Builder(JWEAlgorithm::A128KW, EncryptionMethod::A128GCM).build(),
                       Payload("x"));
    CHECK_THROWS_AS(wrongAlg.encrypt(FakeEncrypter()), AlgorithmNotSupportedError);

    JWEObject wrongEnc(JWEHeader::Builder(JWEAlgorithm::DIR, EncryptionMethod::A256GCM).build(),
                       Payload("x"));
    CHECK_THROWS_AS(wrongEnc.encrypt(FakeEncrypter()), AlgorithmNotSupportedError);
    CHECK(wrongEnc.state() == JWEObject::State::UNENCRYPTED);
}

TEST_CASE("JWEObject: Header filter") {
    std::string s = encryptedObject().serialize();

    JWEObject rejectsEnc = JWEObject::parse(s);
    FakeDecrypter gcm256(JWEHeaderFilter::acceptAll({JWEAlgorithm::DIR}, {EncryptionMethod::A256GCM}));
    CHECK_THROWS_AS(rejectsEnc.decrypt(gcm256), AlgorithmNotAcceptedError);
    CHECK(rejectsEnc.state() == JWEObject::State::ENCRYPTED);

    JWEObject rejectsAlg = JWEObject::parse(s);
    FakeDecrypter rsa(JWEHeaderFilter::acceptAll({JWEAlgorithm::RSA_OAEP_256}, {EncryptionMethod::A128GCM}));
    CHECK_THROWS_AS(rejectsAlg.decrypt(rsa), AlgorithmNotAcceptedError);

    JWEObject rejectsParams = JWEObject::parse(s);
    FakeDecrypter algOnly(JWEHeaderFilter({JWEAlgorithm::DIR}, {EncryptionMethod::A128GCM},
                                          std::vector<std::string>{"alg"}));
    CHECK_THROWS_AS(rejectsParams.decrypt(algOnly), ParamsNotAcceptedError);

    JWEObject accepted = JWEObject::parse(s);
    FakeDecrypter both(JWEHeaderFilter({JWEAlgorithm::DIR}, {EncryptionMethod::A128GCM},
                                       std::vector<std::string>{"alg", "enc"}));
    accepted.decrypt(both);
    CHECK(accepted.state() == JWEObject::State::DECRYPTED);
}

TEST_CASE("JWEObject: Decrypter failure keeps the state") {
    std::string s = encryptedObject().serialize();
    // Drop the tag
    JWEObject object = JWEObject::parse(s.substr(0, s.rfind('.') + 1));
    CHECK_FALSE(object.authTag().has_value());
    CHECK_THROWS_AS(object.decrypt(FakeDecrypter()), CryptoError);
    CHECK(object.state() == JWEObject::State::ENCRYPTED);
}

TEST_CASE("JWEObject: Parse errors") {
    CHECK_THROWS_AS(JWEObject::parse("eyJhbGciOiJkaXIiLCJlbmMiOiJBMTI4R0NNIn0.a.b"), ParseError);
    // JWS header in five parts
    CHECK_THROWS_AS(JWEObject::parse("eyJhbGciOiJIUzI1NiJ9.a.b.c.d"), ParseError);
}

TEST_CASE("parseJOSEObject - dispatch") {
    JOSEObject plain = parseJOSEObject("eyJhbGciOiJub25lIn0.eyJpc3MiOiJqb2UifQ.");
    CHECK(kindOf(plain) == HeaderKind::PLAIN);
    CHECK(std::holds_alternative<PlainObject>(plain));

    JOSEObject jws = parseJOSEObject(signedObject().serialize());
    REQUIRE(kindOf(jws) == HeaderKind::JWS);
    CHECK(std::get<JWSObject>(jws).state() == JWSObject::State::SIGNED);

    JOSEObject jwe = parseJOSEObject(encryptedObject().serialize());
    REQUIRE(kindOf(jwe) == HeaderKind::JWE);
    CHECK(std::holds_alternative<JWEObject>(jwe));
    CHECK(std::get<JWEObject>(jwe).header().encryptionMethod() == EncryptionMethod::A128GCM);
}

TEST_CASE("parseJOSEObject - errors") {
    CHECK_THROWS_AS(parseJOSEObject(""), ParseError);
    // Header without "alg"
    CHECK_THROWS_AS(parseJOSEObject("eyJ0eXAiOiJKV1QifQ.e30.c2ln"), ParseError);
    // JWE header with three parts
    CHECK_THROWS_AS(parseJOSEObject("eyJhbGciOiJkaXIiLCJlbmMiOiJBMTI4R0NNIn0.a.b"), ParseError);
    // JWS header with five parts
    CHECK_THROWS_AS(parseJOSEObject("eyJhbGciOiJIUzI1NiJ9.a.b.c.d"), ParseError);
    // Unsecured object with a signature
    CHECK_THROWS_AS(parseJOSEObject("eyJhbGciOiJub25lIn0.e30.c2ln"), ParseError);

    try {
        (void)parseJOSEObject("bm90IGpzb24.e30.c2ln");
        FAIL("expected ParseError");
    } catch (const ParseError& e) {
        CHECK(std::string(e.what()).find("Invalid unsecured/JWS/JWE header") == 0);
    }
}
