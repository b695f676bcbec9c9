/**
 * @file jws_example.cpp
 * @brief Example demonstrating signed and encrypted JOSE objects
 *
 * This example shows how to:
 * 1. Generate keys and publish them as a JWK set
 * 2. Sign a claim set as a compact JWS and verify it with a selected key
 * 3. Wrap the signed object in a direct-encryption JWE
 * 4. Handle rejected objects through the error hierarchy
 */

#include "jose/jose.hpp"
#include "jose/openssl_crypto.hpp"

#include <iostream>

using namespace jose;

/**
 * @brief Issuer signing key, identified by its thumbprint
 */
ECKey create_signing_key() {
    ECKey generated = generateECKey(Curve::P_256);
    return ECKey::Builder(generated.curve(), generated.x(), generated.y())
        .d(*generated.d())
        .keyID(computeThumbprint(generated).toString())
        .keyUse(KeyUse::SIGNATURE)
        .algorithm(JWSAlgorithm::ES256)
        .build();
}

void print_separator(const std::string& title) {
    std::cout << "\n=== " << title << " ===" << std::endl;
}

int main() {
    try {
        print_separator("Key set");
        ECKey signing_key = create_signing_key();
        JWKSet published(std::vector<JWK>{signing_key});
        std::cout << published.toJSONObject().dump(2) << std::endl;

        print_separator("Signed object");
        JWSObject jws(JWSHeader::Builder(JWSAlgorithm::ES256)
                          .type(JOSEObjectType::JWT)
                          .keyID(*signing_key.keyID())
                          .build(),
                      Payload(json{{"iss", "https://issuer.example.com"},
                                   {"sub", "alice"},
                                   {"scope", "read write"}}));
        jws.sign(ECDSASigner(signing_key));
        std::string compact = jws.serialize();
        std::cout << compact << std::endl;

        print_separator("Verification");
        JWSObject received = JWSObject::parse(compact);
        JWKSelector selector(JWKMatcher::Builder()
                                 .keyID(*received.header().keyID())
                                 .algorithm(received.header().algorithm())
                                 .build());
        auto candidates = selector.select(JWKSet::parse(published.toString()));
        if (candidates.empty()) {
            std::cerr << "No verification key found" << std::endl;
            return 1;
        }
        bool valid = received.validate(ECDSAVerifier(candidates.front().get<ECKey>()));
        std::cout << "Signature valid: " << (valid ? "yes" : "no") << std::endl;
        std::cout << "Claims: " << received.payload().toString() << std::endl;

        print_separator("Encrypted object");
        OctetSequenceKey shared = generateOctetSequenceKey(256);
        JWEObject jwe(JWEHeader::Builder(JWEAlgorithm::DIR, EncryptionMethod::A256GCM)
                          .contentType("JWT")
                          .build(),
                      Payload(compact));
        jwe.encrypt(DirectEncrypter(shared));
        std::string encrypted = jwe.serialize();
        std::cout << encrypted << std::endl;

        JWEObject decrypted = JWEObject::parse(encrypted);
        decrypted.decrypt(DirectDecrypter(shared));
        std::cout << "Decrypted content matches: "
                  << (decrypted.payload()->toString() == compact ? "yes" : "no") << std::endl;

        print_separator("Rejected input");
        try {
            JWSObject::parse("eyJhbGciOiJIUzI1NiJ9.e30");
        } catch (const ParseError& e) {
            std::cout << "ParseError: " << e.what() << std::endl;
        }

        try {
            JWSObject weak(JWSHeader::Builder(JWSAlgorithm::HS512).build(), Payload("x"));
            weak.sign(MACSigner(SecureBytes(32, 0x01)));
        } catch (const AlgorithmError& e) {
            std::cout << "AlgorithmError: " << e.what() << std::endl;
        }
    } catch (const JoseError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
