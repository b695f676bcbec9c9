/**
 * @file openssl_crypto.hpp
 * @brief OpenSSL 3 implementations of the JWS and JWE collaborators, JWK
 * conversion to and from EVP keys, key generation and RFC 7638 thumbprints
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "crypto.hpp"
#include "jwk.hpp"
#include "secure_vector.hpp"

// Forward declarations for OpenSSL types
typedef struct evp_pkey_st EVP_PKEY;

namespace jose {

namespace crypto_constants {
constexpr size_t MIN_HS256_SECRET_BITS = 256;
constexpr size_t MIN_HS384_SECRET_BITS = 384;
constexpr size_t MIN_HS512_SECRET_BITS = 512;
constexpr size_t MIN_RSA_KEY_BITS = 2048;
constexpr size_t GCM_IV_SIZE = 12;   ///< GCM IV size in bytes (96 bits)
constexpr size_t GCM_TAG_SIZE = 16;  ///< GCM authentication tag size in bytes
}  // namespace crypto_constants

/**
 * @brief RAII wrapper for OpenSSL EVP_PKEY
 */
struct EvpKeyDeleter {
  void operator()(EVP_PKEY* key) const noexcept;
};
using EvpKeyPtr = std::unique_ptr<EVP_PKEY, EvpKeyDeleter>;

// Key conversion

/**
 * @throws CryptoError if OpenSSL rejects the key material
 */
EvpKeyPtr toEvpPublicKey(const ECKey& key);
EvpKeyPtr toEvpPublicKey(const RSAKey& key);

/**
 * @throws InvalidArgumentError if the JWK has no private part
 * @throws CryptoError if OpenSSL rejects the key material
 */
EvpKeyPtr toEvpPrivateKey(const ECKey& key);
EvpKeyPtr toEvpPrivateKey(const RSAKey& key);

/**
 * @brief EC JWK from a DER SubjectPublicKeyInfo or DER private key. The
 * private part is included when the DER holds one.
 * @throws KeyTypeError if the key is not on P-256, P-384 or P-521
 */
ECKey ecKeyFromDer(std::span<const uint8_t> der);

/**
 * @brief RSA JWK from a DER SubjectPublicKeyInfo or DER private key
 */
RSAKey rsaKeyFromDer(std::span<const uint8_t> der);

/**
 * @brief EC JWK from an OpenSSL key, with the private part if present
 */
ECKey ecKeyFromEvp(const EVP_PKEY* pkey);
RSAKey rsaKeyFromEvp(const EVP_PKEY* pkey);

// Key generation

ECKey generateECKey(const Curve& curve);
RSAKey generateRSAKey(size_t bits = crypto_constants::MIN_RSA_KEY_BITS);

/**
 * @throws InvalidArgumentError unless bits is a positive multiple of 8
 */
OctetSequenceKey generateOctetSequenceKey(size_t bits);

/**
 * @brief RFC 7638 JWK thumbprint, SHA-256 over the required members in
 * lexicographic order
 */
Base64URL computeThumbprint(const JWK& jwk);

// JWS: HMAC

/**
 * @brief HS256 / HS384 / HS512 signer. The supported algorithms are those
 * the secret is long enough for.
 */
class MACSigner : public JWSSigner {
 public:
  /**
   * @throws KeyLengthError if the secret is shorter than 256 bits
   */
  explicit MACSigner(SecureBytes secret);
  explicit MACSigner(const OctetSequenceKey& key);

  [[nodiscard]] AlgorithmFamily<JWSAlgorithm> supportedAlgorithms()
      const override;

  Base64URL sign(const JWSHeader& header,
                 std::span<const uint8_t> signingInput) const override;

 private:
  SecureBytes secret_;
};

/**
 * @brief HMAC verifier. Headers marking a parameter critical that is not in
 * deferredCriticalParams fail verification.
 */
class MACVerifier : public JWSVerifier {
 public:
  explicit MACVerifier(SecureBytes secret,
                       std::optional<JWSHeaderFilter> filter = std::nullopt,
                       std::vector<std::string> deferredCriticalParams = {});
  explicit MACVerifier(const OctetSequenceKey& key,
                       std::optional<JWSHeaderFilter> filter = std::nullopt,
                       std::vector<std::string> deferredCriticalParams = {});

  [[nodiscard]] AlgorithmFamily<JWSAlgorithm> supportedAlgorithms()
      const override;
  [[nodiscard]] const JWSHeaderFilter* headerFilter() const override {
    return filter_ ? &*filter_ : nullptr;
  }

  bool verify(const JWSHeader& header, std::span<const uint8_t> signingInput,
              const Base64URL& signature) const override;

 private:
  SecureBytes secret_;
  std::optional<JWSHeaderFilter> filter_;
  CriticalHeaderParamsChecker critChecker_;
};

// JWS: RSA

/**
 * @brief RS256..RS512 (PKCS#1 v1.5) and PS256..PS512 (PSS, salt length
 * equal to the digest length) signer
 */
class RSASSASigner : public JWSSigner {
 public:
  /**
   * @throws InvalidArgumentError if the key is not private
   * @throws KeyLengthError if the modulus is shorter than 2048 bits
   */
  explicit RSASSASigner(const RSAKey& privateKey);

  [[nodiscard]] AlgorithmFamily<JWSAlgorithm> supportedAlgorithms()
      const override {
    return JWSAlgorithm::Family::RSA;
  }

  Base64URL sign(const JWSHeader& header,
                 std::span<const uint8_t> signingInput) const override;

 private:
  EvpKeyPtr key_;
};

class RSASSAVerifier : public JWSVerifier {
 public:
  explicit RSASSAVerifier(const RSAKey& publicKey,
                          std::optional<JWSHeaderFilter> filter = std::nullopt,
                          std::vector<std::string> deferredCriticalParams = {});

  [[nodiscard]] AlgorithmFamily<JWSAlgorithm> supportedAlgorithms()
      const override {
    return JWSAlgorithm::Family::RSA;
  }
  [[nodiscard]] const JWSHeaderFilter* headerFilter() const override {
    return filter_ ? &*filter_ : nullptr;
  }

  bool verify(const JWSHeader& header, std::span<const uint8_t> signingInput,
              const Base64URL& signature) const override;

 private:
  EvpKeyPtr key_;
  std::optional<JWSHeaderFilter> filter_;
  CriticalHeaderParamsChecker critChecker_;
};

// JWS: ECDSA

/**
 * @brief ES256 / ES384 / ES512 signer producing the fixed-length R || S
 * signature format. Supports the one algorithm matching the key curve.
 */
class ECDSASigner : public JWSSigner {
 public:
  /**
   * @throws InvalidArgumentError if the key is not private
   * @throws KeyTypeError if the curve is not P-256, P-384 or P-521
   */
  explicit ECDSASigner(const ECKey& privateKey);

  [[nodiscard]] AlgorithmFamily<JWSAlgorithm> supportedAlgorithms()
      const override;

  /**
   * @throws KeyTypeError if the header algorithm does not match the curve
   */
  Base64URL sign(const JWSHeader& header,
                 std::span<const uint8_t> signingInput) const override;

 private:
  Curve curve_;
  EvpKeyPtr key_;
};

class ECDSAVerifier : public JWSVerifier {
 public:
  explicit ECDSAVerifier(const ECKey& publicKey,
                         std::optional<JWSHeaderFilter> filter = std::nullopt,
                         std::vector<std::string> deferredCriticalParams = {});

  [[nodiscard]] AlgorithmFamily<JWSAlgorithm> supportedAlgorithms()
      const override;
  [[nodiscard]] const JWSHeaderFilter* headerFilter() const override {
    return filter_ ? &*filter_ : nullptr;
  }

  bool verify(const JWSHeader& header, std::span<const uint8_t> signingInput,
              const Base64URL& signature) const override;

 private:
  Curve curve_;
  EvpKeyPtr key_;
  std::optional<JWSHeaderFilter> filter_;
  CriticalHeaderParamsChecker critChecker_;
};

// JWE: direct encryption

/**
 * @brief alg "dir" with A128GCM, A192GCM or A256GCM, the shared key is used
 * as the content encryption key
 */
class DirectEncrypter : public JWEEncrypter {
 public:
  /**
   * @throws KeyLengthError unless the key is 128, 192 or 256 bits
   */
  explicit DirectEncrypter(SecureBytes key);
  explicit DirectEncrypter(const OctetSequenceKey& key);

  [[nodiscard]] AlgorithmFamily<JWEAlgorithm> supportedAlgorithms()
      const override {
    return {JWEAlgorithm::DIR};
  }
  [[nodiscard]] AlgorithmFamily<EncryptionMethod> supportedEncryptionMethods()
      const override;

  /**
   * @throws KeyLengthError if the key does not match the encryption method
   */
  JWECryptoParts encrypt(const JWEHeader& header,
                         std::span<const uint8_t> clearText) const override;

 private:
  SecureBytes key_;
};

class DirectDecrypter : public JWEDecrypter {
 public:
  explicit DirectDecrypter(SecureBytes key,
                           std::optional<JWEHeaderFilter> filter = std::nullopt,
                           std::vector<std::string> deferredCriticalParams = {});
  explicit DirectDecrypter(const OctetSequenceKey& key,
                           std::optional<JWEHeaderFilter> filter = std::nullopt,
                           std::vector<std::string> deferredCriticalParams = {});

  [[nodiscard]] AlgorithmFamily<JWEAlgorithm> supportedAlgorithms()
      const override {
    return {JWEAlgorithm::DIR};
  }
  [[nodiscard]] AlgorithmFamily<EncryptionMethod> supportedEncryptionMethods()
      const override;
  [[nodiscard]] const JWEHeaderFilter* headerFilter() const override {
    return filter_ ? &*filter_ : nullptr;
  }

  /**
   * @throws CryptoError if the header lists a critical parameter that is not
   * deferred, an encrypted key is present, the IV or tag is missing, or the
   * tag does not authenticate the cipher text
   */
  std::vector<uint8_t> decrypt(
      const JWEHeader& header, const std::optional<Base64URL>& encryptedKey,
      const std::optional<Base64URL>& iv, const Base64URL& cipherText,
      const std::optional<Base64URL>& authTag) const override;

 private:
  SecureBytes key_;
  std::optional<JWEHeaderFilter> filter_;
  CriticalHeaderParamsChecker critChecker_;
};

}  // namespace jose
