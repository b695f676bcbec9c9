/**
 * @file crypto.hpp
 * @brief Contracts of the cryptographic collaborators that sign, verify,
 * encrypt and decrypt JOSE objects
 *
 * The JOSE object model never performs cryptography itself. It checks
 * algorithm support and header filters, then hands the exact bytes to one
 * of these interfaces. Concrete OpenSSL implementations live in
 * openssl_crypto.hpp.
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "algorithm.hpp"
#include "base64url.hpp"
#include "header.hpp"

namespace jose {

/**
 * @brief Output of a JWE encryption
 */
struct JWECryptoParts {
  /// Absent for direct encryption and direct key agreement
  std::optional<Base64URL> encryptedKey;
  std::optional<Base64URL> iv;
  Base64URL cipherText;
  std::optional<Base64URL> authTag;
};

/**
 * @brief Algorithms and header parameters a JWS verifier accepts
 */
class JWSHeaderFilter {
 public:
  /**
   * @param acceptedAlgorithms Algorithms to accept
   * @param acceptedParameters Header parameter names to accept,
   * std::nullopt to accept any
   */
  explicit JWSHeaderFilter(
      AlgorithmFamily<JWSAlgorithm> acceptedAlgorithms,
      std::optional<std::vector<std::string>> acceptedParameters = std::nullopt)
      : algs_(std::move(acceptedAlgorithms)),
        params_(std::move(acceptedParameters)) {}

  /// Accept the given algorithms with any header parameter
  static JWSHeaderFilter acceptAll(AlgorithmFamily<JWSAlgorithm> algs) {
    return JWSHeaderFilter(std::move(algs));
  }

  /// Accept the given algorithms with registered header parameters only
  static JWSHeaderFilter registeredOnly(AlgorithmFamily<JWSAlgorithm> algs) {
    return JWSHeaderFilter(std::move(algs),
                           JWSHeader::registeredParameterNames());
  }

  [[nodiscard]] const AlgorithmFamily<JWSAlgorithm>& acceptedAlgorithms()
      const noexcept {
    return algs_;
  }
  [[nodiscard]] const std::optional<std::vector<std::string>>&
  acceptedParameters() const noexcept {
    return params_;
  }

  [[nodiscard]] bool acceptsAlgorithm(const Algorithm& alg) const noexcept {
    return algs_.contains(alg);
  }

  [[nodiscard]] bool acceptsParameter(std::string_view name) const noexcept {
    if (!params_) return true;
    for (const auto& accepted : *params_) {
      if (accepted == name) return true;
    }
    return false;
  }

 private:
  AlgorithmFamily<JWSAlgorithm> algs_;
  std::optional<std::vector<std::string>> params_;
};

/**
 * @brief Algorithms, encryption methods and header parameters a JWE
 * decrypter accepts
 */
class JWEHeaderFilter {
 public:
  JWEHeaderFilter(
      AlgorithmFamily<JWEAlgorithm> acceptedAlgorithms,
      AlgorithmFamily<EncryptionMethod> acceptedEncryptionMethods,
      std::optional<std::vector<std::string>> acceptedParameters = std::nullopt)
      : algs_(std::move(acceptedAlgorithms)),
        encs_(std::move(acceptedEncryptionMethods)),
        params_(std::move(acceptedParameters)) {}

  static JWEHeaderFilter acceptAll(AlgorithmFamily<JWEAlgorithm> algs,
                                   AlgorithmFamily<EncryptionMethod> encs) {
    return JWEHeaderFilter(std::move(algs), std::move(encs));
  }

  [[nodiscard]] const AlgorithmFamily<JWEAlgorithm>& acceptedAlgorithms()
      const noexcept {
    return algs_;
  }
  [[nodiscard]] const AlgorithmFamily<EncryptionMethod>&
  acceptedEncryptionMethods() const noexcept {
    return encs_;
  }

  [[nodiscard]] bool acceptsAlgorithm(const Algorithm& alg) const noexcept {
    return algs_.contains(alg);
  }

  [[nodiscard]] bool acceptsEncryptionMethod(
      const EncryptionMethod& enc) const noexcept {
    return encs_.contains(enc);
  }

  [[nodiscard]] bool acceptsParameter(std::string_view name) const noexcept {
    if (!params_) return true;
    for (const auto& accepted : *params_) {
      if (accepted == name) return true;
    }
    return false;
  }

 private:
  AlgorithmFamily<JWEAlgorithm> algs_;
  AlgorithmFamily<EncryptionMethod> encs_;
  std::optional<std::vector<std::string>> params_;
};

/**
 * @brief Checks the "crit" header parameter against the names a verifier or
 * decrypter leaves to the application.
 *
 * A header passes when it has no "crit" or when every listed name is
 * deferred. The deferred names are typically checked by the caller after a
 * successful verification.
 */
class CriticalHeaderParamsChecker {
 public:
  CriticalHeaderParamsChecker() = default;
  explicit CriticalHeaderParamsChecker(std::vector<std::string> deferred)
      : deferred_(std::move(deferred)) {}

  [[nodiscard]] const std::vector<std::string>& deferredParams()
      const noexcept {
    return deferred_;
  }

  [[nodiscard]] bool headerPasses(const Header& header) const {
    const auto& crit = header.criticalParams();
    if (!crit) {
      return true;
    }
    return std::all_of(
        crit->begin(), crit->end(), [this](const std::string& name) {
          return std::find(deferred_.begin(), deferred_.end(), name) !=
                 deferred_.end();
        });
  }

 private:
  std::vector<std::string> deferred_;
};

/**
 * @brief Computes JWS signatures
 */
class JWSSigner {
 public:
  virtual ~JWSSigner() = default;

  [[nodiscard]] virtual AlgorithmFamily<JWSAlgorithm> supportedAlgorithms()
      const = 0;

  /**
   * @param header Header of the object being signed
   * @param signingInput ASCII(BASE64URL(header) || '.' || BASE64URL(payload))
   * @return The signature
   */
  virtual Base64URL sign(const JWSHeader& header,
                         std::span<const uint8_t> signingInput) const = 0;
};

/**
 * @brief Checks JWS signatures
 */
class JWSVerifier {
 public:
  virtual ~JWSVerifier() = default;

  [[nodiscard]] virtual AlgorithmFamily<JWSAlgorithm> supportedAlgorithms()
      const = 0;

  /**
   * @brief Optional filter applied to the header before verification
   * @return The filter, nullptr to accept any supported header
   */
  [[nodiscard]] virtual const JWSHeaderFilter* headerFilter() const {
    return nullptr;
  }

  /**
   * @return Whether the signature is valid, a wrong signature is not an
   * error
   */
  virtual bool verify(const JWSHeader& header,
                      std::span<const uint8_t> signingInput,
                      const Base64URL& signature) const = 0;
};

/**
 * @brief Encrypts JWE payloads
 */
class JWEEncrypter {
 public:
  virtual ~JWEEncrypter() = default;

  [[nodiscard]] virtual AlgorithmFamily<JWEAlgorithm> supportedAlgorithms()
      const = 0;
  [[nodiscard]] virtual AlgorithmFamily<EncryptionMethod>
  supportedEncryptionMethods() const = 0;

  virtual JWECryptoParts encrypt(const JWEHeader& header,
                                 std::span<const uint8_t> clearText) const = 0;
};

/**
 * @brief Decrypts JWE cipher text
 */
class JWEDecrypter {
 public:
  virtual ~JWEDecrypter() = default;

  [[nodiscard]] virtual AlgorithmFamily<JWEAlgorithm> supportedAlgorithms()
      const = 0;
  [[nodiscard]] virtual AlgorithmFamily<EncryptionMethod>
  supportedEncryptionMethods() const = 0;

  [[nodiscard]] virtual const JWEHeaderFilter* headerFilter() const {
    return nullptr;
  }

  /**
   * @return The recovered plaintext
   * @throws CryptoError if the cipher text cannot be authenticated
   */
  virtual std::vector<uint8_t> decrypt(
      const JWEHeader& header, const std::optional<Base64URL>& encryptedKey,
      const std::optional<Base64URL>& iv, const Base64URL& cipherText,
      const std::optional<Base64URL>& authTag) const = 0;
};

}  // namespace jose
