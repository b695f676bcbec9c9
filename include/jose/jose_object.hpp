/**
 * @file jose_object.hpp
 * @brief Unsecured, signed and encrypted JOSE objects and their compact
 * serialization
 *
 * Compact forms:
 *   unsecured  BASE64URL(header) '.' BASE64URL(payload) '.'
 *   JWS        BASE64URL(header) '.' BASE64URL(payload) '.' BASE64URL(sig)
 *   JWE        BASE64URL(header) '.' BASE64URL(encrypted key) '.'
 *              BASE64URL(iv) '.' BASE64URL(cipher text) '.' BASE64URL(tag)
 *
 * The JWE encrypted key, IV and tag segments may be empty.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "base64url.hpp"
#include "crypto.hpp"
#include "header.hpp"
#include "payload.hpp"

namespace jose {

/**
 * @brief Split a compact serialization into its Base64URL parts.
 *
 * Two dots yield the three parts of an unsecured or JWS object, four dots
 * the five parts of a JWE object.
 *
 * @throws ParseError naming the missing or extra delimiter, or
 * InvalidBase64Error for a part outside the base64url alphabet
 */
std::vector<Base64URL> split(std::string_view s);

/**
 * @brief Payload and parsed-part bookkeeping shared by the object kinds
 */
class JOSEObjectBase {
 public:
  /**
   * @brief The parts this object was parsed from, std::nullopt if it was
   * created locally
   */
  [[nodiscard]] const std::optional<std::vector<Base64URL>>& parsedParts()
      const noexcept {
    return parsed_parts_;
  }

  /**
   * @brief The exact compact string this object was parsed from
   */
  [[nodiscard]] std::optional<std::string> parsedString() const;

 protected:
  JOSEObjectBase() = default;
  explicit JOSEObjectBase(std::optional<Payload> payload)
      : payload_(std::move(payload)) {}

  void setParsedParts(std::vector<Base64URL> parts) {
    parsed_parts_ = std::move(parts);
  }

  std::optional<Payload> payload_;

 private:
  std::optional<std::vector<Base64URL>> parsed_parts_;
};

/**
 * @brief Unsecured JOSE object
 */
class PlainObject : public JOSEObjectBase {
 public:
  explicit PlainObject(Payload payload);
  PlainObject(PlainHeader header, Payload payload);

  /**
   * @brief Object from parsed parts
   * @throws ParseError if the header is not an unsecured header
   */
  PlainObject(const Base64URL& firstPart, const Base64URL& secondPart);

  [[nodiscard]] const PlainHeader& header() const noexcept { return header_; }
  [[nodiscard]] const Payload& payload() const noexcept { return *payload_; }

  /**
   * @brief Compact serialization, the third part is always empty
   */
  [[nodiscard]] std::string serialize() const;

  /**
   * @throws ParseError if the string is not a compact unsecured object
   */
  static PlainObject parse(std::string_view s);

 private:
  PlainHeader header_;
};

/**
 * @brief JSON Web Signature object.
 *
 * Lifecycle UNSIGNED -> SIGNED -> VALIDATED. A parsed object starts SIGNED:
 * parsing does not establish authenticity.
 */
class JWSObject : public JOSEObjectBase {
 public:
  enum class State { UNSIGNED, SIGNED, VALIDATED };

  JWSObject(JWSHeader header, Payload payload);

  /**
   * @brief Signed object from parsed parts, the signing input is taken
   * from the first two parts as given
   * @throws ParseError if the header is not a JWS header
   */
  JWSObject(const Base64URL& firstPart, const Base64URL& secondPart,
            const Base64URL& thirdPart);

  [[nodiscard]] const JWSHeader& header() const noexcept { return header_; }
  [[nodiscard]] const Payload& payload() const noexcept { return *payload_; }
  [[nodiscard]] State state() const noexcept { return state_; }
  [[nodiscard]] const std::optional<Base64URL>& signature() const noexcept {
    return signature_;
  }

  /**
   * @brief ASCII(BASE64URL(header) '.' BASE64URL(payload))
   */
  [[nodiscard]] const std::vector<uint8_t>& signingInput() const noexcept {
    return signing_input_;
  }

  /**
   * @throws InvalidStateError unless UNSIGNED
   * @throws AlgorithmNotSupportedError if the signer does not support the
   * header algorithm
   * @throws CryptoError if the signer fails
   */
  void sign(const JWSSigner& signer);

  /**
   * @brief Check the signature, may be repeated
   * @return true and VALIDATED if the signature is good, false without a
   * state change otherwise
   * @throws InvalidStateError if UNSIGNED
   * @throws AlgorithmNotAcceptedError or ParamsNotAcceptedError if the
   * verifier's header filter rejects the header
   */
  bool validate(const JWSVerifier& verifier);

  /**
   * @throws InvalidStateError unless SIGNED or VALIDATED
   */
  [[nodiscard]] std::string serialize() const;

  static JWSObject parse(std::string_view s);

 private:
  JWSHeader header_;
  std::vector<uint8_t> signing_input_;
  std::optional<Base64URL> signature_;
  State state_;
};

/**
 * @brief JSON Web Encryption object.
 *
 * Lifecycle UNENCRYPTED -> ENCRYPTED -> DECRYPTED. A parsed object starts
 * ENCRYPTED and can be decrypted once.
 */
class JWEObject : public JOSEObjectBase {
 public:
  enum class State { UNENCRYPTED, ENCRYPTED, DECRYPTED };

  JWEObject(JWEHeader header, Payload payload);

  /**
   * @brief Encrypted object from the five parsed parts, empty encrypted
   * key, IV and tag parts are treated as absent
   */
  JWEObject(const Base64URL& firstPart, const Base64URL& secondPart,
            const Base64URL& thirdPart, const Base64URL& fourthPart,
            const Base64URL& fifthPart);

  [[nodiscard]] const JWEHeader& header() const noexcept { return header_; }

  /**
   * @brief The plaintext, absent for a parsed object until decrypted
   */
  [[nodiscard]] const std::optional<Payload>& payload() const noexcept {
    return payload_;
  }
  [[nodiscard]] State state() const noexcept { return state_; }

  [[nodiscard]] const std::optional<Base64URL>& encryptedKey() const noexcept {
    return encrypted_key_;
  }
  [[nodiscard]] const std::optional<Base64URL>& iv() const noexcept {
    return iv_;
  }
  [[nodiscard]] const std::optional<Base64URL>& cipherText() const noexcept {
    return cipher_text_;
  }
  [[nodiscard]] const std::optional<Base64URL>& authTag() const noexcept {
    return auth_tag_;
  }

  /**
   * @throws InvalidStateError unless UNENCRYPTED
   * @throws AlgorithmNotSupportedError if the encrypter does not support
   * the header algorithm or encryption method
   */
  void encrypt(const JWEEncrypter& encrypter);

  /**
   * @brief Decrypt and replace the payload with the plaintext
   * @throws InvalidStateError unless ENCRYPTED
   * @throws AlgorithmNotAcceptedError or ParamsNotAcceptedError if the
   * decrypter's header filter rejects the header
   */
  void decrypt(const JWEDecrypter& decrypter);

  /**
   * @throws InvalidStateError unless ENCRYPTED or DECRYPTED
   */
  [[nodiscard]] std::string serialize() const;

  static JWEObject parse(std::string_view s);

 private:
  JWEHeader header_;
  std::optional<Base64URL> encrypted_key_;
  std::optional<Base64URL> iv_;
  std::optional<Base64URL> cipher_text_;
  std::optional<Base64URL> auth_tag_;
  State state_;
};

/**
 * @brief A JOSE object of any kind
 */
using JOSEObject = std::variant<PlainObject, JWSObject, JWEObject>;

/**
 * @brief Parse a compact serialization, dispatching on the header kind
 * @throws ParseError if the string is not a compact JOSE object
 */
JOSEObject parseJOSEObject(std::string_view s);

[[nodiscard]] HeaderKind kindOf(const JOSEObject& object) noexcept;

}  // namespace jose
