/**
 * @file jwk.hpp
 * @brief JSON Web Key (JWK) data model, RFC 7517 and RFC 7518 section 6
 *
 * Keys are immutable values. Each key family (EC, RSA, oct) has its own
 * class with a Builder that validates once at build(); the JWK class is
 * the closed union of the three families used wherever the family is not
 * known statically (parsing, key sets, selection).
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "algorithm.hpp"
#include "base64url.hpp"
#include "error.hpp"
#include "json_utils.hpp"
#include "secure_vector.hpp"

namespace jose {

/**
 * @brief Key family discriminator of the JWK union
 */
enum class KeyKind { EC, RSA, OCT };

/**
 * @brief Intended use of a public key ("use")
 */
enum class KeyUse { SIGNATURE, ENCRYPTION };

/**
 * @brief Permitted key operation ("key_ops")
 */
enum class KeyOperation {
  SIGN,
  VERIFY,
  ENCRYPT,
  DECRYPT,
  WRAP_KEY,
  UNWRAP_KEY,
  DERIVE_KEY,
  DERIVE_BITS
};

/// "sig" or "enc"
std::string_view toIdentifier(KeyUse use) noexcept;

/// "sign", "verify", "encrypt", "decrypt", "wrapKey", ...
std::string_view toIdentifier(KeyOperation op) noexcept;

/**
 * @throws ParseError on an unknown identifier
 */
KeyUse parseKeyUse(std::string_view identifier);

/**
 * @throws ParseError on an unknown identifier
 */
KeyOperation parseKeyOperation(std::string_view identifier);

/**
 * @brief Whether a "use" value and a "key_ops" list may appear together.
 *
 * "sig" admits only sign and verify, "enc" admits the remaining six
 * operations.
 */
bool isConsistent(KeyUse use, const std::vector<KeyOperation>& ops) noexcept;

/**
 * @brief Metadata members common to every key family
 */
struct KeyMetadata {
  std::optional<KeyUse> use;
  std::optional<std::vector<KeyOperation>> ops;
  std::optional<Algorithm> alg;
  std::optional<std::string> kid;
  std::optional<std::string> x5u;
  std::optional<Base64URL> x5t;
  std::optional<std::vector<Base64>> x5c;
};

/**
 * @brief Common base of the key families, holds "kty" and the metadata
 */
class JWKBase {
 public:
  [[nodiscard]] const KeyType& keyType() const noexcept { return kty_; }
  [[nodiscard]] const std::optional<KeyUse>& keyUse() const noexcept {
    return metadata_.use;
  }
  [[nodiscard]] const std::optional<std::vector<KeyOperation>>&
  keyOperations() const noexcept {
    return metadata_.ops;
  }
  [[nodiscard]] const std::optional<Algorithm>& algorithm() const noexcept {
    return metadata_.alg;
  }
  [[nodiscard]] const std::optional<std::string>& keyID() const noexcept {
    return metadata_.kid;
  }
  [[nodiscard]] const std::optional<std::string>& x509CertURL() const noexcept {
    return metadata_.x5u;
  }
  [[nodiscard]] const std::optional<Base64URL>& x509CertThumbprint()
      const noexcept {
    return metadata_.x5t;
  }
  [[nodiscard]] const std::optional<std::vector<Base64>>& x509CertChain()
      const noexcept {
    return metadata_.x5c;
  }
  [[nodiscard]] const KeyMetadata& metadata() const noexcept {
    return metadata_;
  }

 protected:
  JWKBase(KeyType kty, KeyMetadata metadata);

  /// Writes "kty" followed by the present metadata members
  [[nodiscard]] json commonJSONObject() const;

  static KeyMetadata parseMetadata(const json& object);

 private:
  KeyType kty_;
  KeyMetadata metadata_;
};

/**
 * @brief Builder mixin for the metadata members shared by all key families
 */
template <typename Self>
class KeyBuilderBase {
 public:
  Self& keyUse(KeyUse use) {
    metadata_.use = use;
    return self();
  }
  Self& keyOperations(std::vector<KeyOperation> ops) {
    metadata_.ops = std::move(ops);
    return self();
  }
  Self& algorithm(Algorithm alg) {
    metadata_.alg = std::move(alg);
    return self();
  }
  Self& keyID(std::string kid) {
    metadata_.kid = std::move(kid);
    return self();
  }
  Self& x509CertURL(std::string url) {
    metadata_.x5u = std::move(url);
    return self();
  }
  Self& x509CertThumbprint(Base64URL thumbprint) {
    metadata_.x5t = std::move(thumbprint);
    return self();
  }
  Self& x509CertChain(std::vector<Base64> chain) {
    metadata_.x5c = std::move(chain);
    return self();
  }
  /// Replace all metadata members at once
  Self& metadata(KeyMetadata metadata) {
    metadata_ = std::move(metadata);
    return self();
  }

 protected:
  KeyMetadata metadata_;

 private:
  Self& self() { return static_cast<Self&>(*this); }
};

/**
 * @brief Elliptic curve key, public or private
 */
class ECKey : public JWKBase {
 public:
  class Builder : public KeyBuilderBase<Builder> {
   public:
    Builder(Curve crv, Base64URL x, Base64URL y);

    /// Private key component
    Builder& d(Base64URL d);

    /**
     * @throws InvalidArgumentError on empty coordinates or inconsistent
     * metadata
     */
    ECKey build() const;

   private:
    Curve crv_;
    Base64URL x_;
    Base64URL y_;
    std::optional<Base64URL> d_;
  };

  [[nodiscard]] const Curve& curve() const noexcept { return crv_; }
  [[nodiscard]] const Base64URL& x() const noexcept { return x_; }
  [[nodiscard]] const Base64URL& y() const noexcept { return y_; }
  [[nodiscard]] const std::optional<Base64URL>& d() const noexcept {
    return d_;
  }

  [[nodiscard]] bool isPrivate() const noexcept { return d_.has_value(); }

  /**
   * @brief Curve size in bits, coordinate length for unregistered curves
   */
  [[nodiscard]] size_t size() const;

  /**
   * @brief Copy without the private component
   */
  [[nodiscard]] ECKey toPublicJWK() const;

  [[nodiscard]] json toJSONObject() const;

  /**
   * @throws ParseError if "kty" is not "EC" or a mandatory member is missing
   */
  static ECKey fromJSONObject(const json& object);
  static ECKey parse(std::string_view text);

 private:
  ECKey(Curve crv, Base64URL x, Base64URL y, std::optional<Base64URL> d,
        KeyMetadata metadata);

  Curve crv_;
  Base64URL x_;
  Base64URL y_;
  std::optional<Base64URL> d_;
};

/**
 * @brief RSA key, public or private in either representation of
 * RFC 7518 section 6.3.2
 */
class RSAKey : public JWKBase {
 public:
  /**
   * @brief Additional prime for multi-prime keys ("oth" member)
   */
  struct OtherPrimesInfo {
    Base64URL r;
    Base64URL d;
    Base64URL t;

    bool operator==(const OtherPrimesInfo&) const = default;
  };

  class Builder : public KeyBuilderBase<Builder> {
   public:
    /// Modulus and public exponent
    Builder(Base64URL n, Base64URL e);

    Builder& privateExponent(Base64URL d);
    Builder& firstPrimeFactor(Base64URL p);
    Builder& secondPrimeFactor(Base64URL q);
    Builder& firstFactorCRTExponent(Base64URL dp);
    Builder& secondFactorCRTExponent(Base64URL dq);
    Builder& firstCRTCoefficient(Base64URL qi);
    Builder& otherPrimes(std::vector<OtherPrimesInfo> oth);

    /**
     * @throws InvalidArgumentError if the CRT members are only partially
     * present, "oth" is given without them, or the metadata is inconsistent
     */
    RSAKey build() const;

   private:
    friend class RSAKey;

    Base64URL n_;
    Base64URL e_;
    std::optional<Base64URL> d_;
    std::optional<Base64URL> p_;
    std::optional<Base64URL> q_;
    std::optional<Base64URL> dp_;
    std::optional<Base64URL> dq_;
    std::optional<Base64URL> qi_;
    std::optional<std::vector<OtherPrimesInfo>> oth_;
  };

  [[nodiscard]] const Base64URL& modulus() const noexcept { return n_; }
  [[nodiscard]] const Base64URL& publicExponent() const noexcept { return e_; }
  [[nodiscard]] const std::optional<Base64URL>& privateExponent()
      const noexcept {
    return d_;
  }
  [[nodiscard]] const std::optional<Base64URL>& firstPrimeFactor()
      const noexcept {
    return p_;
  }
  [[nodiscard]] const std::optional<Base64URL>& secondPrimeFactor()
      const noexcept {
    return q_;
  }
  [[nodiscard]] const std::optional<Base64URL>& firstFactorCRTExponent()
      const noexcept {
    return dp_;
  }
  [[nodiscard]] const std::optional<Base64URL>& secondFactorCRTExponent()
      const noexcept {
    return dq_;
  }
  [[nodiscard]] const std::optional<Base64URL>& firstCRTCoefficient()
      const noexcept {
    return qi_;
  }
  [[nodiscard]] const std::optional<std::vector<OtherPrimesInfo>>&
  otherPrimes() const noexcept {
    return oth_;
  }

  [[nodiscard]] bool isPrivate() const noexcept {
    return d_.has_value() || p_.has_value();
  }

  /**
   * @brief Modulus size in bits
   */
  [[nodiscard]] size_t size() const;

  [[nodiscard]] RSAKey toPublicJWK() const;

  [[nodiscard]] json toJSONObject() const;

  static RSAKey fromJSONObject(const json& object);
  static RSAKey parse(std::string_view text);

 private:
  RSAKey(const Builder& builder, KeyMetadata metadata);

  Base64URL n_;
  Base64URL e_;
  std::optional<Base64URL> d_;
  std::optional<Base64URL> p_;
  std::optional<Base64URL> q_;
  std::optional<Base64URL> dp_;
  std::optional<Base64URL> dq_;
  std::optional<Base64URL> qi_;
  std::optional<std::vector<OtherPrimesInfo>> oth_;
};

/**
 * @brief Symmetric key ("kty" = "oct"), the key bytes are kept in locked
 * memory
 */
class OctetSequenceKey : public JWKBase {
 public:
  class Builder : public KeyBuilderBase<Builder> {
   public:
    explicit Builder(SecureBytes k);
    explicit Builder(const Base64URL& k);

    /**
     * @throws InvalidArgumentError on an empty key or inconsistent metadata
     */
    OctetSequenceKey build() const;

   private:
    SecureBytes k_;
  };

  [[nodiscard]] const SecureBytes& toByteArray() const noexcept { return k_; }

  /// Encoded "k" member
  [[nodiscard]] Base64URL keyValue() const;

  /// Symmetric keys are always private
  [[nodiscard]] bool isPrivate() const noexcept { return true; }

  /**
   * @brief Key length in bits
   */
  [[nodiscard]] size_t size() const noexcept { return k_.size() * 8; }

  [[nodiscard]] json toJSONObject() const;

  static OctetSequenceKey fromJSONObject(const json& object);
  static OctetSequenceKey parse(std::string_view text);

 private:
  OctetSequenceKey(SecureBytes k, KeyMetadata metadata);

  SecureBytes k_;
};

/**
 * @brief A key of any family
 */
class JWK {
 public:
  using Variant = std::variant<ECKey, RSAKey, OctetSequenceKey>;

  JWK(ECKey key) : key_(std::move(key)) {}
  JWK(RSAKey key) : key_(std::move(key)) {}
  JWK(OctetSequenceKey key) : key_(std::move(key)) {}

  [[nodiscard]] KeyKind kind() const noexcept;

  [[nodiscard]] const JWKBase& common() const noexcept;

  [[nodiscard]] const KeyType& keyType() const noexcept {
    return common().keyType();
  }
  [[nodiscard]] const std::optional<KeyUse>& keyUse() const noexcept {
    return common().keyUse();
  }
  [[nodiscard]] const std::optional<std::vector<KeyOperation>>&
  keyOperations() const noexcept {
    return common().keyOperations();
  }
  [[nodiscard]] const std::optional<Algorithm>& algorithm() const noexcept {
    return common().algorithm();
  }
  [[nodiscard]] const std::optional<std::string>& keyID() const noexcept {
    return common().keyID();
  }

  [[nodiscard]] bool isPrivate() const noexcept;

  /**
   * @brief Key size in bits
   */
  [[nodiscard]] size_t size() const;

  /**
   * @brief Public projection, std::nullopt for symmetric keys which have
   * none
   */
  [[nodiscard]] std::optional<JWK> toPublicJWK() const;

  [[nodiscard]] json toJSONObject() const;
  [[nodiscard]] std::string toJSONString() const;

  template <typename T>
  [[nodiscard]] bool is() const noexcept {
    return std::holds_alternative<T>(key_);
  }

  /**
   * @brief Access the family-specific key
   * @throws KeyTypeError if the key is of another family
   */
  template <typename T>
  [[nodiscard]] const T& get() const {
    if (const T* key = std::get_if<T>(&key_)) {
      return *key;
    }
    throw KeyTypeError("Unexpected key type " + keyType().name());
  }

  [[nodiscard]] const Variant& variant() const noexcept { return key_; }

  /**
   * @brief Parse a key of any family, dispatching on "kty"
   * @throws ParseError if "kty" is missing or names an unsupported family
   */
  static JWK fromJSONObject(const json& object);
  static JWK parse(std::string_view text);

 private:
  Variant key_;
};

}  // namespace jose
