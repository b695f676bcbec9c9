/**
 * @file header.hpp
 * @brief JOSE header model: unsecured, JWS and JWE headers
 *
 * Headers are immutable values built by a Builder. A header parsed from a
 * Base64URL segment keeps that segment and re-emits it unchanged, so the
 * signing input and JWE additional authenticated data of a parsed object
 * are reproduced byte for byte.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "algorithm.hpp"
#include "base64url.hpp"
#include "error.hpp"
#include "json_utils.hpp"
#include "jwk.hpp"

namespace jose {

/**
 * @brief Header (and object) variant discriminator
 */
enum class HeaderKind { PLAIN, JWS, JWE };

/// Parameters common to all headers
struct HeaderParams {
  std::optional<JOSEObjectType> typ;
  std::optional<std::string> cty;
  std::optional<std::vector<std::string>> crit;
  /// Custom parameters, always a JSON object
  json custom = json::object();
  std::optional<Base64URL> parsed;
};

/// Key identification parameters shared by JWS and JWE headers
struct CommonSEParams {
  std::optional<std::string> jku;
  std::optional<JWK> jwk;
  std::optional<std::string> x5u;
  std::optional<Base64URL> x5t;
  std::optional<std::vector<Base64>> x5c;
  std::optional<std::string> kid;
};

/// Key agreement and key wrapping parameters of JWE headers
struct JWEParams {
  std::optional<JWK> epk;
  std::optional<CompressionAlgorithm> zip;
  std::optional<Base64URL> apu;
  std::optional<Base64URL> apv;
  std::optional<Base64URL> p2s;
  std::optional<int64_t> p2c;
  std::optional<Base64URL> iv;
  std::optional<Base64URL> tag;
  std::optional<std::string> kdf;
  /// Integrity algorithm of the older key derivation drafts
  std::optional<JWSAlgorithm> ia;
};

/**
 * @brief Data and accessors common to every header kind
 */
class Header {
 public:
  [[nodiscard]] const Algorithm& algorithm() const noexcept { return alg_; }

  [[nodiscard]] const std::optional<JOSEObjectType>& type() const noexcept {
    return params_.typ;
  }
  [[nodiscard]] const std::optional<std::string>& contentType() const noexcept {
    return params_.cty;
  }
  [[nodiscard]] const std::optional<std::vector<std::string>>& criticalParams()
      const noexcept {
    return params_.crit;
  }

  /// All custom parameters as a JSON object
  [[nodiscard]] const json& customParams() const noexcept {
    return params_.custom;
  }

  /**
   * @return The custom parameter value, nullptr if not present
   */
  [[nodiscard]] const json* customParam(std::string_view name) const;

  /**
   * @brief The segment this header was parsed from, if any
   */
  [[nodiscard]] const std::optional<Base64URL>& parsedBase64URL()
      const noexcept {
    return params_.parsed;
  }

 protected:
  Header(Algorithm alg, HeaderParams params);

  [[nodiscard]] const HeaderParams& headerParams() const noexcept {
    return params_;
  }

  void writeHeaderParams(json& object) const;
  void writeCustomParams(json& object) const;

  /// The parsed segment if there is one, the encoded JSON otherwise
  [[nodiscard]] Base64URL encode(const json& object) const;

 private:
  Algorithm alg_;
  HeaderParams params_;
};

/**
 * @brief Header base adding the key identification parameters of signed
 * and encrypted objects
 */
class CommonSEHeader : public Header {
 public:
  [[nodiscard]] const std::optional<std::string>& jwkURL() const noexcept {
    return se_.jku;
  }
  [[nodiscard]] const std::optional<JWK>& jwk() const noexcept {
    return se_.jwk;
  }
  [[nodiscard]] const std::optional<std::string>& x509CertURL() const noexcept {
    return se_.x5u;
  }
  [[nodiscard]] const std::optional<Base64URL>& x509CertThumbprint()
      const noexcept {
    return se_.x5t;
  }
  [[nodiscard]] const std::optional<std::vector<Base64>>& x509CertChain()
      const noexcept {
    return se_.x5c;
  }
  [[nodiscard]] const std::optional<std::string>& keyID() const noexcept {
    return se_.kid;
  }

 protected:
  CommonSEHeader(Algorithm alg, HeaderParams params, CommonSEParams se);

  void writeCommonSEParams(json& object) const;

  [[nodiscard]] const CommonSEParams& commonSEParams() const noexcept {
    return se_;
  }

 private:
  CommonSEParams se_;
};

/**
 * @brief Builder mixin for the parameters of every header kind
 */
template <typename Self>
class HeaderBuilderBase {
 public:
  Self& type(JOSEObjectType typ) {
    params_.typ = std::move(typ);
    return self();
  }
  Self& contentType(std::string cty) {
    params_.cty = std::move(cty);
    return self();
  }
  Self& criticalParams(std::vector<std::string> crit) {
    params_.crit = std::move(crit);
    return self();
  }
  /**
   * @brief Add or replace a custom parameter, registered names are
   * refused at build()
   */
  Self& customParam(const std::string& name, json value) {
    params_.custom[name] = std::move(value);
    return self();
  }
  /// Replace all custom parameters
  Self& customParams(json params) {
    params_.custom = std::move(params);
    return self();
  }
  Self& parsedBase64URL(Base64URL base64) {
    params_.parsed = std::move(base64);
    return self();
  }

 protected:
  HeaderParams params_;

  Self& self() { return static_cast<Self&>(*this); }
};

/**
 * @brief Builder mixin for the key identification parameters
 */
template <typename Self>
class CommonSEHeaderBuilder : public HeaderBuilderBase<Self> {
 public:
  Self& jwkURL(std::string jku) {
    se_.jku = std::move(jku);
    return this->self();
  }
  /// Public key, private keys are refused at build()
  Self& jwk(JWK key) {
    se_.jwk = std::move(key);
    return this->self();
  }
  Self& x509CertURL(std::string x5u) {
    se_.x5u = std::move(x5u);
    return this->self();
  }
  Self& x509CertThumbprint(Base64URL x5t) {
    se_.x5t = std::move(x5t);
    return this->self();
  }
  Self& x509CertChain(std::vector<Base64> x5c) {
    se_.x5c = std::move(x5c);
    return this->self();
  }
  Self& keyID(std::string kid) {
    se_.kid = std::move(kid);
    return this->self();
  }

 protected:
  CommonSEParams se_;
};

/**
 * @brief Header of an unsecured object, the algorithm is always "none"
 */
class PlainHeader : public Header {
 public:
  class Builder : public HeaderBuilderBase<Builder> {
   public:
    Builder() = default;
    /// Start from the parameters of an existing header
    explicit Builder(const PlainHeader& header);

    /**
     * @throws InvalidArgumentError if a custom parameter uses a registered
     * name
     */
    PlainHeader build() const;
  };

  PlainHeader() : PlainHeader(HeaderParams{}) {}

  static const std::vector<std::string>& registeredParameterNames();

  /// Names of all present parameters, registered and custom
  [[nodiscard]] std::vector<std::string> includedParameters() const;

  [[nodiscard]] json toJSONObject() const;
  [[nodiscard]] std::string toString() const;
  [[nodiscard]] Base64URL toBase64URL() const;

  /**
   * @throws ParseError if "alg" is not "none" or a parameter is mistyped
   */
  static PlainHeader fromJSONObject(
      const json& object, std::optional<Base64URL> parsed = std::nullopt);
  static PlainHeader parse(std::string_view text);
  static PlainHeader parse(const Base64URL& base64);

 private:
  explicit PlainHeader(HeaderParams params);
};

/**
 * @brief JSON Web Signature header
 */
class JWSHeader : public CommonSEHeader {
 public:
  class Builder : public CommonSEHeaderBuilder<Builder> {
   public:
    explicit Builder(JWSAlgorithm alg);
    explicit Builder(const JWSHeader& header);

    /**
     * @throws InvalidArgumentError if the algorithm is "none", a custom
     * parameter uses a registered name, a URL is not absolute or the JWK is
     * private
     */
    JWSHeader build() const;

   private:
    JWSAlgorithm alg_;
  };

  [[nodiscard]] const JWSAlgorithm& algorithm() const noexcept { return alg_; }

  static const std::vector<std::string>& registeredParameterNames();

  [[nodiscard]] std::vector<std::string> includedParameters() const;

  [[nodiscard]] json toJSONObject() const;
  [[nodiscard]] std::string toString() const;
  [[nodiscard]] Base64URL toBase64URL() const;

  static JWSHeader fromJSONObject(
      const json& object, std::optional<Base64URL> parsed = std::nullopt);
  static JWSHeader parse(std::string_view text);
  static JWSHeader parse(const Base64URL& base64);

 private:
  JWSHeader(JWSAlgorithm alg, HeaderParams params, CommonSEParams se);

  JWSAlgorithm alg_;
};

/**
 * @brief JSON Web Encryption header
 */
class JWEHeader : public CommonSEHeader {
 public:
  class Builder : public CommonSEHeaderBuilder<Builder> {
   public:
    Builder(JWEAlgorithm alg, EncryptionMethod enc);
    explicit Builder(const JWEHeader& header);

    /// Ephemeral public key
    Builder& ephemeralPublicKey(JWK epk);
    Builder& compressionAlgorithm(CompressionAlgorithm zip);
    Builder& agreementPartyUInfo(Base64URL apu);
    Builder& agreementPartyVInfo(Base64URL apv);
    Builder& pbes2Salt(Base64URL p2s);
    Builder& pbes2Count(int64_t p2c);
    Builder& iv(Base64URL iv);
    Builder& authTag(Base64URL tag);
    Builder& keyDerivationFunction(std::string kdf);
    Builder& integrityAlgorithm(JWSAlgorithm ia);

    /**
     * @throws InvalidArgumentError if the algorithm is "none", the PBES2
     * count is negative or any check of JWSHeader::Builder::build() fails
     */
    JWEHeader build() const;

   private:
    JWEAlgorithm alg_;
    EncryptionMethod enc_;
    JWEParams jwe_;
  };

  [[nodiscard]] const JWEAlgorithm& algorithm() const noexcept { return alg_; }
  [[nodiscard]] const EncryptionMethod& encryptionMethod() const noexcept {
    return enc_;
  }
  [[nodiscard]] const std::optional<JWK>& ephemeralPublicKey() const noexcept {
    return jwe_.epk;
  }
  [[nodiscard]] const std::optional<CompressionAlgorithm>&
  compressionAlgorithm() const noexcept {
    return jwe_.zip;
  }
  [[nodiscard]] const std::optional<Base64URL>& agreementPartyUInfo()
      const noexcept {
    return jwe_.apu;
  }
  [[nodiscard]] const std::optional<Base64URL>& agreementPartyVInfo()
      const noexcept {
    return jwe_.apv;
  }
  [[nodiscard]] const std::optional<Base64URL>& pbes2Salt() const noexcept {
    return jwe_.p2s;
  }
  [[nodiscard]] const std::optional<int64_t>& pbes2Count() const noexcept {
    return jwe_.p2c;
  }
  [[nodiscard]] const std::optional<Base64URL>& iv() const noexcept {
    return jwe_.iv;
  }
  [[nodiscard]] const std::optional<Base64URL>& authTag() const noexcept {
    return jwe_.tag;
  }
  [[nodiscard]] const std::optional<std::string>& keyDerivationFunction()
      const noexcept {
    return jwe_.kdf;
  }
  [[nodiscard]] const std::optional<JWSAlgorithm>& integrityAlgorithm()
      const noexcept {
    return jwe_.ia;
  }

  static const std::vector<std::string>& registeredParameterNames();

  [[nodiscard]] std::vector<std::string> includedParameters() const;

  [[nodiscard]] json toJSONObject() const;
  [[nodiscard]] std::string toString() const;
  [[nodiscard]] Base64URL toBase64URL() const;

  /**
   * @throws ParseError if "enc" is missing or a parameter is mistyped
   */
  static JWEHeader fromJSONObject(
      const json& object, std::optional<Base64URL> parsed = std::nullopt);
  static JWEHeader parse(std::string_view text);
  static JWEHeader parse(const Base64URL& base64);

 private:
  JWEHeader(JWEAlgorithm alg, EncryptionMethod enc, HeaderParams params,
            CommonSEParams se, JWEParams jwe);

  JWEAlgorithm alg_;
  EncryptionMethod enc_;
  JWEParams jwe_;
};

/**
 * @brief A header of any kind
 */
using AnyHeader = std::variant<PlainHeader, JWSHeader, JWEHeader>;

/**
 * @brief Infer the header kind from a header JSON object.
 *
 * "alg" = "none" is an unsecured header, otherwise the presence of "enc"
 * selects a JWE header and its absence a JWS header.
 *
 * @throws ParseError if "alg" is missing or not a string
 */
HeaderKind inferHeaderKind(const json& object);

/**
 * @brief Read "alg" typed after the inferred header kind
 * @return Algorithm::NONE, a JWEAlgorithm or a JWSAlgorithm
 * @throws ParseError if "alg" is missing, empty or not a string
 */
Algorithm parseAlgorithm(const json& object);

/**
 * @brief Parse a header of any kind, dispatching on the inferred kind
 */
AnyHeader parseHeader(const json& object,
                      std::optional<Base64URL> parsed = std::nullopt);
AnyHeader parseHeader(const Base64URL& base64);

[[nodiscard]] HeaderKind kindOf(const AnyHeader& header) noexcept;

/// Access the parameters common to every header kind
[[nodiscard]] const Header& asHeader(const AnyHeader& header) noexcept;

}  // namespace jose
