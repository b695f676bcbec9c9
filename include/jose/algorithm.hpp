/**
 * @file algorithm.hpp
 * @brief Open-ended named values: algorithms, encryption methods, key types
 * and curves
 *
 * Every value type here follows the same pattern: a closed table of
 * well-known constants plus unlimited ad-hoc extension by name. Equality
 * and hashing are on the name only, so independently constructed values
 * compare equal to the registered constants.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace jose {

/**
 * @brief Implementation requirement of an algorithm or key type as set by
 * RFC 7518 (JWA)
 */
enum class Requirement { REQUIRED, RECOMMENDED, OPTIONAL };

/**
 * @brief Base algorithm value
 */
class Algorithm {
 public:
  /**
   * @brief Construct an algorithm value
   * @param name Algorithm name, must not be empty
   * @param requirement Implementation requirement, unset for ad-hoc names
   * @throws InvalidArgumentError if the name is empty
   */
  explicit Algorithm(std::string name,
                     std::optional<Requirement> requirement = std::nullopt);

  [[nodiscard]] const std::string& name() const noexcept { return name_; }

  [[nodiscard]] std::optional<Requirement> requirement() const noexcept {
    return requirement_;
  }

  [[nodiscard]] const std::string& toString() const noexcept { return name_; }

  bool operator==(const Algorithm& other) const noexcept {
    return name_ == other.name_;
  }

  /// No algorithm, for unsecured (plain) objects
  static const Algorithm NONE;

 private:
  std::string name_;
  std::optional<Requirement> requirement_;
};

/**
 * @brief Immutable ordered set of algorithms of one kind
 */
template <typename T>
class AlgorithmFamily {
 public:
  AlgorithmFamily() = default;
  AlgorithmFamily(std::initializer_list<T> algs) {
    for (const auto& alg : algs) {
      if (!contains(alg)) algs_.push_back(alg);
    }
  }

  [[nodiscard]] bool contains(const Algorithm& alg) const noexcept {
    for (const auto& member : algs_) {
      if (member == alg) return true;
    }
    return false;
  }

  /**
   * @brief Union with another family
   */
  [[nodiscard]] AlgorithmFamily with(const AlgorithmFamily& other) const {
    AlgorithmFamily result = *this;
    for (const auto& alg : other.algs_) {
      if (!result.contains(alg)) result.algs_.push_back(alg);
    }
    return result;
  }

  [[nodiscard]] size_t size() const noexcept { return algs_.size(); }
  [[nodiscard]] bool empty() const noexcept { return algs_.empty(); }
  auto begin() const noexcept { return algs_.begin(); }
  auto end() const noexcept { return algs_.end(); }

 private:
  std::vector<T> algs_;
};

/**
 * @brief JSON Web Signature algorithm ("alg" of a JWS header)
 */
class JWSAlgorithm : public Algorithm {
 public:
  using Algorithm::Algorithm;

  static const JWSAlgorithm HS256;
  static const JWSAlgorithm HS384;
  static const JWSAlgorithm HS512;
  static const JWSAlgorithm RS256;
  static const JWSAlgorithm RS384;
  static const JWSAlgorithm RS512;
  static const JWSAlgorithm ES256;
  static const JWSAlgorithm ES384;
  static const JWSAlgorithm ES512;
  static const JWSAlgorithm PS256;
  static const JWSAlgorithm PS384;
  static const JWSAlgorithm PS512;

  struct Family {
    static const AlgorithmFamily<JWSAlgorithm> HMAC_SHA;
    /// RSASSA-PKCS1-v1_5 and RSASSA-PSS
    static const AlgorithmFamily<JWSAlgorithm> RSA;
    static const AlgorithmFamily<JWSAlgorithm> EC;
    static const AlgorithmFamily<JWSAlgorithm> SIGNATURE;
  };

  /**
   * @brief Registered constant for a known name, ad-hoc value otherwise
   */
  static JWSAlgorithm parse(std::string_view name);
};

/**
 * @brief JSON Web Encryption key management algorithm ("alg" of a JWE header)
 */
class JWEAlgorithm : public Algorithm {
 public:
  using Algorithm::Algorithm;

  static const JWEAlgorithm RSA1_5;
  static const JWEAlgorithm RSA_OAEP;
  static const JWEAlgorithm RSA_OAEP_256;
  static const JWEAlgorithm A128KW;
  static const JWEAlgorithm A192KW;
  static const JWEAlgorithm A256KW;
  static const JWEAlgorithm DIR;
  static const JWEAlgorithm ECDH_ES;
  static const JWEAlgorithm ECDH_ES_A128KW;
  static const JWEAlgorithm ECDH_ES_A192KW;
  static const JWEAlgorithm ECDH_ES_A256KW;
  static const JWEAlgorithm A128GCMKW;
  static const JWEAlgorithm A192GCMKW;
  static const JWEAlgorithm A256GCMKW;
  static const JWEAlgorithm PBES2_HS256_A128KW;
  static const JWEAlgorithm PBES2_HS384_A192KW;
  static const JWEAlgorithm PBES2_HS512_A256KW;

  struct Family {
    static const AlgorithmFamily<JWEAlgorithm> RSA;
    static const AlgorithmFamily<JWEAlgorithm> AES_KW;
    static const AlgorithmFamily<JWEAlgorithm> ECDH_ES;
    static const AlgorithmFamily<JWEAlgorithm> AES_GCM_KW;
    static const AlgorithmFamily<JWEAlgorithm> PBES2;
  };

  static JWEAlgorithm parse(std::string_view name);
};

/**
 * @brief Content encryption method ("enc" of a JWE header)
 */
class EncryptionMethod : public Algorithm {
 public:
  /**
   * @param name Method name
   * @param requirement Implementation requirement
   * @param cekBitLength Content encryption key length, 0 if not known
   */
  explicit EncryptionMethod(std::string name,
                            std::optional<Requirement> requirement = std::nullopt,
                            size_t cekBitLength = 0);

  /**
   * @brief Required content encryption key length in bits, 0 if not known
   */
  [[nodiscard]] size_t cekBitLength() const noexcept { return cek_bit_length_; }

  static const EncryptionMethod A128CBC_HS256;
  static const EncryptionMethod A192CBC_HS384;
  static const EncryptionMethod A256CBC_HS512;
  static const EncryptionMethod A128GCM;
  static const EncryptionMethod A192GCM;
  static const EncryptionMethod A256GCM;

  struct Family {
    static const AlgorithmFamily<EncryptionMethod> AES_CBC_HMAC_SHA;
    static const AlgorithmFamily<EncryptionMethod> AES_GCM;
  };

  static EncryptionMethod parse(std::string_view name);

 private:
  size_t cek_bit_length_;
};

/**
 * @brief Payload compression algorithm ("zip" of a JWE header)
 */
class CompressionAlgorithm : public Algorithm {
 public:
  using Algorithm::Algorithm;

  /// DEFLATE (RFC 1951)
  static const CompressionAlgorithm DEF;

  static CompressionAlgorithm parse(std::string_view name);
};

/**
 * @brief JWK key type ("kty"), the key family discriminator
 */
class KeyType : public Algorithm {
 public:
  using Algorithm::Algorithm;

  static const KeyType EC;
  static const KeyType RSA;
  static const KeyType OCT;

  static KeyType parse(std::string_view name);
};

/**
 * @brief Elliptic curve name ("crv")
 */
class Curve {
 public:
  /**
   * @param name JOSE curve name, e.g. "P-256"
   * @param stdName SEC / OpenSSL curve name, e.g. "prime256v1"
   * @param bitSize Field size in bits, 0 if not known
   * @throws InvalidArgumentError if the name is empty
   */
  explicit Curve(std::string name, std::string stdName = {},
                 size_t bitSize = 0);

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const std::string& stdName() const noexcept {
    return std_name_;
  }
  [[nodiscard]] size_t bitSize() const noexcept { return bit_size_; }
  [[nodiscard]] const std::string& toString() const noexcept { return name_; }

  bool operator==(const Curve& other) const noexcept {
    return name_ == other.name_;
  }

  static const Curve P_256;
  static const Curve P_384;
  static const Curve P_521;

  static Curve parse(std::string_view name);

  /**
   * @brief Look up a well-known curve by its standard name
   */
  static std::optional<Curve> forStdName(std::string_view stdName);

 private:
  std::string name_;
  std::string std_name_;
  size_t bit_size_;
};

/**
 * @brief Media type of a JOSE object ("typ")
 */
class JOSEObjectType {
 public:
  explicit JOSEObjectType(std::string type);

  [[nodiscard]] const std::string& type() const noexcept { return type_; }
  [[nodiscard]] const std::string& toString() const noexcept { return type_; }

  bool operator==(const JOSEObjectType& other) const noexcept {
    return type_ == other.type_;
  }

  static const JOSEObjectType JOSE;
  static const JOSEObjectType JOSE_JSON;
  static const JOSEObjectType JWT;

 private:
  std::string type_;
};

}  // namespace jose

namespace std {
template <>
struct hash<jose::Algorithm> {
  size_t operator()(const jose::Algorithm& alg) const noexcept {
    return hash<string>{}(alg.name());
  }
};

template <>
struct hash<jose::Curve> {
  size_t operator()(const jose::Curve& crv) const noexcept {
    return hash<string>{}(crv.name());
  }
};
}  // namespace std
