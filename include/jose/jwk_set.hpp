/**
 * @file jwk_set.hpp
 * @brief JWK sets and the multi-criteria key matcher used to pick keys
 * during rotation
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "algorithm.hpp"
#include "json_utils.hpp"
#include "jwk.hpp"

namespace jose {

/**
 * @brief Ordered collection of keys, RFC 7517 section 5
 */
class JWKSet {
 public:
  static constexpr std::string_view MIME_TYPE =
      "application/jwk-set+json; charset=UTF-8";

  JWKSet() = default;

  /**
   * @param keys Keys in selection order
   * @param additionalMembers Top-level members other than "keys"
   * @throws InvalidArgumentError if additionalMembers is not an object or
   * has a "keys" member
   */
  explicit JWKSet(std::vector<JWK> keys,
                  json additionalMembers = json::object());

  [[nodiscard]] const std::vector<JWK>& keys() const noexcept { return keys_; }

  [[nodiscard]] const json& additionalMembers() const noexcept {
    return additional_members_;
  }

  /**
   * @brief First key with the given "kid"
   * @return The key, nullptr if there is none
   */
  [[nodiscard]] const JWK* keyByKeyId(std::string_view kid) const noexcept;

  /**
   * @brief Set of the public projections, symmetric keys are left out
   */
  [[nodiscard]] JWKSet toPublicJWKSet() const;

  /**
   * @param publicKeysOnly Emit only public projections, leaving out keys
   * without one
   */
  [[nodiscard]] json toJSONObject(bool publicKeysOnly = true) const;

  [[nodiscard]] std::string toString(bool publicKeysOnly = true) const;

  /**
   * @throws ParseError if "keys" is missing, not an array of objects, or an
   * entry is not a valid key
   */
  static JWKSet fromJSONObject(const json& object);
  static JWKSet parse(std::string_view text);

 private:
  std::vector<JWK> keys_;
  json additional_members_ = json::object();
};

/**
 * @brief Conjunction of optional key criteria.
 *
 * Every set criterion holds optional values: std::nullopt in the set stands
 * for "unspecified" and matches keys lacking that attribute. A criterion
 * that was never set does not constrain the selection.
 */
class JWKMatcher {
 public:
  template <typename T>
  using Criterion = std::optional<std::vector<std::optional<T>>>;

  class Builder {
   public:
    Builder& keyType(KeyType kty);
    Builder& keyTypes(std::vector<std::optional<KeyType>> types);

    Builder& keyUse(KeyUse use);
    Builder& keyUses(std::vector<std::optional<KeyUse>> uses);

    Builder& keyOperation(KeyOperation op);
    Builder& keyOperations(std::vector<std::optional<KeyOperation>> ops);

    Builder& algorithm(Algorithm alg);
    Builder& algorithms(std::vector<std::optional<Algorithm>> algs);

    Builder& keyID(std::string kid);
    Builder& keyIDs(std::vector<std::optional<std::string>> ids);

    /// Symmetric and RSA keys have no curve and count as unspecified
    Builder& curve(Curve crv);
    Builder& curves(std::vector<std::optional<Curve>> crvs);

    Builder& privateOnly(bool privateOnly);
    Builder& publicOnly(bool publicOnly);

    /// Minimum key size in bits, 0 for no bound
    Builder& minKeySize(size_t bits);
    /// Maximum key size in bits, 0 for no bound
    Builder& maxKeySize(size_t bits);

    JWKMatcher build() const;

   private:
    friend class JWKMatcher;

    Criterion<KeyType> types_;
    Criterion<KeyUse> uses_;
    Criterion<KeyOperation> ops_;
    Criterion<Algorithm> algs_;
    Criterion<std::string> ids_;
    Criterion<Curve> curves_;
    bool private_only_ = false;
    bool public_only_ = false;
    size_t min_size_bits_ = 0;
    size_t max_size_bits_ = 0;
  };

  [[nodiscard]] const Criterion<KeyType>& keyTypes() const noexcept {
    return types_;
  }
  [[nodiscard]] const Criterion<KeyUse>& keyUses() const noexcept {
    return uses_;
  }
  [[nodiscard]] const Criterion<KeyOperation>& keyOperations() const noexcept {
    return ops_;
  }
  [[nodiscard]] const Criterion<Algorithm>& algorithms() const noexcept {
    return algs_;
  }
  [[nodiscard]] const Criterion<std::string>& keyIDs() const noexcept {
    return ids_;
  }
  [[nodiscard]] const Criterion<Curve>& curves() const noexcept {
    return curves_;
  }
  [[nodiscard]] bool isPrivateOnly() const noexcept { return private_only_; }
  [[nodiscard]] bool isPublicOnly() const noexcept { return public_only_; }
  [[nodiscard]] size_t minKeySize() const noexcept { return min_size_bits_; }
  [[nodiscard]] size_t maxKeySize() const noexcept { return max_size_bits_; }

  /**
   * @brief Whether the key satisfies every criterion that is set
   */
  [[nodiscard]] bool matches(const JWK& key) const;

 private:
  explicit JWKMatcher(const Builder& builder);

  Criterion<KeyType> types_;
  Criterion<KeyUse> uses_;
  Criterion<KeyOperation> ops_;
  Criterion<Algorithm> algs_;
  Criterion<std::string> ids_;
  Criterion<Curve> curves_;
  bool private_only_;
  bool public_only_;
  size_t min_size_bits_;
  size_t max_size_bits_;
};

/**
 * @brief Selects the keys of a set that satisfy a matcher
 */
class JWKSelector {
 public:
  explicit JWKSelector(JWKMatcher matcher) : matcher_(std::move(matcher)) {}

  [[nodiscard]] const JWKMatcher& matcher() const noexcept { return matcher_; }

  /**
   * @brief Matching keys in set order, empty if none match
   */
  [[nodiscard]] std::vector<JWK> select(const JWKSet& jwkSet) const;

 private:
  JWKMatcher matcher_;
};

}  // namespace jose
