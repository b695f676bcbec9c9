/**
 * @file jwk_set.cpp
 * @brief Implementation of JWK sets, the key matcher and selector
 */

#include "jose/jwk_set.hpp"

#include <algorithm>

#include "jose/logging.hpp"

namespace jose {

namespace {

template <typename T>
bool contains(const std::vector<std::optional<T>>& values,
              const std::optional<T>& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

template <typename T>
bool satisfies(const JWKMatcher::Criterion<T>& criterion,
               const std::optional<T>& value) {
  return !criterion || contains(*criterion, value);
}

template <typename T>
JWKMatcher::Criterion<T> single(T value) {
  return std::vector<std::optional<T>>{std::optional<T>(std::move(value))};
}

}  // namespace

// JWKSet

JWKSet::JWKSet(std::vector<JWK> keys, json additionalMembers)
    : keys_(std::move(keys)), additional_members_(std::move(additionalMembers)) {
  if (!additional_members_.is_object()) {
    throw InvalidArgumentError("Additional JWK set members must be an object");
  }
  if (additional_members_.contains("keys")) {
    throw InvalidArgumentError(
        "The \"keys\" member cannot be an additional member");
  }
}

const JWK* JWKSet::keyByKeyId(std::string_view kid) const noexcept {
  for (const auto& key : keys_) {
    if (key.keyID() && *key.keyID() == kid) {
      return &key;
    }
  }
  return nullptr;
}

JWKSet JWKSet::toPublicJWKSet() const {
  std::vector<JWK> public_keys;
  for (const auto& key : keys_) {
    if (auto public_key = key.toPublicJWK()) {
      public_keys.push_back(std::move(*public_key));
    }
  }
  return JWKSet(std::move(public_keys), additional_members_);
}

json JWKSet::toJSONObject(bool publicKeysOnly) const {
  json object = json::object();
  json keys = json::array();
  for (const auto& key : keys_) {
    if (!publicKeysOnly) {
      keys.push_back(key.toJSONObject());
    } else if (auto public_key = key.toPublicJWK()) {
      keys.push_back(public_key->toJSONObject());
    }
  }
  object["keys"] = std::move(keys);
  for (const auto& [name, value] : additional_members_.items()) {
    object[name] = value;
  }
  return object;
}

std::string JWKSet::toString(bool publicKeysOnly) const {
  return json_utils::toString(toJSONObject(publicKeysOnly));
}

JWKSet JWKSet::fromJSONObject(const json& object) {
  const json& entries = json_utils::getJSONArray(object, "keys");

  std::vector<JWK> keys;
  keys.reserve(entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    if (!entries[i].is_object()) {
      throw ParseError("The \"keys\" JSON array must contain JSON objects");
    }
    try {
      keys.push_back(JWK::fromJSONObject(entries[i]));
    } catch (const ParseError& e) {
      throw ParseError("Invalid JWK at position " + std::to_string(i) + ": " +
                       e.what());
    }
  }

  json additional = json::object();
  for (const auto& [name, value] : object.items()) {
    if (name != "keys") {
      additional[name] = value;
    }
  }
  JOSE_LOG_DEBUG("Parsed JWK set with {} keys", keys.size());
  return JWKSet(std::move(keys), std::move(additional));
}

JWKSet JWKSet::parse(std::string_view text) {
  return fromJSONObject(json_utils::parseJSONObject(text));
}

// JWKMatcher::Builder

JWKMatcher::Builder& JWKMatcher::Builder::keyType(KeyType kty) {
  types_ = single(std::move(kty));
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::keyTypes(
    std::vector<std::optional<KeyType>> types) {
  types_ = std::move(types);
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::keyUse(KeyUse use) {
  uses_ = single(use);
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::keyUses(
    std::vector<std::optional<KeyUse>> uses) {
  uses_ = std::move(uses);
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::keyOperation(KeyOperation op) {
  ops_ = single(op);
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::keyOperations(
    std::vector<std::optional<KeyOperation>> ops) {
  ops_ = std::move(ops);
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::algorithm(Algorithm alg) {
  algs_ = single(std::move(alg));
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::algorithms(
    std::vector<std::optional<Algorithm>> algs) {
  algs_ = std::move(algs);
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::keyID(std::string kid) {
  ids_ = single(std::move(kid));
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::keyIDs(
    std::vector<std::optional<std::string>> ids) {
  ids_ = std::move(ids);
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::curve(Curve crv) {
  curves_ = single(std::move(crv));
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::curves(
    std::vector<std::optional<Curve>> crvs) {
  curves_ = std::move(crvs);
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::privateOnly(bool privateOnly) {
  private_only_ = privateOnly;
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::publicOnly(bool publicOnly) {
  public_only_ = publicOnly;
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::minKeySize(size_t bits) {
  min_size_bits_ = bits;
  return *this;
}

JWKMatcher::Builder& JWKMatcher::Builder::maxKeySize(size_t bits) {
  max_size_bits_ = bits;
  return *this;
}

JWKMatcher JWKMatcher::Builder::build() const { return JWKMatcher(*this); }

// JWKMatcher

JWKMatcher::JWKMatcher(const Builder& builder)
    : types_(builder.types_),
      uses_(builder.uses_),
      ops_(builder.ops_),
      algs_(builder.algs_),
      ids_(builder.ids_),
      curves_(builder.curves_),
      private_only_(builder.private_only_),
      public_only_(builder.public_only_),
      min_size_bits_(builder.min_size_bits_),
      max_size_bits_(builder.max_size_bits_) {}

bool JWKMatcher::matches(const JWK& key) const {
  if (private_only_ && !key.isPrivate()) return false;
  if (public_only_ && key.isPrivate()) return false;

  if (!satisfies(types_, std::optional<KeyType>(key.keyType()))) return false;
  if (!satisfies(uses_, key.keyUse())) return false;

  if (ops_) {
    const auto& key_ops = key.keyOperations();
    if (!key_ops) {
      if (!contains(*ops_, std::optional<KeyOperation>())) return false;
    } else {
      for (KeyOperation op : *key_ops) {
        if (!contains(*ops_, std::optional<KeyOperation>(op))) return false;
      }
    }
  }

  if (!satisfies(algs_, key.algorithm())) return false;
  if (!satisfies(ids_, key.keyID())) return false;

  if (curves_) {
    std::optional<Curve> crv;
    if (key.is<ECKey>()) {
      crv = key.get<ECKey>().curve();
    }
    if (!contains(*curves_, crv)) return false;
  }

  if (min_size_bits_ > 0 && key.size() < min_size_bits_) return false;
  if (max_size_bits_ > 0 && key.size() > max_size_bits_) return false;

  return true;
}

// JWKSelector

std::vector<JWK> JWKSelector::select(const JWKSet& jwkSet) const {
  std::vector<JWK> selected;
  for (const auto& key : jwkSet.keys()) {
    if (matcher_.matches(key)) {
      selected.push_back(key);
    }
  }
  JOSE_LOG_DEBUG("Selected {} of {} keys", selected.size(),
                 jwkSet.keys().size());
  return selected;
}

}  // namespace jose
