/**
 * @file jwk.cpp
 * @brief Implementation of the JWK data model
 */

#include "jose/jwk.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <utility>

#include "jose/logging.hpp"

namespace jose {

namespace {

constexpr std::array<std::pair<KeyOperation, std::string_view>, 8>
    kKeyOperationNames = {{
        {KeyOperation::SIGN, "sign"},
        {KeyOperation::VERIFY, "verify"},
        {KeyOperation::ENCRYPT, "encrypt"},
        {KeyOperation::DECRYPT, "decrypt"},
        {KeyOperation::WRAP_KEY, "wrapKey"},
        {KeyOperation::UNWRAP_KEY, "unwrapKey"},
        {KeyOperation::DERIVE_KEY, "deriveKey"},
        {KeyOperation::DERIVE_BITS, "deriveBits"},
    }};

void validateMetadata(const KeyMetadata& metadata) {
  if (metadata.ops) {
    const auto& ops = *metadata.ops;
    for (auto it = ops.begin(); it != ops.end(); ++it) {
      if (std::find(std::next(it), ops.end(), *it) != ops.end()) {
        throw InvalidArgumentError("Duplicate key operation " +
                                   std::string(toIdentifier(*it)));
      }
    }
    if (metadata.use && !isConsistent(*metadata.use, ops)) {
      throw InvalidArgumentError(
          "The key use \"" + std::string(toIdentifier(*metadata.use)) +
          "\" and key operations are not consistent");
    }
  }
  if (metadata.kid && metadata.kid->empty()) {
    throw InvalidArgumentError("The key ID must not be empty");
  }
  if (metadata.x5u && !json_utils::isAbsoluteURI(*metadata.x5u)) {
    throw InvalidArgumentError("The X.509 certificate URL must be absolute");
  }
  if (metadata.x5c && metadata.x5c->empty()) {
    throw InvalidArgumentError(
        "The X.509 certificate chain must not be empty");
  }
}

void requireNotEmpty(const Base64URL& value, std::string_view name) {
  if (value.empty()) {
    throw InvalidArgumentError("The \"" + std::string(name) +
                               "\" member must not be empty");
  }
}

/**
 * Runs a builder and reports its argument errors as parse errors, since
 * for parsed input they describe malformed JSON, not API misuse.
 */
template <typename Fn>
auto buildParsed(Fn&& build) {
  try {
    return build();
  } catch (const InvalidArgumentError& e) {
    throw ParseError(e.what());
  }
}

void requireKeyType(const json& object, const KeyType& expected) {
  std::string kty = json_utils::getString(object, "kty");
  if (kty != expected.name()) {
    throw ParseError("The key type \"kty\" must be " + expected.name());
  }
}

std::optional<Base64URL> optionalMember(const json& object,
                                        std::string_view name) {
  return json_utils::getOptionalBase64URL(object, name);
}

void putOptional(json& object, const char* name,
                 const std::optional<Base64URL>& value) {
  if (value) {
    object[name] = value->toString();
  }
}

}  // namespace

std::string_view toIdentifier(KeyUse use) noexcept {
  switch (use) {
    case KeyUse::SIGNATURE:
      return "sig";
    case KeyUse::ENCRYPTION:
      return "enc";
  }
  return "";
}

std::string_view toIdentifier(KeyOperation op) noexcept {
  for (const auto& [value, name] : kKeyOperationNames) {
    if (value == op) return name;
  }
  return "";
}

KeyUse parseKeyUse(std::string_view identifier) {
  if (identifier == "sig") return KeyUse::SIGNATURE;
  if (identifier == "enc") return KeyUse::ENCRYPTION;
  throw ParseError("Invalid JWK use: " + std::string(identifier));
}

KeyOperation parseKeyOperation(std::string_view identifier) {
  for (const auto& [value, name] : kKeyOperationNames) {
    if (name == identifier) return value;
  }
  throw ParseError("Invalid JWK operation: " + std::string(identifier));
}

bool isConsistent(KeyUse use, const std::vector<KeyOperation>& ops) noexcept {
  return std::all_of(ops.begin(), ops.end(), [use](KeyOperation op) {
    bool signing = op == KeyOperation::SIGN || op == KeyOperation::VERIFY;
    return use == KeyUse::SIGNATURE ? signing : !signing;
  });
}

// JWKBase

JWKBase::JWKBase(KeyType kty, KeyMetadata metadata)
    : kty_(std::move(kty)), metadata_(std::move(metadata)) {}

json JWKBase::commonJSONObject() const {
  json object = json::object();
  object["kty"] = kty_.name();
  if (metadata_.use) {
    object["use"] = std::string(toIdentifier(*metadata_.use));
  }
  if (metadata_.ops) {
    json ops = json::array();
    for (KeyOperation op : *metadata_.ops) {
      ops.push_back(std::string(toIdentifier(op)));
    }
    object["key_ops"] = std::move(ops);
  }
  if (metadata_.alg) object["alg"] = metadata_.alg->name();
  if (metadata_.kid) object["kid"] = *metadata_.kid;
  if (metadata_.x5u) object["x5u"] = *metadata_.x5u;
  putOptional(object, "x5t", metadata_.x5t);
  if (metadata_.x5c) {
    json chain = json::array();
    for (const auto& cert : *metadata_.x5c) {
      chain.push_back(cert.toString());
    }
    object["x5c"] = std::move(chain);
  }
  return object;
}

KeyMetadata JWKBase::parseMetadata(const json& object) {
  KeyMetadata metadata;
  if (auto use = json_utils::getOptionalString(object, "use")) {
    metadata.use = parseKeyUse(*use);
  }
  if (object.contains("key_ops")) {
    std::vector<KeyOperation> ops;
    for (const auto& name : json_utils::getStringArray(object, "key_ops")) {
      ops.push_back(parseKeyOperation(name));
    }
    metadata.ops = std::move(ops);
  }
  if (auto alg = json_utils::getOptionalString(object, "alg")) {
    if (alg->empty()) {
      throw ParseError("The JWK algorithm \"alg\" must not be empty");
    }
    metadata.alg = Algorithm(std::move(*alg));
  }
  metadata.kid = json_utils::getOptionalString(object, "kid");
  metadata.x5u = json_utils::getOptionalURI(object, "x5u");
  metadata.x5t = json_utils::getOptionalBase64URL(object, "x5t");
  if (object.contains("x5c")) {
    std::vector<Base64> chain;
    for (auto& cert : json_utils::getStringArray(object, "x5c")) {
      try {
        chain.emplace_back(std::move(cert));
      } catch (const InvalidBase64Error&) {
        throw ParseError(
            "JSON object member with key \"x5c\" is not an array of Base64 "
            "strings");
      }
    }
    metadata.x5c = std::move(chain);
  }
  return metadata;
}

// ECKey

ECKey::Builder::Builder(Curve crv, Base64URL x, Base64URL y)
    : crv_(std::move(crv)), x_(std::move(x)), y_(std::move(y)) {}

ECKey::Builder& ECKey::Builder::d(Base64URL d) {
  d_ = std::move(d);
  return *this;
}

ECKey ECKey::Builder::build() const {
  requireNotEmpty(x_, "x");
  requireNotEmpty(y_, "y");
  if (d_) requireNotEmpty(*d_, "d");
  validateMetadata(metadata_);
  return ECKey(crv_, x_, y_, d_, metadata_);
}

ECKey::ECKey(Curve crv, Base64URL x, Base64URL y, std::optional<Base64URL> d,
             KeyMetadata metadata)
    : JWKBase(KeyType::EC, std::move(metadata)),
      crv_(std::move(crv)),
      x_(std::move(x)),
      y_(std::move(y)),
      d_(std::move(d)) {}

size_t ECKey::size() const {
  if (crv_.bitSize() != 0) {
    return crv_.bitSize();
  }
  return x_.decode().size() * 8;
}

ECKey ECKey::toPublicJWK() const {
  return ECKey(crv_, x_, y_, std::nullopt, metadata());
}

json ECKey::toJSONObject() const {
  json object = commonJSONObject();
  object["crv"] = crv_.name();
  object["x"] = x_.toString();
  object["y"] = y_.toString();
  putOptional(object, "d", d_);
  return object;
}

ECKey ECKey::fromJSONObject(const json& object) {
  requireKeyType(object, KeyType::EC);
  return buildParsed([&] {
    // An empty "crv" is rejected by the Curve constructor
    Builder builder(Curve::parse(json_utils::getString(object, "crv")),
                    json_utils::getBase64URL(object, "x"),
                    json_utils::getBase64URL(object, "y"));
    if (auto d = optionalMember(object, "d")) {
      builder.d(std::move(*d));
    }
    builder.metadata(parseMetadata(object));
    return builder.build();
  });
}

ECKey ECKey::parse(std::string_view text) {
  return fromJSONObject(json_utils::parseJSONObject(text));
}

// RSAKey

RSAKey::Builder::Builder(Base64URL n, Base64URL e)
    : n_(std::move(n)), e_(std::move(e)) {}

RSAKey::Builder& RSAKey::Builder::privateExponent(Base64URL d) {
  d_ = std::move(d);
  return *this;
}

RSAKey::Builder& RSAKey::Builder::firstPrimeFactor(Base64URL p) {
  p_ = std::move(p);
  return *this;
}

RSAKey::Builder& RSAKey::Builder::secondPrimeFactor(Base64URL q) {
  q_ = std::move(q);
  return *this;
}

RSAKey::Builder& RSAKey::Builder::firstFactorCRTExponent(Base64URL dp) {
  dp_ = std::move(dp);
  return *this;
}

RSAKey::Builder& RSAKey::Builder::secondFactorCRTExponent(Base64URL dq) {
  dq_ = std::move(dq);
  return *this;
}

RSAKey::Builder& RSAKey::Builder::firstCRTCoefficient(Base64URL qi) {
  qi_ = std::move(qi);
  return *this;
}

RSAKey::Builder& RSAKey::Builder::otherPrimes(
    std::vector<OtherPrimesInfo> oth) {
  oth_ = std::move(oth);
  return *this;
}

RSAKey RSAKey::Builder::build() const {
  requireNotEmpty(n_, "n");
  requireNotEmpty(e_, "e");

  // The second private key representation is all or nothing
  int crt_members = static_cast<int>(p_.has_value()) + q_.has_value() +
                    dp_.has_value() + dq_.has_value() + qi_.has_value();
  if (crt_members != 0 && crt_members != 5) {
    throw InvalidArgumentError(
        "Incomplete RSA private key, \"p\", \"q\", \"dp\", \"dq\" and \"qi\" "
        "must be specified together");
  }
  if (crt_members == 5 && !d_) {
    throw InvalidArgumentError(
        "The RSA private exponent \"d\" is required with the prime factors");
  }
  if (oth_ && crt_members == 0) {
    throw InvalidArgumentError(
        "The \"oth\" member requires the first and second prime factors");
  }
  validateMetadata(metadata_);
  return RSAKey(*this, metadata_);
}

RSAKey::RSAKey(const Builder& builder, KeyMetadata metadata)
    : JWKBase(KeyType::RSA, std::move(metadata)),
      n_(builder.n_),
      e_(builder.e_),
      d_(builder.d_),
      p_(builder.p_),
      q_(builder.q_),
      dp_(builder.dp_),
      dq_(builder.dq_),
      qi_(builder.qi_),
      oth_(builder.oth_) {}

size_t RSAKey::size() const {
  std::vector<uint8_t> modulus = n_.decode();
  auto first = std::find_if(modulus.begin(), modulus.end(),
                            [](uint8_t b) { return b != 0; });
  if (first == modulus.end()) {
    return 0;
  }
  size_t remaining = static_cast<size_t>(modulus.end() - first);
  return (remaining - 1) * 8 + static_cast<size_t>(std::bit_width(*first));
}

RSAKey RSAKey::toPublicJWK() const {
  return Builder(n_, e_).metadata(metadata()).build();
}

json RSAKey::toJSONObject() const {
  json object = commonJSONObject();
  object["n"] = n_.toString();
  object["e"] = e_.toString();
  putOptional(object, "d", d_);
  putOptional(object, "p", p_);
  putOptional(object, "q", q_);
  putOptional(object, "dp", dp_);
  putOptional(object, "dq", dq_);
  putOptional(object, "qi", qi_);
  if (oth_) {
    json primes = json::array();
    for (const auto& prime : *oth_) {
      json info = json::object();
      info["r"] = prime.r.toString();
      info["d"] = prime.d.toString();
      info["t"] = prime.t.toString();
      primes.push_back(std::move(info));
    }
    object["oth"] = std::move(primes);
  }
  return object;
}

RSAKey RSAKey::fromJSONObject(const json& object) {
  requireKeyType(object, KeyType::RSA);
  Builder builder(json_utils::getBase64URL(object, "n"),
                  json_utils::getBase64URL(object, "e"));
  if (auto d = optionalMember(object, "d")) builder.privateExponent(*d);
  if (auto p = optionalMember(object, "p")) builder.firstPrimeFactor(*p);
  if (auto q = optionalMember(object, "q")) builder.secondPrimeFactor(*q);
  if (auto dp = optionalMember(object, "dp")) {
    builder.firstFactorCRTExponent(*dp);
  }
  if (auto dq = optionalMember(object, "dq")) {
    builder.secondFactorCRTExponent(*dq);
  }
  if (auto qi = optionalMember(object, "qi")) builder.firstCRTCoefficient(*qi);

  if (object.contains("oth")) {
    std::vector<OtherPrimesInfo> primes;
    for (const auto& item : json_utils::getJSONArray(object, "oth")) {
      if (!item.is_object()) {
        throw ParseError(
            "JSON object member with key \"oth\" must be an array of objects");
      }
      primes.push_back({json_utils::getBase64URL(item, "r"),
                        json_utils::getBase64URL(item, "d"),
                        json_utils::getBase64URL(item, "t")});
    }
    builder.otherPrimes(std::move(primes));
  }
  builder.metadata(parseMetadata(object));
  return buildParsed([&] { return builder.build(); });
}

RSAKey RSAKey::parse(std::string_view text) {
  return fromJSONObject(json_utils::parseJSONObject(text));
}

// OctetSequenceKey

OctetSequenceKey::Builder::Builder(SecureBytes k) : k_(std::move(k)) {}

OctetSequenceKey::Builder::Builder(const Base64URL& k) {
  std::vector<uint8_t> bytes = k.decode();
  k_ = secure_utils::to_secure_vector(bytes);
  std::fill(bytes.begin(), bytes.end(), uint8_t{0});
}

OctetSequenceKey OctetSequenceKey::Builder::build() const {
  if (k_.empty()) {
    throw InvalidArgumentError("The \"k\" member must not be empty");
  }
  validateMetadata(metadata_);
  return OctetSequenceKey(k_, metadata_);
}

OctetSequenceKey::OctetSequenceKey(SecureBytes k, KeyMetadata metadata)
    : JWKBase(KeyType::OCT, std::move(metadata)), k_(std::move(k)) {}

Base64URL OctetSequenceKey::keyValue() const { return Base64URL::encode(k_); }

json OctetSequenceKey::toJSONObject() const {
  json object = commonJSONObject();
  object["k"] = keyValue().toString();
  return object;
}

OctetSequenceKey OctetSequenceKey::fromJSONObject(const json& object) {
  requireKeyType(object, KeyType::OCT);
  Builder builder(json_utils::getBase64URL(object, "k"));
  builder.metadata(parseMetadata(object));
  return buildParsed([&] { return builder.build(); });
}

OctetSequenceKey OctetSequenceKey::parse(std::string_view text) {
  return fromJSONObject(json_utils::parseJSONObject(text));
}

// JWK

namespace {

KeyKind keyKind(const ECKey&) noexcept { return KeyKind::EC; }
KeyKind keyKind(const RSAKey&) noexcept { return KeyKind::RSA; }
KeyKind keyKind(const OctetSequenceKey&) noexcept { return KeyKind::OCT; }

}  // namespace

KeyKind JWK::kind() const noexcept {
  return std::visit([](const auto& key) { return keyKind(key); }, key_);
}

const JWKBase& JWK::common() const noexcept {
  return std::visit([](const auto& key) -> const JWKBase& { return key; },
                    key_);
}

bool JWK::isPrivate() const noexcept {
  return std::visit([](const auto& key) { return key.isPrivate(); }, key_);
}

size_t JWK::size() const {
  return std::visit([](const auto& key) { return key.size(); }, key_);
}

std::optional<JWK> JWK::toPublicJWK() const {
  switch (kind()) {
    case KeyKind::EC:
      return JWK(std::get<ECKey>(key_).toPublicJWK());
    case KeyKind::RSA:
      return JWK(std::get<RSAKey>(key_).toPublicJWK());
    case KeyKind::OCT:
      break;
  }
  return std::nullopt;
}

json JWK::toJSONObject() const {
  return std::visit([](const auto& key) { return key.toJSONObject(); }, key_);
}

std::string JWK::toJSONString() const {
  return json_utils::toString(toJSONObject());
}

JWK JWK::fromJSONObject(const json& object) {
  KeyType kty = [&] {
    try {
      return KeyType::parse(json_utils::getString(object, "kty"));
    } catch (const InvalidArgumentError&) {
      throw ParseError("The key type \"kty\" must not be empty");
    }
  }();
  JOSE_LOG_TRACE("Parsing JWK with key type {}", kty.name());

  if (kty == KeyType::EC) return ECKey::fromJSONObject(object);
  if (kty == KeyType::RSA) return RSAKey::fromJSONObject(object);
  if (kty == KeyType::OCT) return OctetSequenceKey::fromJSONObject(object);
  throw ParseError("Unsupported key type \"kty\": " + kty.name());
}

JWK JWK::parse(std::string_view text) {
  return fromJSONObject(json_utils::parseJSONObject(text));
}

}  // namespace jose
