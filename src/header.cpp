/**
 * @file header.cpp
 * @brief Header parsing, validation and serialization
 */

#include "jose/header.hpp"

#include <algorithm>

#include "jose/logging.hpp"

namespace jose {

namespace {

const std::vector<std::string> kPlainParams = {"alg", "typ", "cty", "crit"};

const std::vector<std::string> kJWSParams = {"alg", "typ", "cty", "crit",
                                             "jku", "jwk", "x5u", "x5t",
                                             "x5c", "kid"};

const std::vector<std::string> kJWEParams = {
    "alg", "enc", "typ", "cty", "crit", "jku", "jwk", "x5u", "x5t", "x5c",
    "kid", "epk", "zip", "apu", "apv", "p2s", "p2c", "iv",  "tag", "kdf",
    "int"};

bool isRegistered(const std::vector<std::string>& names,
                  const std::string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

void validateHeaderParams(const HeaderParams& params,
                          const std::vector<std::string>& registered) {
  if (!params.custom.is_object()) {
    throw InvalidArgumentError("Custom header parameters must be a JSON object");
  }
  for (const auto& [name, value] : params.custom.items()) {
    if (isRegistered(registered, name)) {
      throw InvalidArgumentError("The parameter name \"" + name +
                                 "\" matches a registered name");
    }
  }
  if (params.crit && params.crit->empty()) {
    throw InvalidArgumentError(
        "The critical parameter names \"crit\" must not be empty");
  }
}

void validateCommonSEParams(const CommonSEParams& se) {
  if (se.jku && !json_utils::isAbsoluteURI(*se.jku)) {
    throw InvalidArgumentError("The JWK set URL \"jku\" must be absolute");
  }
  if (se.x5u && !json_utils::isAbsoluteURI(*se.x5u)) {
    throw InvalidArgumentError(
        "The X.509 certificate URL \"x5u\" must be absolute");
  }
  if (se.jwk && se.jwk->isPrivate()) {
    throw InvalidArgumentError("The \"jwk\" header parameter must be public");
  }
  if (se.x5c && se.x5c->empty()) {
    throw InvalidArgumentError(
        "The X.509 certificate chain \"x5c\" must not be empty");
  }
}

/**
 * Runs a header parser, reporting the builder's argument errors as parse
 * errors of the offending input.
 */
template <typename Fn>
auto parseChecked(Fn&& parse) {
  try {
    return parse();
  } catch (const InvalidArgumentError& e) {
    throw ParseError(std::string("Invalid header: ") + e.what());
  }
}

JWK parseKeyParam(const json& object, const std::string& name) {
  const json& member = json_utils::getJSONObject(object, name);
  try {
    return JWK::fromJSONObject(member);
  } catch (const ParseError& e) {
    throw ParseError("Invalid JWK in header parameter \"" + name +
                     "\": " + e.what());
  }
}

std::vector<Base64> parseCertChain(const json& object,
                                   const std::string& name) {
  std::vector<Base64> chain;
  for (auto& cert : json_utils::getStringArray(object, name)) {
    try {
      chain.emplace_back(std::move(cert));
    } catch (const InvalidBase64Error&) {
      throw ParseError("JSON object member with key \"" + name +
                       "\" is not an array of Base64 strings");
    }
  }
  return chain;
}

template <typename B>
bool parseHeaderParam(B& builder, const json& object, const std::string& name) {
  if (name == "typ") {
    builder.type(JOSEObjectType(json_utils::getString(object, name)));
  } else if (name == "cty") {
    builder.contentType(json_utils::getString(object, name));
  } else if (name == "crit") {
    builder.criticalParams(json_utils::getStringArray(object, name));
  } else {
    return false;
  }
  return true;
}

template <typename B>
bool parseCommonSEParam(B& builder, const json& object,
                        const std::string& name) {
  if (parseHeaderParam(builder, object, name)) {
    return true;
  }
  if (name == "jku") {
    builder.jwkURL(json_utils::getURI(object, name));
  } else if (name == "jwk") {
    builder.jwk(parseKeyParam(object, name));
  } else if (name == "x5u") {
    builder.x509CertURL(json_utils::getURI(object, name));
  } else if (name == "x5t") {
    builder.x509CertThumbprint(json_utils::getBase64URL(object, name));
  } else if (name == "x5c") {
    builder.x509CertChain(parseCertChain(object, name));
  } else if (name == "kid") {
    builder.keyID(json_utils::getString(object, name));
  } else {
    return false;
  }
  return true;
}

json decodeHeader(const Base64URL& base64) {
  return json_utils::parseJSONObject(base64.decodeToString());
}

std::vector<std::string> memberNames(const json& object) {
  std::vector<std::string> names;
  names.reserve(object.size());
  for (const auto& [name, value] : object.items()) {
    names.push_back(name);
  }
  return names;
}

void putOptional(json& object, const char* name,
                 const std::optional<Base64URL>& value) {
  if (value) {
    object[name] = value->toString();
  }
}

}  // namespace

// Header

Header::Header(Algorithm alg, HeaderParams params)
    : alg_(std::move(alg)), params_(std::move(params)) {}

const json* Header::customParam(std::string_view name) const {
  auto it = params_.custom.find(std::string(name));
  if (it == params_.custom.end()) {
    return nullptr;
  }
  return &*it;
}

void Header::writeHeaderParams(json& object) const {
  if (params_.typ) object["typ"] = params_.typ->type();
  if (params_.cty) object["cty"] = *params_.cty;
  if (params_.crit) object["crit"] = *params_.crit;
}

void Header::writeCustomParams(json& object) const {
  for (const auto& [name, value] : params_.custom.items()) {
    if (!object.contains(name)) {
      object[name] = value;
    }
  }
}

Base64URL Header::encode(const json& object) const {
  if (params_.parsed) {
    return *params_.parsed;
  }
  return Base64URL::encode(std::string_view(json_utils::toString(object)));
}

// CommonSEHeader

CommonSEHeader::CommonSEHeader(Algorithm alg, HeaderParams params,
                               CommonSEParams se)
    : Header(std::move(alg), std::move(params)), se_(std::move(se)) {}

void CommonSEHeader::writeCommonSEParams(json& object) const {
  if (se_.jku) object["jku"] = *se_.jku;
  if (se_.jwk) object["jwk"] = se_.jwk->toJSONObject();
  if (se_.x5u) object["x5u"] = *se_.x5u;
  putOptional(object, "x5t", se_.x5t);
  if (se_.x5c) {
    json chain = json::array();
    for (const auto& cert : *se_.x5c) {
      chain.push_back(cert.toString());
    }
    object["x5c"] = std::move(chain);
  }
  if (se_.kid) object["kid"] = *se_.kid;
}

// PlainHeader

PlainHeader::Builder::Builder(const PlainHeader& header) {
  params_ = header.headerParams();
  params_.parsed.reset();
}

PlainHeader PlainHeader::Builder::build() const {
  validateHeaderParams(params_, kPlainParams);
  return PlainHeader(params_);
}

PlainHeader::PlainHeader(HeaderParams params)
    : Header(Algorithm::NONE, std::move(params)) {}

const std::vector<std::string>& PlainHeader::registeredParameterNames() {
  return kPlainParams;
}

std::vector<std::string> PlainHeader::includedParameters() const {
  return memberNames(toJSONObject());
}

json PlainHeader::toJSONObject() const {
  json object = json::object();
  object["alg"] = algorithm().name();
  writeHeaderParams(object);
  writeCustomParams(object);
  return object;
}

std::string PlainHeader::toString() const {
  return json_utils::toString(toJSONObject());
}

Base64URL PlainHeader::toBase64URL() const { return encode(toJSONObject()); }

PlainHeader PlainHeader::fromJSONObject(const json& object,
                                        std::optional<Base64URL> parsed) {
  if (inferHeaderKind(object) != HeaderKind::PLAIN) {
    throw ParseError("The algorithm \"alg\" header parameter must be \"none\"");
  }
  return parseChecked([&] {
    Builder builder;
    for (const auto& [name, value] : object.items()) {
      if (name == "alg" || parseHeaderParam(builder, object, name)) {
        continue;
      }
      builder.customParam(name, value);
    }
    if (parsed) builder.parsedBase64URL(std::move(*parsed));
    return builder.build();
  });
}

PlainHeader PlainHeader::parse(std::string_view text) {
  return fromJSONObject(json_utils::parseJSONObject(text));
}

PlainHeader PlainHeader::parse(const Base64URL& base64) {
  return fromJSONObject(decodeHeader(base64), base64);
}

// JWSHeader

JWSHeader::Builder::Builder(JWSAlgorithm alg) : alg_(std::move(alg)) {}

JWSHeader::Builder::Builder(const JWSHeader& header) : alg_(header.alg_) {
  params_ = header.headerParams();
  params_.parsed.reset();
  se_ = header.commonSEParams();
}

JWSHeader JWSHeader::Builder::build() const {
  if (alg_ == Algorithm::NONE) {
    throw InvalidArgumentError(
        "The JWS algorithm \"alg\" cannot be \"none\"");
  }
  validateHeaderParams(params_, kJWSParams);
  validateCommonSEParams(se_);
  return JWSHeader(alg_, params_, se_);
}

JWSHeader::JWSHeader(JWSAlgorithm alg, HeaderParams params,
                     CommonSEParams se)
    : CommonSEHeader(alg, std::move(params), std::move(se)),
      alg_(std::move(alg)) {}

const std::vector<std::string>& JWSHeader::registeredParameterNames() {
  return kJWSParams;
}

std::vector<std::string> JWSHeader::includedParameters() const {
  return memberNames(toJSONObject());
}

json JWSHeader::toJSONObject() const {
  json object = json::object();
  object["alg"] = alg_.name();
  writeHeaderParams(object);
  writeCommonSEParams(object);
  writeCustomParams(object);
  return object;
}

std::string JWSHeader::toString() const {
  return json_utils::toString(toJSONObject());
}

Base64URL JWSHeader::toBase64URL() const { return encode(toJSONObject()); }

JWSHeader JWSHeader::fromJSONObject(const json& object,
                                    std::optional<Base64URL> parsed) {
  if (inferHeaderKind(object) != HeaderKind::JWS) {
    throw ParseError("Not a JWS header");
  }
  return parseChecked([&] {
    Builder builder(JWSAlgorithm::parse(json_utils::getString(object, "alg")));
    for (const auto& [name, value] : object.items()) {
      if (name == "alg" || parseCommonSEParam(builder, object, name)) {
        continue;
      }
      builder.customParam(name, value);
    }
    if (parsed) builder.parsedBase64URL(std::move(*parsed));
    return builder.build();
  });
}

JWSHeader JWSHeader::parse(std::string_view text) {
  return fromJSONObject(json_utils::parseJSONObject(text));
}

JWSHeader JWSHeader::parse(const Base64URL& base64) {
  return fromJSONObject(decodeHeader(base64), base64);
}

// JWEHeader

JWEHeader::Builder::Builder(JWEAlgorithm alg, EncryptionMethod enc)
    : alg_(std::move(alg)), enc_(std::move(enc)) {}

JWEHeader::Builder::Builder(const JWEHeader& header)
    : alg_(header.alg_), enc_(header.enc_), jwe_(header.jwe_) {
  params_ = header.headerParams();
  params_.parsed.reset();
  se_ = header.commonSEParams();
}

JWEHeader::Builder& JWEHeader::Builder::ephemeralPublicKey(JWK epk) {
  jwe_.epk = std::move(epk);
  return *this;
}

JWEHeader::Builder& JWEHeader::Builder::compressionAlgorithm(
    CompressionAlgorithm zip) {
  jwe_.zip = std::move(zip);
  return *this;
}

JWEHeader::Builder& JWEHeader::Builder::agreementPartyUInfo(Base64URL apu) {
  jwe_.apu = std::move(apu);
  return *this;
}

JWEHeader::Builder& JWEHeader::Builder::agreementPartyVInfo(Base64URL apv) {
  jwe_.apv = std::move(apv);
  return *this;
}

JWEHeader::Builder& JWEHeader::Builder::pbes2Salt(Base64URL p2s) {
  jwe_.p2s = std::move(p2s);
  return *this;
}

JWEHeader::Builder& JWEHeader::Builder::pbes2Count(int64_t p2c) {
  jwe_.p2c = p2c;
  return *this;
}

JWEHeader::Builder& JWEHeader::Builder::iv(Base64URL iv) {
  jwe_.iv = std::move(iv);
  return *this;
}

JWEHeader::Builder& JWEHeader::Builder::authTag(Base64URL tag) {
  jwe_.tag = std::move(tag);
  return *this;
}

JWEHeader::Builder& JWEHeader::Builder::keyDerivationFunction(
    std::string kdf) {
  jwe_.kdf = std::move(kdf);
  return *this;
}

JWEHeader::Builder& JWEHeader::Builder::integrityAlgorithm(JWSAlgorithm ia) {
  jwe_.ia = std::move(ia);
  return *this;
}

JWEHeader JWEHeader::Builder::build() const {
  if (alg_ == Algorithm::NONE) {
    throw InvalidArgumentError(
        "The JWE algorithm \"alg\" cannot be \"none\"");
  }
  if (jwe_.p2c && *jwe_.p2c < 0) {
    throw InvalidArgumentError(
        "The PBES2 count \"p2c\" must not be negative");
  }
  if (jwe_.epk && jwe_.epk->isPrivate()) {
    throw InvalidArgumentError(
        "The ephemeral public key \"epk\" must be public");
  }
  validateHeaderParams(params_, kJWEParams);
  validateCommonSEParams(se_);
  return JWEHeader(alg_, enc_, params_, se_, jwe_);
}

JWEHeader::JWEHeader(JWEAlgorithm alg, EncryptionMethod enc,
                     HeaderParams params, CommonSEParams se, JWEParams jwe)
    : CommonSEHeader(alg, std::move(params), std::move(se)),
      alg_(std::move(alg)),
      enc_(std::move(enc)),
      jwe_(std::move(jwe)) {}

const std::vector<std::string>& JWEHeader::registeredParameterNames() {
  return kJWEParams;
}

std::vector<std::string> JWEHeader::includedParameters() const {
  return memberNames(toJSONObject());
}

json JWEHeader::toJSONObject() const {
  json object = json::object();
  object["alg"] = alg_.name();
  object["enc"] = enc_.name();
  writeHeaderParams(object);
  writeCommonSEParams(object);
  if (jwe_.epk) object["epk"] = jwe_.epk->toJSONObject();
  if (jwe_.zip) object["zip"] = jwe_.zip->name();
  putOptional(object, "apu", jwe_.apu);
  putOptional(object, "apv", jwe_.apv);
  putOptional(object, "p2s", jwe_.p2s);
  if (jwe_.p2c) object["p2c"] = *jwe_.p2c;
  putOptional(object, "iv", jwe_.iv);
  putOptional(object, "tag", jwe_.tag);
  if (jwe_.kdf) object["kdf"] = *jwe_.kdf;
  if (jwe_.ia) object["int"] = jwe_.ia->name();
  writeCustomParams(object);
  return object;
}

std::string JWEHeader::toString() const {
  return json_utils::toString(toJSONObject());
}

Base64URL JWEHeader::toBase64URL() const { return encode(toJSONObject()); }

JWEHeader JWEHeader::fromJSONObject(const json& object,
                                    std::optional<Base64URL> parsed) {
  if (inferHeaderKind(object) != HeaderKind::JWE) {
    throw ParseError("Not a JWE header");
  }
  return parseChecked([&] {
    Builder builder(JWEAlgorithm::parse(json_utils::getString(object, "alg")),
                    EncryptionMethod::parse(json_utils::getString(object, "enc")));
    for (const auto& [name, value] : object.items()) {
      if (name == "alg" || name == "enc" ||
          parseCommonSEParam(builder, object, name)) {
        continue;
      }
      if (name == "epk") {
        builder.ephemeralPublicKey(parseKeyParam(object, name));
      } else if (name == "zip") {
        builder.compressionAlgorithm(
            CompressionAlgorithm::parse(json_utils::getString(object, name)));
      } else if (name == "apu") {
        builder.agreementPartyUInfo(json_utils::getBase64URL(object, name));
      } else if (name == "apv") {
        builder.agreementPartyVInfo(json_utils::getBase64URL(object, name));
      } else if (name == "p2s") {
        builder.pbes2Salt(json_utils::getBase64URL(object, name));
      } else if (name == "p2c") {
        builder.pbes2Count(json_utils::getNonNegativeInteger(object, name));
      } else if (name == "iv") {
        builder.iv(json_utils::getBase64URL(object, name));
      } else if (name == "tag") {
        builder.authTag(json_utils::getBase64URL(object, name));
      } else if (name == "kdf") {
        builder.keyDerivationFunction(json_utils::getString(object, name));
      } else if (name == "int") {
        builder.integrityAlgorithm(
            JWSAlgorithm::parse(json_utils::getString(object, name)));
      } else {
        builder.customParam(name, value);
      }
    }
    if (parsed) builder.parsedBase64URL(std::move(*parsed));
    return builder.build();
  });
}

JWEHeader JWEHeader::parse(std::string_view text) {
  return fromJSONObject(json_utils::parseJSONObject(text));
}

JWEHeader JWEHeader::parse(const Base64URL& base64) {
  return fromJSONObject(decodeHeader(base64), base64);
}

// Algorithm type inference and dispatch

HeaderKind inferHeaderKind(const json& object) {
  std::string alg = json_utils::getString(object, "alg");
  if (alg == Algorithm::NONE.name()) {
    return HeaderKind::PLAIN;
  }
  if (object.contains("enc")) {
    return HeaderKind::JWE;
  }
  return HeaderKind::JWS;
}

Algorithm parseAlgorithm(const json& object) {
  std::string name = json_utils::getString(object, "alg");
  if (name.empty()) {
    throw ParseError("The algorithm \"alg\" header parameter must not be empty");
  }
  switch (inferHeaderKind(object)) {
    case HeaderKind::PLAIN:
      return Algorithm::NONE;
    case HeaderKind::JWE:
      return JWEAlgorithm::parse(name);
    case HeaderKind::JWS:
      break;
  }
  return JWSAlgorithm::parse(name);
}

AnyHeader parseHeader(const json& object, std::optional<Base64URL> parsed) {
  HeaderKind kind = inferHeaderKind(object);
  JOSE_LOG_TRACE("Parsing header of kind {}", static_cast<int>(kind));
  switch (kind) {
    case HeaderKind::PLAIN:
      return PlainHeader::fromJSONObject(object, std::move(parsed));
    case HeaderKind::JWE:
      return JWEHeader::fromJSONObject(object, std::move(parsed));
    case HeaderKind::JWS:
      break;
  }
  return JWSHeader::fromJSONObject(object, std::move(parsed));
}

AnyHeader parseHeader(const Base64URL& base64) {
  return parseHeader(decodeHeader(base64), base64);
}

namespace {

HeaderKind headerKind(const PlainHeader&) noexcept { return HeaderKind::PLAIN; }
HeaderKind headerKind(const JWSHeader&) noexcept { return HeaderKind::JWS; }
HeaderKind headerKind(const JWEHeader&) noexcept { return HeaderKind::JWE; }

}  // namespace

HeaderKind kindOf(const AnyHeader& header) noexcept {
  return std::visit([](const auto& h) { return headerKind(h); }, header);
}

const Header& asHeader(const AnyHeader& header) noexcept {
  return std::visit([](const auto& h) -> const Header& { return h; }, header);
}

}  // namespace jose
