/**
 * @file jose_object.cpp
 * @brief JOSE object state machines and compact serialization
 */

#include "jose/jose_object.hpp"

#include <exception>

#include "jose/logging.hpp"

namespace jose {

namespace {

/**
 * Calls a crypto collaborator. JOSE errors pass through unchanged, any
 * other failure is reported as a CryptoError.
 */
template <typename Fn>
auto invokeCollaborator(std::string_view operation, Fn&& call) {
  try {
    return call();
  } catch (const JoseError&) {
    throw;
  } catch (const std::exception& e) {
    throw CryptoError(std::string(operation) + ": " + e.what());
  }
}

template <typename H>
H parseObjectHeader(const Base64URL& part, std::string_view kind) {
  try {
    return H::parse(part);
  } catch (const ParseError& e) {
    throw ParseError("Invalid " + std::string(kind) + " header: " + e.what());
  }
}

std::vector<uint8_t> toSigningInput(const Base64URL& firstPart,
                                    const Base64URL& secondPart) {
  const std::string& header = firstPart.toString();
  const std::string& payload = secondPart.toString();
  std::vector<uint8_t> input;
  input.reserve(header.size() + 1 + payload.size());
  input.insert(input.end(), header.begin(), header.end());
  input.push_back('.');
  input.insert(input.end(), payload.begin(), payload.end());
  return input;
}

std::optional<Base64URL> nonEmpty(const Base64URL& part) {
  if (part.empty()) {
    return std::nullopt;
  }
  return part;
}

const std::string& orEmpty(const std::optional<Base64URL>& part) {
  static const std::string empty;
  return part ? part->toString() : empty;
}

void requirePartCount(const std::vector<Base64URL>& parts, size_t expected,
                      std::string_view kind) {
  if (parts.size() != expected) {
    throw ParseError("Unexpected number of Base64URL parts for " +
                     std::string(kind) + ", must be " +
                     std::to_string(expected));
  }
}

}  // namespace

std::vector<Base64URL> split(std::string_view s) {
  size_t dot1 = s.find('.');
  if (dot1 == std::string_view::npos) {
    throw ParseError(
        "Invalid serialized unsecured/JWS/JWE object: Missing part "
        "delimiters");
  }

  size_t dot2 = s.find('.', dot1 + 1);
  if (dot2 == std::string_view::npos) {
    throw ParseError(
        "Invalid serialized unsecured/JWS/JWE object: Missing second "
        "delimiter");
  }

  size_t dot3 = s.find('.', dot2 + 1);
  if (dot3 == std::string_view::npos) {
    return {Base64URL(std::string(s.substr(0, dot1))),
            Base64URL(std::string(s.substr(dot1 + 1, dot2 - dot1 - 1))),
            Base64URL(std::string(s.substr(dot2 + 1)))};
  }

  size_t dot4 = s.find('.', dot3 + 1);
  if (dot4 == std::string_view::npos) {
    throw ParseError(
        "Invalid serialized JWE object: Missing fourth delimiter");
  }

  if (s.find('.', dot4 + 1) != std::string_view::npos) {
    throw ParseError(
        "Invalid serialized unsecured/JWS/JWE object: Too many part "
        "delimiters");
  }

  return {Base64URL(std::string(s.substr(0, dot1))),
          Base64URL(std::string(s.substr(dot1 + 1, dot2 - dot1 - 1))),
          Base64URL(std::string(s.substr(dot2 + 1, dot3 - dot2 - 1))),
          Base64URL(std::string(s.substr(dot3 + 1, dot4 - dot3 - 1))),
          Base64URL(std::string(s.substr(dot4 + 1)))};
}

// JOSEObjectBase

std::optional<std::string> JOSEObjectBase::parsedString() const {
  if (!parsed_parts_) {
    return std::nullopt;
  }
  std::string result;
  for (size_t i = 0; i < parsed_parts_->size(); ++i) {
    if (i > 0) result.push_back('.');
    result += (*parsed_parts_)[i].toString();
  }
  return result;
}

// PlainObject

PlainObject::PlainObject(Payload payload)
    : JOSEObjectBase(std::move(payload)) {}

PlainObject::PlainObject(PlainHeader header, Payload payload)
    : JOSEObjectBase(std::move(payload)), header_(std::move(header)) {}

PlainObject::PlainObject(const Base64URL& firstPart,
                         const Base64URL& secondPart)
    : JOSEObjectBase(Payload(secondPart)),
      header_(parseObjectHeader<PlainHeader>(firstPart, "unsecured")) {
  setParsedParts({firstPart, secondPart, Base64URL()});
}

std::string PlainObject::serialize() const {
  return header_.toBase64URL().toString() + "." +
         payload_->toBase64URL().toString() + ".";
}

PlainObject PlainObject::parse(std::string_view s) {
  std::vector<Base64URL> parts = split(s);
  requirePartCount(parts, 3, "an unsecured object");
  if (!parts[2].empty()) {
    throw ParseError("Unexpected third Base64URL part");
  }
  return PlainObject(parts[0], parts[1]);
}

// JWSObject

JWSObject::JWSObject(JWSHeader header, Payload payload)
    : JOSEObjectBase(std::move(payload)),
      header_(std::move(header)),
      state_(State::UNSIGNED) {
  signing_input_ =
      toSigningInput(header_.toBase64URL(), payload_->toBase64URL());
}

JWSObject::JWSObject(const Base64URL& firstPart, const Base64URL& secondPart,
                     const Base64URL& thirdPart)
    : JOSEObjectBase(Payload(secondPart)),
      header_(parseObjectHeader<JWSHeader>(firstPart, "JWS")),
      signing_input_(toSigningInput(firstPart, secondPart)),
      signature_(thirdPart),
      state_(State::SIGNED) {
  if (thirdPart.empty()) {
    throw ParseError("The signature part must not be empty");
  }
  setParsedParts({firstPart, secondPart, thirdPart});
}

void JWSObject::sign(const JWSSigner& signer) {
  if (state_ != State::UNSIGNED) {
    throw InvalidStateError("The JWS object must be in an unsigned state");
  }
  if (!signer.supportedAlgorithms().contains(header_.algorithm())) {
    throw AlgorithmNotSupportedError("The \"" + header_.algorithm().name() +
                                     "\" algorithm is not supported by the "
                                     "JWS signer");
  }

  signature_ = invokeCollaborator("JWS signing", [&] {
    return signer.sign(header_, signing_input_);
  });
  state_ = State::SIGNED;
  JOSE_LOG_DEBUG("Signed JWS object with {}", header_.algorithm().name());
}

bool JWSObject::validate(const JWSVerifier& verifier) {
  if (state_ == State::UNSIGNED) {
    throw InvalidStateError(
        "The JWS object must be in a signed or validated state");
  }

  if (const JWSHeaderFilter* filter = verifier.headerFilter()) {
    if (!filter->acceptsAlgorithm(header_.algorithm())) {
      throw AlgorithmNotAcceptedError("The \"" + header_.algorithm().name() +
                                      "\" algorithm is not accepted by the "
                                      "JWS verifier");
    }
    for (const auto& name : header_.includedParameters()) {
      if (!filter->acceptsParameter(name)) {
        throw ParamsNotAcceptedError("The header parameter \"" + name +
                                     "\" is not accepted by the JWS "
                                     "verifier");
      }
    }
  }
  if (!verifier.supportedAlgorithms().contains(header_.algorithm())) {
    throw AlgorithmNotSupportedError("The \"" + header_.algorithm().name() +
                                     "\" algorithm is not supported by the "
                                     "JWS verifier");
  }

  bool verified = invokeCollaborator("JWS verification", [&] {
    return verifier.verify(header_, signing_input_, *signature_);
  });
  if (verified) {
    state_ = State::VALIDATED;
  }
  JOSE_LOG_DEBUG("JWS signature {}", verified ? "valid" : "invalid");
  return verified;
}

std::string JWSObject::serialize() const {
  if (state_ == State::UNSIGNED) {
    throw InvalidStateError(
        "The JWS object must be in a signed or validated state");
  }
  std::string result(signing_input_.begin(), signing_input_.end());
  result.push_back('.');
  result += signature_->toString();
  return result;
}

JWSObject JWSObject::parse(std::string_view s) {
  std::vector<Base64URL> parts = split(s);
  requirePartCount(parts, 3, "a JWS object");
  return JWSObject(parts[0], parts[1], parts[2]);
}

// JWEObject

JWEObject::JWEObject(JWEHeader header, Payload payload)
    : JOSEObjectBase(std::move(payload)),
      header_(std::move(header)),
      state_(State::UNENCRYPTED) {}

JWEObject::JWEObject(const Base64URL& firstPart, const Base64URL& secondPart,
                     const Base64URL& thirdPart, const Base64URL& fourthPart,
                     const Base64URL& fifthPart)
    : header_(parseObjectHeader<JWEHeader>(firstPart, "JWE")),
      encrypted_key_(nonEmpty(secondPart)),
      iv_(nonEmpty(thirdPart)),
      cipher_text_(fourthPart),
      auth_tag_(nonEmpty(fifthPart)),
      state_(State::ENCRYPTED) {
  setParsedParts({firstPart, secondPart, thirdPart, fourthPart, fifthPart});
}

void JWEObject::encrypt(const JWEEncrypter& encrypter) {
  if (state_ != State::UNENCRYPTED) {
    throw InvalidStateError("The JWE object must be in an unencrypted state");
  }
  if (!encrypter.supportedAlgorithms().contains(header_.algorithm())) {
    throw AlgorithmNotSupportedError("The \"" + header_.algorithm().name() +
                                     "\" algorithm is not supported by the "
                                     "JWE encrypter");
  }
  if (!encrypter.supportedEncryptionMethods().contains(
          header_.encryptionMethod())) {
    throw AlgorithmNotSupportedError(
        "The \"" + header_.encryptionMethod().name() +
        "\" encryption method is not supported by the JWE encrypter");
  }

  std::vector<uint8_t> clear_text = payload_->toBytes();
  JWECryptoParts parts = invokeCollaborator("JWE encryption", [&] {
    return encrypter.encrypt(header_, clear_text);
  });

  encrypted_key_ = std::move(parts.encryptedKey);
  iv_ = std::move(parts.iv);
  cipher_text_ = std::move(parts.cipherText);
  auth_tag_ = std::move(parts.authTag);
  state_ = State::ENCRYPTED;
  JOSE_LOG_DEBUG("Encrypted JWE object with {} / {}",
                 header_.algorithm().name(),
                 header_.encryptionMethod().name());
}

void JWEObject::decrypt(const JWEDecrypter& decrypter) {
  if (state_ != State::ENCRYPTED) {
    throw InvalidStateError("The JWE object must be in an encrypted state");
  }

  if (const JWEHeaderFilter* filter = decrypter.headerFilter()) {
    if (!filter->acceptsAlgorithm(header_.algorithm())) {
      throw AlgorithmNotAcceptedError("The \"" + header_.algorithm().name() +
                                      "\" algorithm is not accepted by the "
                                      "JWE decrypter");
    }
    if (!filter->acceptsEncryptionMethod(header_.encryptionMethod())) {
      throw AlgorithmNotAcceptedError(
          "The \"" + header_.encryptionMethod().name() +
          "\" encryption method is not accepted by the JWE decrypter");
    }
    for (const auto& name : header_.includedParameters()) {
      if (!filter->acceptsParameter(name)) {
        throw ParamsNotAcceptedError("The header parameter \"" + name +
                                     "\" is not accepted by the JWE "
                                     "decrypter");
      }
    }
  }
  if (!decrypter.supportedAlgorithms().contains(header_.algorithm()) ||
      !decrypter.supportedEncryptionMethods().contains(
          header_.encryptionMethod())) {
    throw AlgorithmNotSupportedError(
        "The \"" + header_.algorithm().name() + "\" / \"" +
        header_.encryptionMethod().name() +
        "\" combination is not supported by the JWE decrypter");
  }

  std::vector<uint8_t> clear_text = invokeCollaborator("JWE decryption", [&] {
    return decrypter.decrypt(header_, encrypted_key_, iv_, *cipher_text_,
                             auth_tag_);
  });
  payload_ = Payload(std::move(clear_text));
  state_ = State::DECRYPTED;
}

std::string JWEObject::serialize() const {
  if (state_ == State::UNENCRYPTED) {
    throw InvalidStateError(
        "The JWE object must be in an encrypted or decrypted state");
  }
  std::string result = header_.toBase64URL().toString();
  result.push_back('.');
  result += orEmpty(encrypted_key_);
  result.push_back('.');
  result += orEmpty(iv_);
  result.push_back('.');
  result += orEmpty(cipher_text_);
  result.push_back('.');
  result += orEmpty(auth_tag_);
  return result;
}

JWEObject JWEObject::parse(std::string_view s) {
  std::vector<Base64URL> parts = split(s);
  requirePartCount(parts, 5, "a JWE object");
  return JWEObject(parts[0], parts[1], parts[2], parts[3], parts[4]);
}

// Dispatch

JOSEObject parseJOSEObject(std::string_view s) {
  std::vector<Base64URL> parts = split(s);

  json header;
  try {
    header = json_utils::parseJSONObject(parts[0].decodeToString());
  } catch (const ParseError& e) {
    throw ParseError(std::string("Invalid unsecured/JWS/JWE header: ") +
                     e.what());
  }

  HeaderKind kind = inferHeaderKind(header);
  JOSE_LOG_TRACE("Parsing JOSE object of kind {} with {} parts",
                 static_cast<int>(kind), parts.size());
  switch (kind) {
    case HeaderKind::PLAIN:
      requirePartCount(parts, 3, "an unsecured object");
      if (!parts[2].empty()) {
        throw ParseError("Unexpected third Base64URL part");
      }
      return PlainObject(parts[0], parts[1]);
    case HeaderKind::JWS:
      requirePartCount(parts, 3, "a JWS object");
      return JWSObject(parts[0], parts[1], parts[2]);
    case HeaderKind::JWE:
      break;
  }
  requirePartCount(parts, 5, "a JWE object");
  return JWEObject(parts[0], parts[1], parts[2], parts[3], parts[4]);
}

namespace {

// One overload per JOSEObject alternative
HeaderKind objectKind(const PlainObject&) noexcept { return HeaderKind::PLAIN; }
HeaderKind objectKind(const JWSObject&) noexcept { return HeaderKind::JWS; }
HeaderKind objectKind(const JWEObject&) noexcept { return HeaderKind::JWE; }

}  // namespace

HeaderKind kindOf(const JOSEObject& object) noexcept {
  return std::visit([](const auto& o) { return objectKind(o); }, object);
}

}  // namespace jose
