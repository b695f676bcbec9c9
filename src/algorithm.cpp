/**
 * @file algorithm.cpp
 * @brief Well-known algorithm, key type and curve constants
 */

#include "jose/algorithm.hpp"

#include <array>

namespace jose {

namespace {

template <typename T, size_t N>
T lookup(const std::array<const T*, N>& known, std::string_view name) {
  for (const T* candidate : known) {
    if (candidate->name() == name) {
      return *candidate;
    }
  }
  return T(std::string(name));
}

}  // namespace

Algorithm::Algorithm(std::string name, std::optional<Requirement> requirement)
    : name_(std::move(name)), requirement_(requirement) {
  if (name_.empty()) {
    throw InvalidArgumentError("The algorithm name must not be empty");
  }
}

const Algorithm Algorithm::NONE("none", Requirement::REQUIRED);

// JWS algorithms, RFC 7518 section 3.1
const JWSAlgorithm JWSAlgorithm::HS256("HS256", Requirement::REQUIRED);
const JWSAlgorithm JWSAlgorithm::HS384("HS384", Requirement::OPTIONAL);
const JWSAlgorithm JWSAlgorithm::HS512("HS512", Requirement::OPTIONAL);
const JWSAlgorithm JWSAlgorithm::RS256("RS256", Requirement::RECOMMENDED);
const JWSAlgorithm JWSAlgorithm::RS384("RS384", Requirement::OPTIONAL);
const JWSAlgorithm JWSAlgorithm::RS512("RS512", Requirement::OPTIONAL);
const JWSAlgorithm JWSAlgorithm::ES256("ES256", Requirement::RECOMMENDED);
const JWSAlgorithm JWSAlgorithm::ES384("ES384", Requirement::OPTIONAL);
const JWSAlgorithm JWSAlgorithm::ES512("ES512", Requirement::OPTIONAL);
const JWSAlgorithm JWSAlgorithm::PS256("PS256", Requirement::OPTIONAL);
const JWSAlgorithm JWSAlgorithm::PS384("PS384", Requirement::OPTIONAL);
const JWSAlgorithm JWSAlgorithm::PS512("PS512", Requirement::OPTIONAL);

const AlgorithmFamily<JWSAlgorithm> JWSAlgorithm::Family::HMAC_SHA{
    JWSAlgorithm::HS256, JWSAlgorithm::HS384, JWSAlgorithm::HS512};
const AlgorithmFamily<JWSAlgorithm> JWSAlgorithm::Family::RSA{
    JWSAlgorithm::RS256, JWSAlgorithm::RS384, JWSAlgorithm::RS512,
    JWSAlgorithm::PS256, JWSAlgorithm::PS384, JWSAlgorithm::PS512};
const AlgorithmFamily<JWSAlgorithm> JWSAlgorithm::Family::EC{
    JWSAlgorithm::ES256, JWSAlgorithm::ES384, JWSAlgorithm::ES512};
const AlgorithmFamily<JWSAlgorithm> JWSAlgorithm::Family::SIGNATURE =
    JWSAlgorithm::Family::RSA.with(JWSAlgorithm::Family::EC);

JWSAlgorithm JWSAlgorithm::parse(std::string_view name) {
  static const std::array<const JWSAlgorithm*, 12> known = {
      &HS256, &HS384, &HS512, &RS256, &RS384, &RS512,
      &ES256, &ES384, &ES512, &PS256, &PS384, &PS512};
  return lookup(known, name);
}

// JWE key management algorithms, RFC 7518 section 4.1
const JWEAlgorithm JWEAlgorithm::RSA1_5("RSA1_5", Requirement::REQUIRED);
const JWEAlgorithm JWEAlgorithm::RSA_OAEP("RSA-OAEP", Requirement::OPTIONAL);
const JWEAlgorithm JWEAlgorithm::RSA_OAEP_256("RSA-OAEP-256",
                                              Requirement::OPTIONAL);
const JWEAlgorithm JWEAlgorithm::A128KW("A128KW", Requirement::RECOMMENDED);
const JWEAlgorithm JWEAlgorithm::A192KW("A192KW", Requirement::OPTIONAL);
const JWEAlgorithm JWEAlgorithm::A256KW("A256KW", Requirement::RECOMMENDED);
const JWEAlgorithm JWEAlgorithm::DIR("dir", Requirement::RECOMMENDED);
const JWEAlgorithm JWEAlgorithm::ECDH_ES("ECDH-ES", Requirement::RECOMMENDED);
const JWEAlgorithm JWEAlgorithm::ECDH_ES_A128KW("ECDH-ES+A128KW",
                                                Requirement::RECOMMENDED);
const JWEAlgorithm JWEAlgorithm::ECDH_ES_A192KW("ECDH-ES+A192KW",
                                                Requirement::OPTIONAL);
const JWEAlgorithm JWEAlgorithm::ECDH_ES_A256KW("ECDH-ES+A256KW",
                                                Requirement::RECOMMENDED);
const JWEAlgorithm JWEAlgorithm::A128GCMKW("A128GCMKW", Requirement::OPTIONAL);
const JWEAlgorithm JWEAlgorithm::A192GCMKW("A192GCMKW", Requirement::OPTIONAL);
const JWEAlgorithm JWEAlgorithm::A256GCMKW("A256GCMKW", Requirement::OPTIONAL);
const JWEAlgorithm JWEAlgorithm::PBES2_HS256_A128KW("PBES2-HS256+A128KW",
                                                    Requirement::OPTIONAL);
const JWEAlgorithm JWEAlgorithm::PBES2_HS384_A192KW("PBES2-HS384+A192KW",
                                                    Requirement::OPTIONAL);
const JWEAlgorithm JWEAlgorithm::PBES2_HS512_A256KW("PBES2-HS512+A256KW",
                                                    Requirement::OPTIONAL);

const AlgorithmFamily<JWEAlgorithm> JWEAlgorithm::Family::RSA{
    JWEAlgorithm::RSA1_5, JWEAlgorithm::RSA_OAEP, JWEAlgorithm::RSA_OAEP_256};
const AlgorithmFamily<JWEAlgorithm> JWEAlgorithm::Family::AES_KW{
    JWEAlgorithm::A128KW, JWEAlgorithm::A192KW, JWEAlgorithm::A256KW};
const AlgorithmFamily<JWEAlgorithm> JWEAlgorithm::Family::ECDH_ES{
    JWEAlgorithm::ECDH_ES, JWEAlgorithm::ECDH_ES_A128KW,
    JWEAlgorithm::ECDH_ES_A192KW, JWEAlgorithm::ECDH_ES_A256KW};
const AlgorithmFamily<JWEAlgorithm> JWEAlgorithm::Family::AES_GCM_KW{
    JWEAlgorithm::A128GCMKW, JWEAlgorithm::A192GCMKW, JWEAlgorithm::A256GCMKW};
const AlgorithmFamily<JWEAlgorithm> JWEAlgorithm::Family::PBES2{
    JWEAlgorithm::PBES2_HS256_A128KW, JWEAlgorithm::PBES2_HS384_A192KW,
    JWEAlgorithm::PBES2_HS512_A256KW};

JWEAlgorithm JWEAlgorithm::parse(std::string_view name) {
  static const std::array<const JWEAlgorithm*, 17> known = {
      &RSA1_5,         &RSA_OAEP,       &RSA_OAEP_256,       &A128KW,
      &A192KW,         &A256KW,         &DIR,                &ECDH_ES,
      &ECDH_ES_A128KW, &ECDH_ES_A192KW, &ECDH_ES_A256KW,     &A128GCMKW,
      &A192GCMKW,      &A256GCMKW,      &PBES2_HS256_A128KW, &PBES2_HS384_A192KW,
      &PBES2_HS512_A256KW};
  return lookup(known, name);
}

EncryptionMethod::EncryptionMethod(std::string name,
                                   std::optional<Requirement> requirement,
                                   size_t cekBitLength)
    : Algorithm(std::move(name), requirement), cek_bit_length_(cekBitLength) {}

// Content encryption methods, RFC 7518 section 5.1
const EncryptionMethod EncryptionMethod::A128CBC_HS256("A128CBC-HS256",
                                                       Requirement::REQUIRED,
                                                       256);
const EncryptionMethod EncryptionMethod::A192CBC_HS384("A192CBC-HS384",
                                                       Requirement::OPTIONAL,
                                                       384);
const EncryptionMethod EncryptionMethod::A256CBC_HS512("A256CBC-HS512",
                                                       Requirement::REQUIRED,
                                                       512);
const EncryptionMethod EncryptionMethod::A128GCM("A128GCM",
                                                 Requirement::RECOMMENDED, 128);
const EncryptionMethod EncryptionMethod::A192GCM("A192GCM",
                                                 Requirement::OPTIONAL, 192);
const EncryptionMethod EncryptionMethod::A256GCM("A256GCM",
                                                 Requirement::RECOMMENDED, 256);

const AlgorithmFamily<EncryptionMethod>
    EncryptionMethod::Family::AES_CBC_HMAC_SHA{
        EncryptionMethod::A128CBC_HS256, EncryptionMethod::A192CBC_HS384,
        EncryptionMethod::A256CBC_HS512};
const AlgorithmFamily<EncryptionMethod> EncryptionMethod::Family::AES_GCM{
    EncryptionMethod::A128GCM, EncryptionMethod::A192GCM,
    EncryptionMethod::A256GCM};

EncryptionMethod EncryptionMethod::parse(std::string_view name) {
  static const std::array<const EncryptionMethod*, 6> known = {
      &A128CBC_HS256, &A192CBC_HS384, &A256CBC_HS512,
      &A128GCM,       &A192GCM,       &A256GCM};
  return lookup(known, name);
}

const CompressionAlgorithm CompressionAlgorithm::DEF("DEF");

CompressionAlgorithm CompressionAlgorithm::parse(std::string_view name) {
  static const std::array<const CompressionAlgorithm*, 1> known = {&DEF};
  return lookup(known, name);
}

const KeyType KeyType::EC("EC", Requirement::RECOMMENDED);
const KeyType KeyType::RSA("RSA", Requirement::REQUIRED);
const KeyType KeyType::OCT("oct", Requirement::OPTIONAL);

KeyType KeyType::parse(std::string_view name) {
  static const std::array<const KeyType*, 3> known = {&EC, &RSA, &OCT};
  return lookup(known, name);
}

Curve::Curve(std::string name, std::string stdName, size_t bitSize)
    : name_(std::move(name)), std_name_(std::move(stdName)),
      bit_size_(bitSize) {
  if (name_.empty()) {
    throw InvalidArgumentError("The curve name must not be empty");
  }
}

const Curve Curve::P_256("P-256", "prime256v1", 256);
const Curve Curve::P_384("P-384", "secp384r1", 384);
const Curve Curve::P_521("P-521", "secp521r1", 521);

Curve Curve::parse(std::string_view name) {
  static const std::array<const Curve*, 3> known = {&P_256, &P_384, &P_521};
  return lookup(known, name);
}

std::optional<Curve> Curve::forStdName(std::string_view stdName) {
  for (const Curve* curve : {&P_256, &P_384, &P_521}) {
    if (curve->stdName() == stdName) {
      return *curve;
    }
  }
  // OpenSSL also reports P-256 under its NIST alias
  if (stdName == "secp256r1") {
    return P_256;
  }
  return std::nullopt;
}

JOSEObjectType::JOSEObjectType(std::string type) : type_(std::move(type)) {
  if (type_.empty()) {
    throw InvalidArgumentError("The object type must not be empty");
  }
}

const JOSEObjectType JOSEObjectType::JOSE("JOSE");
const JOSEObjectType JOSEObjectType::JOSE_JSON("JOSE+JSON");
const JOSEObjectType JOSEObjectType::JWT("JWT");

}  // namespace jose
