#include "jose/openssl_crypto.hpp"

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/param_build.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <array>
#include <string>

#include "jose/logging.hpp"

namespace jose {

void EvpKeyDeleter::operator()(EVP_PKEY* key) const noexcept {
  if (key) EVP_PKEY_free(key);
}

namespace {

/**
 * @brief RAII wrapper for OpenSSL contexts
 */
template <typename T, void (*Deleter)(T*)>
class OpenSSLWrapper {
 public:
  explicit OpenSSLWrapper(T* ptr) : ptr_(ptr) {}
  ~OpenSSLWrapper() {
    if (ptr_) Deleter(ptr_);
  }

  // Move-only semantics
  OpenSSLWrapper(const OpenSSLWrapper&) = delete;
  OpenSSLWrapper& operator=(const OpenSSLWrapper&) = delete;
  OpenSSLWrapper(OpenSSLWrapper&& other) noexcept : ptr_(other.ptr_) {
    other.ptr_ = nullptr;
  }
  OpenSSLWrapper& operator=(OpenSSLWrapper&& other) noexcept {
    if (this != &other) {
      if (ptr_) Deleter(ptr_);
      ptr_ = other.ptr_;
      other.ptr_ = nullptr;
    }
    return *this;
  }

  T* get() const noexcept { return ptr_; }
  T* release() noexcept {
    T* tmp = ptr_;
    ptr_ = nullptr;
    return tmp;
  }

 private:
  T* ptr_;
};

using EvpMdCtxWrapper = OpenSSLWrapper<EVP_MD_CTX, EVP_MD_CTX_free>;
using EvpPkeyCtxWrapper = OpenSSLWrapper<EVP_PKEY_CTX, EVP_PKEY_CTX_free>;
using EvpCipherCtxWrapper = OpenSSLWrapper<EVP_CIPHER_CTX, EVP_CIPHER_CTX_free>;
using BignumWrapper = OpenSSLWrapper<BIGNUM, BN_clear_free>;
using ParamBldWrapper = OpenSSLWrapper<OSSL_PARAM_BLD, OSSL_PARAM_BLD_free>;
using ParamWrapper = OpenSSLWrapper<OSSL_PARAM, OSSL_PARAM_free>;
using EcdsaSigWrapper = OpenSSLWrapper<ECDSA_SIG, ECDSA_SIG_free>;

[[noreturn]] void throwOpenSSLError(const std::string& operation) {
  std::string message = operation;
  unsigned long err = ERR_get_error();
  if (err != 0) {
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    message += ": ";
    message += buffer.data();
  }
  ERR_clear_error();
  JOSE_LOG_ERROR("{}", message);
  throw CryptoError(message);
}

void randomBytes(uint8_t* out, size_t size) {
  if (RAND_bytes(out, static_cast<int>(size)) != 1) {
    JOSE_LOG_ERROR("Failed to generate {} random bytes", size);
    unsigned long err = ERR_get_error();
    if (err == 0) {
      throwOsError("RAND_bytes");
    } else {
      throw CryptoError("Failed to generate random bytes: OpenSSL error " +
                        std::to_string(err));
    }
  }
}

BignumWrapper toBignum(const Base64URL& value) {
  std::vector<uint8_t> bytes = value.decode();
  BignumWrapper bn(
      BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
  if (!bn.get()) {
    throwOpenSSLError("Failed to convert key component");
  }
  return bn;
}

/**
 * Big-endian, left-padded to length bytes, or minimal when length is 0
 */
Base64URL toBase64URL(const BIGNUM* bn, size_t length = 0) {
  size_t size = length ? length : static_cast<size_t>(BN_num_bytes(bn));
  std::vector<uint8_t> bytes(size);
  if (BN_bn2binpad(bn, bytes.data(), static_cast<int>(size)) < 0) {
    throwOpenSSLError("Key component does not fit in " +
                      std::to_string(size) + " bytes");
  }
  return Base64URL::encode(bytes);
}

BignumWrapper getBignumParam(const EVP_PKEY* pkey, const char* name) {
  BIGNUM* bn = nullptr;
  if (EVP_PKEY_get_bn_param(pkey, name, &bn) != 1) {
    // Absent parameter, e.g. the private part of a public key
    ERR_clear_error();
    return BignumWrapper(nullptr);
  }
  return BignumWrapper(bn);
}

/**
 * @brief Collects OSSL_PARAMs for EVP_PKEY_fromdata. Pushed values are
 * referenced until build().
 */
class KeyParams {
 public:
  KeyParams() : bld_(OSSL_PARAM_BLD_new()) {
    if (!bld_.get()) {
      throwOpenSSLError("Failed to create OSSL_PARAM_BLD");
    }
  }

  void pushString(const char* name, const std::string& value) {
    if (OSSL_PARAM_BLD_push_utf8_string(bld_.get(), name, value.c_str(), 0) !=
        1) {
      throwOpenSSLError(std::string("Failed to set key parameter ") + name);
    }
  }

  void pushOctets(const char* name, std::vector<uint8_t> value) {
    octets_.push_back(std::move(value));
    const auto& stored = octets_.back();
    if (OSSL_PARAM_BLD_push_octet_string(bld_.get(), name, stored.data(),
                                         stored.size()) != 1) {
      throwOpenSSLError(std::string("Failed to set key parameter ") + name);
    }
  }

  void pushBignum(const char* name, const Base64URL& value) {
    bignums_.push_back(toBignum(value));
    if (OSSL_PARAM_BLD_push_BN(bld_.get(), name, bignums_.back().get()) != 1) {
      throwOpenSSLError(std::string("Failed to set key parameter ") + name);
    }
  }

  EvpKeyPtr build(const char* type, int selection) {
    ParamWrapper params(OSSL_PARAM_BLD_to_param(bld_.get()));
    if (!params.get()) {
      throwOpenSSLError("Failed to build key parameters");
    }

    EvpPkeyCtxWrapper ctx(EVP_PKEY_CTX_new_from_name(nullptr, type, nullptr));
    EVP_PKEY* pkey = nullptr;
    if (!ctx.get() || EVP_PKEY_fromdata_init(ctx.get()) <= 0 ||
        EVP_PKEY_fromdata(ctx.get(), &pkey, selection, params.get()) <= 0) {
      throwOpenSSLError(std::string("Failed to import ") + type + " key");
    }
    return EvpKeyPtr(pkey);
  }

 private:
  ParamBldWrapper bld_;
  std::vector<BignumWrapper> bignums_;
  std::vector<std::vector<uint8_t>> octets_;
};

size_t coordinateLength(const Curve& curve) {
  return (curve.bitSize() + 7) / 8;
}

const std::string& ecGroupName(const Curve& curve) {
  if (curve.stdName().empty() || !Curve::forStdName(curve.stdName())) {
    throw KeyTypeError("Unsupported EC curve: " + curve.name());
  }
  return curve.stdName();
}

void appendCoordinate(std::vector<uint8_t>& out, const Base64URL& value,
                      size_t length) {
  std::vector<uint8_t> bytes = value.decode();
  if (bytes.size() > length) {
    throw CryptoError("EC coordinate exceeds the curve size");
  }
  out.insert(out.end(), length - bytes.size(), 0);
  out.insert(out.end(), bytes.begin(), bytes.end());
}

/// Uncompressed SEC1 point 0x04 || X || Y
std::vector<uint8_t> encodePoint(const ECKey& key) {
  size_t length = coordinateLength(key.curve());
  std::vector<uint8_t> point;
  point.reserve(1 + 2 * length);
  point.push_back(POINT_CONVERSION_UNCOMPRESSED);
  appendCoordinate(point, key.x(), length);
  appendCoordinate(point, key.y(), length);
  return point;
}

EvpKeyPtr importECKey(const ECKey& key, bool withPrivate) {
  KeyParams params;
  params.pushString(OSSL_PKEY_PARAM_GROUP_NAME, ecGroupName(key.curve()));
  params.pushOctets(OSSL_PKEY_PARAM_PUB_KEY, encodePoint(key));
  if (withPrivate) {
    params.pushBignum(OSSL_PKEY_PARAM_PRIV_KEY, *key.d());
  }
  return params.build("EC", withPrivate ? EVP_PKEY_KEYPAIR : EVP_PKEY_PUBLIC_KEY);
}

EvpKeyPtr importRSAKey(const RSAKey& key, bool withPrivate) {
  KeyParams params;
  params.pushBignum(OSSL_PKEY_PARAM_RSA_N, key.modulus());
  params.pushBignum(OSSL_PKEY_PARAM_RSA_E, key.publicExponent());
  if (withPrivate) {
    params.pushBignum(OSSL_PKEY_PARAM_RSA_D, *key.privateExponent());
    if (key.firstPrimeFactor()) {
      params.pushBignum(OSSL_PKEY_PARAM_RSA_FACTOR1, *key.firstPrimeFactor());
      params.pushBignum(OSSL_PKEY_PARAM_RSA_FACTOR2, *key.secondPrimeFactor());
      params.pushBignum(OSSL_PKEY_PARAM_RSA_EXPONENT1,
                        *key.firstFactorCRTExponent());
      params.pushBignum(OSSL_PKEY_PARAM_RSA_EXPONENT2,
                        *key.secondFactorCRTExponent());
      params.pushBignum(OSSL_PKEY_PARAM_RSA_COEFFICIENT1,
                        *key.firstCRTCoefficient());
    }
  }
  return params.build("RSA",
                      withPrivate ? EVP_PKEY_KEYPAIR : EVP_PKEY_PUBLIC_KEY);
}

EvpKeyPtr parseDerKey(std::span<const uint8_t> der) {
  const unsigned char* p = der.data();
  EVP_PKEY* pkey = d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size()));
  if (!pkey) {
    ERR_clear_error();
    p = der.data();
    pkey = d2i_AutoPrivateKey(nullptr, &p, static_cast<long>(der.size()));
  }
  if (!pkey) {
    throwOpenSSLError("Failed to decode DER key");
  }
  return EvpKeyPtr(pkey);
}

const EVP_MD* digestFor(const JWSAlgorithm& alg) {
  if (alg == JWSAlgorithm::HS256 || alg == JWSAlgorithm::RS256 ||
      alg == JWSAlgorithm::PS256 || alg == JWSAlgorithm::ES256) {
    return EVP_sha256();
  }
  if (alg == JWSAlgorithm::HS384 || alg == JWSAlgorithm::RS384 ||
      alg == JWSAlgorithm::PS384 || alg == JWSAlgorithm::ES384) {
    return EVP_sha384();
  }
  if (alg == JWSAlgorithm::HS512 || alg == JWSAlgorithm::RS512 ||
      alg == JWSAlgorithm::PS512 || alg == JWSAlgorithm::ES512) {
    return EVP_sha512();
  }
  return nullptr;
}

const EVP_MD* requireDigest(const JWSAlgorithm& alg,
                            const AlgorithmFamily<JWSAlgorithm>& family) {
  const EVP_MD* md = family.contains(alg) ? digestFor(alg) : nullptr;
  if (!md) {
    throw AlgorithmNotSupportedError("Unsupported JWS algorithm: " +
                                     alg.name());
  }
  return md;
}

bool isPSS(const JWSAlgorithm& alg) {
  return alg == JWSAlgorithm::PS256 || alg == JWSAlgorithm::PS384 ||
         alg == JWSAlgorithm::PS512;
}

void setPSSPadding(EVP_PKEY_CTX* pctx) {
  if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
      EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) <= 0) {
    throwOpenSSLError("Failed to configure RSA-PSS padding");
  }
}

std::vector<uint8_t> digestSign(EVP_PKEY* key, const EVP_MD* md, bool pss,
                                std::span<const uint8_t> data) {
  EvpMdCtxWrapper mdctx(EVP_MD_CTX_new());
  if (!mdctx.get()) throwOpenSSLError("Failed to create signing context");

  EVP_PKEY_CTX* pctx = nullptr;
  if (EVP_DigestSignInit(mdctx.get(), &pctx, md, nullptr, key) <= 0) {
    throwOpenSSLError("Failed to initialize signing");
  }
  if (pss) setPSSPadding(pctx);

  size_t sigLen = 0;
  if (EVP_DigestSign(mdctx.get(), nullptr, &sigLen, data.data(),
                     data.size()) <= 0) {
    throwOpenSSLError("Failed to determine signature length");
  }

  std::vector<uint8_t> signature(sigLen);
  if (EVP_DigestSign(mdctx.get(), signature.data(), &sigLen, data.data(),
                     data.size()) <= 0) {
    throwOpenSSLError("Failed to sign data");
  }
  signature.resize(sigLen);
  return signature;
}

bool digestVerify(EVP_PKEY* key, const EVP_MD* md, bool pss,
                  std::span<const uint8_t> data,
                  std::span<const uint8_t> signature) {
  EvpMdCtxWrapper mdctx(EVP_MD_CTX_new());
  if (!mdctx.get()) throwOpenSSLError("Failed to create verification context");

  EVP_PKEY_CTX* pctx = nullptr;
  if (EVP_DigestVerifyInit(mdctx.get(), &pctx, md, nullptr, key) <= 0) {
    throwOpenSSLError("Failed to initialize verification");
  }
  if (pss) setPSSPadding(pctx);

  int result = EVP_DigestVerify(mdctx.get(), signature.data(),
                                signature.size(), data.data(), data.size());
  // A malformed signature leaves errors on the queue
  ERR_clear_error();
  return result == 1;
}

// HMAC

size_t minSecretBits(const JWSAlgorithm& alg) {
  if (alg == JWSAlgorithm::HS384) return crypto_constants::MIN_HS384_SECRET_BITS;
  if (alg == JWSAlgorithm::HS512) return crypto_constants::MIN_HS512_SECRET_BITS;
  return crypto_constants::MIN_HS256_SECRET_BITS;
}

AlgorithmFamily<JWSAlgorithm> macAlgorithmsFor(size_t secretBits) {
  if (secretBits >= crypto_constants::MIN_HS512_SECRET_BITS) {
    return JWSAlgorithm::Family::HMAC_SHA;
  }
  if (secretBits >= crypto_constants::MIN_HS384_SECRET_BITS) {
    return {JWSAlgorithm::HS256, JWSAlgorithm::HS384};
  }
  return {JWSAlgorithm::HS256};
}

SecureBytes checkedSecret(SecureBytes secret) {
  if (secret.size() * 8 < crypto_constants::MIN_HS256_SECRET_BITS) {
    throw KeyLengthError("The secret length must be at least " +
                         std::to_string(crypto_constants::MIN_HS256_SECRET_BITS) +
                         " bits");
  }
  return secret;
}

std::vector<uint8_t> computeHmac(const JWSHeader& header,
                                 const SecureBytes& secret,
                                 std::span<const uint8_t> data) {
  const JWSAlgorithm& alg = header.algorithm();
  const EVP_MD* md = requireDigest(alg, JWSAlgorithm::Family::HMAC_SHA);
  if (secret.size() * 8 < minSecretBits(alg)) {
    throw KeyLengthError("The secret length for " + alg.name() +
                         " must be at least " +
                         std::to_string(minSecretBits(alg)) + " bits");
  }

  // Intermediate MAC in secure memory
  SecureBytes mac(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (!HMAC(md, secret.data(), static_cast<int>(secret.size()), data.data(),
            data.size(), mac.data(), &len)) {
    throwOpenSSLError("HMAC computation failed");
  }
  return std::vector<uint8_t>(mac.begin(), mac.begin() + len);
}

// ECDSA

const JWSAlgorithm& ecdsaAlgorithmFor(const Curve& curve) {
  if (curve == Curve::P_256) return JWSAlgorithm::ES256;
  if (curve == Curve::P_384) return JWSAlgorithm::ES384;
  if (curve == Curve::P_521) return JWSAlgorithm::ES512;
  throw KeyTypeError("Unsupported EC curve for ECDSA: " + curve.name());
}

void checkECDSAAlgorithm(const JWSAlgorithm& alg, const Curve& curve) {
  if (!JWSAlgorithm::Family::EC.contains(alg)) {
    throw AlgorithmNotSupportedError("Unsupported JWS algorithm: " +
                                     alg.name());
  }
  if (alg != ecdsaAlgorithmFor(curve)) {
    throw KeyTypeError("The " + alg.name() +
                       " algorithm does not match the EC key curve " +
                       curve.name());
  }
}

std::vector<uint8_t> derToConcat(std::span<const uint8_t> der,
                                 size_t length) {
  const unsigned char* p = der.data();
  EcdsaSigWrapper sig(
      d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der.size())));
  if (!sig.get()) throwOpenSSLError("Failed to decode ECDSA signature");

  const BIGNUM* r = nullptr;
  const BIGNUM* s = nullptr;
  ECDSA_SIG_get0(sig.get(), &r, &s);

  std::vector<uint8_t> out(2 * length);
  if (BN_bn2binpad(r, out.data(), static_cast<int>(length)) < 0 ||
      BN_bn2binpad(s, out.data() + length, static_cast<int>(length)) < 0) {
    throwOpenSSLError("Failed to encode ECDSA signature");
  }
  return out;
}

/// std::nullopt for a signature of the wrong length
std::optional<std::vector<uint8_t>> concatToDer(
    std::span<const uint8_t> signature, size_t length) {
  if (signature.size() != 2 * length) {
    return std::nullopt;
  }

  BignumWrapper r(
      BN_bin2bn(signature.data(), static_cast<int>(length), nullptr));
  BignumWrapper s(BN_bin2bn(signature.data() + length,
                            static_cast<int>(length), nullptr));
  EcdsaSigWrapper sig(ECDSA_SIG_new());
  if (!r.get() || !s.get() || !sig.get()) {
    throwOpenSSLError("Failed to allocate ECDSA signature");
  }
  if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
    throwOpenSSLError("Failed to set ECDSA signature");
  }
  // Owned by sig from here on
  r.release();
  s.release();

  int derLen = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (derLen <= 0) throwOpenSSLError("Failed to encode ECDSA signature");
  std::vector<uint8_t> der(static_cast<size_t>(derLen));
  unsigned char* q = der.data();
  i2d_ECDSA_SIG(sig.get(), &q);
  return der;
}

// AES/GCM

const EncryptionMethod* gcmMethodFor(size_t keyBytes) {
  switch (keyBytes) {
    case 16:
      return &EncryptionMethod::A128GCM;
    case 24:
      return &EncryptionMethod::A192GCM;
    case 32:
      return &EncryptionMethod::A256GCM;
    default:
      return nullptr;
  }
}

const EVP_CIPHER* gcmCipherFor(size_t keyBytes) {
  switch (keyBytes) {
    case 16:
      return EVP_aes_128_gcm();
    case 24:
      return EVP_aes_192_gcm();
    default:
      return EVP_aes_256_gcm();
  }
}

SecureBytes checkedContentKey(SecureBytes key) {
  if (!gcmMethodFor(key.size())) {
    throw KeyLengthError(
        "The direct encryption key must be 128, 192 or 256 bits, got " +
        std::to_string(key.size() * 8));
  }
  return key;
}

void checkDirectHeader(const JWEHeader& header, const SecureBytes& key) {
  if (header.algorithm() != JWEAlgorithm::DIR) {
    throw AlgorithmNotSupportedError("Unsupported JWE algorithm: " +
                                     header.algorithm().name());
  }
  const EncryptionMethod& enc = header.encryptionMethod();
  if (!EncryptionMethod::Family::AES_GCM.contains(enc)) {
    throw AlgorithmNotSupportedError("Unsupported JWE encryption method: " +
                                     enc.name());
  }
  if (enc.cekBitLength() != key.size() * 8) {
    throw KeyLengthError("The " + enc.name() + " method requires a " +
                         std::to_string(enc.cekBitLength()) + " bit key");
  }
}

}  // namespace

// Key conversion

EvpKeyPtr toEvpPublicKey(const ECKey& key) { return importECKey(key, false); }

EvpKeyPtr toEvpPublicKey(const RSAKey& key) {
  return importRSAKey(key, false);
}

EvpKeyPtr toEvpPrivateKey(const ECKey& key) {
  if (!key.isPrivate()) {
    throw InvalidArgumentError("The EC JWK has no private part");
  }
  return importECKey(key, true);
}

EvpKeyPtr toEvpPrivateKey(const RSAKey& key) {
  if (!key.isPrivate()) {
    throw InvalidArgumentError("The RSA JWK has no private part");
  }
  if (!key.privateExponent()) {
    throw KeyTypeError("The RSA JWK has no private exponent");
  }
  return importRSAKey(key, true);
}

ECKey ecKeyFromEvp(const EVP_PKEY* pkey) {
  if (!EVP_PKEY_is_a(pkey, "EC")) {
    throw KeyTypeError("The key is not an EC key");
  }

  std::array<char, 64> group{};
  size_t group_len = 0;
  if (EVP_PKEY_get_utf8_string_param(pkey, OSSL_PKEY_PARAM_GROUP_NAME,
                                     group.data(), group.size(),
                                     &group_len) != 1) {
    throwOpenSSLError("Failed to read EC group");
  }
  std::optional<Curve> curve =
      Curve::forStdName(std::string_view(group.data(), group_len));
  if (!curve) {
    throw KeyTypeError("Unsupported EC curve: " +
                       std::string(group.data(), group_len));
  }

  size_t length = coordinateLength(*curve);
  BignumWrapper x = getBignumParam(pkey, OSSL_PKEY_PARAM_EC_PUB_X);
  BignumWrapper y = getBignumParam(pkey, OSSL_PKEY_PARAM_EC_PUB_Y);
  if (!x.get() || !y.get()) {
    throwOpenSSLError("Failed to read EC public key");
  }

  ECKey::Builder builder(*curve, toBase64URL(x.get(), length),
                         toBase64URL(y.get(), length));
  BignumWrapper d = getBignumParam(pkey, OSSL_PKEY_PARAM_PRIV_KEY);
  if (d.get()) {
    builder.d(toBase64URL(d.get(), length));
  }
  return builder.build();
}

RSAKey rsaKeyFromEvp(const EVP_PKEY* pkey) {
  if (!EVP_PKEY_is_a(pkey, "RSA")) {
    throw KeyTypeError("The key is not an RSA key");
  }

  BignumWrapper n = getBignumParam(pkey, OSSL_PKEY_PARAM_RSA_N);
  BignumWrapper e = getBignumParam(pkey, OSSL_PKEY_PARAM_RSA_E);
  if (!n.get() || !e.get()) {
    throwOpenSSLError("Failed to read RSA public key");
  }

  RSAKey::Builder builder(toBase64URL(n.get()), toBase64URL(e.get()));
  BignumWrapper d = getBignumParam(pkey, OSSL_PKEY_PARAM_RSA_D);
  if (d.get()) {
    builder.privateExponent(toBase64URL(d.get()));

    BignumWrapper p = getBignumParam(pkey, OSSL_PKEY_PARAM_RSA_FACTOR1);
    BignumWrapper q = getBignumParam(pkey, OSSL_PKEY_PARAM_RSA_FACTOR2);
    BignumWrapper dp = getBignumParam(pkey, OSSL_PKEY_PARAM_RSA_EXPONENT1);
    BignumWrapper dq = getBignumParam(pkey, OSSL_PKEY_PARAM_RSA_EXPONENT2);
    BignumWrapper qi = getBignumParam(pkey, OSSL_PKEY_PARAM_RSA_COEFFICIENT1);
    if (p.get() && q.get() && dp.get() && dq.get() && qi.get()) {
      builder.firstPrimeFactor(toBase64URL(p.get()))
          .secondPrimeFactor(toBase64URL(q.get()))
          .firstFactorCRTExponent(toBase64URL(dp.get()))
          .secondFactorCRTExponent(toBase64URL(dq.get()))
          .firstCRTCoefficient(toBase64URL(qi.get()));
    }
  }
  return builder.build();
}

ECKey ecKeyFromDer(std::span<const uint8_t> der) {
  EvpKeyPtr pkey = parseDerKey(der);
  return ecKeyFromEvp(pkey.get());
}

RSAKey rsaKeyFromDer(std::span<const uint8_t> der) {
  EvpKeyPtr pkey = parseDerKey(der);
  return rsaKeyFromEvp(pkey.get());
}

// Key generation

ECKey generateECKey(const Curve& curve) {
  JOSE_LOG_DEBUG("Generating EC key pair on {}", curve.name());
  const std::string& group = ecGroupName(curve);

  EvpPkeyCtxWrapper ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
  if (!ctx.get()) {
    throwOpenSSLError("Failed to create EC key context");
  }
  if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_group_name(ctx.get(), group.c_str()) <= 0) {
    throwOpenSSLError("Failed to initialize EC key generation");
  }

  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_generate(ctx.get(), &pkey) <= 0) {
    throwOpenSSLError("Failed to generate EC key pair");
  }
  EvpKeyPtr key(pkey);
  return ecKeyFromEvp(key.get());
}

RSAKey generateRSAKey(size_t bits) {
  if (bits < crypto_constants::MIN_RSA_KEY_BITS) {
    throw KeyLengthError("The RSA key size must be at least " +
                         std::to_string(crypto_constants::MIN_RSA_KEY_BITS) +
                         " bits");
  }
  JOSE_LOG_DEBUG("Generating {} bit RSA key pair", bits);

  EvpPkeyCtxWrapper ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr));
  if (!ctx.get()) {
    throwOpenSSLError("Failed to create RSA key context");
  }
  if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), static_cast<int>(bits)) <=
          0) {
    throwOpenSSLError("Failed to initialize RSA key generation");
  }

  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_generate(ctx.get(), &pkey) <= 0) {
    throwOpenSSLError("Failed to generate RSA key pair");
  }
  EvpKeyPtr key(pkey);
  return rsaKeyFromEvp(key.get());
}

OctetSequenceKey generateOctetSequenceKey(size_t bits) {
  if (bits == 0 || bits % 8 != 0) {
    throw InvalidArgumentError(
        "The key size must be a positive multiple of 8 bits");
  }
  JOSE_LOG_DEBUG("Generating {} bit octet sequence key", bits);
  SecureBytes key(bits / 8);
  randomBytes(key.data(), key.size());
  return OctetSequenceKey::Builder(std::move(key)).build();
}

Base64URL computeThumbprint(const JWK& jwk) {
  // Required members only, in lexicographic order
  json members = json::object();
  switch (jwk.kind()) {
    case KeyKind::EC: {
      const auto& key = jwk.get<ECKey>();
      members["crv"] = key.curve().name();
      members["kty"] = key.keyType().name();
      members["x"] = key.x().toString();
      members["y"] = key.y().toString();
      break;
    }
    case KeyKind::RSA: {
      const auto& key = jwk.get<RSAKey>();
      members["e"] = key.publicExponent().toString();
      members["kty"] = key.keyType().name();
      members["n"] = key.modulus().toString();
      break;
    }
    case KeyKind::OCT: {
      const auto& key = jwk.get<OctetSequenceKey>();
      members["k"] = key.keyValue().toString();
      members["kty"] = key.keyType().name();
      break;
    }
  }

  std::string text = members.dump();
  std::array<uint8_t, EVP_MAX_MD_SIZE> digest{};
  unsigned int len = 0;
  if (EVP_Digest(text.data(), text.size(), digest.data(), &len, EVP_sha256(),
                 nullptr) != 1) {
    throwOpenSSLError("Failed to compute JWK thumbprint");
  }
  return Base64URL::encode(std::span<const uint8_t>(digest.data(), len));
}

// MACSigner / MACVerifier

MACSigner::MACSigner(SecureBytes secret)
    : secret_(checkedSecret(std::move(secret))) {}

MACSigner::MACSigner(const OctetSequenceKey& key)
    : MACSigner(key.toByteArray()) {}

AlgorithmFamily<JWSAlgorithm> MACSigner::supportedAlgorithms() const {
  return macAlgorithmsFor(secret_.size() * 8);
}

Base64URL MACSigner::sign(const JWSHeader& header,
                          std::span<const uint8_t> signingInput) const {
  return Base64URL::encode(computeHmac(header, secret_, signingInput));
}

MACVerifier::MACVerifier(SecureBytes secret,
                         std::optional<JWSHeaderFilter> filter,
                         std::vector<std::string> deferredCriticalParams)
    : secret_(checkedSecret(std::move(secret))),
      filter_(std::move(filter)),
      critChecker_(std::move(deferredCriticalParams)) {}

MACVerifier::MACVerifier(const OctetSequenceKey& key,
                         std::optional<JWSHeaderFilter> filter,
                         std::vector<std::string> deferredCriticalParams)
    : MACVerifier(key.toByteArray(), std::move(filter),
                  std::move(deferredCriticalParams)) {}

AlgorithmFamily<JWSAlgorithm> MACVerifier::supportedAlgorithms() const {
  return macAlgorithmsFor(secret_.size() * 8);
}

bool MACVerifier::verify(const JWSHeader& header,
                         std::span<const uint8_t> signingInput,
                         const Base64URL& signature) const {
  if (!critChecker_.headerPasses(header)) {
    JOSE_LOG_DEBUG("JWS header lists an unsupported critical parameter");
    return false;
  }
  std::vector<uint8_t> expected = computeHmac(header, secret_, signingInput);
  std::vector<uint8_t> actual = signature.decode();
  return secure_utils::constantTimeEqual(expected, actual);
}

// RSASSASigner / RSASSAVerifier

RSASSASigner::RSASSASigner(const RSAKey& privateKey) {
  if (!privateKey.isPrivate()) {
    throw InvalidArgumentError("The RSA key must be private");
  }
  if (privateKey.size() < crypto_constants::MIN_RSA_KEY_BITS) {
    throw KeyLengthError("The RSA key size must be at least " +
                         std::to_string(crypto_constants::MIN_RSA_KEY_BITS) +
                         " bits");
  }
  key_ = toEvpPrivateKey(privateKey);
}

Base64URL RSASSASigner::sign(const JWSHeader& header,
                             std::span<const uint8_t> signingInput) const {
  const JWSAlgorithm& alg = header.algorithm();
  const EVP_MD* md = requireDigest(alg, JWSAlgorithm::Family::RSA);
  return Base64URL::encode(digestSign(key_.get(), md, isPSS(alg), signingInput));
}

RSASSAVerifier::RSASSAVerifier(const RSAKey& publicKey,
                               std::optional<JWSHeaderFilter> filter,
                               std::vector<std::string> deferredCriticalParams)
    : key_(toEvpPublicKey(publicKey)),
      filter_(std::move(filter)),
      critChecker_(std::move(deferredCriticalParams)) {}

bool RSASSAVerifier::verify(const JWSHeader& header,
                            std::span<const uint8_t> signingInput,
                            const Base64URL& signature) const {
  if (!critChecker_.headerPasses(header)) {
    JOSE_LOG_DEBUG("JWS header lists an unsupported critical parameter");
    return false;
  }
  const JWSAlgorithm& alg = header.algorithm();
  const EVP_MD* md = requireDigest(alg, JWSAlgorithm::Family::RSA);
  std::vector<uint8_t> sig = signature.decode();
  return digestVerify(key_.get(), md, isPSS(alg), signingInput, sig);
}

// ECDSASigner / ECDSAVerifier

ECDSASigner::ECDSASigner(const ECKey& privateKey)
    : curve_(privateKey.curve()) {
  // Rejects curves without an ECDSA algorithm
  ecdsaAlgorithmFor(curve_);
  if (!privateKey.isPrivate()) {
    throw InvalidArgumentError("The EC key must be private");
  }
  key_ = toEvpPrivateKey(privateKey);
}

AlgorithmFamily<JWSAlgorithm> ECDSASigner::supportedAlgorithms() const {
  return {ecdsaAlgorithmFor(curve_)};
}

Base64URL ECDSASigner::sign(const JWSHeader& header,
                            std::span<const uint8_t> signingInput) const {
  const JWSAlgorithm& alg = header.algorithm();
  checkECDSAAlgorithm(alg, curve_);
  std::vector<uint8_t> der =
      digestSign(key_.get(), digestFor(alg), false, signingInput);
  return Base64URL::encode(derToConcat(der, coordinateLength(curve_)));
}

ECDSAVerifier::ECDSAVerifier(const ECKey& publicKey,
                             std::optional<JWSHeaderFilter> filter,
                             std::vector<std::string> deferredCriticalParams)
    : curve_(publicKey.curve()),
      key_(toEvpPublicKey(publicKey)),
      filter_(std::move(filter)),
      critChecker_(std::move(deferredCriticalParams)) {
  ecdsaAlgorithmFor(curve_);
}

AlgorithmFamily<JWSAlgorithm> ECDSAVerifier::supportedAlgorithms() const {
  return {ecdsaAlgorithmFor(curve_)};
}

bool ECDSAVerifier::verify(const JWSHeader& header,
                           std::span<const uint8_t> signingInput,
                           const Base64URL& signature) const {
  if (!critChecker_.headerPasses(header)) {
    JOSE_LOG_DEBUG("JWS header lists an unsupported critical parameter");
    return false;
  }
  const JWSAlgorithm& alg = header.algorithm();
  checkECDSAAlgorithm(alg, curve_);
  std::optional<std::vector<uint8_t>> der =
      concatToDer(signature.decode(), coordinateLength(curve_));
  if (!der) {
    return false;
  }
  return digestVerify(key_.get(), digestFor(alg), false, signingInput, *der);
}

// DirectEncrypter / DirectDecrypter

DirectEncrypter::DirectEncrypter(SecureBytes key)
    : key_(checkedContentKey(std::move(key))) {}

DirectEncrypter::DirectEncrypter(const OctetSequenceKey& key)
    : DirectEncrypter(key.toByteArray()) {}

AlgorithmFamily<EncryptionMethod> DirectEncrypter::supportedEncryptionMethods()
    const {
  return {*gcmMethodFor(key_.size())};
}

JWECryptoParts DirectEncrypter::encrypt(
    const JWEHeader& header, std::span<const uint8_t> clearText) const {
  checkDirectHeader(header, key_);

  std::vector<uint8_t> iv(crypto_constants::GCM_IV_SIZE);
  randomBytes(iv.data(), iv.size());
  std::string aad = header.toBase64URL().toString();

  EvpCipherCtxWrapper ctx(EVP_CIPHER_CTX_new());
  if (!ctx.get()) throwOpenSSLError("Failed to create AES-GCM context");

  if (EVP_EncryptInit_ex(ctx.get(), gcmCipherFor(key_.size()), nullptr,
                         nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(iv.size()), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(),
                         iv.data()) != 1) {
    throwOpenSSLError("Failed to initialize AES-GCM encryption");
  }

  int len = 0;
  if (EVP_EncryptUpdate(ctx.get(), nullptr, &len,
                        reinterpret_cast<const unsigned char*>(aad.data()),
                        static_cast<int>(aad.size())) != 1) {
    throwOpenSSLError("Failed to set AES-GCM additional data");
  }

  std::vector<uint8_t> cipherText(clearText.size() + EVP_MAX_BLOCK_LENGTH);
  int cipherLen = 0;
  if (!clearText.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), cipherText.data(), &len, clearText.data(),
                          static_cast<int>(clearText.size())) != 1) {
      throwOpenSSLError("Failed to encrypt data");
    }
    cipherLen = len;
  }
  if (EVP_EncryptFinal_ex(ctx.get(), cipherText.data() + cipherLen, &len) !=
      1) {
    throwOpenSSLError("Failed to finalize AES-GCM encryption");
  }
  cipherText.resize(static_cast<size_t>(cipherLen + len));

  std::vector<uint8_t> tag(crypto_constants::GCM_TAG_SIZE);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(tag.size()), tag.data()) != 1) {
    throwOpenSSLError("Failed to get AES-GCM authentication tag");
  }

  return JWECryptoParts{std::nullopt, Base64URL::encode(iv),
                        Base64URL::encode(cipherText), Base64URL::encode(tag)};
}

DirectDecrypter::DirectDecrypter(SecureBytes key,
                                 std::optional<JWEHeaderFilter> filter,
                                 std::vector<std::string> deferredCriticalParams)
    : key_(checkedContentKey(std::move(key))),
      filter_(std::move(filter)),
      critChecker_(std::move(deferredCriticalParams)) {}

DirectDecrypter::DirectDecrypter(const OctetSequenceKey& key,
                                 std::optional<JWEHeaderFilter> filter,
                                 std::vector<std::string> deferredCriticalParams)
    : DirectDecrypter(key.toByteArray(), std::move(filter),
                      std::move(deferredCriticalParams)) {}

AlgorithmFamily<EncryptionMethod> DirectDecrypter::supportedEncryptionMethods()
    const {
  return {*gcmMethodFor(key_.size())};
}

std::vector<uint8_t> DirectDecrypter::decrypt(
    const JWEHeader& header, const std::optional<Base64URL>& encryptedKey,
    const std::optional<Base64URL>& iv, const Base64URL& cipherText,
    const std::optional<Base64URL>& authTag) const {
  if (!critChecker_.headerPasses(header)) {
    throw CryptoError("The JWE header lists an unsupported critical parameter");
  }
  checkDirectHeader(header, key_);
  if (encryptedKey && !encryptedKey->empty()) {
    throw CryptoError("Unexpected encrypted key for direct encryption");
  }
  if (!iv || !authTag) {
    throw CryptoError("Missing JWE initialization vector or authentication tag");
  }

  std::vector<uint8_t> ivBytes = iv->decode();
  std::vector<uint8_t> tag = authTag->decode();
  if (ivBytes.size() != crypto_constants::GCM_IV_SIZE) {
    throw CryptoError("Invalid IV size for AES-GCM (must be 12 bytes)");
  }
  if (tag.size() != crypto_constants::GCM_TAG_SIZE) {
    throw CryptoError("Invalid AES-GCM authentication tag size");
  }
  std::vector<uint8_t> input = cipherText.decode();
  std::string aad = header.toBase64URL().toString();

  EvpCipherCtxWrapper ctx(EVP_CIPHER_CTX_new());
  if (!ctx.get()) throwOpenSSLError("Failed to create AES-GCM context");

  if (EVP_DecryptInit_ex(ctx.get(), gcmCipherFor(key_.size()), nullptr,
                         nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(ivBytes.size()), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(),
                         ivBytes.data()) != 1) {
    throwOpenSSLError("Failed to initialize AES-GCM decryption");
  }

  int len = 0;
  if (EVP_DecryptUpdate(ctx.get(), nullptr, &len,
                        reinterpret_cast<const unsigned char*>(aad.data()),
                        static_cast<int>(aad.size())) != 1) {
    throwOpenSSLError("Failed to set AES-GCM additional data");
  }

  std::vector<uint8_t> clearText(input.size() + EVP_MAX_BLOCK_LENGTH);
  int clearLen = 0;
  if (!input.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), clearText.data(), &len, input.data(),
                          static_cast<int>(input.size())) != 1) {
      throwOpenSSLError("Failed to decrypt data");
    }
    clearLen = len;
  }

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(tag.size()), tag.data()) != 1) {
    throwOpenSSLError("Failed to set AES-GCM authentication tag");
  }

  if (EVP_DecryptFinal_ex(ctx.get(), clearText.data() + clearLen, &len) != 1) {
    ERR_clear_error();
    JOSE_LOG_DEBUG("AES-GCM tag mismatch for {}",
                   header.encryptionMethod().name());
    throw CryptoError("AES-GCM authentication tag verification failed");
  }
  clearText.resize(static_cast<size_t>(clearLen + len));
  return clearText;
}

}  // namespace jose
