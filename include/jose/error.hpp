/**
 * @file error.hpp
 * @brief Error codes and exception hierarchy for the JOSE library
 */

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jose {

/**
 * @brief Error codes for programmatic error handling
 */
enum class JoseErrorCode : uint32_t {
  SUCCESS = 0,
  PARSE_ERROR = 1000,
  INVALID_BASE64 = 1001,
  INVALID_ARGUMENT = 2000,
  INVALID_STATE = 2001,
  ALGORITHM_ERROR = 3000,
  ALGORITHM_NOT_SUPPORTED = 3001,
  ALGORITHM_NOT_ACCEPTED = 3002,
  PARAMS_NOT_ACCEPTED = 3003,
  KEY_LENGTH = 3004,
  KEY_TYPE = 3005,
  CRYPTO_OPERATION_FAILED = 4000,
  OS_ERROR = 6000,
  MEMORY_ERROR = 6001,
  SYSTEM_CALL_FAILED = 6005
};

/**
 * @brief Convert error code to string description
 */
constexpr std::string_view errorCodeToString(JoseErrorCode code) noexcept {
  switch (code) {
    case JoseErrorCode::SUCCESS:
      return "Success";
    case JoseErrorCode::PARSE_ERROR:
      return "Parse error";
    case JoseErrorCode::INVALID_BASE64:
      return "Invalid Base64URL encoding";
    case JoseErrorCode::INVALID_ARGUMENT:
      return "Invalid argument";
    case JoseErrorCode::INVALID_STATE:
      return "Invalid object state";
    case JoseErrorCode::ALGORITHM_ERROR:
      return "Algorithm error";
    case JoseErrorCode::ALGORITHM_NOT_SUPPORTED:
      return "Algorithm not supported";
    case JoseErrorCode::ALGORITHM_NOT_ACCEPTED:
      return "Algorithm not accepted";
    case JoseErrorCode::PARAMS_NOT_ACCEPTED:
      return "Header parameters not accepted";
    case JoseErrorCode::KEY_LENGTH:
      return "Invalid key length";
    case JoseErrorCode::KEY_TYPE:
      return "Invalid key type";
    case JoseErrorCode::CRYPTO_OPERATION_FAILED:
      return "Cryptographic operation failed";
    case JoseErrorCode::OS_ERROR:
      return "Operating system error";
    case JoseErrorCode::MEMORY_ERROR:
      return "Memory allocation error";
    case JoseErrorCode::SYSTEM_CALL_FAILED:
      return "System call failed";
    default:
      return "Unknown error";
  }
}

/**
 * @brief Base exception class for all JOSE errors
 */
class JoseError : public std::runtime_error {
 public:
  /**
   * @brief Construct an error with message and error code
   * @param code Error code
   * @param message Error description (optional, uses default if empty)
   */
  explicit JoseError(JoseErrorCode code, std::string_view message = {})
      : std::runtime_error(message.empty()
                               ? std::string(errorCodeToString(code))
                               : std::string(message)),
        error_code_(code) {}

  /**
   * @brief Get the error code
   * @return The error code
   */
  [[nodiscard]] JoseErrorCode errorCode() const noexcept { return error_code_; }

 private:
  JoseErrorCode error_code_;
};

/**
 * @brief Malformed compact form, malformed JSON, or a missing or mistyped
 * mandatory member
 */
class ParseError : public JoseError {
 public:
  explicit ParseError(std::string_view details)
      : JoseError(JoseErrorCode::PARSE_ERROR, details) {}

 protected:
  ParseError(JoseErrorCode code, std::string_view details)
      : JoseError(code, details) {}
};

class InvalidBase64Error : public ParseError {
 public:
  explicit InvalidBase64Error(std::string_view details)
      : ParseError(
            JoseErrorCode::INVALID_BASE64,
            std::string("Invalid Base64URL encoding: ") + std::string(details)) {}
};

/**
 * @brief Programmer misuse, e.g. an empty mandatory constructor argument
 */
class InvalidArgumentError : public JoseError {
 public:
  explicit InvalidArgumentError(std::string_view details)
      : JoseError(JoseErrorCode::INVALID_ARGUMENT, details) {}
};

/**
 * @brief An operation was attempted from a lifecycle state that forbids it
 */
class InvalidStateError : public JoseError {
 public:
  explicit InvalidStateError(std::string_view details)
      : JoseError(JoseErrorCode::INVALID_STATE, details) {}
};

/**
 * @brief Algorithm unsupported by a collaborator, or unsuitable key material
 */
class AlgorithmError : public JoseError {
 public:
  explicit AlgorithmError(std::string_view details)
      : JoseError(JoseErrorCode::ALGORITHM_ERROR, details) {}

 protected:
  AlgorithmError(JoseErrorCode code, std::string_view details)
      : JoseError(code, details) {}
};

class AlgorithmNotSupportedError : public AlgorithmError {
 public:
  explicit AlgorithmNotSupportedError(std::string_view details)
      : AlgorithmError(JoseErrorCode::ALGORITHM_NOT_SUPPORTED, details) {}
};

class AlgorithmNotAcceptedError : public AlgorithmError {
 public:
  explicit AlgorithmNotAcceptedError(std::string_view details)
      : AlgorithmError(JoseErrorCode::ALGORITHM_NOT_ACCEPTED, details) {}
};

class ParamsNotAcceptedError : public AlgorithmError {
 public:
  explicit ParamsNotAcceptedError(std::string_view details)
      : AlgorithmError(JoseErrorCode::PARAMS_NOT_ACCEPTED, details) {}
};

class KeyLengthError : public AlgorithmError {
 public:
  explicit KeyLengthError(std::string_view details)
      : AlgorithmError(JoseErrorCode::KEY_LENGTH, details) {}
};

class KeyTypeError : public AlgorithmError {
 public:
  explicit KeyTypeError(std::string_view details)
      : AlgorithmError(JoseErrorCode::KEY_TYPE, details) {}
};

/**
 * @brief Exception for cryptographic operation failures
 */
class CryptoError : public JoseError {
 public:
  explicit CryptoError(std::string_view details)
      : JoseError(JoseErrorCode::CRYPTO_OPERATION_FAILED,
                  std::string("Cryptographic operation failed: ") +
                      std::string(details)) {}
};

/**
 * @brief Exception for OS-related errors
 */
class OsError : public JoseError {
 public:
  explicit OsError(std::string_view details)
      : JoseError(
            JoseErrorCode::OS_ERROR,
            std::string("Operating system error: ") + std::string(details)) {}
};

class MemoryError : public JoseError {
 public:
  explicit MemoryError(std::string_view details)
      : JoseError(
            JoseErrorCode::MEMORY_ERROR,
            std::string("Memory allocation error: ") + std::string(details)) {}
};

class SystemCallError : public JoseError {
 public:
  explicit SystemCallError(std::string_view details)
      : JoseError(JoseErrorCode::SYSTEM_CALL_FAILED,
                  std::string("System call failed: ") + std::string(details)) {}
};

/**
 * @brief Throw the OS exception matching an errno value
 */
[[noreturn]] inline void throwOsError(const std::string& operation,
                                      int error_code = errno) {
  std::string error_msg = std::strerror(error_code);

  switch (error_code) {
    case ENOMEM:
      throw MemoryError(operation + ": " + error_msg);
    case 0:
      throw OsError(operation + ": no errno reported");
    default:
      throw SystemCallError(operation + ": " + error_msg);
  }
}

}  // namespace jose
