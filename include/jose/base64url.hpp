/**
 * @file base64url.hpp
 * @brief Base64URL and Base64 codecs and the encoded-value types used on the
 * JOSE wire
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace jose {

/**
 * @brief Implementation for base64url encoding from span
 * @param data Input byte span
 * @return Unpadded base64url string
 */
std::string base64UrlEncodeImpl(std::span<const uint8_t> data);

/**
 * @brief Implementation for standard (padded) base64 encoding from span
 */
std::string base64EncodeImpl(std::span<const uint8_t> data);

/**
 * @brief Concept for data types suitable for base64 encoding
 */
template <typename T>
concept Base64Data = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<std::remove_cv_t<typename T::value_type>, uint8_t>;
};

/**
 * @brief Encode data as base64url
 * @param data Input bytes
 * @return Base64url string without padding
 */
template <Base64Data T>
std::string base64UrlEncode(const T& data) {
  return base64UrlEncodeImpl({std::data(data), std::size(data)});
}

/**
 * @brief Decode base64url string
 * @param data Base64url string, trailing '=' padding tolerated
 * @return Decoded bytes
 * @throws InvalidBase64Error if invalid characters found
 */
std::vector<uint8_t> base64UrlDecode(std::string_view data);

template <Base64Data T>
std::string base64Encode(const T& data) {
  return base64EncodeImpl({std::data(data), std::size(data)});
}

/**
 * @brief Decode standard base64 (as used by the "x5c" parameter)
 * @throws InvalidBase64Error if invalid characters found
 */
std::vector<uint8_t> base64Decode(std::string_view data);

/**
 * @brief A Base64URL-encoded value, kept in its encoded form.
 *
 * Equality is on the encoded text, which lets parsed JOSE segments be
 * re-emitted byte for byte.
 */
class Base64URL {
 public:
  Base64URL() = default;

  /**
   * @brief Wrap already-encoded text
   * @throws InvalidBase64Error if the text has characters outside the
   * base64url alphabet
   */
  explicit Base64URL(std::string encoded);

  template <Base64Data T>
  static Base64URL encode(const T& data) {
    Base64URL result;
    result.value_ = base64UrlEncode(data);
    return result;
  }

  static Base64URL encode(std::string_view text);

  [[nodiscard]] std::vector<uint8_t> decode() const;

  /**
   * @brief Decode to a UTF-8 string
   */
  [[nodiscard]] std::string decodeToString() const;

  [[nodiscard]] const std::string& toString() const noexcept { return value_; }

  [[nodiscard]] bool empty() const noexcept { return value_.empty(); }

  bool operator==(const Base64URL& other) const noexcept = default;

 private:
  std::string value_;
};

/**
 * @brief A standard Base64-encoded value (X.509 certificate chain entries)
 */
class Base64 {
 public:
  explicit Base64(std::string encoded);

  [[nodiscard]] std::vector<uint8_t> decode() const;

  [[nodiscard]] const std::string& toString() const noexcept { return value_; }

  bool operator==(const Base64& other) const noexcept = default;

 private:
  std::string value_;
};

}  // namespace jose

namespace std {
template <>
struct hash<jose::Base64URL> {
  size_t operator()(const jose::Base64URL& value) const noexcept {
    return hash<string>{}(value.toString());
  }
};
}  // namespace std
