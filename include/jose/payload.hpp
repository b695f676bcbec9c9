/**
 * @file payload.hpp
 * @brief Payload of a JOSE object with lazily derived, cached views
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "base64url.hpp"
#include "json_utils.hpp"

namespace jose {

/**
 * @brief Message payload.
 *
 * The payload is created from one authoritative view (JSON object, string,
 * bytes or Base64URL). The other views are derived on first access under
 * UTF-8 and Base64URL encoding and cached; the caches are guarded so that
 * concurrent reads of one payload are safe.
 */
class Payload {
 public:
  enum class Origin { JSON, STRING, BYTE_ARRAY, BASE64URL };

  explicit Payload(json object);
  explicit Payload(std::string text);
  explicit Payload(const char* text) : Payload(std::string(text)) {}
  explicit Payload(std::vector<uint8_t> bytes);
  explicit Payload(Base64URL base64);

  Payload(const Payload& other);
  Payload& operator=(const Payload& other);
  Payload(Payload&& other) noexcept;
  Payload& operator=(Payload&& other) noexcept;
  ~Payload() = default;

  [[nodiscard]] Origin origin() const noexcept { return origin_; }

  /**
   * @brief JSON object view
   * @return std::nullopt if the payload is not a JSON object
   */
  [[nodiscard]] std::optional<json> toJSONObject() const;

  /// UTF-8 string view
  [[nodiscard]] std::string toString() const;

  [[nodiscard]] std::vector<uint8_t> toBytes() const;

  [[nodiscard]] Base64URL toBase64URL() const;

 private:
  const std::string& stringView() const;
  const std::vector<uint8_t>& bytesView() const;

  Origin origin_;

  mutable std::mutex mutex_;
  mutable bool json_resolved_ = false;
  mutable std::optional<json> json_;
  mutable std::optional<std::string> string_;
  mutable std::optional<std::vector<uint8_t>> bytes_;
  mutable std::optional<Base64URL> base64_;
};

}  // namespace jose
