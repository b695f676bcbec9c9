/**
 * @file payload.cpp
 * @brief Payload view conversions
 */

#include "jose/payload.hpp"

namespace jose {

Payload::Payload(json object) : origin_(Origin::JSON) {
  if (!object.is_object()) {
    throw InvalidArgumentError("The JSON payload must be a JSON object");
  }
  json_resolved_ = true;
  json_ = std::move(object);
}

Payload::Payload(std::string text)
    : origin_(Origin::STRING), string_(std::move(text)) {}

Payload::Payload(std::vector<uint8_t> bytes)
    : origin_(Origin::BYTE_ARRAY), bytes_(std::move(bytes)) {}

Payload::Payload(Base64URL base64)
    : origin_(Origin::BASE64URL), base64_(std::move(base64)) {}

Payload::Payload(const Payload& other) {
  std::lock_guard<std::mutex> lock(other.mutex_);
  origin_ = other.origin_;
  json_resolved_ = other.json_resolved_;
  json_ = other.json_;
  string_ = other.string_;
  bytes_ = other.bytes_;
  base64_ = other.base64_;
}

Payload& Payload::operator=(const Payload& other) {
  if (this != &other) {
    std::scoped_lock lock(mutex_, other.mutex_);
    origin_ = other.origin_;
    json_resolved_ = other.json_resolved_;
    json_ = other.json_;
    string_ = other.string_;
    bytes_ = other.bytes_;
    base64_ = other.base64_;
  }
  return *this;
}

Payload::Payload(Payload&& other) noexcept
    : origin_(other.origin_),
      json_resolved_(other.json_resolved_),
      json_(std::move(other.json_)),
      string_(std::move(other.string_)),
      bytes_(std::move(other.bytes_)),
      base64_(std::move(other.base64_)) {}

Payload& Payload::operator=(Payload&& other) noexcept {
  if (this != &other) {
    origin_ = other.origin_;
    json_resolved_ = other.json_resolved_;
    json_ = std::move(other.json_);
    string_ = std::move(other.string_);
    bytes_ = std::move(other.bytes_);
    base64_ = std::move(other.base64_);
  }
  return *this;
}

// The view helpers below expect mutex_ to be held

const std::string& Payload::stringView() const {
  if (!string_) {
    switch (origin_) {
      case Origin::JSON:
        string_ = json_utils::toString(*json_);
        break;
      case Origin::BYTE_ARRAY:
        string_ = std::string(bytes_->begin(), bytes_->end());
        break;
      case Origin::BASE64URL:
        string_ = base64_->decodeToString();
        break;
      case Origin::STRING:
        break;
    }
  }
  return *string_;
}

const std::vector<uint8_t>& Payload::bytesView() const {
  if (!bytes_) {
    if (origin_ == Origin::BASE64URL) {
      bytes_ = base64_->decode();
    } else {
      const std::string& text = stringView();
      bytes_ = std::vector<uint8_t>(text.begin(), text.end());
    }
  }
  return *bytes_;
}

std::optional<json> Payload::toJSONObject() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!json_resolved_) {
    json_resolved_ = true;
    try {
      json_ = json_utils::parseJSONObject(stringView());
    } catch (const ParseError&) {
      // Not a JSON object, the other views remain valid
      json_.reset();
    }
  }
  return json_;
}

std::string Payload::toString() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stringView();
}

std::vector<uint8_t> Payload::toBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bytesView();
}

Base64URL Payload::toBase64URL() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!base64_) {
    base64_ = Base64URL::encode(bytesView());
  }
  return *base64_;
}

}  // namespace jose
