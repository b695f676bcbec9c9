/**
 * @file json_utils.cpp
 * @brief Typed JSON member access
 */

#include "jose/json_utils.hpp"

#include <cctype>

namespace jose {
namespace json_utils {

namespace {

std::string quoted(std::string_view name) {
  return "\"" + std::string(name) + "\"";
}

const json& getMember(const json& object, std::string_view name) {
  auto it = object.find(std::string(name));
  if (it == object.end()) {
    throw ParseError("Missing JSON object member with key " + quoted(name));
  }
  if (it->is_null()) {
    throw ParseError("JSON object member with key " + quoted(name) +
                     " has null value");
  }
  return *it;
}

}  // namespace

json parseJSONObject(std::string_view text) {
  json parsed;
  try {
    parsed = json::parse(text.begin(), text.end());
  } catch (const json::parse_error& e) {
    throw ParseError(std::string("Invalid JSON: ") + e.what());
  }
  if (!parsed.is_object()) {
    throw ParseError("JSON entity is not an object");
  }
  return parsed;
}

std::string toString(const json& value) { return value.dump(); }

std::string getString(const json& object, std::string_view name) {
  const json& member = getMember(object, name);
  if (!member.is_string()) {
    throw ParseError("Unexpected type of JSON object member with key " +
                     quoted(name) + ", must be a string");
  }
  return member.get<std::string>();
}

Base64URL getBase64URL(const json& object, std::string_view name) {
  std::string value = getString(object, name);
  try {
    return Base64URL(std::move(value));
  } catch (const InvalidBase64Error&) {
    throw ParseError("JSON object member with key " + quoted(name) +
                     " is not valid Base64URL");
  }
}

std::string getURI(const json& object, std::string_view name) {
  std::string value = getString(object, name);
  if (!isAbsoluteURI(value)) {
    throw ParseError("JSON object member with key " + quoted(name) +
                     " is not an absolute URI");
  }
  return value;
}

std::vector<std::string> getStringArray(const json& object,
                                        std::string_view name) {
  const json& member = getJSONArray(object, name);
  std::vector<std::string> values;
  values.reserve(member.size());
  for (const auto& item : member) {
    if (!item.is_string()) {
      throw ParseError("JSON object member with key " + quoted(name) +
                       " is not an array of strings");
    }
    values.push_back(item.get<std::string>());
  }
  return values;
}

const json& getJSONObject(const json& object, std::string_view name) {
  const json& member = getMember(object, name);
  if (!member.is_object()) {
    throw ParseError("Unexpected type of JSON object member with key " +
                     quoted(name) + ", must be an object");
  }
  return member;
}

const json& getJSONArray(const json& object, std::string_view name) {
  const json& member = getMember(object, name);
  if (!member.is_array()) {
    throw ParseError("Unexpected type of JSON object member with key " +
                     quoted(name) + ", must be an array");
  }
  return member;
}

int64_t getNonNegativeInteger(const json& object, std::string_view name) {
  const json& member = getMember(object, name);
  if (member.is_number_unsigned()) {
    return static_cast<int64_t>(member.get<uint64_t>());
  }
  if (!member.is_number_integer() || member.get<int64_t>() < 0) {
    throw ParseError("JSON object member with key " + quoted(name) +
                     " must be a non-negative integer");
  }
  return member.get<int64_t>();
}

std::optional<std::string> getOptionalString(const json& object,
                                             std::string_view name) {
  if (!object.contains(std::string(name))) return std::nullopt;
  return getString(object, name);
}

std::optional<Base64URL> getOptionalBase64URL(const json& object,
                                              std::string_view name) {
  if (!object.contains(std::string(name))) return std::nullopt;
  return getBase64URL(object, name);
}

std::optional<std::string> getOptionalURI(const json& object,
                                          std::string_view name) {
  if (!object.contains(std::string(name))) return std::nullopt;
  return getURI(object, name);
}

bool isAbsoluteURI(std::string_view value) noexcept {
  // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
  auto colon = value.find(':');
  if (colon == std::string_view::npos || colon == 0) {
    return false;
  }
  if (!std::isalpha(static_cast<unsigned char>(value[0]))) {
    return false;
  }
  for (size_t i = 1; i < colon; ++i) {
    auto c = static_cast<unsigned char>(value[i]);
    if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
      return false;
    }
  }
  for (char c : value) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return colon + 1 < value.size();
}

}  // namespace json_utils
}  // namespace jose
