/**
 * @file json_utils.hpp
 * @brief JSON value type and typed member accessors that report malformed
 * input as ParseError
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "base64url.hpp"
#include "error.hpp"

namespace jose {

/// JSON tree type, objects keep member insertion order
using json = nlohmann::ordered_json;

namespace json_utils {

/**
 * @brief Parse text into a JSON object
 * @throws ParseError if the text is not JSON or not a JSON object
 */
json parseJSONObject(std::string_view text);

/**
 * @brief Compact serialization of a JSON value
 */
std::string toString(const json& value);

/**
 * @brief Mandatory string member
 * @throws ParseError if missing or not a string
 */
std::string getString(const json& object, std::string_view name);

/**
 * @brief Mandatory member holding Base64URL text
 */
Base64URL getBase64URL(const json& object, std::string_view name);

/**
 * @brief Mandatory member holding an absolute URI
 */
std::string getURI(const json& object, std::string_view name);

/**
 * @brief Mandatory array-of-strings member
 */
std::vector<std::string> getStringArray(const json& object,
                                        std::string_view name);

/**
 * @brief Mandatory JSON object member
 */
const json& getJSONObject(const json& object, std::string_view name);

/**
 * @brief Mandatory JSON array member
 */
const json& getJSONArray(const json& object, std::string_view name);

/**
 * @brief Mandatory non-negative integer member
 */
int64_t getNonNegativeInteger(const json& object, std::string_view name);

// Optional variants return std::nullopt when the member is absent and throw
// ParseError when it is present with the wrong type.
std::optional<std::string> getOptionalString(const json& object,
                                             std::string_view name);
std::optional<Base64URL> getOptionalBase64URL(const json& object,
                                              std::string_view name);
std::optional<std::string> getOptionalURI(const json& object,
                                          std::string_view name);

/**
 * @brief Check that a string is an absolute URI (has a scheme)
 */
bool isAbsoluteURI(std::string_view value) noexcept;

}  // namespace json_utils
}  // namespace jose
