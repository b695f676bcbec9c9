#include "jose/base64url.hpp"

#include <array>

namespace jose {

static constexpr std::string_view base64_chars_url =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

static constexpr std::string_view base64_chars_std =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

namespace {

using DecodeTable = std::array<int8_t, 256>;

DecodeTable makeDecodeTable(std::string_view alphabet) {
  DecodeTable table{};
  table.fill(-1);
  for (size_t i = 0; i < alphabet.size(); ++i) {
    table[static_cast<unsigned char>(alphabet[i])] = static_cast<int8_t>(i);
  }
  return table;
}

std::string encodeWith(std::span<const uint8_t> data,
                       std::string_view alphabet, bool pad) {
  std::string result;
  result.reserve(((data.size() + 2) / 3) * 4);

  int val = 0, valb = -6;
  for (uint8_t c : data) {
    val = (val << 8) + c;
    valb += 8;
    while (valb >= 0) {
      result.push_back(alphabet[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    result.push_back(alphabet[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  if (pad) {
    while (result.size() % 4 != 0) {
      result.push_back('=');
    }
  }
  return result;
}

std::vector<uint8_t> decodeWith(std::string_view encoded,
                                const DecodeTable& table) {
  std::vector<uint8_t> result;
  result.reserve((encoded.size() * 3) / 4);

  int val = 0, valb = -8;
  for (size_t i = 0; i < encoded.size(); ++i) {
    char c = encoded[i];
    if (c == '=') {
      // Padding may only trail
      if (encoded.find_first_not_of('=', i) != std::string_view::npos) {
        throw InvalidBase64Error("Padding character inside encoded data");
      }
      break;
    }

    int8_t decoded = table[static_cast<unsigned char>(c)];
    if (decoded == -1) {
      throw InvalidBase64Error("Invalid character in base64 string");
    }

    val = (val << 6) + decoded;
    valb += 6;
    if (valb >= 0) {
      result.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return result;
}

}  // namespace

std::string base64UrlEncodeImpl(std::span<const uint8_t> data) {
  return encodeWith(data, base64_chars_url, false);
}

std::string base64EncodeImpl(std::span<const uint8_t> data) {
  return encodeWith(data, base64_chars_std, true);
}

std::vector<uint8_t> base64UrlDecode(std::string_view encoded) {
  static const DecodeTable decode_table = makeDecodeTable(base64_chars_url);
  return decodeWith(encoded, decode_table);
}

std::vector<uint8_t> base64Decode(std::string_view encoded) {
  static const DecodeTable decode_table = makeDecodeTable(base64_chars_std);
  return decodeWith(encoded, decode_table);
}

namespace {

// Alphabet characters, then at most two trailing '=' padding characters
void checkEncoded(std::string_view value, std::string_view alphabet,
                  const char* kind) {
  size_t data_end = value.find('=');
  if (data_end != std::string_view::npos) {
    if (value.find_first_not_of('=', data_end) != std::string_view::npos) {
      throw InvalidBase64Error(std::string("Padding character inside ") +
                               kind + " value");
    }
    if (value.size() - data_end > 2) {
      throw InvalidBase64Error(std::string("Excess padding in ") + kind +
                               " value");
    }
  }
  for (char c : value.substr(0, data_end)) {
    if (alphabet.find(c) == std::string_view::npos) {
      throw InvalidBase64Error(std::string("Illegal character in ") + kind +
                               " value");
    }
  }
}

}  // namespace

//
// Base64URL
//

Base64URL::Base64URL(std::string encoded) : value_(std::move(encoded)) {
  checkEncoded(value_, base64_chars_url, "Base64URL");
}

Base64URL Base64URL::encode(std::string_view text) {
  std::span<const uint8_t> bytes(
      reinterpret_cast<const uint8_t*>(text.data()), text.size());
  Base64URL result;
  result.value_ = base64UrlEncodeImpl(bytes);
  return result;
}

std::vector<uint8_t> Base64URL::decode() const {
  return base64UrlDecode(value_);
}

std::string Base64URL::decodeToString() const {
  auto bytes = decode();
  return std::string(bytes.begin(), bytes.end());
}

//
// Base64
//

Base64::Base64(std::string encoded) : value_(std::move(encoded)) {
  checkEncoded(value_, base64_chars_std, "Base64");
}

std::vector<uint8_t> Base64::decode() const { return base64Decode(value_); }

}  // namespace jose
