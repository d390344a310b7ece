#include <sharevault/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string_view>

namespace sharevault::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

constexpr auto kBase64Table = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::optional<uint32_t> base64_value(const char c) {
  auto position = kBase64Table.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(position);
}

bool is_account_separator(const char c) {
  return c == '-' || c == '_' || c == '.';
}

bool is_account_character(const char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

template <std::size_t Size>
std::optional<std::array<uint8_t, Size>> try_make_fixed(
    const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != Size) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, Size>{};
  std::copy(decoded->begin(), decoded->end(), out.begin());
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  return try_make_fixed<32>(hex);
}

std::optional<ed25519_public_key_t> try_make_public_key(
    const std::string_view& hex) {
  return try_make_fixed<32>(hex);
}

std::optional<ed25519_signature_t> try_make_signature(
    const std::string_view& hex) {
  return try_make_fixed<64>(hex);
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto i = size_t{0};
  while (i + 3 <= bytes.size()) {
    auto value = (static_cast<uint32_t>(bytes[i]) << 16u) |
                 (static_cast<uint32_t>(bytes[i + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[i + 2]);
    out.push_back(kBase64Table[(value >> 18u) & 0x3Fu]);
    out.push_back(kBase64Table[(value >> 12u) & 0x3Fu]);
    out.push_back(kBase64Table[(value >> 6u) & 0x3Fu]);
    out.push_back(kBase64Table[value & 0x3Fu]);
    i += 3;
  }
  if (i < bytes.size()) {
    auto value = static_cast<uint32_t>(bytes[i]) << 16u;
    out.push_back(kBase64Table[(value >> 18u) & 0x3Fu]);
    if ((i + 1) < bytes.size()) {
      value |= static_cast<uint32_t>(bytes[i + 1]) << 8u;
      out.push_back(kBase64Table[(value >> 12u) & 0x3Fu]);
      out.push_back(kBase64Table[(value >> 6u) & 0x3Fu]);
      out.push_back('=');
    } else {
      out.push_back(kBase64Table[(value >> 12u) & 0x3Fu]);
      out.push_back('=');
      out.push_back('=');
    }
  }
  return out;
}

std::optional<bytes_t> try_from_base64(const std::string_view text) {
  if ((text.size() % 4) != 0) {
    return std::nullopt;
  }
  auto decoded = bytes_t{};
  decoded.reserve((text.size() / 4) * 3);
  for (size_t i = 0; i < text.size(); i += 4) {
    auto padding = size_t{0};
    auto value = uint32_t{0};
    for (size_t j = 0; j < 4; ++j) {
      auto c = text[i + j];
      if (c == '=') {
        // Padding only in the final group, never in its first two places.
        if (i + 4 != text.size() || j < 2) {
          return std::nullopt;
        }
        ++padding;
        value <<= 6u;
        continue;
      }
      auto digit = base64_value(c);
      if (!digit || padding != 0) {
        return std::nullopt;
      }
      value = (value << 6u) | *digit;
    }
    decoded.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    if (padding < 2) {
      decoded.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    }
    if (padding < 1) {
      decoded.push_back(static_cast<uint8_t>(value & 0xFFu));
    }
  }
  return decoded;
}

std::optional<amount_t> try_parse_amount(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  static const auto kMax = std::numeric_limits<amount_t>::max();
  auto value = amount_t{0};
  for (const auto c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    auto digit = static_cast<unsigned>(c - '0');
    if (value > (kMax - digit) / 10) {
      return std::nullopt;
    }
    value = (value * 10) + digit;
  }
  return value;
}

bool is_valid_account_id(const std::string_view account) {
  if (account.size() < 2 || account.size() > 64) {
    return false;
  }
  auto previous_was_separator = true;
  for (const auto c : account) {
    if (is_account_separator(c)) {
      if (previous_was_separator) {
        return false;
      }
      previous_was_separator = true;
      continue;
    }
    if (!is_account_character(c)) {
      return false;
    }
    previous_was_separator = false;
  }
  return !previous_was_separator;
}

}  // namespace sharevault::schema
