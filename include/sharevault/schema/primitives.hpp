#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sharevault::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = std::string;
using asset_id_t = std::string;
using amount_t = boost::multiprecision::uint128_t;
using gas_t = uint64_t;
using ed25519_public_key_t = std::array<uint8_t, 32>;
using ed25519_signature_t = std::array<uint8_t, 64>;

inline constexpr gas_t kTeraGas = 1'000'000'000'000;

/// 10^24, the smallest-denomination scale of one whole share or native unit.
inline const amount_t kWholeUnit =
    amount_t{1'000'000'000'000} * amount_t{1'000'000'000'000};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
std::optional<ed25519_public_key_t> try_make_public_key(
    const std::string_view& hex);
std::optional<ed25519_signature_t> try_make_signature(
    const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
/// Standard alphabet with '=' padding; std::nullopt on malformed input.
std::optional<bytes_t> try_from_base64(const std::string_view text);

/// Parse a decimal amount. Rejects empty input, non-digits and values that do
/// not fit in 128 bits.
std::optional<amount_t> try_parse_amount(const std::string_view text);

/// Account ids follow the named-account rules: 2..64 characters of
/// [a-z0-9], separated by single '-', '_' or '.' characters.
bool is_valid_account_id(const std::string_view account);

}  // namespace sharevault::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
