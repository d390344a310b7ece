#include <sharevault/blake3/hash.hpp>
#include <sharevault/execution/options.hpp>

namespace sharevault::execution {

sharevault::schema::hash32_t make_chain_id(const std::string_view chain_name) {
  return sharevault::blake3::hash(chain_name);
}

std::optional<genesis_account> try_parse_genesis_account(
    const std::string_view value) {
  auto separator = value.find('=');
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }
  auto account = value.substr(0, separator);
  if (!sharevault::schema::is_valid_account_id(account)) {
    return std::nullopt;
  }
  auto rest = value.substr(separator + 1);
  auto public_key = std::optional<sharevault::schema::ed25519_public_key_t>{};
  if (auto key_separator = rest.find(':');
      key_separator != std::string_view::npos) {
    public_key =
        sharevault::schema::try_make_public_key(rest.substr(key_separator + 1));
    if (!public_key) {
      return std::nullopt;
    }
    rest = rest.substr(0, key_separator);
  }
  auto balance = sharevault::schema::try_parse_amount(rest);
  if (!balance) {
    return std::nullopt;
  }
  return genesis_account{.account_id = std::string{account},
                         .balance = *balance,
                         .public_key = public_key};
}

}  // namespace sharevault::execution
