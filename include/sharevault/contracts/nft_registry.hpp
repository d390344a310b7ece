#pragma once

#include <sharevault/runtime/component.hpp>
#include <sharevault/schema/nft_registry_state.hpp>

namespace sharevault::contracts {

/// Minimal unique-asset registry vaults take custody from.
///
/// A successful `nft_transfer` returns the token's previous owner so that a
/// resumption can tell whose asset moved.
class nft_registry final
    : public runtime::stateful_component<
          sharevault::schema::nft_registry_state_t> {
 public:
  sharevault::schema::component_kind_t kind() const override;

 protected:
  runtime::call_outcome execute(
      runtime::call_context& context,
      const sharevault::schema::method_call_t& call,
      sharevault::schema::nft_registry_state_t& state) override;

 private:
  runtime::call_outcome mint(runtime::call_context& context,
                             const sharevault::schema::nft_mint_t& args,
                             sharevault::schema::nft_registry_state_t& state);
  runtime::call_outcome approve(
      runtime::call_context& context,
      const sharevault::schema::nft_approve_t& args,
      sharevault::schema::nft_registry_state_t& state);
  runtime::call_outcome transfer(
      runtime::call_context& context,
      const sharevault::schema::nft_transfer_t& args,
      sharevault::schema::nft_registry_state_t& state);
};

}  // namespace sharevault::contracts
