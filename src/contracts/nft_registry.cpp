#include <spdlog/spdlog.h>
#include <sharevault/contracts/constants.hpp>
#include <sharevault/contracts/nft_registry.hpp>

#include <string>
#include <utility>

using namespace sharevault::schema;
using namespace sharevault::runtime;

namespace sharevault::contracts {

component_kind_t nft_registry::kind() const {
  return component_kind_t::nft_registry;
}

call_outcome nft_registry::execute(call_context& context,
                                   const method_call_t& call,
                                   nft_registry_state_t& state) {
  return std::visit(
      overloaded{
          [&](const nft_mint_t& args) { return mint(context, args, state); },
          [&](const nft_approve_t& args) {
            return approve(context, args, state);
          },
          [&](const nft_transfer_t& args) {
            return transfer(context, args, state);
          },
          [](const auto&) { return make_failure(error_code::method_not_found); }},
      call);
}

call_outcome nft_registry::mint(call_context& context,
                                const nft_mint_t& args,
                                nft_registry_state_t& state) {
  if (context.predecessor() != state.owner) {
    return make_failure(error_code::unauthorized);
  }
  if (!is_valid_account_id(args.owner)) {
    return make_failure(error_code::invalid_account_id);
  }
  if (state.tokens.contains(args.token_id)) {
    return make_failure(error_code::asset_exists);
  }
  auto token = nft_token_t{};
  token.token_id = args.token_id;
  token.owner = args.owner;
  state.tokens[args.token_id] = std::move(token);
  context.emit("nft_mint", {{"owner_id", args.owner},
                            {"token_id", args.token_id}});
  return make_success();
}

call_outcome nft_registry::approve(call_context& context,
                                   const nft_approve_t& args,
                                   nft_registry_state_t& state) {
  auto token = state.tokens.find(args.token_id);
  if (token == std::end(state.tokens)) {
    return make_failure(error_code::asset_missing);
  }
  if (token->second.owner != context.predecessor()) {
    return make_failure(error_code::unauthorized);
  }
  if (!is_valid_account_id(args.account)) {
    return make_failure(error_code::invalid_account_id);
  }
  auto approval_id = token->second.next_approval_id++;
  token->second.approvals[args.account] = approval_id;
  context.emit("nft_approve", {{"token_id", args.token_id},
                               {"account_id", args.account},
                               {"approval_id", std::to_string(approval_id)}});
  return make_success_value(approval_id);
}

call_outcome nft_registry::transfer(call_context& context,
                                    const nft_transfer_t& args,
                                    nft_registry_state_t& state) {
  if (context.attached_deposit() != kOneUnitDeposit) {
    return make_failure(error_code::deposit_required);
  }
  auto token = state.tokens.find(args.token_id);
  if (token == std::end(state.tokens)) {
    return make_failure(error_code::asset_missing);
  }
  const auto& sender = context.predecessor();
  if (token->second.owner != sender) {
    auto approval = token->second.approvals.find(sender);
    if (approval == std::end(token->second.approvals)) {
      return make_failure(error_code::asset_not_owned);
    }
    if (args.approval_id && *args.approval_id != approval->second) {
      return make_failure(error_code::approval_mismatch);
    }
  }
  if (token->second.owner == args.receiver) {
    return make_failure(error_code::self_transfer);
  }
  if (!is_valid_account_id(args.receiver)) {
    return make_failure(error_code::invalid_account_id);
  }
  auto previous = std::exchange(token->second.owner, args.receiver);
  token->second.approvals.clear();
  spdlog::debug("Asset '{}' moved from '{}' to '{}'", args.token_id, previous,
                args.receiver);
  context.emit("nft_transfer", {{"old_owner_id", previous},
                                {"new_owner_id", args.receiver},
                                {"token_id", args.token_id}});
  return make_success_value(previous);
}

}  // namespace sharevault::contracts
