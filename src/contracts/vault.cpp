#include <spdlog/spdlog.h>
#include <sharevault/contracts/constants.hpp>
#include <sharevault/contracts/vault.hpp>
#include <sharevault/ledger/share_ledger.hpp>
#include <sharevault/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <utility>

using namespace sharevault::schema;
using namespace sharevault::runtime;

namespace sharevault::contracts {

namespace {

using encoder_t = sharevault::schema::encoding::encoder<
    sharevault::schema::encoding::scale_encoder_tag>;

error_code check_batch(const std::vector<asset_id_t>& assets) {
  if (assets.empty()) {
    return error_code::empty_batch;
  }
  auto seen = std::set<asset_id_t>{};
  for (const auto& asset : assets) {
    if (!seen.insert(asset).second) {
      return error_code::duplicate_asset;
    }
  }
  return error_code::ok;
}

std::optional<amount_t> batch_amount(const amount_t& unit_value,
                                     const std::size_t count) {
  if (count != 0 && unit_value > std::numeric_limits<amount_t>::max() / count) {
    return std::nullopt;
  }
  return unit_value * count;
}

intent_status_t summarize(const settlement_intent_t& intent) {
  auto settled = std::size_t{};
  auto failed = std::size_t{};
  for (const auto& leg : intent.legs) {
    if (leg.status == intent_status_t::pending) {
      return intent_status_t::pending;
    }
    if (leg.status == intent_status_t::settled) {
      ++settled;
    } else {
      ++failed;
    }
  }
  if (failed == 0) {
    return intent_status_t::settled;
  }
  return settled == 0 ? intent_status_t::failed
                      : intent_status_t::partially_failed;
}

void on_tokens_burned(call_context& context,
                      const account_id_t& account,
                      const amount_t& amount) {
  spdlog::info("Account @{} burned {}", account, amount.str());
  context.emit("ft_burn", {{"owner_id", account}, {"amount", amount.str()}});
}

void on_account_closed(call_context& context,
                       const account_id_t& account,
                       const amount_t& balance) {
  spdlog::info("Closed @{} with {}", account, balance.str());
  context.emit("account_closed",
               {{"account_id", account}, {"balance", balance.str()}});
}

void on_tokens_minted(call_context& context,
                      const account_id_t& account,
                      const amount_t& amount) {
  context.emit("ft_mint", {{"owner_id", account}, {"amount", amount.str()}});
}

fungible_metadata_t make_metadata(const std::string& name,
                                  const std::string& symbol,
                                  const std::string& media) {
  auto metadata = fungible_metadata_t{};
  metadata.name = name;
  metadata.symbol = symbol;
  metadata.icon = media;
  return metadata;
}

}  // namespace

vault::vault(vault_options options) : options_{std::move(options)} {}

component_kind_t vault::kind() const {
  return component_kind_t::vault;
}

call_outcome vault::execute(call_context& context,
                            const method_call_t& call,
                            vault_state_t& state) {
  if (!state.initialized && !std::holds_alternative<init_vault_t>(call)) {
    return make_failure(error_code::not_initialized);
  }
  return std::visit(
      overloaded{
          [&](const init_vault_t& args) { return init(context, args, state); },
          [&](const get_info_t&) {
            auto info = public_vault_info_t{};
            auto code = make_public_info(state, info);
            if (code != error_code::ok) {
              return make_failure(code);
            }
            return make_success_value(info);
          },
          [&](const deposit_t& args) {
            return deposit(context, {args.asset_id}, state);
          },
          [&](const batch_deposit_t& args) {
            return deposit(context, args.asset_ids, state);
          },
          [&](const withdraw_t& args) {
            return withdraw(context, {args.asset_id}, state);
          },
          [&](const batch_withdraw_t& args) {
            return withdraw(context, args.asset_ids, state);
          },
          [&](const swap_t& args) { return swap(context, args, state); },
          [&](const set_params_t& args) {
            return set_params(context, args, state);
          },
          [&](const ft_transfer_t& args) {
            return ft_transfer(context, args, state);
          },
          [&](const ft_transfer_call_t& args) {
            return ft_transfer_call(context, args, state);
          },
          [&](const ft_resolve_transfer_t& args) {
            return ft_resolve_transfer(context, args, state);
          },
          [&](const storage_deposit_t& args) {
            return storage_deposit(context, args, state);
          },
          [&](const storage_withdraw_t& args) {
            return storage_withdraw(context, args, state);
          },
          [&](const storage_unregister_t& args) {
            return storage_unregister(context, args, state);
          },
          [&](const on_transfer_settled_t& args) {
            return on_transfer_settled(context, args, state);
          },
          [](const auto&) { return make_failure(error_code::method_not_found); }},
      call);
}

call_outcome vault::init(call_context& context,
                         const init_vault_t& args,
                         vault_state_t& state) {
  if (state.initialized) {
    return make_failure(error_code::already_initialized);
  }
  auto metadata = make_metadata(args.name, args.symbol, args.media);
  if (!is_valid(metadata)) {
    return make_failure(error_code::invalid_metadata);
  }

  state.initialized = true;
  state.origin = args.origin;
  state.registry = context.predecessor();
  state.unit_value = kDefaultUnitValue;
  state.name = args.name;
  state.symbol = args.symbol;
  state.media = args.media;
  state.metadata = std::move(metadata);

  // The vault holds one permanent seed unit.
  auto ledger = sharevault::ledger::share_ledger{state.ledger};
  ledger.register_account(context.current_account());
  auto code = ledger.deposit(context.current_account(), state.unit_value);
  if (code != error_code::ok) {
    return make_failure(code);
  }
  on_tokens_minted(context, context.current_account(), state.unit_value);
  spdlog::info("Vault '{}' initialized for origin '{}' by registry '{}'",
               context.current_account(), state.origin, state.registry);
  return make_success();
}

bool vault::request_transfer(call_context& context,
                             const vault_state_t& state,
                             const asset_id_t& asset,
                             const account_id_t& receiver,
                             const uint64_t intent_id,
                             const gas_t callback_gas) {
  auto call =
      make_function_call(state.origin,
                         nft_transfer_t{.receiver = receiver, .token_id = asset},
                         kTransferGas, kOneUnitDeposit);
  if (options_.settlement_mode == settlement_mode_t::confirmed) {
    call = then(std::move(call), context.current_account(),
                on_transfer_settled_t{.intent_id = intent_id, .asset_id = asset},
                callback_gas);
  }
  return context.schedule(std::move(call)).has_value();
}

call_outcome vault::deposit(call_context& context,
                            const std::vector<asset_id_t>& assets,
                            vault_state_t& state) {
  if (auto code = check_batch(assets); code != error_code::ok) {
    return make_failure(code);
  }
  const auto& caller = context.predecessor();
  auto ledger = sharevault::ledger::share_ledger{state.ledger};
  ledger.register_account(caller);

  if (options_.settlement_mode == settlement_mode_t::optimistic) {
    auto amount = batch_amount(state.unit_value, assets.size());
    if (!amount) {
      return make_failure(error_code::arithmetic_overflow);
    }
    auto code = ledger.deposit(caller, *amount);
    if (code != error_code::ok) {
      return make_failure(code);
    }
    for (const auto& asset : assets) {
      if (!request_transfer(context, state, asset, context.current_account(),
                            0)) {
        return make_failure(error_code::gas_exhausted);
      }
    }
    on_tokens_minted(context, caller, *amount);
    return make_success();
  }

  auto intent = settlement_intent_t{};
  intent.intent_id = state.next_intent_id++;
  intent.kind = intent_kind_t::deposit;
  intent.account = caller;
  intent.shares_per_leg = state.unit_value;
  intent.created_height = context.block_height();
  for (const auto& asset : assets) {
    intent.legs.push_back(settlement_leg_t{.asset_id = asset, .inbound = true});
    if (!request_transfer(context, state, asset, context.current_account(),
                          intent.intent_id)) {
      return make_failure(error_code::gas_exhausted);
    }
  }
  context.emit("settlement_intent_opened",
               {{"intent_id", std::to_string(intent.intent_id)},
                {"kind", std::string{to_string(intent.kind)}},
                {"account_id", caller}});
  auto intent_id = intent.intent_id;
  state.intents[intent_id] = std::move(intent);
  return make_success_value(intent_id);
}

call_outcome vault::withdraw(call_context& context,
                             const std::vector<asset_id_t>& assets,
                             vault_state_t& state) {
  if (auto code = check_batch(assets); code != error_code::ok) {
    return make_failure(code);
  }
  const auto& caller = context.predecessor();
  auto maybe_amount = batch_amount(state.unit_value, assets.size());
  if (!maybe_amount) {
    return make_failure(error_code::arithmetic_overflow);
  }
  const auto amount = *maybe_amount;
  auto ledger = sharevault::ledger::share_ledger{state.ledger};
  if (ledger.balance_of(caller) < amount) {
    return make_failure(
        error_code::insufficient_balance,
        assets.size() == 1
            ? "Token balance is smaller than the asset value"
            : "Token balance is smaller than the asset batch value");
  }

  if (options_.settlement_mode == settlement_mode_t::optimistic) {
    auto code = ledger.withdraw(caller, amount);
    if (code != error_code::ok) {
      return make_failure(code);
    }
    for (const auto& asset : assets) {
      if (!request_transfer(context, state, asset, caller, 0)) {
        return make_failure(error_code::gas_exhausted);
      }
    }
    on_tokens_burned(context, caller, amount);
    return make_success();
  }

  auto code = ledger.lock(caller, amount);
  if (code != error_code::ok) {
    return make_failure(code);
  }
  auto intent = settlement_intent_t{};
  intent.intent_id = state.next_intent_id++;
  intent.kind = intent_kind_t::withdraw;
  intent.account = caller;
  intent.shares_per_leg = state.unit_value;
  intent.created_height = context.block_height();
  for (const auto& asset : assets) {
    intent.legs.push_back(
        settlement_leg_t{.asset_id = asset, .inbound = false});
    if (!request_transfer(context, state, asset, caller, intent.intent_id)) {
      return make_failure(error_code::gas_exhausted);
    }
  }
  context.emit("settlement_intent_opened",
               {{"intent_id", std::to_string(intent.intent_id)},
                {"kind", std::string{to_string(intent.kind)}},
                {"account_id", caller},
                {"locked", amount.str()}});
  auto intent_id = intent.intent_id;
  state.intents[intent_id] = std::move(intent);
  return make_success_value(intent_id);
}

// No ownership or approval check is made on the outgoing asset; whichever
// asset the vault holds under that id leaves custody.
call_outcome vault::swap(call_context& context,
                         const swap_t& args,
                         vault_state_t& state) {
  if (args.asset_in == args.asset_out) {
    return make_failure(error_code::duplicate_asset);
  }
  const auto& caller = context.predecessor();
  if (options_.settlement_mode == settlement_mode_t::optimistic) {
    if (!request_transfer(context, state, args.asset_in,
                          context.current_account(), 0) ||
        !request_transfer(context, state, args.asset_out, caller, 0)) {
      return make_failure(error_code::gas_exhausted);
    }
    return make_success();
  }

  // The outgoing leg is only requested once the incoming asset is confirmed
  // to come from the caller.
  auto intent = settlement_intent_t{};
  intent.intent_id = state.next_intent_id++;
  intent.kind = intent_kind_t::swap;
  intent.account = caller;
  intent.created_height = context.block_height();
  intent.legs.push_back(
      settlement_leg_t{.asset_id = args.asset_in, .inbound = true});
  intent.legs.push_back(
      settlement_leg_t{.asset_id = args.asset_out, .inbound = false});
  if (!request_transfer(context, state, args.asset_in,
                        context.current_account(), intent.intent_id,
                        kSwapCallbackGas)) {
    return make_failure(error_code::gas_exhausted);
  }
  context.emit("settlement_intent_opened",
               {{"intent_id", std::to_string(intent.intent_id)},
                {"kind", std::string{to_string(intent.kind)}},
                {"account_id", caller}});
  auto intent_id = intent.intent_id;
  state.intents[intent_id] = std::move(intent);
  return make_success_value(intent_id);
}

call_outcome vault::set_params(call_context& context,
                               const set_params_t& args,
                               vault_state_t& state) {
  if (context.predecessor() != state.registry) {
    return make_failure(error_code::unauthorized, "!authorized");
  }
  if (args.unit_value == 0) {
    return make_failure(error_code::invalid_unit_value);
  }
  auto metadata = state.metadata;
  metadata.name = args.name;
  metadata.symbol = args.symbol;
  metadata.icon = args.media;
  if (!is_valid(metadata)) {
    return make_failure(error_code::invalid_metadata);
  }
  state.name = args.name;
  state.symbol = args.symbol;
  state.unit_value = args.unit_value;
  state.media = args.media;
  state.metadata = std::move(metadata);
  context.emit("vault_params_updated",
               {{"name", state.name},
                {"symbol", state.symbol},
                {"unit_value", state.unit_value.str()}});
  return make_success();
}

call_outcome vault::ft_transfer(call_context& context,
                                const ft_transfer_t& args,
                                vault_state_t& state) {
  if (context.attached_deposit() != kOneUnitDeposit) {
    return make_failure(error_code::deposit_required);
  }
  auto ledger = sharevault::ledger::share_ledger{state.ledger};
  auto code = ledger.transfer(context.predecessor(), args.receiver, args.amount);
  if (code != error_code::ok) {
    return make_failure(code);
  }
  auto attributes = std::vector<std::pair<std::string, std::string>>{
      {"old_owner_id", context.predecessor()},
      {"new_owner_id", args.receiver},
      {"amount", args.amount.str()}};
  if (args.memo) {
    attributes.emplace_back("memo", *args.memo);
  }
  context.emit("ft_transfer", std::move(attributes));
  return make_success();
}

call_outcome vault::ft_transfer_call(call_context& context,
                                     const ft_transfer_call_t& args,
                                     vault_state_t& state) {
  if (context.attached_deposit() != kOneUnitDeposit) {
    return make_failure(error_code::deposit_required);
  }
  const auto& sender = context.predecessor();
  auto ledger = sharevault::ledger::share_ledger{state.ledger};
  auto code = ledger.transfer(sender, args.receiver, args.amount);
  if (code != error_code::ok) {
    return make_failure(code);
  }
  auto attributes = std::vector<std::pair<std::string, std::string>>{
      {"old_owner_id", sender},
      {"new_owner_id", args.receiver},
      {"amount", args.amount.str()}};
  if (args.memo) {
    attributes.emplace_back("memo", *args.memo);
  }
  context.emit("ft_transfer", std::move(attributes));

  auto call = make_function_call(
      args.receiver,
      ft_on_transfer_t{.sender = sender, .amount = args.amount, .msg = args.msg},
      kFtOnTransferGas);
  call = then(std::move(call), context.current_account(),
              ft_resolve_transfer_t{.sender = sender,
                                    .receiver = args.receiver,
                                    .amount = args.amount},
              kFtResolveTransferGas);
  auto index = context.schedule(std::move(call));
  if (!index) {
    return make_failure(error_code::gas_exhausted);
  }
  return make_deferred(*index);
}

// Refunds whatever the receiver did not use. An unreadable or failed answer
// counts as nothing used.
call_outcome vault::ft_resolve_transfer(call_context& context,
                                        const ft_resolve_transfer_t& args,
                                        vault_state_t& state) {
  if (auto code = context.check_private_callback(); code != error_code::ok) {
    return make_failure(code);
  }
  auto unused = args.amount;
  if (const auto* success =
          std::get_if<promise_success_t>(&context.promise_results().front())) {
    auto reported =
        encoder_t{}.try_decode<amount_t>(bytes_view_t{success->payload});
    if (reported) {
      unused = std::min(*reported, args.amount);
    }
  }

  auto ledger = sharevault::ledger::share_ledger{state.ledger};
  auto refund = std::min(unused, ledger.balance_of(args.receiver));
  if (refund > 0) {
    if (ledger.is_registered(args.sender)) {
      auto code = ledger.transfer(args.receiver, args.sender, refund);
      if (code != error_code::ok) {
        return make_failure(code);
      }
      context.emit("ft_transfer", {{"old_owner_id", args.receiver},
                                   {"new_owner_id", args.sender},
                                   {"amount", refund.str()},
                                   {"memo", "refund"}});
    } else {
      // The sender closed its account in the meantime.
      auto code = ledger.withdraw(args.receiver, refund);
      if (code != error_code::ok) {
        return make_failure(code);
      }
      on_tokens_burned(context, args.receiver, refund);
    }
  }
  return make_success_value(amount_t{args.amount - refund});
}

call_outcome vault::storage_deposit(call_context& context,
                                    const storage_deposit_t& args,
                                    vault_state_t& state) {
  auto account = args.account.value_or(context.predecessor());
  if (!is_valid_account_id(account)) {
    return make_failure(error_code::invalid_account_id);
  }
  auto ledger = sharevault::ledger::share_ledger{state.ledger};
  auto registered = ledger.register_account(account);
  if (!registered) {
    spdlog::debug("Account '{}' is already registered with vault '{}'",
                  account, context.current_account());
  }
  return make_success_value(registered);
}

call_outcome vault::storage_unregister(call_context& context,
                                       const storage_unregister_t& args,
                                       vault_state_t& state) {
  if (context.attached_deposit() != kOneUnitDeposit) {
    return make_failure(error_code::deposit_required);
  }
  const auto& account = context.predecessor();
  auto ledger = sharevault::ledger::share_ledger{state.ledger};
  if (!ledger.is_registered(account)) {
    return make_success_value(false);
  }
  auto burned = amount_t{};
  auto code = ledger.close_account(account, args.force, burned);
  if (code != error_code::ok) {
    return make_failure(code);
  }
  on_account_closed(context, account, burned);
  if (burned > 0) {
    on_tokens_burned(context, account, burned);
  }
  return make_success_value(true);
}

call_outcome vault::storage_withdraw(call_context& context,
                                     const storage_withdraw_t& args,
                                     vault_state_t& state) {
  if (context.attached_deposit() != kOneUnitDeposit) {
    return make_failure(error_code::deposit_required);
  }
  auto balance = make_storage_balance(state, context.predecessor());
  if (!balance) {
    return make_failure(error_code::account_not_registered);
  }
  if (args.amount && *args.amount > balance->available) {
    return make_failure(error_code::invalid_amount,
                        "amount is greater than the available storage balance");
  }
  return make_success_value(*balance);
}

call_outcome vault::on_transfer_settled(call_context& context,
                                        const on_transfer_settled_t& args,
                                        vault_state_t& state) {
  if (auto code = context.check_private_callback(); code != error_code::ok) {
    return make_failure(code);
  }
  auto intent = state.intents.find(args.intent_id);
  if (intent == std::end(state.intents)) {
    return make_failure(error_code::intent_missing);
  }
  auto& legs = intent->second.legs;
  auto leg = std::find_if(std::begin(legs), std::end(legs),
                          [&](const settlement_leg_t& value) {
                            return value.asset_id == args.asset_id &&
                                   value.status == intent_status_t::pending;
                          });
  if (leg == std::end(legs)) {
    return make_failure(error_code::intent_missing,
                        "no pending leg for asset " + args.asset_id);
  }

  auto ledger = sharevault::ledger::share_ledger{state.ledger};
  const auto account = intent->second.account;
  const auto shares = intent->second.shares_per_leg;
  const auto kind = intent->second.kind;
  // A swap whose incoming leg did not settle never sends its outgoing asset.
  auto abandon_swap_output = [&](const std::string& reason) {
    if (kind != intent_kind_t::swap || !leg->inbound) {
      return;
    }
    for (auto& other : legs) {
      if (!other.inbound && other.status == intent_status_t::pending) {
        other.status = intent_status_t::failed;
        other.failure = reason;
      }
    }
  };

  auto outcome = std::visit(
      overloaded{
          [&](const promise_success_t& success) -> call_outcome {
            if (leg->inbound) {
              auto encoder = encoder_t{};
              auto previous =
                  encoder.try_decode<account_id_t>(bytes_view_t{success.payload});
              if (!previous || *previous != account) {
                auto owner = previous.value_or(std::string{"unknown"});
                leg->status = intent_status_t::failed;
                leg->failure = "asset was held by " + owner;
                abandon_swap_output(leg->failure);
                if (previous && *previous != context.current_account() &&
                    !return_asset(context, state, args.asset_id, *previous)) {
                  return make_failure(error_code::gas_exhausted);
                }
                spdlog::warn(
                    "Vault '{}' received asset '{}' for intent {} from '{}' "
                    "instead of '{}'",
                    context.current_account(), args.asset_id, args.intent_id,
                    owner, account);
                return make_recorded_failure(error_code::asset_not_owned,
                                             leg->failure);
              }
            }
            leg->status = intent_status_t::settled;
            if (kind == intent_kind_t::deposit) {
              auto code = ledger.deposit(account, shares);
              if (code == error_code::account_not_registered) {
                ledger.register_account(account);
                code = ledger.deposit(account, shares);
              }
              if (code != error_code::ok) {
                return make_failure(code);
              }
              on_tokens_minted(context, account, shares);
            } else if (kind == intent_kind_t::withdraw) {
              auto code = ledger.burn_locked(shares);
              if (code != error_code::ok) {
                return make_failure(code);
              }
              on_tokens_burned(context, account, shares);
            } else if (leg->inbound) {
              auto output = std::find_if(
                  std::begin(legs), std::end(legs),
                  [](const settlement_leg_t& value) { return !value.inbound; });
              if (output != std::end(legs) &&
                  !request_transfer(context, state, output->asset_id, account,
                                    args.intent_id)) {
                return make_failure(error_code::gas_exhausted);
              }
            }
            return make_success();
          },
          [&](const promise_failure_t& failure) -> call_outcome {
            if (options_.failure_policy == remote_failure_policy_t::abort) {
              return make_failure(error_code::remote_step_failed,
                                  failure.reason);
            }
            leg->status = intent_status_t::failed;
            leg->failure = failure.reason;
            abandon_swap_output(failure.reason);
            if (kind == intent_kind_t::withdraw) {
              auto code = ledger.unlock(account, shares);
              if (code != error_code::ok) {
                return make_failure(code);
              }
            }
            spdlog::warn(
                "Vault '{}' transfer of asset '{}' for intent {} failed: {}",
                context.current_account(), args.asset_id, args.intent_id,
                failure.reason);
            return make_recorded_failure(error_code::remote_step_failed,
                                         failure.reason);
          },
          [&](const promise_pending_t& pending) -> call_outcome {
            auto reason = "transfer unresolved, awaiting receipt " +
                          std::to_string(pending.receipt_id);
            if (options_.failure_policy == remote_failure_policy_t::abort) {
              return make_failure(error_code::remote_step_pending, reason);
            }
            // Shares stay escrowed; the leg needs reconciliation.
            leg->failure = reason;
            return make_recorded_failure(error_code::remote_step_pending,
                                         reason);
          }},
      context.promise_results().front());
  if (!outcome.ok() && !outcome.commit_state) {
    return outcome;
  }

  auto status = summarize(intent->second);
  intent->second.status = status;
  if (status == intent_status_t::settled) {
    context.emit("settlement_intent_settled",
                 {{"intent_id", std::to_string(args.intent_id)}});
    state.intents.erase(intent);
  } else if (status != intent_status_t::pending) {
    context.emit("settlement_intent_failed",
                 {{"intent_id", std::to_string(args.intent_id)},
                  {"status", std::string{to_string(status)}}});
  }
  return outcome;
}

bool vault::return_asset(call_context& context,
                         const vault_state_t& state,
                         const asset_id_t& asset,
                         const account_id_t& owner) {
  auto call = make_function_call(
      state.origin, nft_transfer_t{.receiver = owner, .token_id = asset},
      kTransferGas, kOneUnitDeposit);
  return context.schedule(std::move(call)).has_value();
}

std::optional<storage_balance_t> make_storage_balance(
    const vault_state_t& state,
    const account_id_t& account) {
  if (state.ledger.balances.find(account) == std::end(state.ledger.balances)) {
    return std::nullopt;
  }
  return storage_balance_t{};
}

storage_balance_bounds_t make_storage_balance_bounds() {
  auto bounds = storage_balance_bounds_t{};
  bounds.max = amount_t{0};
  return bounds;
}

error_code make_public_info(const vault_state_t& state,
                            public_vault_info_t& info) {
  if (!state.initialized) {
    return error_code::not_initialized;
  }
  if (state.unit_value == 0 || state.ledger.total_supply < state.unit_value) {
    return error_code::supply_underflow;
  }
  info.name = state.name;
  info.symbol = state.symbol;
  info.reported_supply = state.ledger.total_supply / state.unit_value - 1;
  info.media = state.media;
  return error_code::ok;
}

}  // namespace sharevault::contracts
