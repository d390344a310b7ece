#include <spdlog/spdlog.h>
#include <sharevault/contracts/constants.hpp>
#include <sharevault/contracts/registry.hpp>
#include <sharevault/schema/encoding/scale/encoder.hpp>
#include <sharevault/schema/public_vault_info.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

using namespace sharevault::schema;
using namespace sharevault::runtime;

namespace sharevault::contracts {

namespace {

using encoder_t = sharevault::schema::encoding::encoder<
    sharevault::schema::encoding::scale_encoder_tag>;

bool address_in_use(const registry_state_t& state,
                    const account_id_t& address,
                    const account_id_t& origin) {
  for (const auto& [recorded_origin, vault] : state.origin_to_vault) {
    static_cast<void>(recorded_origin);
    if (vault == address) {
      return true;
    }
  }
  for (const auto& [pending_origin, creation] : state.pending_creations) {
    if (pending_origin != origin &&
        creation.status == creation_status_t::pending &&
        creation.vault_address == address) {
      return true;
    }
  }
  return false;
}

}  // namespace

account_id_t derive_vault_address(const std::string_view symbol,
                                  const std::string_view registry_account) {
  auto address = std::string{symbol};
  std::replace(std::begin(address), std::end(address), '.', '-');
  address.push_back('.');
  address.append(registry_account);
  std::transform(std::begin(address), std::end(address), std::begin(address),
                 [](const unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return address;
}

vault_record_t append_record(registry_state_t& state,
                             const account_id_t& origin,
                             const account_id_t& vault_address) {
  auto record = vault_record_t{};
  record.index = state.counter++;
  record.origin = origin;
  record.vault_address = vault_address;
  state.index_to_origin[record.index] = origin;
  state.origin_to_vault[origin] = vault_address;
  return record;
}

std::optional<account_id_t> vault_address_by_index(
    const registry_state_t& state,
    const uint64_t index) {
  auto origin = state.index_to_origin.find(index);
  if (origin == std::end(state.index_to_origin)) {
    return std::nullopt;
  }
  auto vault = state.origin_to_vault.find(origin->second);
  if (vault == std::end(state.origin_to_vault)) {
    return std::nullopt;
  }
  return vault->second;
}

registry::registry(registry_options options) : options_{std::move(options)} {}

component_kind_t registry::kind() const {
  return component_kind_t::registry;
}

call_outcome registry::execute(call_context& context,
                               const method_call_t& call,
                               registry_state_t& state) {
  if (!state.initialized) {
    return make_failure(error_code::not_initialized);
  }
  return std::visit(
      overloaded{
          [&](const create_vault_t& args) {
            return create_vault(context, args, state);
          },
          [&](const get_vault_info_by_index_t& args) {
            return request_info(context, args.index, state);
          },
          [&](const refresh_all_t&) { return refresh_all(context, state); },
          [&](const set_vault_params_t& args) {
            return set_vault_params(context, args, state);
          },
          [&](const set_fee_t& args) {
            if (context.predecessor() != state.owner) {
              return make_failure(error_code::unauthorized);
            }
            state.fee = args.fee;
            context.emit("fee_updated", {{"fee", args.fee.str()}});
            return make_success();
          },
          [&](const on_vault_created_t& args) {
            return on_vault_created(context, args, state);
          },
          [&](const on_vault_info_t& args) {
            return on_vault_info(context, args, state);
          },
          [](const auto&) { return make_failure(error_code::method_not_found); }},
      call);
}

call_outcome registry::create_vault(call_context& context,
                                    const create_vault_t& args,
                                    registry_state_t& state) {
  if (state.origin_to_vault.contains(args.origin)) {
    return make_failure(error_code::origin_already_registered,
                        "Found this origin before");
  }
  if (auto pending = state.pending_creations.find(args.origin);
      pending != std::end(state.pending_creations) &&
      pending->second.status == creation_status_t::pending) {
    return make_failure(error_code::vault_creation_pending);
  }
  if (!is_valid_account_id(args.origin)) {
    return make_failure(error_code::invalid_account_id, "invalid origin");
  }
  auto address = derive_vault_address(args.symbol, context.current_account());
  if (!is_valid_account_id(address)) {
    return make_failure(error_code::invalid_account_id,
                        "derived vault address '" + address + "' is invalid");
  }
  if (address_in_use(state, address, args.origin)) {
    return make_failure(error_code::vault_exists);
  }

  auto batch = outgoing_call{};
  batch.receiver = address;
  batch.actions.push_back(create_account_action_t{});
  batch.actions.push_back(transfer_action_t{.amount = options_.vault_funding});
  batch.actions.push_back(
      deploy_component_action_t{.kind = component_kind_t::vault});
  batch.actions.push_back(
      function_call_action_t{.call = init_vault_t{.origin = args.origin,
                                                  .name = args.name,
                                                  .symbol = args.symbol,
                                                  .media = args.media},
                             .gas = context.prepaid_gas() / 3,
                             .deposit = {}});

  if (options_.record_commit_mode == record_commit_mode_t::eager) {
    if (!context.schedule(std::move(batch))) {
      return make_failure(error_code::gas_exhausted);
    }
    auto record = append_record(state, args.origin, address);
    spdlog::warn(
        "Registry '{}' recorded vault '{}' at index {} before provisioning "
        "was confirmed",
        context.current_account(), address, record.index);
    context.emit("vault_created",
                 {{"index", std::to_string(record.index)},
                  {"origin", args.origin},
                  {"vault", address}});
    return make_success_value(address);
  }

  batch = then(std::move(batch), context.current_account(),
               on_vault_created_t{.origin = args.origin},
               kCreationCallbackGas);
  if (!context.schedule(std::move(batch))) {
    return make_failure(error_code::gas_exhausted);
  }
  auto creation = pending_creation_t{};
  creation.origin = args.origin;
  creation.vault_address = address;
  creation.name = args.name;
  creation.symbol = args.symbol;
  creation.media = args.media;
  creation.created_height = context.block_height();
  state.pending_creations[args.origin] = std::move(creation);
  context.emit("vault_creation_requested",
               {{"origin", args.origin}, {"vault", address}});
  return make_success_value(address);
}

call_outcome registry::request_info(call_context& context,
                                    const uint64_t index,
                                    const registry_state_t& state) {
  auto address = vault_address_by_index(state, index);
  if (!address) {
    return make_failure(error_code::vault_not_found);
  }
  auto call = then(make_function_call(*address, get_info_t{}, kInfoCallGas),
                   context.current_account(), on_vault_info_t{.index = index},
                   kInfoCallbackGas);
  if (!context.schedule(std::move(call))) {
    return make_failure(error_code::gas_exhausted);
  }
  return make_success();
}

call_outcome registry::refresh_all(call_context& context,
                                   registry_state_t& state) {
  state.info_cache.clear();
  state.info_failures.clear();
  for (auto index = uint64_t{0}; index < state.counter; ++index) {
    auto outcome = request_info(context, index, state);
    if (!outcome.ok()) {
      return outcome;
    }
  }
  return make_success_value(state.counter);
}

call_outcome registry::set_vault_params(call_context& context,
                                        const set_vault_params_t& args,
                                        const registry_state_t& state) {
  if (context.predecessor() != state.owner) {
    return make_failure(error_code::unauthorized);
  }
  auto known = std::any_of(std::begin(state.origin_to_vault),
                           std::end(state.origin_to_vault),
                           [&](const auto& entry) {
                             return entry.second == args.vault;
                           });
  if (!known) {
    return make_failure(error_code::vault_not_found);
  }
  auto index = context.schedule(
      make_function_call(args.vault,
                         set_params_t{.name = args.name,
                                      .symbol = args.symbol,
                                      .unit_value = args.unit_value,
                                      .media = args.media},
                         kParamsForwardGas));
  if (!index) {
    return make_failure(error_code::gas_exhausted);
  }
  return make_deferred(*index);
}

call_outcome registry::on_vault_created(call_context& context,
                                        const on_vault_created_t& args,
                                        registry_state_t& state) {
  if (auto code = context.check_private_callback(); code != error_code::ok) {
    return make_failure(code);
  }
  auto pending = state.pending_creations.find(args.origin);
  if (pending == std::end(state.pending_creations) ||
      pending->second.status != creation_status_t::pending) {
    return make_failure(error_code::intent_missing);
  }

  return std::visit(
      overloaded{
          [&](const promise_success_t&) -> call_outcome {
            auto record = append_record(state, args.origin,
                                        pending->second.vault_address);
            state.pending_creations.erase(pending);
            spdlog::info("Registry '{}' created vault '{}' at index {}",
                         context.current_account(), record.vault_address,
                         record.index);
            context.emit("vault_created",
                         {{"index", std::to_string(record.index)},
                          {"origin", record.origin},
                          {"vault", record.vault_address}});
            return make_success_value(record);
          },
          [&](const promise_failure_t& failure) -> call_outcome {
            if (options_.failure_policy == remote_failure_policy_t::abort) {
              return make_failure(error_code::remote_step_failed,
                                  failure.reason);
            }
            pending->second.status = creation_status_t::failed;
            pending->second.failure = failure.reason;
            spdlog::warn("Registry '{}' failed to provision vault '{}': {}",
                         context.current_account(),
                         pending->second.vault_address, failure.reason);
            context.emit("vault_creation_failed",
                         {{"origin", args.origin}, {"reason", failure.reason}});
            return make_recorded_failure(error_code::remote_step_failed,
                                         failure.reason);
          },
          [&](const promise_pending_t& unresolved) -> call_outcome {
            auto reason = "provisioning unresolved, awaiting receipt " +
                          std::to_string(unresolved.receipt_id);
            if (options_.failure_policy == remote_failure_policy_t::abort) {
              return make_failure(error_code::remote_step_pending, reason);
            }
            pending->second.failure = reason;
            return make_recorded_failure(error_code::remote_step_pending,
                                         reason);
          }},
      context.promise_results().front());
}

call_outcome registry::on_vault_info(call_context& context,
                                     const on_vault_info_t& args,
                                     registry_state_t& state) {
  if (auto code = context.check_private_callback(); code != error_code::ok) {
    return make_failure(code);
  }
  auto record_failure = [&](const error_code code,
                            const std::string& reason) -> call_outcome {
    if (options_.failure_policy == remote_failure_policy_t::abort) {
      return make_failure(code, reason);
    }
    state.info_failures[args.index] = reason;
    spdlog::warn("Registry '{}' info request for index {} failed: {}",
                 context.current_account(), args.index, reason);
    return make_recorded_failure(code, reason);
  };

  return std::visit(
      overloaded{
          [&](const promise_success_t& success) -> call_outcome {
            auto encoder = encoder_t{};
            auto info = encoder.try_decode<public_vault_info_t>(
                bytes_view_t{success.payload.data(), success.payload.size()});
            if (!info) {
              return record_failure(error_code::remote_step_failed,
                                    "malformed vault info payload");
            }
            state.info_failures.erase(args.index);
            state.info_cache[args.index] = info.value();
            return make_success_value(info.value());
          },
          [&](const promise_failure_t& failure) -> call_outcome {
            return record_failure(error_code::remote_step_failed,
                                  failure.reason);
          },
          [&](const promise_pending_t& unresolved) -> call_outcome {
            return record_failure(
                error_code::remote_step_pending,
                "info unresolved, awaiting receipt " +
                    std::to_string(unresolved.receipt_id));
          }},
      context.promise_results().front());
}

}  // namespace sharevault::contracts
