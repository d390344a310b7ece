#include <spdlog/spdlog.h>
#include <sharevault/runtime/host.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <random>
#include <string>
#include <utility>

using namespace sharevault::schema;

namespace sharevault::runtime {

namespace {

bool try_credit(amount_t& balance, const amount_t& amount) {
  if (balance > std::numeric_limits<amount_t>::max() - amount) {
    return false;
  }
  balance += amount;
  return true;
}

amount_t outgoing_deposit(const outgoing_call& call) {
  auto total = amount_t{};
  for (const auto& action : call.actions) {
    std::visit(overloaded{[&](const transfer_action_t& transfer) {
                            total += transfer.amount;
                          },
                          [&](const function_call_action_t& function_call) {
                            total += function_call.deposit;
                          },
                          [](const auto&) {}},
               action);
  }
  return total;
}

}  // namespace

amount_t attached_deposit(const receipt_t& receipt) {
  auto total = amount_t{};
  for (const auto& action : receipt.actions) {
    std::visit(overloaded{[&](const transfer_action_t& transfer) {
                            total += transfer.amount;
                          },
                          [&](const function_call_action_t& function_call) {
                            total += function_call.deposit;
                          },
                          [](const auto&) {}},
               action);
  }
  return total;
}

host::host(host_options options) : options_{std::move(options)} {
  if (options_.receipt_delay < 1) {
    spdlog::warn("Receipt delay {} is below 1 block; using 1",
                 options_.receipt_delay);
    options_.receipt_delay = 1;
  }
}

void host::install(std::unique_ptr<component> implementation) {
  auto kind = implementation->kind();
  spdlog::debug("Installing component '{}'", to_string(kind));
  components_[kind] = std::move(implementation);
}

void host::put_account(account_record_t record) {
  changes_.accounts.insert(record.account_id);
  auto account_id = record.account_id;
  accounts_[account_id] = std::move(record);
}

void host::put_contract_state(const account_id_t& account, bytes_t state) {
  changes_.contracts.insert(account);
  contract_states_[account] = std::move(state);
}

void host::put_receipt(receipt_t receipt) {
  changes_.receipts_added.insert(receipt.receipt_id);
  next_receipt_id_ = std::max(next_receipt_id_, receipt.receipt_id + 1);
  auto receipt_id = receipt.receipt_id;
  receipts_[receipt_id] = std::move(receipt);
}

void host::set_next_receipt_id(const uint64_t next_receipt_id) {
  next_receipt_id_ = std::max(next_receipt_id_, next_receipt_id);
}

const account_record_t* host::find_account(const account_id_t& account) const {
  auto it = accounts_.find(account);
  return it == std::end(accounts_) ? nullptr : &it->second;
}

const bytes_t* host::find_contract_state(const account_id_t& account) const {
  auto it = contract_states_.find(account);
  return it == std::end(contract_states_) ? nullptr : &it->second;
}

const std::map<uint64_t, receipt_t>& host::pending_receipts() const {
  return receipts_;
}

uint64_t host::next_receipt_id() const {
  return next_receipt_id_;
}

const host_options& host::options() const {
  return options_;
}

receipt_outcome_t host::execute_transaction(const transaction_t& tx,
                                            const int64_t height) {
  auto receipt = receipt_t{};
  receipt.receipt_id = allocate_receipt_id();
  receipt.predecessor = tx.signer;
  receipt.signer = tx.signer;
  receipt.receiver = tx.receiver;
  receipt.actions.push_back(
      function_call_action_t{.call = tx.call, .gas = tx.gas, .deposit = tx.deposit});
  receipt.ready_height = height;

  auto reject = [&](const error_code code) {
    auto outcome = receipt_outcome_t{};
    outcome.receipt_id = receipt.receipt_id;
    outcome.predecessor = receipt.predecessor;
    outcome.receiver = receipt.receiver;
    outcome.method = std::string{method_name(tx.call)};
    outcome.code = static_cast<uint32_t>(code);
    outcome.log = std::string{describe(code)};
    outcome.height = height;
    record(outcome);
    return outcome;
  };

  auto signer = accounts_.find(tx.signer);
  if (signer == std::end(accounts_)) {
    return reject(error_code::account_missing);
  }
  if (tx.gas > options_.max_prepaid_gas) {
    return reject(error_code::gas_exhausted);
  }
  if (signer->second.balance < tx.deposit) {
    return reject(error_code::insufficient_funds);
  }
  signer->second.balance -= tx.deposit;
  changes_.accounts.insert(tx.signer);
  return execute_receipt(receipt, height);
}

std::vector<receipt_outcome_t> host::execute_ready_receipts(
    const int64_t height) {
  auto outcomes = std::vector<receipt_outcome_t>{};
  for (const auto receipt_id : ready_receipts(height)) {
    auto node = receipts_.extract(receipt_id);
    if (node.empty()) {
      continue;
    }
    if (changes_.receipts_added.erase(receipt_id) == 0) {
      changes_.receipts_removed.insert(receipt_id);
    }
    outcomes.push_back(execute_receipt(node.mapped(), height));
  }
  return outcomes;
}

change_set host::take_changes() {
  return std::exchange(changes_, change_set{});
}

receipt_outcome_t host::execute_receipt(const receipt_t& receipt,
                                        const int64_t height) {
  auto staged = staged_step{};
  if (auto account = accounts_.find(receipt.receiver);
      account != std::end(accounts_)) {
    staged.account = account->second;
  }
  if (auto state = contract_states_.find(receipt.receiver);
      state != std::end(contract_states_)) {
    staged.contract_state = state->second;
  }

  auto outcome = run_actions(receipt, height, staged);
  auto deferred_receipt = std::optional<uint64_t>{};
  if (outcome.ok() || outcome.commit_state) {
    if (staged.account) {
      accounts_[receipt.receiver] = std::move(staged.account.value());
      changes_.accounts.insert(receipt.receiver);
    }
    if (staged.contract_touched) {
      contract_states_[receipt.receiver] = std::move(staged.contract_state);
      changes_.contracts.insert(receipt.receiver);
    }
    auto scheduled =
        schedule_outgoing(receipt, std::move(staged.outgoing), height);
    if (outcome.deferred_to && *outcome.deferred_to < scheduled.size()) {
      deferred_receipt = scheduled[*outcome.deferred_to];
    }
  } else {
    refund(receipt);
    staged.events.clear();
  }

  if (!outcome.ok()) {
    spdlog::warn("Receipt {} '{}' on '{}' failed: {}", receipt.receipt_id,
                 staged.method, receipt.receiver, outcome.log);
  } else {
    spdlog::debug("Receipt {} '{}' on '{}' succeeded", receipt.receipt_id,
                  staged.method, receipt.receiver);
  }

  if (receipt.resumption) {
    schedule_callback(receipt, to_promise_result(outcome, deferred_receipt),
                      height);
  }

  auto result = receipt_outcome_t{};
  result.receipt_id = receipt.receipt_id;
  result.predecessor = receipt.predecessor;
  result.receiver = receipt.receiver;
  result.method = staged.method;
  result.code = static_cast<uint32_t>(outcome.code);
  result.log = outcome.log;
  result.data = std::move(outcome.data);
  result.gas_used = staged.gas_used;
  result.height = height;
  result.events = std::move(staged.events);
  record(result);
  return result;
}

call_outcome host::run_actions(const receipt_t& receipt,
                               const int64_t height,
                               staged_step& staged) {
  auto last = make_success();
  for (const auto& action : receipt.actions) {
    auto step = std::visit(
        overloaded{
            [&](const create_account_action_t&) -> call_outcome {
              if (staged.account) {
                return make_failure(error_code::account_exists);
              }
              if (!is_valid_account_id(receipt.receiver)) {
                return make_failure(error_code::invalid_account_id);
              }
              auto record = account_record_t{};
              record.account_id = receipt.receiver;
              staged.account = std::move(record);
              staged.contract_state.clear();
              return make_success();
            },
            [&](const transfer_action_t& transfer) -> call_outcome {
              if (!staged.account) {
                return make_failure(error_code::account_missing);
              }
              if (!try_credit(staged.account->balance, transfer.amount)) {
                return make_failure(error_code::arithmetic_overflow);
              }
              return make_success();
            },
            [&](const deploy_component_action_t& deploy) -> call_outcome {
              if (!staged.account) {
                return make_failure(error_code::account_missing);
              }
              if (!components_.contains(deploy.kind)) {
                return make_failure(error_code::component_missing);
              }
              staged.account->kind = deploy.kind;
              staged.contract_state.clear();
              staged.contract_touched = true;
              return make_success();
            },
            [&](const function_call_action_t& function_call) -> call_outcome {
              return run_function_call(receipt, function_call, height, staged);
            }},
        action);
    if (!step.ok()) {
      return step;
    }
    last = std::move(step);
  }
  return last;
}

call_outcome host::run_function_call(const receipt_t& receipt,
                                     const function_call_action_t& action,
                                     const int64_t height,
                                     staged_step& staged) {
  staged.method = std::string{method_name(action.call)};
  if (!staged.account) {
    return make_failure(error_code::account_missing);
  }
  if (!try_credit(staged.account->balance, action.deposit)) {
    return make_failure(error_code::arithmetic_overflow);
  }
  auto implementation = components_.find(staged.account->kind);
  if (staged.account->kind == component_kind_t::none ||
      implementation == std::end(components_)) {
    return make_failure(error_code::component_missing);
  }
  if (action.gas < options_.function_call_gas) {
    return make_failure(error_code::gas_exhausted);
  }

  auto context = call_context{
      call_context::environment{.current_account = receipt.receiver,
                                .predecessor = receipt.predecessor,
                                .signer = receipt.signer,
                                .prepaid_gas = action.gas,
                                .attached_deposit = action.deposit,
                                .block_height = height,
                                .promise_results = receipt.promise_results},
      options_.function_call_gas};
  auto outcome =
      implementation->second->invoke(context, action.call, staged.contract_state);
  staged.gas_used += context.used_gas();
  if (!outcome.ok() && !outcome.commit_state) {
    return outcome;
  }
  staged.contract_touched = true;

  auto outgoing = context.take_outgoing();
  auto required = amount_t{};
  for (const auto& call : outgoing) {
    required += outgoing_deposit(call);
  }
  if (required > staged.account->balance) {
    return make_failure(error_code::insufficient_funds,
                        "outgoing calls attach more than the account holds");
  }
  staged.account->balance -= required;
  std::move(std::begin(outgoing), std::end(outgoing),
            std::back_inserter(staged.outgoing));
  auto events = context.take_events();
  std::move(std::begin(events), std::end(events),
            std::back_inserter(staged.events));
  return outcome;
}

std::vector<uint64_t> host::schedule_outgoing(const receipt_t& parent,
                                              std::vector<outgoing_call> outgoing,
                                              const int64_t height) {
  auto scheduled = std::vector<uint64_t>{};
  scheduled.reserve(outgoing.size());
  for (auto& call : outgoing) {
    auto receipt = receipt_t{};
    receipt.receipt_id = allocate_receipt_id();
    receipt.predecessor = parent.receiver;
    receipt.signer = parent.signer;
    receipt.receiver = std::move(call.receiver);
    receipt.actions = std::move(call.actions);
    receipt.resumption = std::move(call.resumption);
    receipt.ready_height = height + options_.receipt_delay;
    spdlog::debug("Scheduled receipt {} from '{}' to '{}' at height {}",
                  receipt.receipt_id, receipt.predecessor, receipt.receiver,
                  receipt.ready_height);
    scheduled.push_back(receipt.receipt_id);
    changes_.receipts_added.insert(receipt.receipt_id);
    auto receipt_id = receipt.receipt_id;
    receipts_[receipt_id] = std::move(receipt);
  }
  return scheduled;
}

void host::schedule_callback(const receipt_t& parent,
                             promise_result_t result,
                             const int64_t height) {
  const auto& resumption = parent.resumption.value();
  auto receipt = receipt_t{};
  receipt.receipt_id = allocate_receipt_id();
  receipt.predecessor = resumption.account;
  receipt.signer = parent.signer;
  receipt.receiver = resumption.account;
  receipt.actions.push_back(function_call_action_t{
      .call = resumption.callback, .gas = resumption.gas, .deposit = {}});
  receipt.promise_results.push_back(std::move(result));
  receipt.ready_height = height + options_.receipt_delay;
  spdlog::debug("Scheduled callback {} on '{}' for receipt {}",
                receipt.receipt_id, receipt.receiver, parent.receipt_id);
  changes_.receipts_added.insert(receipt.receipt_id);
  auto receipt_id = receipt.receipt_id;
  receipts_[receipt_id] = std::move(receipt);
}

void host::refund(const receipt_t& receipt) {
  auto amount = attached_deposit(receipt);
  if (amount == 0) {
    return;
  }
  auto predecessor = accounts_.find(receipt.predecessor);
  if (predecessor == std::end(accounts_)) {
    spdlog::warn("Dropping refund of {} for missing account '{}'",
                 amount.str(), receipt.predecessor);
    return;
  }
  if (!try_credit(predecessor->second.balance, amount)) {
    spdlog::warn("Dropping refund of {} for '{}': balance overflow",
                 amount.str(), receipt.predecessor);
    return;
  }
  changes_.accounts.insert(receipt.predecessor);
}

void host::record(const receipt_outcome_t& outcome) {
  changes_.outcomes.push_back(outcome);
}

std::vector<uint64_t> host::ready_receipts(const int64_t height) const {
  auto ready = std::vector<uint64_t>{};
  for (const auto& [receipt_id, receipt] : receipts_) {
    if (receipt.ready_height <= height) {
      ready.push_back(receipt_id);
    }
  }
  switch (options_.delivery_order) {
    case delivery_order_t::fifo:
      break;
    case delivery_order_t::lifo:
      std::reverse(std::begin(ready), std::end(ready));
      break;
    case delivery_order_t::shuffled: {
      auto generator = std::mt19937_64{options_.shuffle_seed ^
                                       static_cast<uint64_t>(height)};
      std::shuffle(std::begin(ready), std::end(ready), generator);
      break;
    }
  }
  return ready;
}

uint64_t host::allocate_receipt_id() {
  return next_receipt_id_++;
}

}  // namespace sharevault::runtime
