#pragma once

#include <sharevault/runtime/call_context.hpp>
#include <sharevault/runtime/component.hpp>
#include <sharevault/runtime/modes.hpp>
#include <sharevault/runtime/outcome.hpp>
#include <sharevault/schema/account_record.hpp>
#include <sharevault/schema/component_kind.hpp>
#include <sharevault/schema/primitives.hpp>
#include <sharevault/schema/receipt.hpp>
#include <sharevault/schema/receipt_outcome.hpp>
#include <sharevault/schema/transaction.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sharevault::runtime {

struct host_options final {
  /// Blocks between scheduling a receipt and executing it; at least 1.
  int64_t receipt_delay{1};
  delivery_order_t delivery_order{delivery_order_t::fifo};
  uint64_t shuffle_seed{};
  /// Charged to every executed method before it runs.
  sharevault::schema::gas_t function_call_gas{2 *
                                              sharevault::schema::kTeraGas};
  sharevault::schema::gas_t max_prepaid_gas{300 *
                                            sharevault::schema::kTeraGas};
};

/// Everything the host mutated since the last `take_changes`.
struct change_set final {
  std::set<sharevault::schema::account_id_t> accounts;
  std::set<sharevault::schema::account_id_t> contracts;
  std::set<uint64_t> receipts_added;
  std::set<uint64_t> receipts_removed;
  std::vector<sharevault::schema::receipt_outcome_t> outcomes;
};

/// Executes transactions and receipts against in-memory world state.
///
/// A transaction's first step runs immediately. Every outgoing call becomes
/// a receipt that is ready `receipt_delay` blocks later; a receipt's actions
/// run all-or-nothing, and a receipt with a resumption produces exactly one
/// callback receipt carrying its outcome.
class host final {
 public:
  explicit host(host_options options);

  void install(std::unique_ptr<component> implementation);

  void put_account(sharevault::schema::account_record_t record);
  void put_contract_state(const sharevault::schema::account_id_t& account,
                          sharevault::schema::bytes_t state);
  void put_receipt(sharevault::schema::receipt_t receipt);
  void set_next_receipt_id(uint64_t next_receipt_id);

  const sharevault::schema::account_record_t* find_account(
      const sharevault::schema::account_id_t& account) const;
  const sharevault::schema::bytes_t* find_contract_state(
      const sharevault::schema::account_id_t& account) const;
  const std::map<uint64_t, sharevault::schema::receipt_t>& pending_receipts()
      const;
  uint64_t next_receipt_id() const;
  const host_options& options() const;

  /// Deduct the attached deposit from the signer and run the first step.
  sharevault::schema::receipt_outcome_t execute_transaction(
      const sharevault::schema::transaction_t& tx,
      int64_t height);

  /// Run every pending receipt whose ready height has been reached, in the
  /// configured delivery order.
  std::vector<sharevault::schema::receipt_outcome_t> execute_ready_receipts(
      int64_t height);

  change_set take_changes();

 private:
  struct staged_step final {
    std::optional<sharevault::schema::account_record_t> account;
    sharevault::schema::bytes_t contract_state;
    bool contract_touched{};
    std::vector<outgoing_call> outgoing;
    std::vector<sharevault::schema::transaction_event_t> events;
    sharevault::schema::gas_t gas_used{};
    std::string method;
  };

  sharevault::schema::receipt_outcome_t execute_receipt(
      const sharevault::schema::receipt_t& receipt,
      int64_t height);
  call_outcome run_actions(const sharevault::schema::receipt_t& receipt,
                           int64_t height,
                           staged_step& staged);
  call_outcome run_function_call(
      const sharevault::schema::receipt_t& receipt,
      const sharevault::schema::function_call_action_t& action,
      int64_t height,
      staged_step& staged);
  std::vector<uint64_t> schedule_outgoing(
      const sharevault::schema::receipt_t& parent,
      std::vector<outgoing_call> outgoing,
      int64_t height);
  void schedule_callback(const sharevault::schema::receipt_t& parent,
                         sharevault::schema::promise_result_t result,
                         int64_t height);
  void refund(const sharevault::schema::receipt_t& receipt);
  void record(const sharevault::schema::receipt_outcome_t& outcome);
  std::vector<uint64_t> ready_receipts(int64_t height) const;
  uint64_t allocate_receipt_id();

  host_options options_;
  std::map<sharevault::schema::component_kind_t, std::unique_ptr<component>>
      components_;
  std::map<sharevault::schema::account_id_t,
           sharevault::schema::account_record_t>
      accounts_;
  std::map<sharevault::schema::account_id_t, sharevault::schema::bytes_t>
      contract_states_;
  std::map<uint64_t, sharevault::schema::receipt_t> receipts_;
  uint64_t next_receipt_id_{};
  change_set changes_;
};

/// Sum of native units a receipt moves to its receiver.
sharevault::schema::amount_t attached_deposit(
    const sharevault::schema::receipt_t& receipt);

}  // namespace sharevault::runtime
