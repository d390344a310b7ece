#pragma once

#include <sharevault/schema/error_code.hpp>
#include <sharevault/schema/method_call.hpp>
#include <sharevault/schema/primitives.hpp>
#include <sharevault/schema/promise_result.hpp>
#include <sharevault/schema/receipt.hpp>
#include <sharevault/schema/transaction_event.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace sharevault::runtime {

/// A batch of actions a component asks the host to run on another account
/// in a later block, plus the resumption invoked with its outcome.
struct outgoing_call final {
  sharevault::schema::account_id_t receiver;
  std::vector<sharevault::schema::receipt_action_t> actions;
  std::optional<sharevault::schema::resumption_t> resumption;
};

outgoing_call make_function_call(sharevault::schema::account_id_t receiver,
                                 sharevault::schema::method_call_t call,
                                 sharevault::schema::gas_t gas,
                                 sharevault::schema::amount_t deposit = {});

/// Attach a resumption on `account` that runs `callback` with the batch
/// outcome.
outgoing_call then(outgoing_call call,
                   sharevault::schema::account_id_t account,
                   sharevault::schema::method_call_t callback,
                   sharevault::schema::gas_t gas);

/// Execution environment of one component method.
class call_context final {
 public:
  struct environment final {
    sharevault::schema::account_id_t current_account;
    sharevault::schema::account_id_t predecessor;
    sharevault::schema::account_id_t signer;
    sharevault::schema::gas_t prepaid_gas{};
    sharevault::schema::amount_t attached_deposit{};
    int64_t block_height{};
    std::vector<sharevault::schema::promise_result_t> promise_results;
  };

  /// `base_cost` is charged up front for running the method itself.
  call_context(environment env, sharevault::schema::gas_t base_cost);

  const sharevault::schema::account_id_t& current_account() const;
  const sharevault::schema::account_id_t& predecessor() const;
  const sharevault::schema::account_id_t& signer() const;
  const sharevault::schema::amount_t& attached_deposit() const;
  int64_t block_height() const;

  sharevault::schema::gas_t prepaid_gas() const;
  sharevault::schema::gas_t used_gas() const;
  sharevault::schema::gas_t remaining_gas() const;

  const std::vector<sharevault::schema::promise_result_t>& promise_results()
      const;

  /// Callbacks may only be invoked by the component itself with exactly one
  /// promise result.
  sharevault::schema::error_code check_private_callback() const;

  /// Queue `call` and charge the gas it carries. Returns the index of the
  /// queued call, or std::nullopt when the budget cannot cover it.
  [[nodiscard]] std::optional<std::size_t> schedule(outgoing_call call);

  void emit(std::string_view type,
            std::vector<std::pair<std::string, std::string>> attributes);

  std::vector<outgoing_call> take_outgoing();
  std::vector<sharevault::schema::transaction_event_t> take_events();

 private:
  environment env_;
  sharevault::schema::gas_t used_gas_{};
  std::vector<outgoing_call> outgoing_;
  std::vector<sharevault::schema::transaction_event_t> events_;
};

}  // namespace sharevault::runtime
