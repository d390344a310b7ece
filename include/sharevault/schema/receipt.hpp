#pragma once

#include <sharevault/schema/component_kind.hpp>
#include <sharevault/schema/method_call.hpp>
#include <sharevault/schema/primitives.hpp>
#include <sharevault/schema/promise_result.hpp>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

// Schema type: receipt.
// A unit of deferred work addressed to one account. Its actions execute
// all-or-nothing in a later block; an optional resumption names the callback
// the host schedules on the initiator once the outcome is known.
namespace sharevault::schema {

template <uint16_t Version>
struct create_account_action;

template <>
struct create_account_action<1> final {
  uint16_t version{1};
};

using create_account_action_t = create_account_action<1>;

template <uint16_t Version>
struct transfer_action;

template <>
struct transfer_action<1> final {
  uint16_t version{1};
  amount_t amount{};
};

using transfer_action_t = transfer_action<1>;

template <uint16_t Version>
struct deploy_component_action;

template <>
struct deploy_component_action<1> final {
  uint16_t version{1};
  component_kind_t kind{component_kind_t::none};
};

using deploy_component_action_t = deploy_component_action<1>;

template <uint16_t Version>
struct function_call_action;

template <>
struct function_call_action<1> final {
  uint16_t version{1};
  method_call_t call;
  gas_t gas{};
  amount_t deposit{};
};

using function_call_action_t = function_call_action<1>;

using receipt_action_t = std::variant<create_account_action_t,
                                      transfer_action_t,
                                      deploy_component_action_t,
                                      function_call_action_t>;

template <uint16_t Version>
struct resumption;

template <>
struct resumption<1> final {
  uint16_t version{1};
  account_id_t account;
  method_call_t callback;
  gas_t gas{};
};

using resumption_t = resumption<1>;

template <uint16_t Version>
struct receipt;

template <>
struct receipt<1> final {
  uint16_t version{1};
  uint64_t receipt_id{};
  account_id_t predecessor;
  account_id_t signer;
  account_id_t receiver;
  std::vector<receipt_action_t> actions;
  std::optional<resumption_t> resumption;
  std::vector<promise_result_t> promise_results;
  int64_t ready_height{};
};

using receipt_t = receipt<1>;

}  // namespace sharevault::schema
