#include <sharevault/runtime/call_context.hpp>

#include <string>

using namespace sharevault::schema;

namespace sharevault::runtime {

namespace {

gas_t attached_gas(const outgoing_call& call) {
  auto total = gas_t{};
  for (const auto& action : call.actions) {
    if (const auto* function_call =
            std::get_if<function_call_action_t>(&action)) {
      total += function_call->gas;
    }
  }
  if (call.resumption) {
    total += call.resumption->gas;
  }
  return total;
}

}  // namespace

outgoing_call make_function_call(account_id_t receiver,
                                 method_call_t call,
                                 const gas_t gas,
                                 amount_t deposit) {
  auto outgoing = outgoing_call{};
  outgoing.receiver = std::move(receiver);
  outgoing.actions.push_back(function_call_action_t{
      .call = std::move(call), .gas = gas, .deposit = std::move(deposit)});
  return outgoing;
}

outgoing_call then(outgoing_call call,
                   account_id_t account,
                   method_call_t callback,
                   const gas_t gas) {
  call.resumption = resumption_t{
      .account = std::move(account), .callback = std::move(callback), .gas = gas};
  return call;
}

call_context::call_context(environment env, const gas_t base_cost)
    : env_{std::move(env)}, used_gas_{base_cost} {}

const account_id_t& call_context::current_account() const {
  return env_.current_account;
}

const account_id_t& call_context::predecessor() const {
  return env_.predecessor;
}

const account_id_t& call_context::signer() const {
  return env_.signer;
}

const amount_t& call_context::attached_deposit() const {
  return env_.attached_deposit;
}

int64_t call_context::block_height() const {
  return env_.block_height;
}

gas_t call_context::prepaid_gas() const {
  return env_.prepaid_gas;
}

gas_t call_context::used_gas() const {
  return used_gas_;
}

gas_t call_context::remaining_gas() const {
  return used_gas_ >= env_.prepaid_gas ? 0 : env_.prepaid_gas - used_gas_;
}

const std::vector<promise_result_t>& call_context::promise_results() const {
  return env_.promise_results;
}

error_code call_context::check_private_callback() const {
  if (env_.predecessor != env_.current_account) {
    return error_code::unauthorized;
  }
  if (env_.promise_results.size() != 1) {
    return error_code::not_a_callback;
  }
  return error_code::ok;
}

std::optional<std::size_t> call_context::schedule(outgoing_call call) {
  auto gas = attached_gas(call);
  if (gas > remaining_gas()) {
    return std::nullopt;
  }
  used_gas_ += gas;
  outgoing_.push_back(std::move(call));
  return outgoing_.size() - 1;
}

void call_context::emit(
    const std::string_view type,
    std::vector<std::pair<std::string, std::string>> attributes) {
  auto event = transaction_event_t{};
  event.type = std::string{type};
  event.attributes.reserve(attributes.size());
  for (auto& [key, value] : attributes) {
    event.attributes.push_back(transaction_event_attribute_t{
        .key = std::move(key), .value = std::move(value), .index = true});
  }
  events_.push_back(std::move(event));
}

std::vector<outgoing_call> call_context::take_outgoing() {
  return std::exchange(outgoing_, {});
}

std::vector<transaction_event_t> call_context::take_events() {
  return std::exchange(events_, {});
}

}  // namespace sharevault::runtime
