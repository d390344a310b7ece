#include <sharevault/runtime/outcome.hpp>

#include <utility>

namespace sharevault::runtime {

call_outcome make_success(sharevault::schema::bytes_t data) {
  auto outcome = call_outcome{};
  outcome.data = std::move(data);
  return outcome;
}

call_outcome make_failure(const sharevault::schema::error_code code,
                          std::string log) {
  auto outcome = call_outcome{};
  outcome.code = code;
  outcome.log = log.empty() ? std::string{sharevault::schema::describe(code)}
                            : std::move(log);
  outcome.commit_state = false;
  return outcome;
}

call_outcome make_recorded_failure(const sharevault::schema::error_code code,
                                   std::string log) {
  auto outcome = make_failure(code, std::move(log));
  outcome.commit_state = true;
  return outcome;
}

call_outcome make_deferred(const std::size_t outgoing_index) {
  auto outcome = call_outcome{};
  outcome.deferred_to = outgoing_index;
  return outcome;
}

sharevault::schema::promise_result_t to_promise_result(
    const call_outcome& outcome,
    const std::optional<uint64_t> deferred_receipt_id) {
  if (!outcome.ok()) {
    return sharevault::schema::promise_failure_t{
        .code = outcome.code, .reason = outcome.log};
  }
  if (deferred_receipt_id) {
    return sharevault::schema::promise_pending_t{.receipt_id =
                                                     *deferred_receipt_id};
  }
  return sharevault::schema::promise_success_t{.payload = outcome.data};
}

}  // namespace sharevault::runtime
