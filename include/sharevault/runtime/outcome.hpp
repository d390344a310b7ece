#pragma once

#include <sharevault/schema/encoding/scale/encoder.hpp>
#include <sharevault/schema/error_code.hpp>
#include <sharevault/schema/primitives.hpp>
#include <sharevault/schema/promise_result.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace sharevault::runtime {

/// Result of one component method.
///
/// A failed outcome normally discards every state change of the step. A
/// recorded failure keeps them: the step completed, updated its saga state
/// and reports a typed error to whoever observes the outcome.
struct call_outcome final {
  sharevault::schema::error_code code{sharevault::schema::error_code::ok};
  std::string log;
  sharevault::schema::bytes_t data;
  bool commit_state{true};
  /// Index into the step's outgoing calls whose result stands in for this
  /// one; resumptions observe it as pending.
  std::optional<std::size_t> deferred_to;

  bool ok() const { return code == sharevault::schema::error_code::ok; }
};

call_outcome make_success(sharevault::schema::bytes_t data = {});

template <typename T>
call_outcome make_success_value(const T& value) {
  auto encoder = sharevault::schema::encoding::encoder<
      sharevault::schema::encoding::scale_encoder_tag>{};
  return make_success(encoder.encode(value));
}

call_outcome make_failure(sharevault::schema::error_code code,
                          std::string log = {});
call_outcome make_recorded_failure(sharevault::schema::error_code code,
                                   std::string log = {});
call_outcome make_deferred(std::size_t outgoing_index);

/// Map a remote step's outcome to what its resumption receives.
sharevault::schema::promise_result_t to_promise_result(
    const call_outcome& outcome,
    std::optional<uint64_t> deferred_receipt_id = std::nullopt);

}  // namespace sharevault::runtime
