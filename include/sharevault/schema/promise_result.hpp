#pragma once

#include <sharevault/schema/error_code.hpp>
#include <sharevault/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <variant>

// Schema type: promise result.
// The single outcome delivered to a resumption: the remote step succeeded
// with a SCALE payload, failed with a typed code, or has not resolved yet.
namespace sharevault::schema {

template <uint16_t Version>
struct promise_success;

template <>
struct promise_success<1> final {
  uint16_t version{1};
  bytes_t payload;
};

using promise_success_t = promise_success<1>;

template <uint16_t Version>
struct promise_failure;

template <>
struct promise_failure<1> final {
  uint16_t version{1};
  error_code code{error_code::remote_step_failed};
  std::string reason;
};

using promise_failure_t = promise_failure<1>;

template <uint16_t Version>
struct promise_pending;

template <>
struct promise_pending<1> final {
  uint16_t version{1};
  uint64_t receipt_id{};
};

using promise_pending_t = promise_pending<1>;

using promise_result_t =
    std::variant<promise_success_t, promise_failure_t, promise_pending_t>;

}  // namespace sharevault::schema
