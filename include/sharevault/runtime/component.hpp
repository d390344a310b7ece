#pragma once

#include <sharevault/common/critical.hpp>
#include <sharevault/runtime/call_context.hpp>
#include <sharevault/runtime/outcome.hpp>
#include <sharevault/schema/component_kind.hpp>
#include <sharevault/schema/encoding/scale/encoder.hpp>
#include <sharevault/schema/method_call.hpp>
#include <sharevault/schema/primitives.hpp>
#include <utility>

namespace sharevault::runtime {

/// Code deployed on an account. The host owns the state bytes and only keeps
/// the mutated bytes when the returned outcome commits.
class component {
 public:
  virtual ~component() = default;

  virtual sharevault::schema::component_kind_t kind() const = 0;

  virtual call_outcome invoke(call_context& context,
                              const sharevault::schema::method_call_t& call,
                              sharevault::schema::bytes_t& state) = 0;
};

/// Component whose state is one SCALE-encoded versioned record.
template <typename State>
class stateful_component : public component {
 public:
  call_outcome invoke(call_context& context,
                      const sharevault::schema::method_call_t& call,
                      sharevault::schema::bytes_t& state) final {
    auto encoder = sharevault::schema::encoding::encoder<
        sharevault::schema::encoding::scale_encoder_tag>{};
    auto decoded = State{};
    if (!state.empty()) {
      auto maybe_state = encoder.template try_decode<State>(
          sharevault::schema::bytes_view_t{state.data(), state.size()});
      if (!maybe_state) {
        sharevault::common::critical("corrupt component state for account");
      }
      decoded = std::move(maybe_state.value());
    }
    auto outcome = execute(context, call, decoded);
    if (outcome.ok() || outcome.commit_state) {
      state = encoder.encode(decoded);
    }
    return outcome;
  }

 protected:
  virtual call_outcome execute(call_context& context,
                               const sharevault::schema::method_call_t& call,
                               State& state) = 0;
};

}  // namespace sharevault::runtime
