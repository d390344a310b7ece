#pragma once

#include <sharevault/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Behavioural switches shared by the host and the components it runs.
namespace sharevault::runtime {

/// How a vault applies share changes for asset transfers it requests.
/// `optimistic` mutates the ledger before the transfer resolves and leaves
/// funds at risk until remote confirmation.
enum class settlement_mode_t : uint8_t { confirmed = 0, optimistic = 1 };

/// What a resumption does with a failed or unresolved remote step.
enum class remote_failure_policy_t : uint8_t { propagate = 0, abort = 1 };

/// When the registry appends a vault record. `eager` writes the record
/// before the provisioning batch is confirmed and is unsafe.
enum class record_commit_mode_t : uint8_t { confirmed = 0, eager = 1 };

/// Order in which receipts that become ready in the same block execute.
enum class delivery_order_t : uint8_t { fifo = 0, lifo = 1, shuffled = 2 };

inline constexpr auto kSettlementModeMappings =
    std::array{std::pair<std::string_view, settlement_mode_t>{
                   "confirmed", settlement_mode_t::confirmed},
               std::pair<std::string_view, settlement_mode_t>{
                   "optimistic", settlement_mode_t::optimistic}};

inline constexpr auto kRemoteFailurePolicyMappings =
    std::array{std::pair<std::string_view, remote_failure_policy_t>{
                   "propagate", remote_failure_policy_t::propagate},
               std::pair<std::string_view, remote_failure_policy_t>{
                   "abort", remote_failure_policy_t::abort}};

inline constexpr auto kRecordCommitModeMappings =
    std::array{std::pair<std::string_view, record_commit_mode_t>{
                   "confirmed", record_commit_mode_t::confirmed},
               std::pair<std::string_view, record_commit_mode_t>{
                   "eager", record_commit_mode_t::eager}};

inline constexpr auto kDeliveryOrderMappings = std::array{
    std::pair<std::string_view, delivery_order_t>{"fifo",
                                                  delivery_order_t::fifo},
    std::pair<std::string_view, delivery_order_t>{"lifo",
                                                  delivery_order_t::lifo},
    std::pair<std::string_view, delivery_order_t>{"shuffled",
                                                  delivery_order_t::shuffled}};

inline constexpr std::string_view to_string(const settlement_mode_t value) {
  return sharevault::schema::to_string(value, kSettlementModeMappings)
      .value_or("unknown");
}

inline constexpr std::string_view to_string(
    const remote_failure_policy_t value) {
  return sharevault::schema::to_string(value, kRemoteFailurePolicyMappings)
      .value_or("unknown");
}

inline constexpr std::string_view to_string(const record_commit_mode_t value) {
  return sharevault::schema::to_string(value, kRecordCommitModeMappings)
      .value_or("unknown");
}

inline constexpr std::string_view to_string(const delivery_order_t value) {
  return sharevault::schema::to_string(value, kDeliveryOrderMappings)
      .value_or("unknown");
}

}  // namespace sharevault::runtime

namespace sharevault::schema {

template <>
inline std::optional<sharevault::runtime::settlement_mode_t>
try_from_string<sharevault::runtime::settlement_mode_t>(
    const std::string_view value) {
  return from_string(value, sharevault::runtime::kSettlementModeMappings);
}

template <>
inline std::optional<sharevault::runtime::remote_failure_policy_t>
try_from_string<sharevault::runtime::remote_failure_policy_t>(
    const std::string_view value) {
  return from_string(value, sharevault::runtime::kRemoteFailurePolicyMappings);
}

template <>
inline std::optional<sharevault::runtime::record_commit_mode_t>
try_from_string<sharevault::runtime::record_commit_mode_t>(
    const std::string_view value) {
  return from_string(value, sharevault::runtime::kRecordCommitModeMappings);
}

template <>
inline std::optional<sharevault::runtime::delivery_order_t>
try_from_string<sharevault::runtime::delivery_order_t>(
    const std::string_view value) {
  return from_string(value, sharevault::runtime::kDeliveryOrderMappings);
}

}  // namespace sharevault::schema
