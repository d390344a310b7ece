#pragma once

#include <sharevault/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for accounts, component state,
// nonces, pending receipts, receipt outcomes and the outcome height index.
namespace sharevault::schema::key {

inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kContractKeyPrefix{"SYS|STATE|CONTRACT|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kReceiptKeyPrefix{"SYS|RECEIPT|"};
inline constexpr std::string_view kOutcomeKeyPrefix{"SYS|OUTCOME|"};
inline constexpr std::string_view kOutcomeHeightKeyPrefix{
    "SYS|OUTCOME_HEIGHT|"};
inline constexpr std::string_view kSequenceKeyPrefix{"SYS|STATE|SEQUENCE|"};

template <typename Encoder, typename T>
sharevault::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                              std::string_view prefix,
                                              const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
sharevault::schema::bytes_t make_prefix_key(Encoder& encoder,
                                            std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
sharevault::schema::bytes_t make_account_key(
    Encoder& encoder,
    const sharevault::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kAccountKeyPrefix, account);
}

template <typename Encoder>
sharevault::schema::bytes_t make_contract_key(
    Encoder& encoder,
    const sharevault::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kContractKeyPrefix, account);
}

template <typename Encoder>
sharevault::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const sharevault::schema::account_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
sharevault::schema::bytes_t make_receipt_key(Encoder& encoder,
                                             uint64_t receipt_id) {
  return make_prefixed_key(encoder, kReceiptKeyPrefix, receipt_id);
}

template <typename Encoder>
sharevault::schema::bytes_t make_outcome_key(Encoder& encoder,
                                             uint64_t receipt_id) {
  return make_prefixed_key(encoder, kOutcomeKeyPrefix, receipt_id);
}

/// Prefix of every outcome index entry recorded at `height`.
template <typename Encoder>
sharevault::schema::bytes_t make_outcome_height_prefix(Encoder& encoder,
                                                       int64_t height) {
  return make_prefixed_key(encoder, kOutcomeHeightKeyPrefix, height);
}

template <typename Encoder>
sharevault::schema::bytes_t make_outcome_height_key(Encoder& encoder,
                                                    int64_t height,
                                                    uint64_t receipt_id) {
  auto key = make_outcome_height_prefix(encoder, height);
  encoder.encode(receipt_id, key);
  return key;
}

template <typename Encoder>
sharevault::schema::bytes_t make_receipt_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kSequenceKeyPrefix,
                           std::string_view{"NEXT_RECEIPT"});
}

}  // namespace sharevault::schema::key
