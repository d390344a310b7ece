#include <spdlog/spdlog.h>
#include <sharevault/service/server.hpp>

#include <string>
#include <vector>

using namespace sharevault::service;
using namespace sharevault::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

template <typename Message>
void populate_events(const std::vector<transaction_event_t>& source,
                     Message* destination) {
  for (const auto& event : source) {
    auto* out = destination->add_events();
    out->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* out_attribute = out->add_attributes();
      out_attribute->set_key(attribute.key);
      out_attribute->set_value(attribute.value);
      out_attribute->set_index(attribute.index);
    }
  }
}

template <typename Message>
void populate_tx_result(const transaction_result_t& source,
                        Message* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_gas_wanted(source.gas_wanted);
  destination->set_gas_used(source.gas_used);
  destination->set_codespace(source.codespace);
  populate_events(source.events, destination);
}

void populate_receipt_outcome(const receipt_outcome_t& source,
                              sharevault::host::v1::ReceiptOutcome* destination) {
  destination->set_receipt_id(source.receipt_id);
  destination->set_predecessor(source.predecessor);
  destination->set_receiver(source.receiver);
  destination->set_method(source.method);
  destination->set_code(source.code);
  destination->set_log(source.log);
  destination->set_data(make_string(source.data));
  destination->set_gas_used(source.gas_used);
  destination->set_height(source.height);
  populate_events(source.events, destination);
}

std::string make_hash_string(const hash32_t& hash) {
  return std::string{std::begin(hash), std::end(hash)};
}

}  // namespace

listener::listener(sharevault::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const sharevault::host::v1::RequestInfo* request,
    sharevault::host::v1::ResponseInfo* response) {
  auto info = execution_engine_.info();
  spdlog::debug("Info handshake from driver version '{}'", request->version());
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_state_root(
      make_hash_string(info.last_block_state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const sharevault::host::v1::RequestCheckTx* request,
    sharevault::host::v1::ResponseCheckTx* response) {
  auto tx = make_bytes(request->tx());
  auto check = execution_engine_.check_transaction(bytes_view_t{tx});
  populate_tx_result(check, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::FinalizeBlock(
    grpc::CallbackServerContext* context,
    const sharevault::host::v1::RequestFinalizeBlock* request,
    sharevault::host::v1::ResponseFinalizeBlock* response) {
  auto txs = std::vector<bytes_t>{};
  txs.reserve(request->txs_size());
  for (const auto& tx : request->txs()) {
    txs.push_back(make_bytes(tx));
  }

  auto execution = execution_engine_.finalize_block(request->height(), txs);
  for (const auto& tx_result : execution.tx_results) {
    populate_tx_result(tx_result, response->add_tx_results());
  }
  for (const auto& outcome : execution.receipt_outcomes) {
    populate_receipt_outcome(outcome, response->add_receipt_outcomes());
  }
  response->set_state_root(make_hash_string(execution.state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Commit(
    grpc::CallbackServerContext* context,
    const sharevault::host::v1::RequestCommit* /*request*/,
    sharevault::host::v1::ResponseCommit* response) {
  auto commit = execution_engine_.commit();
  response->set_retain_height(commit.retain_height);
  response->set_committed_height(commit.committed_height);
  response->set_state_root(make_hash_string(commit.state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const sharevault::host::v1::RequestQuery* request,
    sharevault::host::v1::ResponseQuery* response) {
  auto data = make_bytes(request->data());
  auto query = execution_engine_.query(request->path(), bytes_view_t{data});
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}
