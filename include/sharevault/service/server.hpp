#pragma once

#include <sharevault/host/v1/host.grpc.pb.h>
#include <sharevault/execution/engine.hpp>

namespace sharevault::service {

/// Host callback listener a consensus driver uses to run the engine.
///
/// Quick reference:
/// - Info: handshake; latest committed height and state root.
/// - CheckTx: mempool admission checks; no state mutation.
/// - FinalizeBlock: execute block txs and ready receipts, return results and
///   the state root.
/// - Commit: persist finalized state.
/// - Query: read-only routes over the latest finalized state.
struct listener final : public sharevault::host::v1::Host::CallbackService {
  /// Bind listener to execution engine instance.
  explicit listener(sharevault::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const sharevault::host::v1::RequestInfo* request,
      sharevault::host::v1::ResponseInfo* response) override final;

  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const sharevault::host::v1::RequestCheckTx* request,
      sharevault::host::v1::ResponseCheckTx* response) override final;

  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const sharevault::host::v1::RequestFinalizeBlock* request,
      sharevault::host::v1::ResponseFinalizeBlock* response) override final;

  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const sharevault::host::v1::RequestCommit* request,
      sharevault::host::v1::ResponseCommit* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const sharevault::host::v1::RequestQuery* request,
      sharevault::host::v1::ResponseQuery* response) override final;

  /// Backing execution engine implementing deterministic state machine rules.
  sharevault::execution::engine& execution_engine_;
};

}  // namespace sharevault::service
