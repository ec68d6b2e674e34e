#pragma once

#include <lockbox/v1/custody.grpc.pb.h>
#include <lockbox/execution/engine.hpp>

namespace lockbox::rpc {

/// Callback-style gRPC front end for the custody engine.
///
/// - Submit: authenticate and apply a signed request.
/// - Check: authenticate only; no state mutation.
/// - Query: read-only routes under /engine and /state.
/// - Info: last applied sequence and state root.
struct listener final : public lockbox::v1::Custody::CallbackService {
  /// Bind listener to execution engine instance.
  explicit listener(lockbox::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Submit(
      grpc::CallbackServerContext* context,
      const lockbox::v1::SubmitRequest* request,
      lockbox::v1::SubmitResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Check(
      grpc::CallbackServerContext* context,
      const lockbox::v1::SubmitRequest* request,
      lockbox::v1::SubmitResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const lockbox::v1::QueryRequest* request,
      lockbox::v1::QueryResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const lockbox::v1::InfoRequest* request,
      lockbox::v1::InfoResponse* response) override final;

  lockbox::execution::engine& execution_engine_;
};

}  // namespace lockbox::rpc
