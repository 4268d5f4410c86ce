#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ctxsync::grpc {

/*
  Failure of an outbound RPC (L2 cache, producers, embedder, vector store).
  Callers decide whether it degrades or propagates.
*/
class RpcError : public std::runtime_error {
 public:
  RpcError(::grpc::StatusCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ::grpc::StatusCode code() const {
    return code_;
  }

  bool IsTimeout() const {
    return code_ == ::grpc::StatusCode::DEADLINE_EXCEEDED;
  }

 private:
  ::grpc::StatusCode code_;
};

void ThrowIfRpcFailed(const ::grpc::Status& status, std::string_view operation);

void SetDeadline(::grpc::ClientContext& ctx, std::chrono::milliseconds timeout);

} // namespace ctxsync::grpc
