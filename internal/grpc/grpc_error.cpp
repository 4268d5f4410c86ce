#include "grpc_error.hpp"

namespace ctxsync::grpc {

void ThrowIfRpcFailed(const ::grpc::Status& status, std::string_view operation) {
  if (status.ok()) {
    return;
  }

  std::string message(operation);
  message += " failed (code ";
  message += std::to_string(static_cast<int>(status.error_code()));
  message += "): ";
  message += status.error_message();
  throw RpcError(status.error_code(), message);
}

void SetDeadline(::grpc::ClientContext& ctx, std::chrono::milliseconds timeout) {
  if (timeout.count() > 0) {
    ctx.set_deadline(std::chrono::system_clock::now() + timeout);
  }
}

} // namespace ctxsync::grpc
