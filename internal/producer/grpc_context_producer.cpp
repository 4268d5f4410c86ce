#include "context_producer.hpp"

#include <stdexcept>

#include "internal/grpc/grpc_error.hpp"

namespace ctxsync::producer {

GrpcContextProducer::GrpcContextProducer(std::shared_ptr<v1::ContextProducer::StubInterface> stub) : stub_(std::move(stub)) {
  if (!stub_) {
    throw std::invalid_argument("GrpcContextProducer: stub is required");
  }
}

std::optional<ProducerSnapshot> GrpcContextProducer::FetchCurrent(const std::string& context_id, std::chrono::milliseconds timeout) {
  v1::FetchCurrentRequest req;
  req.set_context_id(context_id);

  v1::FetchCurrentResponse resp;
  ::grpc::ClientContext    ctx;
  grpc::SetDeadline(ctx, timeout);
  grpc::ThrowIfRpcFailed(stub_->FetchCurrent(&ctx, req, &resp), "ContextProducer.FetchCurrent");

  if (!resp.found()) {
    return std::nullopt;
  }

  ProducerSnapshot snapshot;
  snapshot.payload        = resp.payload();
  snapshot.source_version = resp.source_version();
  snapshot.updated_at     = resp.has_updated_at() ? util::FromProto(resp.updated_at()) : util::Now();
  return snapshot;
}

} // namespace ctxsync::producer
