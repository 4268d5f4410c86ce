#include "vector_clients.hpp"

#include <stdexcept>

#include "internal/grpc/grpc_error.hpp"

namespace ctxsync::index {

GrpcEmbedder::GrpcEmbedder(std::shared_ptr<v1::Embedder::StubInterface> stub, std::chrono::milliseconds timeout)
    : stub_(std::move(stub)), timeout_(timeout) {
  if (!stub_) {
    throw std::invalid_argument("GrpcEmbedder: stub is required");
  }
}

std::vector<EmbeddingVector> GrpcEmbedder::Embed(const std::vector<std::string>& texts) {
  v1::EmbedRequest req;
  for (const auto& text : texts) {
    req.add_texts(text);
  }

  v1::EmbedResponse     resp;
  ::grpc::ClientContext ctx;
  grpc::SetDeadline(ctx, timeout_);
  grpc::ThrowIfRpcFailed(stub_->Embed(&ctx, req, &resp), "Embedder.Embed");

  std::vector<EmbeddingVector> out;
  out.reserve(resp.embeddings_size());
  for (const auto& embedding : resp.embeddings()) {
    out.emplace_back(embedding.values().begin(), embedding.values().end());
  }
  return out;
}

GrpcVectorStore::GrpcVectorStore(std::shared_ptr<v1::VectorStore::StubInterface> stub, std::chrono::milliseconds timeout)
    : stub_(std::move(stub)), timeout_(timeout) {
  if (!stub_) {
    throw std::invalid_argument("GrpcVectorStore: stub is required");
  }
}

void GrpcVectorStore::Upsert(const std::vector<VectorRecord>& records) {
  v1::UpsertRequest req;
  for (const auto& record : records) {
    auto* entry = req.add_entries();
    entry->set_context_id(record.context_id);
    entry->mutable_embedding()->mutable_values()->Add(record.embedding.begin(), record.embedding.end());
    for (const auto& [key, value] : record.metadata) {
      (*entry->mutable_metadata())[key] = value;
    }
  }

  v1::UpsertResponse    resp;
  ::grpc::ClientContext ctx;
  grpc::SetDeadline(ctx, timeout_);
  grpc::ThrowIfRpcFailed(stub_->Upsert(&ctx, req, &resp), "VectorStore.Upsert");
}

std::vector<ScoredContext> GrpcVectorStore::Query(const EmbeddingVector& embedding, uint32_t limit, float threshold) {
  v1::QueryRequest req;
  req.mutable_embedding()->mutable_values()->Add(embedding.begin(), embedding.end());
  req.set_limit(limit);
  req.set_threshold(threshold);

  v1::QueryResponse     resp;
  ::grpc::ClientContext ctx;
  grpc::SetDeadline(ctx, timeout_);
  grpc::ThrowIfRpcFailed(stub_->Query(&ctx, req, &resp), "VectorStore.Query");

  std::vector<ScoredContext> out;
  out.reserve(resp.matches_size());
  for (const auto& match : resp.matches()) {
    out.push_back({match.context_id(), match.score()});
  }
  return out;
}

} // namespace ctxsync::index
