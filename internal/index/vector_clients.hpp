#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ctxsync/v1.hpp"

namespace ctxsync::index {

using EmbeddingVector = std::vector<float>;

struct VectorRecord {
  std::string                        context_id;
  EmbeddingVector                    embedding;
  std::map<std::string, std::string> metadata;
};

struct ScoredContext {
  std::string context_id;
  float       score = 0.0f;
};

/*
  External embedding model. Returns one embedding per input text, in order.
*/
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<EmbeddingVector> Embed(const std::vector<std::string>& texts) = 0;
};

/*
  External similarity store.
*/
class VectorStore {
 public:
  virtual ~VectorStore() = default;

  virtual void Upsert(const std::vector<VectorRecord>& records) = 0;

  virtual std::vector<ScoredContext> Query(const EmbeddingVector& embedding, uint32_t limit, float threshold) = 0;
};

// ------------------------------------------------------------
// gRPC implementations
// ------------------------------------------------------------

class GrpcEmbedder final : public Embedder {
 public:
  GrpcEmbedder(std::shared_ptr<v1::Embedder::StubInterface> stub, std::chrono::milliseconds timeout);

  std::vector<EmbeddingVector> Embed(const std::vector<std::string>& texts) override;

 private:
  std::shared_ptr<v1::Embedder::StubInterface> stub_;
  std::chrono::milliseconds                    timeout_;
};

class GrpcVectorStore final : public VectorStore {
 public:
  GrpcVectorStore(std::shared_ptr<v1::VectorStore::StubInterface> stub, std::chrono::milliseconds timeout);

  void                       Upsert(const std::vector<VectorRecord>& records) override;
  std::vector<ScoredContext> Query(const EmbeddingVector& embedding, uint32_t limit, float threshold) override;

 private:
  std::shared_ptr<v1::VectorStore::StubInterface> stub_;
  std::chrono::milliseconds                       timeout_;
};

} // namespace ctxsync::index
