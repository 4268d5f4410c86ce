#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/index/vector_clients.hpp"
#include "internal/util/payload.hpp"

namespace ctxsync::index {

struct IndexEntry {
  std::string      context_id;
  uint64_t         version = 0;
  v1::SourceSystem source  = v1::SOURCE_SYSTEM_UNSPECIFIED;
  util::Payload    payload;
};

struct IndexResult {
  uint64_t indexed = 0;
  uint64_t failed  = 0;
};

/*
  Batches committed payloads through the embedder into the vector store.

  Entries of a failed batch stay pending and are retried first on the next
  Update or RetryPending; per context only the newest version is kept.
  The pending queue is never locked across embedder or store calls, so
  Enqueue and PendingCount do not wait on network I/O. Flushes run one at
  a time.
*/
class VectorIndexer {
 public:
  struct Options {
    uint32_t                  batch_size     = 16;
    std::chrono::milliseconds flush_interval = std::chrono::seconds(1);
  };

  VectorIndexer(std::shared_ptr<Embedder> embedder, std::shared_ptr<VectorStore> store, Options options);
  ~VectorIndexer();

  VectorIndexer(const VectorIndexer&)            = delete;
  VectorIndexer& operator=(const VectorIndexer&) = delete;

  // Queues without flushing; the background flusher or the next
  // RetryPending picks the entries up.
  void Enqueue(const std::vector<IndexEntry>& entries);

  IndexResult Update(const std::vector<IndexEntry>& entries);
  IndexResult RetryPending();

  void Start();
  void Stop();

  // Store failures are logged and yield no matches.
  std::vector<ScoredContext> Search(const EmbeddingVector& embedding, uint32_t limit, float threshold);

  std::size_t PendingCount() const;

 private:
  void        QueueLocked(const IndexEntry& entry);
  IndexResult Flush();
  void        IndexBatch(const std::vector<IndexEntry>& batch);
  void        Loop();

  std::shared_ptr<Embedder>    embedder_;
  std::shared_ptr<VectorStore> store_;
  Options                      options_;

  mutable std::mutex                mutex_;
  std::map<std::string, IndexEntry> pending_;

  std::mutex flush_mutex_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_;
};

} // namespace ctxsync::index
