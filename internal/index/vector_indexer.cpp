#include "vector_indexer.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/merge/conflict_resolver.hpp"
#include "internal/observability/logging.hpp"

namespace ctxsync::index {

VectorIndexer::VectorIndexer(std::shared_ptr<Embedder> embedder, std::shared_ptr<VectorStore> store, Options options)
    : embedder_(std::move(embedder)), store_(std::move(store)), options_(options) {
  if (!embedder_ || !store_) {
    throw std::invalid_argument("VectorIndexer: embedder and vector store are required");
  }
  if (options_.batch_size == 0) {
    options_.batch_size = 16;
  }
  if (options_.flush_interval <= std::chrono::milliseconds::zero()) {
    options_.flush_interval = std::chrono::seconds(1);
  }
}

VectorIndexer::~VectorIndexer() {
  Stop();
}

std::size_t VectorIndexer::PendingCount() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

void VectorIndexer::QueueLocked(const IndexEntry& entry) {
  auto it = pending_.find(entry.context_id);
  if (it == pending_.end()) {
    pending_.emplace(entry.context_id, entry);
  } else if (entry.version >= it->second.version) {
    it->second = entry;
  }
}

void VectorIndexer::Enqueue(const std::vector<IndexEntry>& entries) {
  std::lock_guard lock(mutex_);
  for (const auto& entry : entries) {
    QueueLocked(entry);
  }
}

IndexResult VectorIndexer::Update(const std::vector<IndexEntry>& entries) {
  Enqueue(entries);
  return Flush();
}

IndexResult VectorIndexer::RetryPending() {
  return Flush();
}

IndexResult VectorIndexer::Flush() {
  std::lock_guard flushing(flush_mutex_);

  std::vector<IndexEntry> work;
  {
    std::lock_guard lock(mutex_);
    work.reserve(pending_.size());
    for (auto& [_, entry] : pending_) {
      work.push_back(std::move(entry));
    }
    pending_.clear();
  }

  IndexResult result;

  for (std::size_t offset = 0; offset < work.size(); offset += options_.batch_size) {
    const auto              end = std::min(work.size(), offset + options_.batch_size);
    std::vector<IndexEntry> batch(work.begin() + offset, work.begin() + end);

    try {
      IndexBatch(batch);
      result.indexed += batch.size();
    } catch (const std::exception& e) {
      result.failed += batch.size();
      CTXSYNC_LOG_WARN("vector index batch failed, keeping entries pending",
                       {observability::UintField("entries", batch.size()), observability::ErrorField(e.what())});
      std::lock_guard lock(mutex_);
      for (const auto& entry : batch) {
        QueueLocked(entry);
      }
    }
  }
  return result;
}

void VectorIndexer::IndexBatch(const std::vector<IndexEntry>& batch) {
  std::vector<std::string> texts;
  texts.reserve(batch.size());
  for (const auto& entry : batch) {
    texts.push_back(util::CanonicalJson(entry.payload));
  }

  auto embeddings = embedder_->Embed(texts);
  if (embeddings.size() != batch.size()) {
    throw std::runtime_error("embedder returned " + std::to_string(embeddings.size()) + " embeddings for " + std::to_string(batch.size()) + " texts");
  }

  std::vector<VectorRecord> records;
  records.reserve(batch.size());
  for (std::size_t i = 0; i < batch.size(); ++i) {
    VectorRecord record;
    record.context_id          = batch[i].context_id;
    record.embedding           = std::move(embeddings[i]);
    record.metadata["version"] = std::to_string(batch[i].version);
    record.metadata["source"]  = std::string(merge::SourceName(batch[i].source));
    records.push_back(std::move(record));
  }
  store_->Upsert(records);
}

std::vector<ScoredContext> VectorIndexer::Search(const EmbeddingVector& embedding, uint32_t limit, float threshold) {
  try {
    return store_->Query(embedding, limit, threshold);
  } catch (const std::exception& e) {
    CTXSYNC_LOG_ERROR("vector search failed", {observability::ErrorField(e.what())});
    return {};
  }
}

// ------------------------------------------------------------
// Background flusher
// ------------------------------------------------------------

void VectorIndexer::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&VectorIndexer::Loop, this);
}

void VectorIndexer::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void VectorIndexer::Loop() {
  std::unique_lock lock(wake_mutex_);
  while (running_) {
    wake_.wait_for(lock, options_.flush_interval, [this] { return !running_; });
    if (!running_) {
      break;
    }
    lock.unlock();
    const auto result = Flush();
    if (result.indexed > 0 || result.failed > 0) {
      CTXSYNC_LOG_DEBUG("vector index flush", {observability::UintField("indexed", result.indexed), observability::UintField("failed", result.failed)});
    }
    lock.lock();
  }
}

} // namespace ctxsync::index
