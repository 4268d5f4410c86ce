#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "ctxsync/v1.hpp"
#include "internal/util/payload.hpp"
#include "internal/util/time.hpp"

namespace ctxsync::producer {

struct ProducerSnapshot {
  util::Payload   payload;
  std::string     source_version;
  util::TimePoint updated_at{};
};

/*
  A producer system (System A or System B) that owns its own copy of a
  context. nullopt means the producer has no such context; unreachable or
  timed-out producers throw.
*/
class ContextProducer {
 public:
  virtual ~ContextProducer() = default;

  virtual std::optional<ProducerSnapshot> FetchCurrent(const std::string& context_id, std::chrono::milliseconds timeout) = 0;
};

class GrpcContextProducer final : public ContextProducer {
 public:
  explicit GrpcContextProducer(std::shared_ptr<v1::ContextProducer::StubInterface> stub);

  std::optional<ProducerSnapshot> FetchCurrent(const std::string& context_id, std::chrono::milliseconds timeout) override;

 private:
  std::shared_ptr<v1::ContextProducer::StubInterface> stub_;
};

} // namespace ctxsync::producer
