/*
 * 설명: 연결 핸들별 인증 주체와 송신 큐를 샤딩된 맵으로 관리하고 프레임을 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#include "chessrelay/connection_registry.hpp"

#include <algorithm>

namespace chessrelay {

ConnectionRegistry::ConnectionRegistry(std::size_t shard_count) {
  shard_count = std::max<std::size_t>(1, shard_count);
  shards_.reserve(shard_count);
  for (std::size_t i = 0; i < shard_count; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

ConnectionRegistry::Shard& ConnectionRegistry::ShardFor(ConnectionHandle handle) const {
  return *shards_[std::hash<ConnectionHandle>{}(handle) % shards_.size()];
}

ConnectionHandle ConnectionRegistry::Allocate() { return ConnectionHandle{next_handle_.fetch_add(1)}; }

void ConnectionRegistry::Register(ConnectionHandle handle, const Principal& principal,
                                  const std::shared_ptr<OutboundSink>& sink) {
  auto& shard = ShardFor(handle);
  bool inserted = false;
  {
    std::lock_guard<std::mutex> lock(shard.mutex);
    inserted = shard.entries.insert_or_assign(handle, Entry{principal, sink}).second;
  }
  if (inserted) {
    auto count = active_.fetch_add(1) + 1;
    if (observability_) {
      observability_->SetWebsocketActive(count);
    }
  }
}

void ConnectionRegistry::Unregister(ConnectionHandle handle) {
  auto& shard = ShardFor(handle);
  std::size_t erased = 0;
  {
    std::lock_guard<std::mutex> lock(shard.mutex);
    erased = shard.entries.erase(handle);
  }
  if (erased > 0) {
    auto count = active_.fetch_sub(1) - 1;
    if (observability_) {
      observability_->SetWebsocketActive(count);
    }
  }
}

std::optional<Principal> ConnectionRegistry::PrincipalOf(ConnectionHandle handle) const {
  auto& shard = ShardFor(handle);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(handle);
  if (it == shard.entries.end()) {
    return std::nullopt;
  }
  return it->second.principal;
}

bool ConnectionRegistry::Send(ConnectionHandle handle, const OutboundEnvelope& env) const {
  std::shared_ptr<OutboundSink> sink;
  {
    auto& shard = ShardFor(handle);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(handle);
    if (it == shard.entries.end()) {
      return false;
    }
    sink = it->second.sink.lock();
  }
  if (!sink) {
    return false;
  }
  sink->Deliver(EncodeOutbound(env));
  return true;
}

}  // namespace chessrelay
