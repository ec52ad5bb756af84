/*
 * 설명: 살아 있는 연결과 연결별 인증 주체를 샤딩된 맵으로 관리하고 송신 큐로 프레임을 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chessrelay/observability.hpp"
#include "chessrelay/protocol.hpp"
#include "chessrelay/types.hpp"

namespace chessrelay {

// 연결 하나의 유일한 송신자. Deliver는 어느 스레드에서 불려도 되며 블로킹하지 않는다.
class OutboundSink {
 public:
  virtual ~OutboundSink() = default;
  virtual void Deliver(std::string frame) = 0;
};

class ConnectionRegistry {
 public:
  explicit ConnectionRegistry(std::size_t shard_count = 16);

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  ConnectionHandle Allocate();
  void Register(ConnectionHandle handle, const Principal& principal, const std::shared_ptr<OutboundSink>& sink);
  void Unregister(ConnectionHandle handle);
  std::optional<Principal> PrincipalOf(ConnectionHandle handle) const;

  // 등록되지 않았거나 이미 닫힌 연결이면 false.
  bool Send(ConnectionHandle handle, const OutboundEnvelope& env) const;
  std::size_t ActiveConnections() const { return active_.load(); }

 private:
  struct Entry {
    Principal principal;
    std::weak_ptr<OutboundSink> sink;
  };

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<ConnectionHandle, Entry> entries;
  };

  Shard& ShardFor(ConnectionHandle handle) const;

  std::vector<std::unique_ptr<Shard>> shards_;
  std::atomic<std::uint64_t> next_handle_{1};
  std::atomic<std::size_t> active_{0};
  std::shared_ptr<Observability> observability_;
};

}  // namespace chessrelay
