/*
 * 설명: WebSocket 읽기 루프를 라우터에 연결하고, 모든 송신을 strand 위 단일 큐로 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#include "chessrelay/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace chessrelay {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   const Principal& principal, std::shared_ptr<ConnectionRegistry> registry,
                                   std::shared_ptr<ProtocolRouter> router,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)),
      principal_(principal),
      registry_(std::move(registry)),
      router_(std::move(router)),
      observability_(std::move(observability)),
      max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { Teardown("destroyed"); }

void WebSocketSession::OnAccept(boost::beast::error_code ec) {
  if (ec) {
    if (observability_) {
      LogContext ctx;
      ctx.name = "ws.accept_failed";
      ctx.user_id = principal_.id;
      ctx.detail = ec.message();
      observability_->Warn(ctx);
    }
    return;
  }
  handle_ = registry_->Allocate();
  registry_->Register(handle_, principal_, shared_from_this());
  if (observability_) {
    LogContext ctx;
    ctx.name = "ws.connected";
    ctx.user_id = principal_.id;
    ctx.connection = handle_.value();
    observability_->Info(ctx);
  }
  DoRead();
}

void WebSocketSession::Deliver(std::string frame) {
  // 어느 스레드에서 불려도 실제 큐 조작은 이 연결의 strand에서만 일어난다.
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
    self->EnqueueMessage(std::move(frame));
  });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    Teardown(ec == boost::beast::websocket::error::closed ? "closed" : ec.message());
    return;
  }
  if (closing_) {
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  router_->HandleFrame(principal_, handle_, data);

  DoRead();
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    Teardown(ec.message());
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  // 진행 중인 쓰기의 버퍼(front)는 완료 콜백까지 살아 있어야 한다.
  while (send_queue_.size() > (writing_ ? 1u : 0u)) {
    queued_bytes_ -= send_queue_.back().size();
    send_queue_.pop_back();
  }
  if (observability_) {
    LogContext ctx;
    ctx.name = "ws.backpressure_close";
    ctx.user_id = principal_.id;
    ctx.connection = handle_.value();
    observability_->Warn(ctx);
  }
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) { self->Teardown("backpressure_exceeded"); });
}

void WebSocketSession::Teardown(const std::string& reason) {
  if (torn_down_ || !handle_.valid()) {
    return;
  }
  torn_down_ = true;
  registry_->Unregister(handle_);
  router_->OnDisconnect(handle_);
  if (observability_) {
    LogContext ctx;
    ctx.name = "ws.disconnected";
    ctx.user_id = principal_.id;
    ctx.connection = handle_.value();
    ctx.detail = reason;
    observability_->Info(ctx);
  }
}

}  // namespace chessrelay
