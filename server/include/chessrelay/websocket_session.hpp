/*
 * 설명: WebSocket 연결 하나의 읽기 루프와 단일 송신 큐(백프레셔 포함)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "chessrelay/connection_registry.hpp"
#include "chessrelay/observability.hpp"
#include "chessrelay/protocol_router.hpp"
#include "chessrelay/types.hpp"

namespace chessrelay {

class WebSocketSession : public OutboundSink, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, const Principal& principal,
                   std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<ProtocolRouter> router,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  ~WebSocketSession() override;

  // 업그레이드 요청을 수락한 뒤 등록하고 읽기를 시작한다.
  template <class Request>
  void Run(const Request& req);

  void Deliver(std::string frame) override;

  ConnectionHandle Handle() const { return handle_; }

 private:
  void OnAccept(boost::beast::error_code ec);
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void Teardown(const std::string& reason);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  Principal principal_;
  ConnectionHandle handle_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<ProtocolRouter> router_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool torn_down_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

template <class Request>
void WebSocketSession::Run(const Request& req) {
  // HTTP 단계에서 걸린 tcp_stream 만료 시간을 해제하고 WebSocket 자체 타임아웃에 맡긴다.
  boost::beast::get_lowest_layer(ws_).expires_never();
  ws_.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws_.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "chessrelay");
  }));
  ws_.async_accept(req, boost::beast::bind_front_handler(&WebSocketSession::OnAccept, shared_from_this()));
}

}  // namespace chessrelay
