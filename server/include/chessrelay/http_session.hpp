/*
 * 설명: HTTP 연결을 처리하고 헬스 체크와 인증된 WS 업그레이드(/ws)를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "chessrelay/auth.hpp"
#include "chessrelay/config.hpp"
#include "chessrelay/connection_registry.hpp"
#include "chessrelay/observability.hpp"
#include "chessrelay/protocol_router.hpp"
#include "chessrelay/session_store.hpp"

namespace chessrelay {

struct HttpServices {
  std::shared_ptr<TokenVerifier> verifier;
  std::shared_ptr<RateLimiter> rate_limiter;
  std::shared_ptr<ConnectionRegistry> registry;
  std::shared_ptr<SessionStore> store;
  std::shared_ptr<ProtocolRouter> router;
  std::shared_ptr<Observability> observability;
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, HttpServices services);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleWebSocket();
  void SendJson(boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);
  std::string ExtractToken() const;
  std::string RemoteIp();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  HttpServices services_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace chessrelay
