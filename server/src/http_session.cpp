/*
 * 설명: HTTP 요청을 처리하고 /health 응답과 인증된 /ws 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#include "chessrelay/http_session.hpp"

#include <unordered_map>

#include <boost/beast/version.hpp>

#include "chessrelay/protocol.hpp"
#include "chessrelay/websocket_session.hpp"

namespace chessrelay {

namespace {
std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

void SplitTarget(const std::string& target, std::string& path, std::string& query) {
  auto qpos = target.find('?');
  path = target.substr(0, qpos);
  query = qpos == std::string::npos ? std::string{} : target.substr(qpos + 1);
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, HttpServices services)
    : stream_(std::move(socket)), config_(config), services_(std::move(services)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = services_.observability ? services_.observability->NextTraceId() : std::string{};

  std::string path;
  std::string query;
  SplitTarget(std::string(req_.target()), path, query);
  if (boost::beast::websocket::is_upgrade(req_) && path == "/ws") {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  std::string path;
  std::string query;
  SplitTarget(std::string(req_.target()), path, query);

  if (req_.method() == http::verb::get && path == "/health") {
    auto snapshot = services_.observability->Snapshot(services_.store->ActiveCount(),
                                                      services_.store->CompletedCount());
    nlohmann::json data{{"status", "ok"},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"sessions", {{"active", snapshot.active_sessions}, {"completed", snapshot.completed_sessions}}},
                        {"errors", {{"decode", snapshot.decode_errors}, {"rating", snapshot.rating_failures}}}};
    return SendJson(http::status::ok, MakeSuccessEnvelope(data));
  }

  SendJson(http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleWebSocket() {
  using namespace boost::beast;
  auto ip = RemoteIp();
  auto now = std::chrono::system_clock::now();
  if (!services_.rate_limiter->Allow(ip, now)) {
    return SendJson(http::status::too_many_requests,
                    MakeErrorEnvelope("rate_limited", "인증 실패가 너무 많습니다. 잠시 후 다시 시도하세요"));
  }

  std::string error_code;
  std::string error_message;
  auto principal = services_.verifier->Verify(ExtractToken(), now, error_code, error_message);
  if (!principal) {
    services_.rate_limiter->RecordFailure(ip, now);
    if (services_.observability) {
      LogContext ctx;
      ctx.name = "auth.rejected";
      ctx.trace_id = trace_id_;
      ctx.detail = ip + " " + error_code;
      services_.observability->Warn(ctx);
    }
    return SendJson(http::status::unauthorized, MakeErrorEnvelope(error_code, error_message));
  }

  websocket::stream<tcp_stream> ws{std::move(stream_)};
  std::make_shared<WebSocketSession>(std::move(ws), *principal, services_.registry, services_.router,
                                     services_.observability, config_.ws_queue_limit_messages,
                                     config_.ws_queue_limit_bytes)
      ->Run(req_);
}

void HttpSession::SendJson(boost::beast::http::status status, const nlohmann::json& body) {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->result(status);
  res->set(boost::beast::http::field::server, "chessrelay");
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (services_.observability) {
    LogContext ctx;
    ctx.name = "http.request";
    ctx.trace_id = trace_id_;
    ctx.detail = std::string(req_.target()) + " " + std::to_string(res->result_int());
    ctx.latency_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                           std::chrono::steady_clock::now() - request_start_)
                                           .count());
    services_.observability->Info(ctx);
  }
  boost::beast::http::async_write(stream_, *res,
                                  [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                                    if (ec) {
                                      return;
                                    }
                                    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send,
                                                                    ec);
                                  });
}

std::string HttpSession::ExtractToken() const {
  auto auth_it = req_.find(boost::beast::http::field::authorization);
  if (auth_it != req_.end()) {
    const std::string prefix = "Bearer ";
    std::string value(auth_it->value());
    if (value.size() > prefix.size() && value.compare(0, prefix.size(), prefix) == 0) {
      return value.substr(prefix.size());
    }
  }
  std::string path;
  std::string query;
  SplitTarget(std::string(req_.target()), path, query);
  auto params = ParseQueryParams(query);
  auto it = params.find("token");
  return it == params.end() ? std::string{} : it->second;
}

std::string HttpSession::RemoteIp() {
  boost::beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string();
}

}  // namespace chessrelay
