#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "chessrelay/app.hpp"
#include "support/test_support.hpp"

namespace {

constexpr const char* kSecret = "e2e-secret";

unsigned short ResolvePort() {
  const char* env_port = std::getenv("E2E_PORT");
  return env_port ? static_cast<unsigned short>(std::stoi(env_port)) : 18089;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

class SessionFlowFixture : public ::testing::Test {
 protected:
  using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  void SetUp() override {
    port_ = ResolvePort();
    accounts_ = std::make_shared<chessrelay::testing::FakeAccountStore>();
    accounts_->Put(chessrelay::testing::MakeAccount("u-alice", "alice"));
    accounts_->Put(chessrelay::testing::MakeAccount("u-bob", "bob"));

    auto cfg = chessrelay::LoadConfigFromEnv();
    cfg.port = port_;
    cfg.jwt_secret = kSecret;
    cfg.log_level = "error";
    cfg.worker_threads = 2;
    app_ = std::make_unique<chessrelay::ServerApp>(cfg, accounts_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    ASSERT_TRUE(WaitForReady());
  }

  void TearDown() override {
    if (app_) {
      app_->Stop();
    }
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  SimpleHttpResponse Get(const std::string& target) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve(host_, std::to_string(port_));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{boost::beast::http::verb::get, target, 11};
    req.set(boost::beast::http::field::host, host_);
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  bool WaitForReady() {
    for (int i = 0; i < 25; ++i) {
      try {
        if (Get("/health").status == boost::beast::http::status::ok) {
          return true;
        }
      } catch (const boost::system::system_error&) {
        // 아직 리스너가 열리지 않았다.
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return false;
  }

  std::unique_ptr<WebSocket> ConnectWs(const std::string& token) {
    auto ws = std::make_unique<WebSocket>(ioc_);
    boost::asio::ip::tcp::resolver resolver{ioc_};
    auto const results = resolver.resolve(host_, std::to_string(port_));
    ws->next_layer().connect(results);
    ws->set_option(boost::beast::websocket::stream_base::decorator([token](boost::beast::websocket::request_type& req) {
      req.set(boost::beast::http::field::authorization, "Bearer " + token);
    }));
    ws->handshake(host_, "/ws");
    return ws;
  }

  nlohmann::json ReadWs(WebSocket& ws, boost::beast::flat_buffer& buffer) {
    buffer.consume(buffer.size());
    ws.read(buffer);
    return nlohmann::json::parse(boost::beast::buffers_to_string(buffer.cdata()));
  }

  // 지정한 타입이 올 때까지 읽는다. 사이에 끼는 다른 프레임은 건너뛴다.
  nlohmann::json ReadUntil(WebSocket& ws, boost::beast::flat_buffer& buffer, const std::string& type) {
    for (int i = 0; i < 16; ++i) {
      auto msg = ReadWs(ws, buffer);
      if (msg.value("type", "") == type) {
        return msg;
      }
    }
    return nlohmann::json();
  }

  void Write(WebSocket& ws, const nlohmann::json& frame) { ws.write(boost::asio::buffer(frame.dump())); }

  std::string host_{"127.0.0.1"};
  unsigned short port_{18089};
  std::shared_ptr<chessrelay::testing::FakeAccountStore> accounts_;
  std::unique_ptr<chessrelay::ServerApp> app_;
  std::thread server_thread_;
  boost::asio::io_context ioc_;
};

}  // namespace

TEST_F(SessionFlowFixture, HealthReportsCounters) {
  auto res = Get("/health");
  EXPECT_EQ(res.status, boost::beast::http::status::ok);
  EXPECT_TRUE(res.body["success"].get<bool>());
  EXPECT_EQ(res.body["data"]["status"], "ok");
  EXPECT_EQ(res.body["data"]["sessions"]["active"], 0);

  auto missing = Get("/nowhere");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  EXPECT_FALSE(missing.body["success"].get<bool>());
}

TEST_F(SessionFlowFixture, UpgradeWithoutValidTokenIsRefused) {
  WebSocket ws(ioc_);
  boost::asio::ip::tcp::resolver resolver{ioc_};
  ws.next_layer().connect(resolver.resolve(host_, std::to_string(port_)));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::request_type& req) {
    req.set(boost::beast::http::field::authorization, "Bearer not-a-token");
  }));
  boost::beast::websocket::response_type res;
  boost::beast::error_code ec;
  ws.handshake(res, host_, "/ws", ec);
  EXPECT_TRUE(ec);
  EXPECT_EQ(res.result(), boost::beast::http::status::unauthorized);
}

TEST_F(SessionFlowFixture, PairPlayCheckmateAndRate) {
  auto ws_a = ConnectWs(chessrelay::testing::MintToken(kSecret, "u-alice", "alice"));
  auto ws_b = ConnectWs(chessrelay::testing::MintToken(kSecret, "u-bob", "bob"));
  boost::beast::flat_buffer buf_a;
  boost::beast::flat_buffer buf_b;

  Write(*ws_a, {{"type", "ping"}});
  EXPECT_EQ(ReadWs(*ws_a, buf_a)["type"], "pong");

  Write(*ws_a, {{"type", "join"}});
  EXPECT_EQ(ReadWs(*ws_a, buf_a)["type"], "waiting");
  Write(*ws_b, {{"type", "join"}});

  auto start_a = ReadUntil(*ws_a, buf_a, "gameStart");
  auto start_b = ReadUntil(*ws_b, buf_b, "gameStart");
  ASSERT_FALSE(start_a.is_null());
  ASSERT_FALSE(start_b.is_null());
  EXPECT_EQ(start_a["payload"]["color"], "white");
  EXPECT_EQ(start_a["payload"]["opponent"], "bob");
  EXPECT_EQ(start_b["payload"]["color"], "black");
  EXPECT_EQ(start_b["payload"]["opponent"], "alice");
  auto game_id = start_a["payload"]["gameId"].get<std::string>();
  EXPECT_EQ(start_b["payload"]["gameId"], game_id);

  Write(*ws_b, {{"type", "move"}, {"payload", {{"gameId", game_id}, {"move", "e5"}}}});
  auto early = ReadUntil(*ws_b, buf_b, "error");
  EXPECT_EQ(early["payload"]["code"], "not_your_turn");

  const char* moves[] = {"e4", "e5", "Bc4", "Nc6", "Qh5", "Nf6", "Qxf7#"};
  bool white = true;
  for (const auto* move : moves) {
    Write(white ? *ws_a : *ws_b, {{"type", "move"}, {"payload", {{"gameId", game_id}, {"move", move}}}});
    auto echo_a = ReadUntil(*ws_a, buf_a, "move");
    auto echo_b = ReadUntil(*ws_b, buf_b, "move");
    EXPECT_EQ(echo_a["payload"]["move"], move);
    EXPECT_EQ(echo_b["payload"]["position"], echo_a["payload"]["position"]);
    white = !white;
  }

  auto over_a = ReadUntil(*ws_a, buf_a, "gameOver");
  auto over_b = ReadUntil(*ws_b, buf_b, "gameOver");
  EXPECT_EQ(over_a["payload"]["outcome"], "white won");
  EXPECT_EQ(over_a["payload"]["method"], "checkmate");
  EXPECT_EQ(over_b["payload"]["winner"], "white");

  for (int i = 0; i < 50 && accounts_->UpdateCount() < 2; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  app_->GetRatingUpdater()->Drain();
  EXPECT_EQ(accounts_->GetById("u-alice")->elo_rating, 1216);
  EXPECT_EQ(accounts_->GetById("u-bob")->elo_rating, 1184);

  auto health = Get("/health");
  EXPECT_EQ(health.body["data"]["sessions"]["completed"], 1);

  ws_a->close(boost::beast::websocket::close_code::normal);
  ws_b->close(boost::beast::websocket::close_code::normal);
}

TEST_F(SessionFlowFixture, SocketOutlivesHttpReadDeadline) {
  auto ws = ConnectWs(chessrelay::testing::MintToken(kSecret, "u-alice", "alice"));
  boost::beast::flat_buffer buf;

  Write(*ws, {{"type", "ping"}});
  EXPECT_EQ(ReadWs(*ws, buf)["type"], "pong");

  // 업그레이드 전 HTTP 읽기에 걸린 30초 만료를 넘겨서 기다린다.
  std::this_thread::sleep_for(std::chrono::seconds(35));

  Write(*ws, {{"type", "ping"}});
  EXPECT_EQ(ReadWs(*ws, buf)["type"], "pong");

  ws->close(boost::beast::websocket::close_code::normal);
}

TEST_F(SessionFlowFixture, TerminationSignalStopsServerCleanly) {
  auto ws = ConnectWs(chessrelay::testing::MintToken(kSecret, "u-alice", "alice"));
  boost::beast::flat_buffer buf;
  Write(*ws, {{"type", "join"}});
  EXPECT_EQ(ReadWs(*ws, buf)["type"], "waiting");

  // 시그널 처리기는 io 스레드에서 Stop을 부른다. Run은 모든 워커를 join한 뒤 반환해야 한다.
  std::raise(SIGTERM);
  server_thread_.join();
  app_.reset();

  boost::beast::error_code ec;
  ws->read(buf, ec);
  EXPECT_TRUE(ec);
}
