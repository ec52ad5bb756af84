/*
 * 설명: 서버 수명주기, 리스닝 소켓, 워커 스레드와 컴포넌트 조립을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp, server/tests/unit/config_test.cpp
 */
#include "chessrelay/app.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "chessrelay/chess_rules.hpp"
#include "chessrelay/http_session.hpp"
#include "chessrelay/mariadb_account_store.hpp"

namespace chessrelay {

namespace {

// std::chrono::seconds 변환에서 넘치지 않도록 하루 단위로 제한한다.
constexpr std::size_t kMaxIntervalSeconds = 86400;

}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           HttpServices services)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), services_(std::move(services)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->services_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  HttpServices services_;
};

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<AccountStore> accounts)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), accounts_(std::move(accounts)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  if (!accounts_) {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    db_client_ = std::make_shared<MariaDbClient>(db_config);
    accounts_ = std::make_shared<MariaDbAccountStore>(db_client_);
  }
  rating_updater_ = std::make_shared<RatingUpdater>(accounts_, observability_, config.rating_k_factor);
  oracle_ = std::make_shared<ChessRules>();
  registry_ = std::make_shared<ConnectionRegistry>(config.registry_shards);
  registry_->SetObservability(observability_);
  store_ = std::make_shared<SessionStore>();
  reaper_ = std::make_shared<SessionReaper>(ioc_, store_, observability_,
                                            std::chrono::seconds(config.reap_interval_seconds),
                                            std::chrono::seconds(config.completed_retention_seconds));
  SessionServices services{oracle_, registry_, rating_updater_, observability_};
  match_queue_ = std::make_shared<MatchQueue>(store_, services, config.default_clock_seconds);
  router_ = std::make_shared<ProtocolRouter>(registry_, store_, match_queue_, observability_);
  verifier_ = std::make_shared<TokenVerifier>(config.jwt_secret);
  rate_limiter_ = std::make_shared<RateLimiter>(config.auth_rate_limit_max,
                                                std::chrono::seconds(config.auth_rate_window_seconds));
}

ServerApp::~ServerApp() {
  Stop();
  JoinWorkers();
  rating_updater_->Stop();
}

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    HttpServices services{verifier_, rate_limiter_, registry_, store_, router_, observability_};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, services);
    listener_->Run();
    reaper_->Start();
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      LogContext stop_ctx;
      stop_ctx.name = "server.signal";
      stop_ctx.detail = std::to_string(signal_number);
      observability_->Info(stop_ctx);
      Stop();
    });
    LogContext ctx;
    ctx.name = "server.started";
    ctx.detail = "port " + std::to_string(config_.port);
    observability_->Info(ctx);
    RunWorkers();
    ioc_.run();
    signals.cancel();
  } catch (const std::exception& ex) {
    LogContext ctx;
    ctx.name = "server.failed";
    ctx.detail = ex.what();
    observability_->Error(ctx);
    running_ = false;
    ioc_.stop();
    JoinWorkers();
    throw;
  }
  // run()이 반환된 스레드는 워커가 아니므로 여기서 모두 join할 수 있다.
  JoinWorkers();
  rating_updater_->Stop();
  LogContext ctx;
  ctx.name = "server.stopped";
  observability_->Info(ctx);
}

void ServerApp::RunWorkers() {
  unsigned int thread_count = static_cast<unsigned int>(config_.worker_threads);
  if (thread_count == 0) {
    thread_count = std::max(1u, std::thread::hardware_concurrency());
  }
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  boost::asio::post(ioc_, [this]() { Shutdown(); });
}

void ServerApp::Shutdown() {
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  if (reaper_) {
    reaper_->Stop();
  }
  ioc_.stop();
}

void ServerApp::JoinWorkers() {
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto reject = [](const char* key, const std::string& value) {
    return std::invalid_argument(std::string(key) + " 값이 올바르지 않습니다: " + value);
  };
  // 부호, 공백, 뒤따르는 문자를 허용하지 않는 10진 정수만 받는다.
  auto get_unsigned = [&](const char* key, const char* def, std::size_t min_value,
                          std::size_t max_value) -> std::size_t {
    auto value = get_env(key, def);
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
      throw reject(key, value);
    }
    unsigned long long parsed = 0;
    try {
      parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
      throw reject(key, value);
    }
    if (parsed < min_value || parsed > max_value) {
      throw reject(key, value);
    }
    return static_cast<std::size_t>(parsed);
  };
  auto get_seconds = [&](const char* key, const char* def) -> double {
    auto value = get_env(key, def);
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
      throw reject(key, value);
    }
    std::size_t idx = 0;
    double parsed = 0.0;
    try {
      parsed = std::stod(value, &idx);
    } catch (const std::out_of_range&) {
      throw reject(key, value);
    }
    if (idx != value.size() || !std::isfinite(parsed) || parsed <= 0.0) {
      throw reject(key, value);
    }
    return parsed;
  };
  constexpr std::size_t kAny = std::numeric_limits<std::size_t>::max();

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(get_unsigned("SERVER_PORT", "8080", 1, 65535));
  cfg.db_host = get_env("DB_HOST", "127.0.0.1");
  cfg.db_port = static_cast<unsigned short>(get_unsigned("DB_PORT", "3306", 1, 65535));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.jwt_secret = get_env("JWT_SECRET_KEY", "");
  cfg.default_clock_seconds = get_seconds("DEFAULT_CLOCK_SECONDS", "600");
  cfg.ws_queue_limit_messages = get_unsigned("WS_QUEUE_LIMIT_MESSAGES", "64", 1, kAny);
  cfg.ws_queue_limit_bytes = get_unsigned("WS_QUEUE_LIMIT_BYTES", "262144", 1, kAny);
  cfg.rating_k_factor = static_cast<int>(get_unsigned("RATING_K_FACTOR", "32", 1, 100));
  cfg.completed_retention_seconds = get_unsigned("COMPLETED_SESSION_RETENTION_SECONDS", "300", 0, kMaxIntervalSeconds);
  cfg.reap_interval_seconds =
      std::max<std::size_t>(1, get_unsigned("SESSION_REAP_INTERVAL_SECONDS", "30", 0, kMaxIntervalSeconds));
  cfg.auth_rate_window_seconds = get_unsigned("AUTH_RATE_WINDOW_SECONDS", "60", 0, kMaxIntervalSeconds);
  cfg.auth_rate_limit_max = get_unsigned("AUTH_RATE_LIMIT_MAX", "5", 0, kAny);
  cfg.registry_shards = std::max<std::size_t>(1, get_unsigned("REGISTRY_SHARDS", "16", 0, 4096));
  cfg.worker_threads = get_unsigned("WORKER_THREADS", "0", 0, 1024);
  return cfg;
}

}  // namespace chessrelay
