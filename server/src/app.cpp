/*
 * 설명: 서버 수명주기, 구성 요소 조립, 리스닝 스레드와 환경설정 로딩을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/transfer_flow_test.cpp
 */
#include "lanxfer/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "lanxfer/http_session.hpp"

namespace lanxfer {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<TrustedOriginPolicy> origin_policy, std::shared_ptr<TokenIssuer> token_issuer,
           std::shared_ptr<SessionStore> sessions, std::shared_ptr<TransferRecordStore> store,
           std::shared_ptr<TransferCoordinator> coordinator, std::shared_ptr<BroadcastHub> hub,
           std::shared_ptr<Observability> observability, std::shared_ptr<UploadWorkers> uploads)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config),
        origin_policy_(std::move(origin_policy)), token_issuer_(std::move(token_issuer)),
        sessions_(std::move(sessions)), store_(std::move(store)), coordinator_(std::move(coordinator)),
        hub_(std::move(hub)), observability_(std::move(observability)), uploads_(std::move(uploads)) {
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
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->origin_policy_,
                                          self->token_issuer_, self->sessions_, self->store_, self->coordinator_,
                                          self->hub_, self->observability_, self->uploads_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<TrustedOriginPolicy> origin_policy_;
  std::shared_ptr<TokenIssuer> token_issuer_;
  std::shared_ptr<SessionStore> sessions_;
  std::shared_ptr<TransferRecordStore> store_;
  std::shared_ptr<TransferCoordinator> coordinator_;
  std::shared_ptr<BroadcastHub> hub_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<UploadWorkers> uploads_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(static_cast<int>(std::max<std::size_t>(1, config.worker_threads))),
      work_guard_(boost::asio::make_work_guard(ioc_)) {
  state_ = MakeSharedState();
  observability_ = std::make_shared<Observability>();
  origin_policy_ = std::make_shared<TrustedOriginPolicy>(config.lan_ip);

  PairingConfig pairing;
  pairing.token_ttl = std::chrono::seconds(config.token_ttl_seconds);
  pairing.session_ttl = std::chrono::seconds(config.session_ttl_seconds);
  token_issuer_ = std::make_shared<TokenIssuer>(state_, pairing);
  sessions_ = std::make_shared<SessionStore>(state_, token_issuer_, pairing);
  devices_ = std::make_shared<DeviceRegistry>(state_);

  DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  history_ = std::make_shared<MariaDbHistoryLog>(db_client_);
  store_ = std::make_shared<TransferRecordStore>(state_, history_, observability_);

  hub_ = std::make_shared<BroadcastHub>(state_);
  hub_->SetObservability(observability_);

  CoordinatorConfig coordinator_config;
  coordinator_config.download_dir = config.download_dir;
  coordinator_config.transient_dir = config.transient_dir;
  coordinator_config.max_upload_bytes = config.max_upload_bytes;
  coordinator_ = std::make_shared<TransferCoordinator>(state_, origin_policy_, sessions_, devices_, store_, hub_,
                                                       observability_, coordinator_config);
  std::weak_ptr<TransferCoordinator> weak_coordinator = coordinator_;
  uploads_ = std::make_shared<UploadWorkers>(config.upload_threads);
  hub_->SetSnapshotProvider([weak_coordinator](const ClientConnection& connection) {
    auto coordinator = weak_coordinator.lock();
    return coordinator ? coordinator->InitSnapshot(connection) : nlohmann::json::array();
  });
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    history_->EnsureSchema();
    auto address = boost::asio::ip::make_address(config_.bind_address);
    boost::asio::ip::tcp::endpoint endpoint{address, config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, origin_policy_, token_issuer_, sessions_, store_,
                                           coordinator_, hub_, observability_, uploads_);
    listener_->Run();
    auto token = token_issuer_->Issue(false);
    std::cout << "서버 시작: " << config_.bind_address << ":" << config_.port << "\n";
    std::cout << "데스크톱 주소: http://127.0.0.1:" << config_.port << "/\n";
    std::cout << "모바일 주소: http://" << origin_policy_->LanIp() << ":" << config_.port << "/?token=" << token.value
              << "\n";
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      std::cout << "신호 " << signal_number << " 수신, 종료합니다\n";
      work_guard_.reset();
      if (listener_) {
        listener_->Stop();
      }
      ioc_.stop();
    });
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const std::size_t thread_count = std::max<std::size_t>(1, config_.worker_threads);
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (std::size_t i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  // io 스레드가 모두 멈춘 뒤에 업로드 스레드를 멈춰야 진행 중인 소켓 읽기가 버퍼에 쓰지 않는다.
  uploads_->Stop();
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const std::string& def) -> std::string {
    const char* val = std::getenv(key);
    return val && *val ? std::string{val} : def;
  };

  const char* home = std::getenv("HOME");
  std::string default_download_dir = home ? std::string(home) + "/Downloads" : std::string("./downloads");
  const std::size_t default_workers = std::max(4u, std::thread::hardware_concurrency());

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "5000")));
  cfg.bind_address = get_env("SERVER_BIND", "0.0.0.0");
  cfg.lan_ip = get_env("LAN_IP", "");
  if (cfg.lan_ip.empty()) {
    cfg.lan_ip = DetectLanIp();
  }
  cfg.download_dir = get_env("DOWNLOAD_DIR", default_download_dir);
  cfg.transient_dir = get_env("TRANSIENT_DIR", "./transient_uploads");
  cfg.token_ttl_seconds = static_cast<std::size_t>(std::stoul(get_env("TOKEN_TTL_SECONDS", "120")));
  cfg.session_ttl_seconds = static_cast<std::size_t>(std::stoul(get_env("SESSION_TTL_SECONDS", "28800")));
  cfg.max_upload_bytes = static_cast<std::uint64_t>(std::stoull(get_env("MAX_UPLOAD_BYTES", "10737418240")));
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "256")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "4194304")));
  cfg.worker_threads =
      static_cast<std::size_t>(std::stoul(get_env("WORKER_THREADS", std::to_string(default_workers))));
  cfg.upload_threads = static_cast<std::size_t>(std::stoul(get_env("UPLOAD_THREADS", "16")));
  cfg.db_host = get_env("DB_HOST", "127.0.0.1");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "lanxfer");
  return cfg;
}

}  // namespace lanxfer
