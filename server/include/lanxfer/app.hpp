/*
 * 설명: 서버 전체 수명주기와 구성 요소 조립을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/transfer_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "lanxfer/auth.hpp"
#include "lanxfer/config.hpp"
#include "lanxfer/db_client.hpp"
#include "lanxfer/device_registry.hpp"
#include "lanxfer/mariadb_history_log.hpp"
#include "lanxfer/observability.hpp"
#include "lanxfer/realtime.hpp"
#include "lanxfer/shared_state.hpp"
#include "lanxfer/transfer_coordinator.hpp"
#include "lanxfer/transfer_store.hpp"
#include "lanxfer/trusted_origin.hpp"
#include "lanxfer/upload_workers.hpp"

namespace lanxfer {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<TokenIssuer> GetTokenIssuer() { return token_issuer_; }
  std::shared_ptr<TransferCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<SharedState> state_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<TrustedOriginPolicy> origin_policy_;
  std::shared_ptr<TokenIssuer> token_issuer_;
  std::shared_ptr<SessionStore> sessions_;
  std::shared_ptr<DeviceRegistry> devices_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<MariaDbHistoryLog> history_;
  std::shared_ptr<TransferRecordStore> store_;
  std::shared_ptr<BroadcastHub> hub_;
  std::shared_ptr<TransferCoordinator> coordinator_;
  std::shared_ptr<UploadWorkers> uploads_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace lanxfer
