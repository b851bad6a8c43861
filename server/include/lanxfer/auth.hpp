/*
 * 설명: 1회용 페어링 토큰 발급과 IP 바인딩 세션 관리를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pairing_test.cpp, server/tests/e2e/transfer_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "lanxfer/errors.hpp"
#include "lanxfer/shared_state.hpp"

namespace lanxfer {

struct PairingToken {
  std::string value;
  std::chrono::system_clock::time_point expires_at;
  bool consumed{false};
};

struct Session {
  std::string id;
  std::string bound_ip;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point last_seen_at;
};

struct PairingConfig {
  std::chrono::seconds token_ttl{std::chrono::seconds(120)};
  std::chrono::seconds session_ttl{std::chrono::hours(8)};
  std::size_t token_length{12};
};

class TokenIssuer {
 public:
  TokenIssuer(std::shared_ptr<SharedState> state, const PairingConfig& config, Clock clock = SystemClock());

  PairingToken Issue(bool force_new);

  // 호출자는 SharedState::mutex를 잡고 있어야 한다.
  bool ConsumeLocked(const std::string& token, std::chrono::system_clock::time_point now, ServiceError& error);

 private:
  std::shared_ptr<SharedState> state_;
  PairingConfig config_;
  Clock clock_;
  PairingToken current_;
};

class SessionStore {
 public:
  SessionStore(std::shared_ptr<SharedState> state, std::shared_ptr<TokenIssuer> token_issuer,
               const PairingConfig& config, Clock clock = SystemClock());

  // presented_session이 같은 IP에서 유효하면 토큰을 소비하지 않고 그 세션을 돌려준다.
  std::optional<std::string> Exchange(const std::string& token, const std::string& ip,
                                      const std::optional<std::string>& presented_session, ServiceError& error);
  std::optional<Session> Validate(const std::string& session_id, const std::string& ip);
  bool Purge(const std::string& session_id);
  std::size_t ActiveCount();

  std::chrono::seconds SessionTtl() const { return config_.session_ttl; }

 private:
  std::optional<Session> ValidateLocked(const std::string& session_id, const std::string& ip,
                                        std::chrono::system_clock::time_point now);
  void CleanupExpiredLocked(std::chrono::system_clock::time_point now);
  bool IsExpired(const Session& session, std::chrono::system_clock::time_point now) const;

  std::shared_ptr<SharedState> state_;
  std::shared_ptr<TokenIssuer> token_issuer_;
  PairingConfig config_;
  Clock clock_;
  std::unordered_map<std::string, Session> sessions_;
};

}  // namespace lanxfer
