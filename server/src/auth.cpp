/*
 * 설명: 페어링 토큰 회전/소비와 세션 교환/검증/지연 만료를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pairing_test.cpp
 */
#include "lanxfer/auth.hpp"

#include <mutex>

#include "lanxfer/random.hpp"

namespace lanxfer {

TokenIssuer::TokenIssuer(std::shared_ptr<SharedState> state, const PairingConfig& config, Clock clock)
    : state_(std::move(state)), config_(config), clock_(std::move(clock)) {}

PairingToken TokenIssuer::Issue(bool force_new) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  auto now = clock_();
  bool reusable = !force_new && !current_.value.empty() && !current_.consumed && current_.expires_at > now;
  if (reusable) {
    return current_;
  }
  current_.value = RandomToken(config_.token_length);
  current_.expires_at = now + config_.token_ttl;
  current_.consumed = false;
  return current_;
}

bool TokenIssuer::ConsumeLocked(const std::string& token, std::chrono::system_clock::time_point now,
                                ServiceError& error) {
  if (current_.value.empty() || current_.value != token) {
    error.Set(ErrorKind::kAuth, error_code::kTokenInvalid, "토큰이 유효하지 않습니다");
    return false;
  }
  if (current_.consumed) {
    error.Set(ErrorKind::kAuth, error_code::kTokenConsumed, "이미 사용된 토큰입니다");
    return false;
  }
  if (current_.expires_at <= now) {
    error.Set(ErrorKind::kAuth, error_code::kTokenExpired, "토큰이 만료되었습니다");
    return false;
  }
  current_.consumed = true;
  return true;
}

SessionStore::SessionStore(std::shared_ptr<SharedState> state, std::shared_ptr<TokenIssuer> token_issuer,
                           const PairingConfig& config, Clock clock)
    : state_(std::move(state)), token_issuer_(std::move(token_issuer)), config_(config), clock_(std::move(clock)) {}

std::optional<std::string> SessionStore::Exchange(const std::string& token, const std::string& ip,
                                                  const std::optional<std::string>& presented_session,
                                                  ServiceError& error) {
  if (token.empty()) {
    error.Set(ErrorKind::kAuth, error_code::kTokenMissing, "1회용 토큰이 없습니다");
    return std::nullopt;
  }
  if (ip.empty()) {
    error.Set(ErrorKind::kAuth, error_code::kOriginUnknown, "요청 주소를 확인할 수 없습니다");
    return std::nullopt;
  }
  auto session_id = RandomHex(16);

  std::lock_guard<std::mutex> lock(state_->mutex);
  auto now = clock_();
  CleanupExpiredLocked(now);
  if (presented_session && !presented_session->empty()) {
    auto existing = ValidateLocked(*presented_session, ip, now);
    if (existing) {
      return existing->id;
    }
  }
  if (!token_issuer_->ConsumeLocked(token, now, error)) {
    return std::nullopt;
  }
  sessions_[session_id] = Session{session_id, ip, now, now};
  return session_id;
}

std::optional<Session> SessionStore::Validate(const std::string& session_id, const std::string& ip) {
  if (session_id.empty()) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  auto now = clock_();
  CleanupExpiredLocked(now);
  return ValidateLocked(session_id, ip, now);
}

std::optional<Session> SessionStore::ValidateLocked(const std::string& session_id, const std::string& ip,
                                                    std::chrono::system_clock::time_point now) {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  if (IsExpired(it->second, now)) {
    sessions_.erase(it);
    return std::nullopt;
  }
  if (it->second.bound_ip != ip) {
    return std::nullopt;
  }
  it->second.last_seen_at = now;
  return it->second;
}

bool SessionStore::Purge(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return sessions_.erase(session_id) > 0;
}

std::size_t SessionStore::ActiveCount() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  CleanupExpiredLocked(clock_());
  return sessions_.size();
}

void SessionStore::CleanupExpiredLocked(std::chrono::system_clock::time_point now) {
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (IsExpired(it->second, now)) {
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

bool SessionStore::IsExpired(const Session& session, std::chrono::system_clock::time_point now) const {
  return now - session.last_seen_at > config_.session_ttl;
}

}  // namespace lanxfer
