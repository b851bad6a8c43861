/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/transfer_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace lanxfer {

struct AppConfig {
  unsigned short port;
  std::string bind_address;
  std::string lan_ip;
  std::string download_dir;
  std::string transient_dir;
  std::size_t token_ttl_seconds;
  std::size_t session_ttl_seconds;
  std::uint64_t max_upload_bytes;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t worker_threads;
  std::size_t upload_threads;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
};

AppConfig LoadConfigFromEnv();

}  // namespace lanxfer
