/*
 * 설명: REST/WS 응답 엔벨로프 생성과 오류 분류별 HTTP 상태 매핑을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "lanxfer/errors.hpp"

namespace lanxfer {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);
// detail에 오류 분류를 담는다.
nlohmann::json MakeErrorEnvelope(const ServiceError& error);

unsigned HttpStatusCode(ErrorKind kind);

struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);

}  // namespace lanxfer
