/*
 * 설명: JSON 응답 엔벨로프를 생성하고 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "lanxfer/api_response.hpp"

#include <chrono>

#include "lanxfer/transfer_record.hpp"

namespace lanxfer {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(const ServiceError& error) {
  auto envelope = MakeErrorEnvelope(error.code, error.message);
  envelope["error"]["detail"] = {{"kind", ErrorKindName(error.kind)}};
  return envelope;
}

unsigned HttpStatusCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kAuth:
      return 401;
    case ErrorKind::kForbidden:
      return 403;
    case ErrorKind::kBadRequest:
      return 400;
    case ErrorKind::kLimitExceeded:
      return 413;
    case ErrorKind::kNotFound:
      return 404;
    case ErrorKind::kConflict:
      return 409;
    case ErrorKind::kStorage:
    case ErrorKind::kIo:
      return 500;
  }
  return 500;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload;
  return j;
}

}  // namespace lanxfer
