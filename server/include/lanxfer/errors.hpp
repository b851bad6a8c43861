/*
 * 설명: 서비스 계층 공통 오류 분류와 오류 코드를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pairing_test.cpp, server/tests/unit/transfer_coordinator_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

namespace lanxfer {

enum class ErrorKind {
  kAuth,
  kForbidden,
  kBadRequest,
  kLimitExceeded,
  kNotFound,
  kConflict,
  kStorage,
  kIo,
};

struct ServiceError {
  ErrorKind kind{ErrorKind::kBadRequest};
  std::string code;
  std::string message;

  void Set(ErrorKind k, std::string_view c, std::string_view m) {
    kind = k;
    code = c;
    message = m;
  }
};

namespace error_code {
inline constexpr std::string_view kTokenMissing = "token_missing";
inline constexpr std::string_view kOriginUnknown = "origin_unknown";
inline constexpr std::string_view kTokenInvalid = "token_invalid";
inline constexpr std::string_view kTokenConsumed = "token_consumed";
inline constexpr std::string_view kTokenExpired = "token_expired";
inline constexpr std::string_view kMissingDeviceId = "missing_device_id";
inline constexpr std::string_view kUnauthorized = "unauthorized";
inline constexpr std::string_view kForbidden = "forbidden";
inline constexpr std::string_view kBadRequest = "bad_request";
inline constexpr std::string_view kLimitExceeded = "limit_exceeded";
inline constexpr std::string_view kNotFound = "not_found";
inline constexpr std::string_view kSaveInProgress = "save_in_progress";
inline constexpr std::string_view kStorageError = "storage_error";
inline constexpr std::string_view kIoFailure = "io_failure";
}  // namespace error_code

std::string_view ErrorKindName(ErrorKind kind);

}  // namespace lanxfer
