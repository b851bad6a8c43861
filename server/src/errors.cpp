/*
 * 설명: 오류 분류 이름을 로그/응답용 문자열로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "lanxfer/errors.hpp"

namespace lanxfer {

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kAuth:
      return "auth";
    case ErrorKind::kForbidden:
      return "forbidden";
    case ErrorKind::kBadRequest:
      return "bad_request";
    case ErrorKind::kLimitExceeded:
      return "limit_exceeded";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kConflict:
      return "conflict";
    case ErrorKind::kStorage:
      return "storage";
    case ErrorKind::kIo:
      return "io";
  }
  return "unknown";
}

}  // namespace lanxfer
