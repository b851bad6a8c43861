/*
 * 설명: 요청 대상/쿼리/쿠키 파싱과 다운로드 헤더 생성 도우미.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/http_util_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lanxfer {

struct RequestTarget {
  std::string path;
  std::string query;
};

RequestTarget SplitTarget(std::string_view target);
std::string UrlDecode(std::string_view text);
std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query);
std::optional<std::string> FindCookie(std::string_view cookie_header, std::string_view name);
std::optional<std::size_t> ParsePositiveInt(const std::string& value);

// ASCII 대체 이름과 RFC 5987 filename*을 모두 담은 attachment 헤더 값.
std::string ContentDispositionAttachment(std::string_view file_name);

}  // namespace lanxfer
