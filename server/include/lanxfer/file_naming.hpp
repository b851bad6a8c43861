/*
 * 설명: 업로드/저장 대상 파일명 정리와 충돌 없는 경로 할당을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/file_naming_test.cpp
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/core/error.hpp>
#include <boost/beast/core/file.hpp>

namespace lanxfer {

// Windows에서 쓸 수 없는 문자(<>:"/\|?*)와 제어 문자를 '_'로 바꾸고 앞뒤 공백/점을 제거한다.
std::string SanitizeFilenameForWindows(std::string_view name);

// ASCII 영숫자와 . - _ 만 남긴다. 비어 있으면 빈 문자열.
std::string SecureFilename(std::string_view name);

// "name (n).ext" 규칙으로 경로를 고르고 파일을 배타적으로 생성해 동시 할당 경쟁을 막는다.
// 시도 횟수를 다 쓰면 file_exists 오류와 함께 nullopt를 돌려준다.
std::optional<std::filesystem::path> ReserveUniqueFile(const std::filesystem::path& directory,
                                                       std::string_view desired_name, boost::beast::file& file,
                                                       boost::beast::error_code& ec);

}  // namespace lanxfer
