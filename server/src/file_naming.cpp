/*
 * 설명: 파일명 정리 규칙과 " (n)" 접미사 기반 충돌 해소를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/file_naming_test.cpp
 */
#include "lanxfer/file_naming.hpp"

#include <cctype>

namespace lanxfer {
namespace {
constexpr std::string_view kFallbackName = "downloaded_file";
constexpr unsigned long long kMaxCollisionAttempts = 10000;

bool IsInvalidWindowsFilenameChar(char ch) {
  auto uch = static_cast<unsigned char>(ch);
  if (uch < 0x20 || uch == 0x7f) {
    return true;
  }
  switch (ch) {
    case '<':
    case '>':
    case ':':
    case '"':
    case '/':
    case '\\':
    case '|':
    case '?':
    case '*':
      return true;
    default:
      return false;
  }
}

std::string CandidateName(const std::string& stem, const std::string& suffix, unsigned long long index) {
  if (index == 0) {
    return stem + suffix;
  }
  return stem + " (" + std::to_string(index) + ")" + suffix;
}

void SplitName(const std::string& clean_name, std::string& stem, std::string& suffix) {
  std::filesystem::path as_path(clean_name);
  stem = as_path.stem().string();
  suffix = as_path.extension().string();
  if (stem.empty()) {
    stem = std::string(kFallbackName);
  }
}
}  // namespace

std::string SanitizeFilenameForWindows(std::string_view name) {
  std::string result;
  result.reserve(name.size());
  for (char ch : name) {
    result.push_back(IsInvalidWindowsFilenameChar(ch) ? '_' : ch);
  }
  auto first = result.find_first_not_of(" .");
  if (first == std::string::npos) {
    return std::string(kFallbackName);
  }
  auto last = result.find_last_not_of(" .");
  return result.substr(first, last - first + 1);
}

std::string SecureFilename(std::string_view name) {
  std::string joined;
  bool pending_separator = false;
  for (char ch : name) {
    auto uch = static_cast<unsigned char>(ch);
    if (uch >= 0x80) {
      continue;
    }
    if (std::isspace(uch) || ch == '/' || ch == '\\') {
      pending_separator = !joined.empty();
      continue;
    }
    if (!(std::isalnum(uch) || ch == '.' || ch == '-' || ch == '_')) {
      continue;
    }
    if (pending_separator) {
      joined.push_back('_');
      pending_separator = false;
    }
    joined.push_back(ch);
  }
  auto first = joined.find_first_not_of("._");
  if (first == std::string::npos) {
    return {};
  }
  auto last = joined.find_last_not_of("._");
  return joined.substr(first, last - first + 1);
}

std::optional<std::filesystem::path> ReserveUniqueFile(const std::filesystem::path& directory,
                                                       std::string_view desired_name, boost::beast::file& file,
                                                       boost::beast::error_code& ec) {
  std::string stem;
  std::string suffix;
  SplitName(SanitizeFilenameForWindows(desired_name), stem, suffix);
  for (unsigned long long index = 0; index < kMaxCollisionAttempts; ++index) {
    auto candidate = directory / CandidateName(stem, suffix, index);
    ec = {};
    file.open(candidate.string().c_str(), boost::beast::file_mode::write_new, ec);
    if (!ec) {
      return candidate;
    }
    if (ec != boost::beast::errc::file_exists) {
      return std::nullopt;
    }
  }
  ec = boost::beast::errc::make_error_code(boost::beast::errc::file_exists);
  return std::nullopt;
}

}  // namespace lanxfer
