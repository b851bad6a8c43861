/*
 * 설명: HTTP 요청 파싱 도우미 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/http_util_test.cpp
 */
#include "lanxfer/http_util.hpp"

#include <cctype>
#include <stdexcept>

namespace lanxfer {

namespace {
int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool IsAttrChar(unsigned char c) {
  return std::isalnum(c) || c == '!' || c == '#' || c == '$' || c == '&' || c == '+' || c == '-' || c == '.' ||
         c == '^' || c == '_' || c == '`' || c == '|' || c == '~';
}
}  // namespace

RequestTarget SplitTarget(std::string_view target) {
  RequestTarget out;
  auto qpos = target.find('?');
  if (qpos == std::string_view::npos) {
    out.path = std::string(target);
  } else {
    out.path = std::string(target.substr(0, qpos));
    out.query = std::string(target.substr(qpos + 1));
  }
  return out;
}

std::string UrlDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < text.size() && HexValue(text[i + 1]) >= 0 && HexValue(text[i + 2]) >= 0) {
      out.push_back(static_cast<char>(HexValue(text[i + 1]) * 16 + HexValue(text[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(UrlDecode(pair.substr(0, eq)), UrlDecode(pair.substr(eq + 1)));
    } else if (!pair.empty()) {
      params.emplace(UrlDecode(pair), std::string{});
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<std::string> FindCookie(std::string_view cookie_header, std::string_view name) {
  std::size_t pos = 0;
  while (pos < cookie_header.size()) {
    auto semi = cookie_header.find(';', pos);
    auto item = cookie_header.substr(pos, semi == std::string_view::npos ? std::string_view::npos : semi - pos);
    while (!item.empty() && item.front() == ' ') {
      item.remove_prefix(1);
    }
    auto eq = item.find('=');
    if (eq != std::string_view::npos && item.substr(0, eq) == name) {
      auto value = item.substr(eq + 1);
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
      }
      return std::string(value);
    }
    if (semi == std::string_view::npos) {
      break;
    }
    pos = semi + 1;
  }
  return std::nullopt;
}

std::optional<std::size_t> ParsePositiveInt(const std::string& value) {
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    auto parsed = std::stoull(value, &idx);
    if (idx != value.size()) {
      return std::nullopt;
    }
    return static_cast<std::size_t>(parsed);
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::string ContentDispositionAttachment(std::string_view file_name) {
  std::string fallback;
  std::string encoded;
  static constexpr char kHex[] = "0123456789ABCDEF";
  for (unsigned char c : file_name) {
    if (c >= 0x20 && c < 0x7f && c != '"' && c != '\\') {
      fallback.push_back(static_cast<char>(c));
    } else {
      fallback.push_back('_');
    }
    if (IsAttrChar(c)) {
      encoded.push_back(static_cast<char>(c));
    } else {
      encoded.push_back('%');
      encoded.push_back(kHex[c >> 4]);
      encoded.push_back(kHex[c & 0x0f]);
    }
  }
  if (fallback.empty()) {
    fallback = "download";
  }
  return "attachment; filename=\"" + fallback + "\"; filename*=UTF-8''" + encoded;
}

}  // namespace lanxfer
