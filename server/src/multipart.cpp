/*
 * 설명: 경계 문자열 검색 기반의 스트리밍 multipart 파서.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/multipart_test.cpp
 */
#include "lanxfer/multipart.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <utility>
#include <vector>

namespace lanxfer {

namespace {
constexpr std::size_t kMaxHeaderBytes = 16 * 1024;

std::string ToLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

// key=value; key="quoted value" 목록을 나눈다. 따옴표 안의 ';'는 구분자가 아니다.
std::vector<std::pair<std::string, std::string>> SplitParameters(std::string_view value) {
  std::vector<std::pair<std::string, std::string>> params;
  std::size_t pos = 0;
  while (pos < value.size()) {
    std::string key;
    std::string val;
    while (pos < value.size() && value[pos] != '=' && value[pos] != ';') {
      key.push_back(value[pos++]);
    }
    if (pos < value.size() && value[pos] == '=') {
      ++pos;
      while (pos < value.size() && (value[pos] == ' ' || value[pos] == '\t')) {
        ++pos;
      }
      if (pos < value.size() && value[pos] == '"') {
        ++pos;
        while (pos < value.size() && value[pos] != '"') {
          if (value[pos] == '\\' && pos + 1 < value.size()) {
            ++pos;
          }
          val.push_back(value[pos++]);
        }
        ++pos;
        while (pos < value.size() && value[pos] != ';') {
          ++pos;
        }
      } else {
        while (pos < value.size() && value[pos] != ';') {
          val.push_back(value[pos++]);
        }
        val = std::string(Trim(val));
      }
    }
    if (pos < value.size() && value[pos] == ';') {
      ++pos;
    }
    auto trimmed_key = ToLower(Trim(key));
    if (!trimmed_key.empty()) {
      params.emplace_back(std::move(trimmed_key), std::move(val));
    }
  }
  return params;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string PercentDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      int hi = HexValue(text[i + 1]);
      int lo = HexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

// RFC 5987 ext-value: charset'lang'pct-encoded
std::optional<std::string> DecodeExtValue(std::string_view value) {
  auto first = value.find('\'');
  if (first == std::string_view::npos) {
    return std::nullopt;
  }
  auto second = value.find('\'', first + 1);
  if (second == std::string_view::npos) {
    return std::nullopt;
  }
  auto charset = ToLower(value.substr(0, first));
  if (charset != "utf-8" && charset != "us-ascii") {
    return std::nullopt;
  }
  return PercentDecode(value.substr(second + 1));
}
}  // namespace

std::optional<std::string> ParseMultipartBoundary(std::string_view content_type) {
  auto semi = content_type.find(';');
  auto media = ToLower(Trim(content_type.substr(0, semi)));
  if (media != "multipart/form-data" || semi == std::string_view::npos) {
    return std::nullopt;
  }
  for (auto& [key, value] : SplitParameters(content_type.substr(semi + 1))) {
    if (key == "boundary" && !value.empty() && value.size() <= 200) {
      return value;
    }
  }
  return std::nullopt;
}

MultipartPart ParseContentDisposition(std::string_view value) {
  MultipartPart part;
  auto semi = value.find(';');
  if (semi == std::string_view::npos) {
    return part;
  }
  std::optional<std::string> extended;
  for (auto& [key, val] : SplitParameters(value.substr(semi + 1))) {
    if (key == "name") {
      part.name = val;
    } else if (key == "filename") {
      part.filename = val;
    } else if (key == "filename*") {
      extended = DecodeExtValue(val);
    }
  }
  if (extended) {
    part.filename = std::move(extended);
  }
  return part;
}

MultipartReader::MultipartReader(std::string boundary, RawReader reader, std::size_t read_chunk)
    : delimiter_("\r\n--" + boundary), reader_(std::move(reader)), read_chunk_(std::max<std::size_t>(read_chunk, 1)) {
  // 첫 경계 앞에는 CRLF가 없으므로 모든 경계를 같은 형태로 찾도록 미리 붙여 둔다.
  buffer_ = "\r\n";
}

void MultipartReader::Malformed(ServiceError& error, std::string_view message) {
  state_ = State::kDone;
  error.Set(ErrorKind::kBadRequest, error_code::kBadRequest, message);
}

bool MultipartReader::Fill(ServiceError& error) {
  if (eof_) {
    return false;
  }
  auto old_size = buffer_.size();
  buffer_.resize(old_size + read_chunk_);
  auto read = reader_(buffer_.data() + old_size, read_chunk_);
  if (!read) {
    buffer_.resize(old_size);
    state_ = State::kDone;
    error.Set(ErrorKind::kIo, error_code::kIoFailure, "요청 본문을 읽는 중 연결이 끊어졌습니다");
    return false;
  }
  buffer_.resize(old_size + *read);
  if (*read == 0) {
    eof_ = true;
    return false;
  }
  return true;
}

bool MultipartReader::ConsumeDelimiterTail(ServiceError& error) {
  // 경계 직후 "--"는 본문 끝, CRLF는 다음 파트 헤더.
  while (buffer_.size() < 2) {
    if (!Fill(error)) {
      if (error.code.empty()) {
        Malformed(error, "multipart 경계가 잘렸습니다");
      }
      return false;
    }
  }
  if (buffer_.compare(0, 2, "--") == 0) {
    state_ = State::kDone;
    buffer_.clear();
    return true;
  }
  // 경계 줄 끝의 공백(transport padding)은 허용한다.
  std::size_t pos = 0;
  while (true) {
    while (pos < buffer_.size() && (buffer_[pos] == ' ' || buffer_[pos] == '\t')) {
      ++pos;
    }
    if (pos + 2 <= buffer_.size()) {
      break;
    }
    if (!Fill(error)) {
      if (error.code.empty()) {
        Malformed(error, "multipart 경계가 잘렸습니다");
      }
      return false;
    }
  }
  if (buffer_.compare(pos, 2, "\r\n") != 0) {
    Malformed(error, "multipart 경계 형식이 올바르지 않습니다");
    return false;
  }
  buffer_.erase(0, pos + 2);
  state_ = State::kHeaders;
  return true;
}

std::optional<MultipartPart> MultipartReader::ReadHeaders(ServiceError& error) {
  std::size_t end = std::string::npos;
  while (true) {
    // 헤더가 없는 파트는 바로 빈 줄로 시작한다.
    if (buffer_.size() >= 2 && buffer_.compare(0, 2, "\r\n") == 0) {
      end = 0;
      break;
    }
    end = buffer_.find("\r\n\r\n");
    if (end != std::string::npos) {
      break;
    }
    if (buffer_.size() > kMaxHeaderBytes) {
      Malformed(error, "multipart 파트 헤더가 너무 깁니다");
      return std::nullopt;
    }
    if (!Fill(error)) {
      if (error.code.empty()) {
        Malformed(error, "multipart 파트 헤더가 잘렸습니다");
      }
      return std::nullopt;
    }
  }

  MultipartPart part;
  std::string_view headers(buffer_.data(), end);
  std::size_t pos = 0;
  while (pos < headers.size()) {
    auto eol = headers.find("\r\n", pos);
    auto line = headers.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
      auto key = ToLower(Trim(line.substr(0, colon)));
      auto value = Trim(line.substr(colon + 1));
      if (key == "content-disposition") {
        auto parsed = ParseContentDisposition(value);
        part.name = std::move(parsed.name);
        part.filename = std::move(parsed.filename);
      } else if (key == "content-type") {
        part.content_type = std::string(value);
      }
    }
    if (eol == std::string_view::npos) {
      break;
    }
    pos = eol + 2;
  }
  buffer_.erase(0, end == 0 ? 2 : end + 4);
  state_ = State::kBody;
  return part;
}

bool MultipartReader::SkipPartBody(ServiceError& error) {
  std::vector<char> scratch(read_chunk_);
  while (true) {
    auto read = ReadPartData(scratch.data(), scratch.size(), error);
    if (!read) {
      return false;
    }
    if (*read == 0) {
      return true;
    }
  }
}

std::optional<MultipartPart> MultipartReader::NextFilePart(std::string_view field_name, ServiceError& error) {
  while (true) {
    switch (state_) {
      case State::kPreamble: {
        auto pos = buffer_.find(delimiter_);
        if (pos == std::string::npos) {
          if (buffer_.size() >= delimiter_.size()) {
            buffer_.erase(0, buffer_.size() - (delimiter_.size() - 1));
          }
          if (!Fill(error)) {
            if (error.code.empty()) {
              Malformed(error, "multipart 경계를 찾을 수 없습니다");
            }
            return std::nullopt;
          }
          break;
        }
        buffer_.erase(0, pos + delimiter_.size());
        if (!ConsumeDelimiterTail(error)) {
          return std::nullopt;
        }
        break;
      }
      case State::kHeaders: {
        auto part = ReadHeaders(error);
        if (!part) {
          return std::nullopt;
        }
        if (part->name == field_name && part->filename) {
          return part;
        }
        if (!SkipPartBody(error)) {
          return std::nullopt;
        }
        break;
      }
      case State::kBody:
        if (!SkipPartBody(error)) {
          return std::nullopt;
        }
        break;
      case State::kDone:
        return std::nullopt;
    }
  }
}

std::optional<std::size_t> MultipartReader::ReadPartData(char* out, std::size_t capacity, ServiceError& error) {
  if (state_ != State::kBody || capacity == 0) {
    return std::size_t{0};
  }
  while (true) {
    auto pos = buffer_.find(delimiter_);
    if (pos != std::string::npos) {
      if (pos > 0) {
        auto n = std::min(capacity, pos);
        std::memcpy(out, buffer_.data(), n);
        buffer_.erase(0, n);
        return n;
      }
      buffer_.erase(0, delimiter_.size());
      if (!ConsumeDelimiterTail(error)) {
        return std::nullopt;
      }
      return std::size_t{0};
    }
    // 경계의 앞부분일 수 있는 꼬리는 남겨 둔다.
    auto keep = delimiter_.size() - 1;
    if (buffer_.size() > keep) {
      auto n = std::min(capacity, buffer_.size() - keep);
      std::memcpy(out, buffer_.data(), n);
      buffer_.erase(0, n);
      return n;
    }
    if (!Fill(error)) {
      if (error.code.empty()) {
        Malformed(error, "multipart 본문이 경계 없이 끝났습니다");
      }
      return std::nullopt;
    }
  }
}

}  // namespace lanxfer
