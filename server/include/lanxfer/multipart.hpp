/*
 * 설명: multipart/form-data 본문을 메모리에 모두 올리지 않고 파트 단위로 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/multipart_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "lanxfer/errors.hpp"

namespace lanxfer {

struct MultipartPart {
  std::string name;
  std::optional<std::string> filename;
  std::string content_type;
};

// Content-Type 헤더에서 boundary 파라미터를 꺼낸다. multipart/form-data가 아니면 nullopt.
std::optional<std::string> ParseMultipartBoundary(std::string_view content_type);

// Content-Disposition 헤더 값에서 name/filename을 읽는다. filename*=UTF-8''... 이 우선한다.
MultipartPart ParseContentDisposition(std::string_view value);

class MultipartReader {
 public:
  // 원본 본문을 읽는다. 0은 본문 끝, nullopt는 전송 오류.
  using RawReader = std::function<std::optional<std::size_t>(char* buffer, std::size_t capacity)>;

  MultipartReader(std::string boundary, RawReader reader, std::size_t read_chunk = 64 * 1024);

  // field_name 이름의 파일 파트 헤더까지 진행한다. 다른 파트는 건너뛴다.
  std::optional<MultipartPart> NextFilePart(std::string_view field_name, ServiceError& error);
  // 현재 파트의 본문 바이트를 읽는다. 0이면 파트가 끝났다.
  std::optional<std::size_t> ReadPartData(char* out, std::size_t capacity, ServiceError& error);

 private:
  enum class State { kPreamble, kHeaders, kBody, kDone };

  bool Fill(ServiceError& error);
  bool ConsumeDelimiterTail(ServiceError& error);
  std::optional<MultipartPart> ReadHeaders(ServiceError& error);
  bool SkipPartBody(ServiceError& error);
  void Malformed(ServiceError& error, std::string_view message);

  std::string delimiter_;
  RawReader reader_;
  std::size_t read_chunk_;
  std::string buffer_;
  bool eof_{false};
  State state_{State::kPreamble};
};

}  // namespace lanxfer
