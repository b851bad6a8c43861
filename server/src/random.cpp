/*
 * 설명: OpenSSL RAND_bytes로 16진 식별자와 편향 없는 토큰 문자열을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pairing_test.cpp
 */
#include "lanxfer/random.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace lanxfer {
namespace {
void FillRandom(std::vector<unsigned char>& buffer) {
  if (buffer.empty()) {
    return;
  }
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("RAND_bytes 실패");
  }
}
}  // namespace

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  FillRandom(buffer);
  std::ostringstream oss;
  for (unsigned char byte : buffer) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return oss.str();
}

std::string RandomToken(std::size_t length, std::string_view alphabet) {
  if (alphabet.empty() || alphabet.size() > 256) {
    throw std::invalid_argument("alphabet 크기가 올바르지 않습니다");
  }
  // 모듈로 편향을 피하려고 limit 이상의 바이트는 버린다.
  const std::size_t limit = 256 - (256 % alphabet.size());
  std::string out;
  out.reserve(length);
  std::vector<unsigned char> buffer(length * 2 + 8);
  while (out.size() < length) {
    FillRandom(buffer);
    for (unsigned char byte : buffer) {
      if (byte >= limit) {
        continue;
      }
      out.push_back(alphabet[byte % alphabet.size()]);
      if (out.size() == length) {
        break;
      }
    }
  }
  return out;
}

}  // namespace lanxfer
