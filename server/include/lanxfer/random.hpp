/*
 * 설명: OpenSSL CSPRNG 기반 식별자/토큰 생성 유틸리티.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pairing_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace lanxfer {

// 혼동되는 문자(0/O, 1/l/I)를 제외한 알파벳
inline constexpr std::string_view kUnambiguousAlphabet =
    "ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnpqrstuvwxyz23456789";

std::string RandomHex(std::size_t bytes);
std::string RandomToken(std::size_t length, std::string_view alphabet = kUnambiguousAlphabet);

}  // namespace lanxfer
