/*
 * 설명: 네트워크 출발지 주소로 데스크톱(신뢰) 요청을 판별한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/device_registry_test.cpp
 */
#pragma once

#include <string>
#include <unordered_set>

namespace lanxfer {

class TrustedOriginPolicy {
 public:
  explicit TrustedOriginPolicy(const std::string& lan_ip);

  bool IsTrusted(const std::string& ip) const;
  const std::string& LanIp() const { return lan_ip_; }

  // ::ffff:a.b.c.d 형태는 IPv4 문자열로 바꾼다.
  static std::string Normalize(const std::string& ip);

 private:
  std::string lan_ip_;
  std::unordered_set<std::string> trusted_;
};

std::string DetectLanIp();

}  // namespace lanxfer
