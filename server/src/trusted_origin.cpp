/*
 * 설명: 루프백과 데스크톱 LAN 주소를 신뢰 목록으로 관리하고 LAN 주소를 탐지한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/device_registry_test.cpp
 */
#include "lanxfer/trusted_origin.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/udp.hpp>

namespace lanxfer {

TrustedOriginPolicy::TrustedOriginPolicy(const std::string& lan_ip) : lan_ip_(Normalize(lan_ip)) {
  trusted_.insert("127.0.0.1");
  trusted_.insert("::1");
  if (!lan_ip_.empty()) {
    trusted_.insert(lan_ip_);
  }
}

bool TrustedOriginPolicy::IsTrusted(const std::string& ip) const {
  if (ip.empty()) {
    return false;
  }
  return trusted_.count(Normalize(ip)) > 0;
}

std::string TrustedOriginPolicy::Normalize(const std::string& ip) {
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(ip, ec);
  if (ec) {
    return ip;
  }
  if (address.is_v6() && address.to_v6().is_v4_mapped()) {
    return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, address.to_v6()).to_string();
  }
  return address.to_string();
}

std::string DetectLanIp() {
  // UDP connect는 패킷을 보내지 않고 라우팅에 쓰일 로컬 주소만 정한다.
  boost::asio::io_context ioc;
  boost::asio::ip::udp::socket socket(ioc);
  boost::system::error_code ec;
  socket.open(boost::asio::ip::udp::v4(), ec);
  if (ec) {
    return "127.0.0.1";
  }
  socket.connect({boost::asio::ip::make_address_v4("8.8.8.8"), 80}, ec);
  if (ec) {
    return "127.0.0.1";
  }
  auto local = socket.local_endpoint(ec);
  if (ec) {
    return "127.0.0.1";
  }
  return local.address().to_string();
}

}  // namespace lanxfer
