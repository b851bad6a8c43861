/*
 * 설명: 요청이 자체 선언한 디바이스 식별자를 정규화/기록하고 최근 모바일 디바이스를 추적한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/device_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lanxfer/errors.hpp"
#include "lanxfer/shared_state.hpp"

namespace lanxfer {

inline constexpr std::string_view kDesktopDeviceId = "desktop";
inline constexpr std::string_view kDesktopDeviceName = "Desktop";
inline constexpr std::size_t kMaxDeviceIdLength = 120;
inline constexpr std::size_t kMaxDeviceNameLength = 80;

struct DeviceIdentity {
  std::string id;
  std::string name;
  bool is_desktop{false};
};

class DeviceRegistry {
 public:
  explicit DeviceRegistry(std::shared_ptr<SharedState> state);

  std::optional<DeviceIdentity> Resolve(bool trusted_origin, const std::optional<std::string>& declared_id,
                                        const std::optional<std::string>& declared_name, ServiceError& error);
  // 데스크톱이 대신 보내는 파일의 수신자. 페어링된 모바일이 없으면 데스크톱 자신.
  DeviceIdentity PreferredMobileDevice();
  std::optional<std::string> NameOf(const std::string& device_id);

  static DeviceIdentity DesktopIdentity();
  static std::string NormalizeDeviceId(std::string_view raw);
  static std::string NormalizeDeviceName(std::string_view raw, const std::string& device_id);

 private:
  std::shared_ptr<SharedState> state_;
  std::unordered_map<std::string, std::string> names_;
  std::string latest_mobile_id_;
};

}  // namespace lanxfer
