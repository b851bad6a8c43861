/*
 * 설명: 디바이스 식별자 정규화, 표시 이름 결정, 최근 모바일 포인터 갱신을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/device_registry_test.cpp
 */
#include "lanxfer/device_registry.hpp"

#include <cctype>
#include <mutex>

namespace lanxfer {
namespace {
std::string_view Trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

// UTF-8 코드포인트 단위로 자른다.
std::string TruncateUtf8(std::string_view value, std::size_t max_chars) {
  std::size_t chars = 0;
  std::size_t pos = 0;
  while (pos < value.size() && chars < max_chars) {
    auto lead = static_cast<unsigned char>(value[pos]);
    std::size_t width = 1;
    if ((lead & 0xE0) == 0xC0) {
      width = 2;
    } else if ((lead & 0xF0) == 0xE0) {
      width = 3;
    } else if ((lead & 0xF8) == 0xF0) {
      width = 4;
    }
    if (pos + width > value.size()) {
      break;
    }
    pos += width;
    ++chars;
  }
  return std::string(value.substr(0, pos));
}
}  // namespace

DeviceRegistry::DeviceRegistry(std::shared_ptr<SharedState> state) : state_(std::move(state)) {}

std::optional<DeviceIdentity> DeviceRegistry::Resolve(bool trusted_origin,
                                                      const std::optional<std::string>& declared_id,
                                                      const std::optional<std::string>& declared_name,
                                                      ServiceError& error) {
  if (trusted_origin) {
    return DesktopIdentity();
  }
  auto device_id = NormalizeDeviceId(declared_id.value_or(""));
  if (device_id.empty()) {
    error.Set(ErrorKind::kAuth, error_code::kMissingDeviceId, "디바이스 식별자가 없습니다");
    return std::nullopt;
  }
  if (device_id == kDesktopDeviceId) {
    error.Set(ErrorKind::kAuth, error_code::kMissingDeviceId, "예약된 디바이스 식별자입니다");
    return std::nullopt;
  }
  auto device_name = NormalizeDeviceName(declared_name.value_or(""), device_id);

  std::lock_guard<std::mutex> lock(state_->mutex);
  names_[device_id] = device_name;
  latest_mobile_id_ = device_id;
  return DeviceIdentity{device_id, device_name, false};
}

DeviceIdentity DeviceRegistry::PreferredMobileDevice() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (latest_mobile_id_.empty()) {
    return DesktopIdentity();
  }
  auto it = names_.find(latest_mobile_id_);
  std::string name = it != names_.end() ? it->second : NormalizeDeviceName("", latest_mobile_id_);
  return DeviceIdentity{latest_mobile_id_, name, false};
}

std::optional<std::string> DeviceRegistry::NameOf(const std::string& device_id) {
  if (device_id == kDesktopDeviceId) {
    return std::string(kDesktopDeviceName);
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  auto it = names_.find(device_id);
  if (it == names_.end()) {
    return std::nullopt;
  }
  return it->second;
}

DeviceIdentity DeviceRegistry::DesktopIdentity() {
  return DeviceIdentity{std::string(kDesktopDeviceId), std::string(kDesktopDeviceName), true};
}

std::string DeviceRegistry::NormalizeDeviceId(std::string_view raw) {
  auto value = Trim(raw);
  if (value.size() > kMaxDeviceIdLength) {
    value = value.substr(0, kMaxDeviceIdLength);
  }
  std::string safe;
  safe.reserve(value.size());
  for (char ch : value) {
    auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) || ch == '-' || ch == '_') {
      safe.push_back(ch);
    }
  }
  return safe;
}

std::string DeviceRegistry::NormalizeDeviceName(std::string_view raw, const std::string& device_id) {
  auto value = Trim(raw);
  if (value.empty()) {
    return "Mobile-" + device_id.substr(0, 8);
  }
  return TruncateUtf8(value, kMaxDeviceNameLength);
}

}  // namespace lanxfer
