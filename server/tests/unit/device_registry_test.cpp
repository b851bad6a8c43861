#include <gtest/gtest.h>

#include "lanxfer/device_registry.hpp"
#include "lanxfer/trusted_origin.hpp"

namespace {

TEST(DeviceRegistryTest, TrustedOriginAlwaysResolvesToDesktop) {
  lanxfer::DeviceRegistry registry(lanxfer::MakeSharedState());
  lanxfer::ServiceError error;
  auto device = registry.Resolve(true, std::string("phone-1"), std::string("Phone"), error);
  ASSERT_TRUE(device.has_value());
  EXPECT_EQ(device->id, "desktop");
  EXPECT_TRUE(device->is_desktop);
  EXPECT_EQ(registry.PreferredMobileDevice().id, "desktop");
}

TEST(DeviceRegistryTest, NormalizesDeclaredIdentifier) {
  EXPECT_EQ(lanxfer::DeviceRegistry::NormalizeDeviceId("  ab c/d-e_f!  "), "abcd-e_f");
  EXPECT_EQ(lanxfer::DeviceRegistry::NormalizeDeviceId(std::string(200, 'x')).size(), 120u);
  EXPECT_EQ(lanxfer::DeviceRegistry::NormalizeDeviceId("기기"), "");
}

TEST(DeviceRegistryTest, MissingOrReservedIdentifierIsRejected) {
  lanxfer::DeviceRegistry registry(lanxfer::MakeSharedState());
  lanxfer::ServiceError missing;
  EXPECT_FALSE(registry.Resolve(false, std::nullopt, std::nullopt, missing).has_value());
  EXPECT_EQ(missing.code, lanxfer::error_code::kMissingDeviceId);
  EXPECT_EQ(missing.kind, lanxfer::ErrorKind::kAuth);

  lanxfer::ServiceError stripped;
  EXPECT_FALSE(registry.Resolve(false, std::string("!!!"), std::nullopt, stripped).has_value());
  EXPECT_EQ(stripped.code, lanxfer::error_code::kMissingDeviceId);

  lanxfer::ServiceError reserved;
  EXPECT_FALSE(registry.Resolve(false, std::string("desktop"), std::nullopt, reserved).has_value());
}

TEST(DeviceRegistryTest, DerivesAndTruncatesDisplayName) {
  lanxfer::DeviceRegistry registry(lanxfer::MakeSharedState());
  lanxfer::ServiceError error;
  auto unnamed = registry.Resolve(false, std::string("abcdef123456"), std::nullopt, error);
  ASSERT_TRUE(unnamed.has_value());
  EXPECT_EQ(unnamed->name, "Mobile-abcdef12");

  std::string long_name;
  for (int i = 0; i < 100; ++i) {
    long_name += "가";
  }
  auto named = registry.Resolve(false, std::string("phone-2"), long_name, error);
  ASSERT_TRUE(named.has_value());
  EXPECT_EQ(named->name.size(), 80u * 3u);
  EXPECT_EQ(registry.NameOf("phone-2"), named->name);
}

TEST(DeviceRegistryTest, PreferredMobileTracksLatestResolution) {
  lanxfer::DeviceRegistry registry(lanxfer::MakeSharedState());
  lanxfer::ServiceError error;
  registry.Resolve(false, std::string("phone-a"), std::string("A"), error);
  registry.Resolve(false, std::string("phone-b"), std::string("B"), error);
  EXPECT_EQ(registry.PreferredMobileDevice().id, "phone-b");

  registry.Resolve(false, std::string("phone-a"), std::string("A2"), error);
  auto preferred = registry.PreferredMobileDevice();
  EXPECT_EQ(preferred.id, "phone-a");
  EXPECT_EQ(preferred.name, "A2");
  EXPECT_FALSE(preferred.is_desktop);
}

TEST(TrustedOriginTest, LoopbackAndLanAddressAreTrusted) {
  lanxfer::TrustedOriginPolicy policy("192.168.0.10");
  EXPECT_TRUE(policy.IsTrusted("127.0.0.1"));
  EXPECT_TRUE(policy.IsTrusted("::1"));
  EXPECT_TRUE(policy.IsTrusted("192.168.0.10"));
  EXPECT_TRUE(policy.IsTrusted("::ffff:192.168.0.10"));
  EXPECT_FALSE(policy.IsTrusted("192.168.0.20"));
  EXPECT_FALSE(policy.IsTrusted(""));
  EXPECT_EQ(lanxfer::TrustedOriginPolicy::Normalize("::ffff:10.0.0.5"), "10.0.0.5");
}

}  // namespace
