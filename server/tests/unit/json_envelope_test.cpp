#include <gtest/gtest.h>

#include "lanxfer/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = lanxfer::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = lanxfer::MakeErrorEnvelope("bad_request", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "bad_request");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, ServiceErrorCarriesKind) {
  lanxfer::ServiceError error;
  error.Set(lanxfer::ErrorKind::kLimitExceeded, lanxfer::error_code::kLimitExceeded, "너무 큽니다");
  auto env = lanxfer::MakeErrorEnvelope(error);
  EXPECT_EQ(env["error"]["code"], "limit_exceeded");
  EXPECT_EQ(env["error"]["detail"]["kind"], std::string(lanxfer::ErrorKindName(error.kind)));
}

TEST(JsonEnvelopeTest, ErrorKindsMapToHttpStatus) {
  EXPECT_EQ(lanxfer::HttpStatusCode(lanxfer::ErrorKind::kAuth), 401u);
  EXPECT_EQ(lanxfer::HttpStatusCode(lanxfer::ErrorKind::kForbidden), 403u);
  EXPECT_EQ(lanxfer::HttpStatusCode(lanxfer::ErrorKind::kBadRequest), 400u);
  EXPECT_EQ(lanxfer::HttpStatusCode(lanxfer::ErrorKind::kLimitExceeded), 413u);
  EXPECT_EQ(lanxfer::HttpStatusCode(lanxfer::ErrorKind::kNotFound), 404u);
  EXPECT_EQ(lanxfer::HttpStatusCode(lanxfer::ErrorKind::kConflict), 409u);
  EXPECT_EQ(lanxfer::HttpStatusCode(lanxfer::ErrorKind::kStorage), 500u);
  EXPECT_EQ(lanxfer::HttpStatusCode(lanxfer::ErrorKind::kIo), 500u);
}

TEST(JsonEnvelopeTest, WebSocketEventShape) {
  auto j = lanxfer::ToWsJson({"event", "record_removed", 7, {{"id", "r1"}}});
  EXPECT_EQ(j["t"], "event");
  EXPECT_EQ(j["event"], "record_removed");
  EXPECT_EQ(j["seq"], 7);
  EXPECT_EQ(j["p"]["id"], "r1");

  auto err = lanxfer::ToWsJson({"error", "", 8, {{"code", "bad_request"}}});
  EXPECT_TRUE(err["event"].is_null());
}
