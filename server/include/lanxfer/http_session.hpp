/*
 * 설명: HTTP 연결을 처리하고 페어링/기록/업로드/다운로드/저장/설정 엔드포인트 및 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/transfer_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "lanxfer/api_response.hpp"
#include "lanxfer/auth.hpp"
#include "lanxfer/config.hpp"
#include "lanxfer/observability.hpp"
#include "lanxfer/realtime.hpp"
#include "lanxfer/transfer_coordinator.hpp"
#include "lanxfer/transfer_store.hpp"
#include "lanxfer/trusted_origin.hpp"
#include "lanxfer/upload_workers.hpp"
#include "lanxfer/websocket_session.hpp"

namespace lanxfer {

inline constexpr std::string_view kSessionCookieName = "lft_session";

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using StringResponse = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<TrustedOriginPolicy> origin_policy, std::shared_ptr<TokenIssuer> token_issuer,
              std::shared_ptr<SessionStore> sessions, std::shared_ptr<TransferRecordStore> store,
              std::shared_ptr<TransferCoordinator> coordinator, std::shared_ptr<BroadcastHub> hub,
              std::shared_ptr<Observability> observability, std::shared_ptr<UploadWorkers> uploads);
  void Run();

 private:
  void DoReadHeader();
  void OnReadHeader(boost::beast::error_code ec, std::size_t bytes_transferred);
  void OnReadBody(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleIndex();
  void HandleUpload();
  // 업로드 스레드에서 실행된다. 응답은 스트림 executor로 넘겨 보낸다.
  void RunUpload(const Principal& principal, const std::string& boundary,
                 std::optional<std::uint64_t> declared_length);
  std::optional<std::size_t> ReadUploadChunk(char* out, std::size_t capacity);
  void HandleDownload(const std::string& record_id);
  void HandleWebSocket();

  std::shared_ptr<StringResponse> MakeResponse(boost::beast::http::status status);
  void SendJson(boost::beast::http::status status, const nlohmann::json& body);
  void SendError(const ServiceError& error);
  void SendError(boost::beast::http::status status, std::string_view code, std::string_view message);
  void SendResponse(std::shared_ptr<StringResponse> res);
  void LogRequest(unsigned status, const std::optional<std::string>& record_id);
  std::optional<Principal> AuthorizeOrReply(bool allow_query);
  RequestContext BuildContext(bool allow_query);
  std::optional<std::string> SessionIdFromRequest(bool allow_query);
  std::optional<nlohmann::json> ParseJsonBody();
  std::optional<std::string> HeaderValue(std::string_view name) const;
  nlohmann::json PairingPayload(const PairingToken& token) const;
  std::string RemoteIp();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  std::optional<boost::beast::http::request_parser<boost::beast::http::empty_body>> header_parser_;
  std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> body_parser_;
  std::optional<boost::beast::http::request_parser<boost::beast::http::buffer_body>> upload_parser_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::string path_;
  std::unordered_map<std::string, std::string> query_;
  AppConfig config_;
  std::shared_ptr<TrustedOriginPolicy> origin_policy_;
  std::shared_ptr<TokenIssuer> token_issuer_;
  std::shared_ptr<SessionStore> sessions_;
  std::shared_ptr<TransferRecordStore> store_;
  std::shared_ptr<TransferCoordinator> coordinator_;
  std::shared_ptr<BroadcastHub> hub_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<UploadWorkers> uploads_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<std::string> device_id_;
};

}  // namespace lanxfer
