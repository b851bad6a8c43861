/*
 * 설명: HTTP 요청을 처리하고 페어링/기록/업로드/다운로드/저장/설정/WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/transfer_flow_test.cpp
 */
#include "lanxfer/http_session.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <limits>
#include <optional>

#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "lanxfer/api_response.hpp"
#include "lanxfer/http_util.hpp"
#include "lanxfer/multipart.hpp"
#include "lanxfer/observability.hpp"

namespace lanxfer {

namespace http = boost::beast::http;

namespace {
constexpr std::uint64_t kJsonBodyLimit = 1024 * 1024;
constexpr std::size_t kMaxHistoryPageSize = 500;
constexpr const char* kServerName = "lanxfer";
// 업로드 중 한 번의 읽기가 이 시간 동안 진척이 없으면 전송을 끊는다.
constexpr std::chrono::seconds kUploadIdleTimeout{60};
constexpr std::chrono::milliseconds kUploadPollInterval{200};

class MultipartPartSource : public ByteSource {
 public:
  explicit MultipartPartSource(MultipartReader& reader) : reader_(reader) {}

  std::optional<std::size_t> Read(char* buffer, std::size_t capacity, ServiceError& error) override {
    return reader_.ReadPartData(buffer, capacity, error);
  }

 private:
  MultipartReader& reader_;
};

std::string HostForUrl(const std::string& ip) {
  if (ip.find(':') != std::string::npos) {
    return "[" + ip + "]";
  }
  return ip;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<TrustedOriginPolicy> origin_policy,
                         std::shared_ptr<TokenIssuer> token_issuer, std::shared_ptr<SessionStore> sessions,
                         std::shared_ptr<TransferRecordStore> store,
                         std::shared_ptr<TransferCoordinator> coordinator, std::shared_ptr<BroadcastHub> hub,
                         std::shared_ptr<Observability> observability, std::shared_ptr<UploadWorkers> uploads)
    : stream_(std::move(socket)), config_(config), origin_policy_(std::move(origin_policy)),
      token_issuer_(std::move(token_issuer)), sessions_(std::move(sessions)), store_(std::move(store)),
      coordinator_(std::move(coordinator)), hub_(std::move(hub)), observability_(std::move(observability)),
      uploads_(std::move(uploads)) {}

void HttpSession::Run() { DoReadHeader(); }

void HttpSession::DoReadHeader() {
  auto self = shared_from_this();
  header_parser_.emplace();
  body_parser_.reset();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read_header(stream_, buffer_, *header_parser_,
                          [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                            self->OnReadHeader(ec, bytes_transferred);
                          });
}

void HttpSession::OnReadHeader(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  device_id_.reset();
  if (observability_) {
    observability_->IncrementRequest();
  }

  const auto& header = header_parser_->get();
  req_.base() = header.base();
  auto target = SplitTarget(std::string(header.target()));
  path_ = target.path;
  query_ = ParseQueryParams(target.query);

  if (boost::beast::websocket::is_upgrade(header)) {
    return HandleWebSocket();
  }
  if (header.method() == http::verb::post && path_ == "/upload") {
    return HandleUpload();
  }

  body_parser_.emplace(std::move(*header_parser_));
  body_parser_->body_limit(kJsonBodyLimit);
  auto self = shared_from_this();
  http::async_read(stream_, buffer_, *body_parser_,
                   [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                     self->OnReadBody(ec, bytes_transferred);
                   });
}

void HttpSession::OnReadBody(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::body_limit) {
    return SendError(http::status::payload_too_large, error_code::kLimitExceeded, "요청 본문이 너무 큽니다");
  }
  if (ec) {
    return;
  }
  req_ = body_parser_->release();
  HandleRequest();
}

void HttpSession::HandleRequest() {
  const auto method = req_.method();

  if (method == http::verb::get && path_ == "/") {
    return HandleIndex();
  }

  if (method == http::verb::get && path_ == "/health") {
    return SendJson(http::status::ok, {{"status", "ok"}, {"version", "v1.0.0"}});
  }

  if (method == http::verb::get && path_ == "/metrics") {
    if (!origin_policy_->IsTrusted(RemoteIp())) {
      return SendError(http::status::forbidden, error_code::kForbidden, "데스크톱에서만 조회할 수 있습니다");
    }
    auto snapshot = observability_->Snapshot(sessions_->ActiveCount(), store_->LiveCount());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"sessions", {{"active", snapshot.active_sessions}}},
                        {"records", {{"live", snapshot.live_records}}}};
    return SendJson(http::status::ok, data);
  }

  if (method == http::verb::get && path_ == "/auth/mobile-token") {
    if (!origin_policy_->IsTrusted(RemoteIp())) {
      return SendError(http::status::forbidden, error_code::kForbidden, "데스크톱에서만 QR 코드를 갱신할 수 있습니다");
    }
    return SendJson(http::status::ok, PairingPayload(token_issuer_->Issue(true)));
  }

  if (method == http::verb::get && path_ == "/records") {
    auto principal = AuthorizeOrReply(false);
    if (!principal) {
      return;
    }
    std::size_t offset = 0;
    std::optional<std::size_t> limit;
    if (auto it = query_.find("offset"); it != query_.end()) {
      auto parsed = ParsePositiveInt(it->second);
      if (!parsed) {
        return SendError(http::status::bad_request, error_code::kBadRequest, "offset 값이 올바르지 않습니다");
      }
      offset = *parsed;
    }
    if (auto it = query_.find("limit"); it != query_.end()) {
      auto parsed = ParsePositiveInt(it->second);
      if (!parsed || *parsed < 1 || *parsed > kMaxHistoryPageSize) {
        return SendError(http::status::bad_request, error_code::kBadRequest, "limit 값은 1 이상 500 이하여야 합니다");
      }
      limit = *parsed;
    }
    ServiceError error;
    auto records = coordinator_->History(*principal, offset, limit, error);
    if (!records) {
      return SendError(error);
    }
    return SendJson(http::status::ok, {{"records", *records}});
  }

  if (method == http::verb::get && path_ == "/settings") {
    auto principal = AuthorizeOrReply(false);
    if (!principal) {
      return;
    }
    auto settings = coordinator_->Settings();
    return SendJson(http::status::ok, {{"maxUploadBytes", settings.max_upload_bytes},
                                       {"sessionTtlSeconds", sessions_->SessionTtl().count()},
                                       {"downloadDir", settings.download_dir.string()}});
  }

  if (method == http::verb::post && (path_ == "/settings/upload-limit" || path_ == "/settings/download-dir")) {
    if (!origin_policy_->IsTrusted(RemoteIp())) {
      return SendError(http::status::forbidden, error_code::kForbidden, "데스크톱에서만 설정을 바꿀 수 있습니다");
    }
    auto body = ParseJsonBody();
    ServiceError error;
    if (path_ == "/settings/upload-limit") {
      if (!body || !body->contains("maxUploadBytes") || !body->at("maxUploadBytes").is_number_unsigned()) {
        return SendError(http::status::bad_request, error_code::kBadRequest, "maxUploadBytes는 양의 정수여야 합니다");
      }
      if (!coordinator_->SetMaxUploadBytes(body->at("maxUploadBytes").get<std::uint64_t>(), error)) {
        return SendError(error);
      }
    } else {
      if (!body || !body->contains("downloadDir") || !body->at("downloadDir").is_string()) {
        return SendError(http::status::bad_request, error_code::kBadRequest, "downloadDir가 필요합니다");
      }
      if (!coordinator_->SetDownloadDir(body->at("downloadDir").get<std::string>(), error)) {
        return SendError(error);
      }
    }
    auto settings = coordinator_->Settings();
    return SendJson(http::status::ok, {{"maxUploadBytes", settings.max_upload_bytes},
                                       {"downloadDir", settings.download_dir.string()}});
  }

  if (method == http::verb::post && path_ == "/upload-desktop-path") {
    auto principal = AuthorizeOrReply(false);
    if (!principal) {
      return;
    }
    auto body = ParseJsonBody();
    if (!body || !body->contains("filePath") || !body->at("filePath").is_string()) {
      return SendError(http::status::bad_request, error_code::kBadRequest, "filePath가 필요합니다");
    }
    ServiceError error;
    auto entry = coordinator_->UploadLocalPath(*principal, body->at("filePath").get<std::string>(), error);
    if (!entry) {
      return SendError(error);
    }
    return SendJson(http::status::ok, {{"record", store_->PublicView(*entry, true)}});
  }

  const std::string files_prefix = "/files/";
  if (path_.rfind(files_prefix, 0) == 0) {
    auto rest = path_.substr(files_prefix.size());
    const std::string save_suffix = "/save";
    if (method == http::verb::get && !rest.empty() && rest.find('/') == std::string::npos) {
      return HandleDownload(rest);
    }
    if (method == http::verb::post && rest.size() > save_suffix.size() &&
        rest.compare(rest.size() - save_suffix.size(), save_suffix.size(), save_suffix) == 0) {
      auto record_id = rest.substr(0, rest.size() - save_suffix.size());
      if (record_id.find('/') == std::string::npos) {
        auto principal = AuthorizeOrReply(false);
        if (!principal) {
          return;
        }
        ServiceError error;
        auto saved = coordinator_->Save(*principal, record_id, error);
        if (!saved) {
          return SendError(error);
        }
        return SendJson(http::status::ok, {{"savedPath", saved->saved_path.string()},
                                           {"fileName", saved->file_name},
                                           {"downloadDir", saved->download_dir.string()}});
      }
    }
  }

  SendError(http::status::not_found, error_code::kNotFound, "지원되지 않는 경로입니다");
}

void HttpSession::HandleIndex() {
  auto ip = RemoteIp();
  bool trusted = origin_policy_->IsTrusted(ip);
  auto presented = SessionIdFromRequest(false);

  auto token_it = query_.find("token");
  if (token_it != query_.end() && !token_it->second.empty()) {
    ServiceError error;
    auto session_id = sessions_->Exchange(token_it->second, ip, presented, error);
    if (!session_id) {
      return SendError(http::status::forbidden, error.code, error.message);
    }
    auto ttl = sessions_->SessionTtl().count();
    auto res = MakeResponse(http::status::ok);
    res->set(http::field::set_cookie, std::string(kSessionCookieName) + "=" + *session_id +
                                          "; Max-Age=" + std::to_string(ttl) + "; Path=/; HttpOnly; SameSite=Lax");
    res->body() = MakeSuccessEnvelope({{"role", "mobile"}, {"sessionId", *session_id}, {"sessionTtlSeconds", ttl}})
                      .dump();
    res->content_length(res->body().size());
    return SendResponse(res);
  }

  auto role_it = query_.find("role");
  bool mobile_role = role_it != query_.end() && role_it->second == "mobile";
  if (mobile_role || !trusted) {
    if (presented && sessions_->Validate(*presented, ip)) {
      return SendJson(http::status::ok, {{"role", "mobile"}, {"sessionId", *presented}});
    }
    if (mobile_role) {
      return SendError(http::status::forbidden, "reauth_required", "QR 코드를 다시 스캔해 주세요");
    }
    return SendError(http::status::forbidden, error_code::kUnauthorized, "인증되지 않은 접근입니다");
  }

  auto payload = PairingPayload(token_issuer_->Issue(false));
  payload["role"] = "desktop";
  SendJson(http::status::ok, payload);
}

void HttpSession::HandleUpload() {
  auto principal = AuthorizeOrReply(false);
  if (!principal) {
    return;
  }
  auto content_type = HeaderValue("Content-Type");
  auto boundary = content_type ? ParseMultipartBoundary(*content_type) : std::nullopt;
  if (!boundary) {
    return SendError(http::status::bad_request, error_code::kBadRequest, "multipart/form-data 요청이 필요합니다");
  }
  std::optional<std::uint64_t> declared_length;
  if (auto length = header_parser_->content_length()) {
    declared_length = *length;
  }

  upload_parser_.emplace(std::move(*header_parser_));
  upload_parser_->body_limit((std::numeric_limits<std::uint64_t>::max)());
  stream_.expires_never();
  auto self = shared_from_this();
  uploads_->Post([self, principal = *principal, boundary = *boundary, declared_length] {
    self->RunUpload(principal, boundary, declared_length);
  });
}

void HttpSession::RunUpload(const Principal& principal, const std::string& boundary,
                            std::optional<std::uint64_t> declared_length) {
  MultipartReader reader(boundary, [this](char* out, std::size_t capacity) { return ReadUploadChunk(out, capacity); });
  auto self = shared_from_this();
  auto reply_error = [self](ServiceError error) {
    boost::asio::post(self->stream_.get_executor(), [self, error] { self->SendError(error); });
  };

  ServiceError error;
  auto part = reader.NextFilePart("file", error);
  if (!part) {
    if (error.code.empty()) {
      error.Set(ErrorKind::kBadRequest, error_code::kBadRequest, "업로드할 파일이 없습니다");
    }
    return reply_error(error);
  }
  MultipartPartSource source(reader);
  auto entry = coordinator_->Upload(principal, part->filename.value_or(""), declared_length, source, error);
  if (!entry) {
    return reply_error(error);
  }
  auto body = nlohmann::json{{"record", store_->PublicView(*entry, principal.trusted)}};
  boost::asio::post(stream_.get_executor(), [self, body] { self->SendJson(http::status::ok, body); });
}

std::optional<std::size_t> HttpSession::ReadUploadChunk(char* out, std::size_t capacity) {
  // 소켓 읽기는 스트림 executor에서 비동기로 수행하고 업로드 스레드는 완료만 기다린다.
  while (!upload_parser_->is_done()) {
    auto done = std::make_shared<std::promise<boost::beast::error_code>>();
    auto completed = done->get_future();
    auto self = shared_from_this();
    boost::asio::post(stream_.get_executor(), [self, out, capacity, done] {
      self->upload_parser_->get().body().data = out;
      self->upload_parser_->get().body().size = capacity;
      self->stream_.expires_after(kUploadIdleTimeout);
      http::async_read_some(self->stream_, self->buffer_, *self->upload_parser_,
                            [done](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                              done->set_value(ec);
                            });
    });
    while (completed.wait_for(kUploadPollInterval) != std::future_status::ready) {
      if (uploads_->Stopping()) {
        return std::nullopt;
      }
    }
    boost::beast::error_code ec;
    try {
      ec = completed.get();
    } catch (const std::future_error&) {
      // 완료 핸들러가 실행되지 않고 파괴되었다(io_context 종료).
      return std::nullopt;
    }
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      return std::nullopt;
    }
    auto produced = capacity - upload_parser_->get().body().size;
    if (produced > 0) {
      return produced;
    }
  }
  return std::size_t{0};
}

void HttpSession::HandleDownload(const std::string& record_id) {
  auto principal = AuthorizeOrReply(false);
  if (!principal) {
    return;
  }
  ServiceError error;
  auto ticket = coordinator_->BeginDownload(*principal, record_id, error);
  if (!ticket) {
    return SendError(error);
  }

  auto res = std::make_shared<http::response<http::file_body>>();
  res->version(req_.version());
  res->result(http::status::ok);
  boost::beast::error_code ec;
  res->body().open(ticket->record.file_path.c_str(), boost::beast::file_mode::scan, ec);
  if (ec) {
    coordinator_->FinishDownload(*ticket, false);
    error.Set(ErrorKind::kIo, error_code::kIoFailure, "파일을 열 수 없습니다: " + ec.message());
    return SendError(error);
  }
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/octet-stream");
  res->set(http::field::content_disposition, ContentDispositionAttachment(ticket->record.file_name));
  res->prepare_payload();
  LogRequest(200, record_id);

  auto shared_ticket = std::make_shared<DownloadTicket>(std::move(*ticket));
  auto self = shared_from_this();
  stream_.expires_never();
  http::async_write(stream_, *res,
                    [self, res, shared_ticket](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                      self->coordinator_->FinishDownload(*shared_ticket, !ec);
                      if (ec) {
                        return;
                      }
                      self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
                    });
}

void HttpSession::HandleWebSocket() {
  auto principal = AuthorizeOrReply(true);
  if (!principal) {
    return;
  }
  ClientConnection connection{principal->trusted, principal->device.id};
  stream_.expires_never();
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(http::field::server, kServerName);
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    if (observability_) {
      observability_->Log(LogContext{trace_id_, device_id_, std::nullopt, "ws.accept_failed", 0, std::nullopt,
                                     ec.message()});
    }
    return;
  }
  LogRequest(101, std::nullopt);
  std::make_shared<WebSocketSession>(std::move(ws), connection, hub_, config_.ws_queue_limit_messages,
                                     config_.ws_queue_limit_bytes)
      ->Run();
}

std::shared_ptr<HttpSession::StringResponse> HttpSession::MakeResponse(http::status status) {
  auto res = std::make_shared<StringResponse>();
  res->version(req_.version());
  res->result(status);
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");
  return res;
}

void HttpSession::SendJson(http::status status, const nlohmann::json& body) {
  auto res = MakeResponse(status);
  res->body() = MakeSuccessEnvelope(body).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendError(const ServiceError& error) {
  auto res = MakeResponse(http::int_to_status(HttpStatusCode(error.kind)));
  res->body() = MakeErrorEnvelope(error).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendError(http::status status, std::string_view code, std::string_view message) {
  auto res = MakeResponse(status);
  res->body() = MakeErrorEnvelope(code, message).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<StringResponse> res) {
  auto self = shared_from_this();
  LogRequest(res->result_int(), std::nullopt);
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void HttpSession::LogRequest(unsigned status, const std::optional<std::string>& record_id) {
  if (!observability_) {
    return;
  }
  if (status >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability_->Log(LogContext{trace_id_, device_id_, record_id,
                                 std::string(req_.method_string()) + " " + path_, static_cast<long>(latency),
                                 static_cast<int>(status), std::nullopt});
}

std::optional<Principal> HttpSession::AuthorizeOrReply(bool allow_query) {
  ServiceError error;
  auto principal = coordinator_->Authorize(BuildContext(allow_query), error);
  if (!principal) {
    SendError(error);
    return std::nullopt;
  }
  device_id_ = principal->device.id;
  return principal;
}

RequestContext HttpSession::BuildContext(bool allow_query) {
  RequestContext ctx;
  ctx.ip = RemoteIp();
  ctx.session_id = SessionIdFromRequest(allow_query);
  ctx.device_id = HeaderValue("X-Device-Id");
  ctx.device_name = HeaderValue("X-Device-Name");
  if (allow_query) {
    if (auto it = query_.find("device_id"); !ctx.device_id && it != query_.end()) {
      ctx.device_id = it->second;
    }
    if (auto it = query_.find("device_name"); !ctx.device_name && it != query_.end()) {
      ctx.device_name = it->second;
    }
  }
  return ctx;
}

std::optional<std::string> HttpSession::SessionIdFromRequest(bool allow_query) {
  if (auto header = HeaderValue("X-Session-Id")) {
    return header;
  }
  if (auto cookie_header = HeaderValue("Cookie")) {
    auto cookie = FindCookie(*cookie_header, kSessionCookieName);
    if (cookie && !cookie->empty()) {
      return cookie;
    }
  }
  if (allow_query) {
    for (const char* key : {"session_id", "token"}) {
      auto it = query_.find(key);
      if (it != query_.end() && !it->second.empty()) {
        return it->second;
      }
    }
  }
  return std::nullopt;
}

std::optional<nlohmann::json> HttpSession::ParseJsonBody() {
  try {
    auto body = nlohmann::json::parse(req_.body());
    if (!body.is_object()) {
      return std::nullopt;
    }
    return body;
  } catch (const nlohmann::json::parse_error&) {
    return std::nullopt;
  }
}

std::optional<std::string> HttpSession::HeaderValue(std::string_view name) const {
  auto it = req_.find(std::string(name));
  if (it == req_.end() || it->value().empty()) {
    return std::nullopt;
  }
  return std::string(it->value());
}

nlohmann::json HttpSession::PairingPayload(const PairingToken& token) const {
  auto url = "http://" + HostForUrl(origin_policy_->LanIp()) + ":" + std::to_string(config_.port) +
             "/?token=" + token.value;
  return {{"mobileUrl", url}, {"token", token.value}, {"expiresAt", ToIsoString(token.expires_at)}};
}

std::string HttpSession::RemoteIp() {
  boost::beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (ec) {
    return "";
  }
  return TrustedOriginPolicy::Normalize(endpoint.address().to_string());
}

}  // namespace lanxfer
