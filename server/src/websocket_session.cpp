/*
 * 설명: WebSocket 메시지를 읽어 ping에 응답하고, 허브가 전달한 레코드 이벤트를 순서대로 보낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/transfer_flow_test.cpp
 */
#include "lanxfer/websocket_session.hpp"

#include <chrono>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

#include "lanxfer/transfer_record.hpp"

namespace lanxfer {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   const ClientConnection& connection, std::shared_ptr<BroadcastHub> hub,
                                   std::size_t max_queue_messages, std::size_t max_queue_bytes)
    : ws_(std::move(ws)), connection_(connection), hub_(std::move(hub)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() {
  if (connection_id_ != 0) {
    hub_->Unregister(connection_id_);
  }
}

void WebSocketSession::Run() {
  connection_id_ = hub_->NextConnectionId();
  if (!hub_->Register(connection_id_, connection_, shared_from_this())) {
    closing_ = true;
    auto self = shared_from_this();
    ws_.async_close(boost::beast::websocket::close_code::internal_error, [self](boost::beast::error_code) {});
    return;
  }
  DoRead();
}

bool WebSocketSession::Deliver(const std::string& event, const nlohmann::json& payload) {
  if (closing_) {
    return false;
  }
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, event, payload]() { self->SendEvent(event, payload); });
  return true;
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    MarkClosed();
    return;
  }
  if (closing_) {
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  if (data == "ping") {
    SendEvent("pong", {{"ts", ToIsoString(std::chrono::system_clock::now())}});
    return DoRead();
  }
  try {
    auto message = nlohmann::json::parse(data);
    auto type_it = message.find("t");
    auto event_it = message.find("event");
    if (type_it == message.end() || !type_it->is_string() || *type_it != "event" || event_it == message.end() ||
        !event_it->is_string()) {
      SendError("bad_request", "잘못된 메시지 형식");
    } else if (*event_it == "ping") {
      SendEvent("pong", {{"ts", ToIsoString(std::chrono::system_clock::now())}});
    } else {
      SendError("bad_request", "알 수 없는 이벤트");
    }
  } catch (const nlohmann::json::exception&) {
    SendError("bad_request", "JSON 파싱 오류");
  }

  DoRead();
}

void WebSocketSession::SendEvent(const std::string& event, const nlohmann::json& payload) {
  WsEnvelope env{.type = "event", .event = event, .seq = ++seq_, .payload = payload};
  EnqueueMessage(ToWsJson(env).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void WebSocketSession::SendError(std::string_view code, std::string_view message) {
  WsEnvelope env{.type = "error", .event = "", .seq = ++seq_, .payload = {{"code", code}, {"message", message}}};
  EnqueueMessage(ToWsJson(env).dump());
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    MarkClosed();
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  MarkClosed();
  // 전송 중인 메시지 버퍼는 OnWrite까지 살아 있어야 한다.
  while (send_queue_.size() > (writing_ ? 1u : 0u)) {
    queued_bytes_ -= send_queue_.back().size();
    send_queue_.pop_back();
  }
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::MarkClosed() {
  closing_ = true;
  hub_->Unregister(connection_id_);
}

}  // namespace lanxfer
