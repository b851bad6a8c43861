/*
 * 설명: 실시간 연결 하나의 수신 루프와 제한된 송신 큐를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/transfer_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "lanxfer/api_response.hpp"
#include "lanxfer/realtime.hpp"

namespace lanxfer {

class WebSocketSession : public ClientChannel, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, const ClientConnection& connection,
                   std::shared_ptr<BroadcastHub> hub, std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  // 임의의 스레드에서 호출된다. 실제 전송은 연결의 strand에서 수행한다.
  bool Deliver(const std::string& event, const nlohmann::json& payload) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void SendEvent(const std::string& event, const nlohmann::json& payload);
  void SendError(std::string_view code, std::string_view message);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void MarkClosed();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  ClientConnection connection_;
  std::shared_ptr<BroadcastHub> hub_;
  std::uint64_t connection_id_{0};
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  std::uint64_t seq_{0};
  bool writing_{false};
  std::atomic<bool> closing_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace lanxfer
