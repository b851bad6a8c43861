/*
 * 설명: 업로드 본문 스트리밍을 io 스레드와 분리된 전용 스레드 풀에서 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/upload_workers_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <functional>

#include <boost/asio/thread_pool.hpp>

namespace lanxfer {

class UploadWorkers {
 public:
  explicit UploadWorkers(std::size_t threads);
  ~UploadWorkers();

  UploadWorkers(const UploadWorkers&) = delete;
  UploadWorkers& operator=(const UploadWorkers&) = delete;

  void Post(std::function<void()> job);
  // 대기 중인 작업은 버리고 실행 중인 작업이 끝나기를 기다린다.
  // 실행 중인 작업은 Stopping()을 보고 스스로 빠져나와야 한다.
  void Stop();
  bool Stopping() const { return stopping_.load(); }

 private:
  boost::asio::thread_pool pool_;
  std::atomic<bool> stopping_{false};
};

}  // namespace lanxfer
