/*
 * 설명: 업로드 전용 스레드 풀 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/upload_workers_test.cpp
 */
#include "lanxfer/upload_workers.hpp"

#include <algorithm>
#include <utility>

#include <boost/asio/post.hpp>

namespace lanxfer {

UploadWorkers::UploadWorkers(std::size_t threads) : pool_(std::max<std::size_t>(1, threads)) {}

UploadWorkers::~UploadWorkers() { Stop(); }

void UploadWorkers::Post(std::function<void()> job) {
  if (stopping_) {
    return;
  }
  boost::asio::post(pool_, std::move(job));
}

void UploadWorkers::Stop() {
  if (stopping_.exchange(true)) {
    return;
  }
  pool_.stop();
  pool_.join();
}

}  // namespace lanxfer
