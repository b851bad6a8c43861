/*
 * 설명: 토큰/세션/디바이스/라이브 레코드/연결 레지스트리가 공유하는 단일 락 도메인.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace lanxfer {

using Clock = std::function<std::chrono::system_clock::time_point()>;

inline Clock SystemClock() {
  return [] { return std::chrono::system_clock::now(); };
}

// 임계구역 안에서는 I/O를 수행하지 않는다.
struct SharedState {
  std::mutex mutex;
};

inline std::shared_ptr<SharedState> MakeSharedState() { return std::make_shared<SharedState>(); }

}  // namespace lanxfer
