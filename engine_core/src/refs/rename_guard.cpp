/**
 * @file rename_guard.cpp
 * @brief RenameGuard implementation
 */

#include "LinkKeeper/refs/rename_guard.hpp"

#include <chrono>

namespace LinkKeeper::refs {

RenameGuard::RenameGuard() : RenameGuard(&RenameGuard::steadyNowMs) {}

RenameGuard::RenameGuard(Clock clock, u64 suppressWindowMs, u64 retentionMs)
    : m_clock(std::move(clock)), m_suppressWindowMs(suppressWindowMs),
      m_retentionMs(retentionMs) {
  if (!m_clock) {
    m_clock = &RenameGuard::steadyNowMs;
  }
}

bool RenameGuard::admit(const AssetIdentity& oldIdentity, const AssetIdentity& newIdentity) {
  std::lock_guard<std::mutex> lock(m_mutex);

  const u64 now = m_clock();
  const TransitionKey key{oldIdentity.path(), newIdentity.path()};

  // Clean up entries outside the retention window
  auto it = m_admitted.begin();
  while (it != m_admitted.end()) {
    const u64 age = now >= it->second ? now - it->second : 0;
    if (age > m_retentionMs) {
      it = m_admitted.erase(it);
    } else {
      ++it;
    }
  }

  auto found = m_admitted.find(key);
  if (found != m_admitted.end()) {
    const u64 sinceAdmitted = now >= found->second ? now - found->second : 0;
    if (sinceAdmitted < m_suppressWindowMs) {
      return false;
    }
  }

  m_admitted[key] = now;
  return true;
}

void RenameGuard::setSuppressWindow(u64 windowMs) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_suppressWindowMs = windowMs;
}

void RenameGuard::setRetention(u64 retentionMs) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_retentionMs = retentionMs;
}

u64 RenameGuard::suppressWindow() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_suppressWindowMs;
}

u64 RenameGuard::retention() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_retentionMs;
}

usize RenameGuard::trackedCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_admitted.size();
}

void RenameGuard::clear() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_admitted.clear();
}

u64 RenameGuard::steadyNowMs() {
  return static_cast<u64>(std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now().time_since_epoch())
                              .count());
}

} // namespace LinkKeeper::refs
