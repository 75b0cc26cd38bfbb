#pragma once

/**
 * @file rename_guard.hpp
 * @brief Suppresses repeated rewrite passes for the same rename
 *
 * A host often reports one rename through several events (a move event
 * followed by a generic change event). The guard admits the first
 * (old, new) transition and rejects the same key again for a short window.
 * Entries are pruned lazily on every check.
 */

#include "LinkKeeper/core/types.hpp"
#include "LinkKeeper/refs/link_types.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace LinkKeeper::refs {

class RenameGuard {
public:
  /// Milliseconds on an arbitrary monotonic scale
  using Clock = std::function<u64()>;

  static constexpr u64 DEFAULT_SUPPRESS_WINDOW_MS = 2000;
  static constexpr u64 DEFAULT_RETENTION_MS = 5000;

  RenameGuard();
  explicit RenameGuard(Clock clock, u64 suppressWindowMs = DEFAULT_SUPPRESS_WINDOW_MS,
                       u64 retentionMs = DEFAULT_RETENTION_MS);

  /**
   * @brief Admit or reject a transition
   *
   * Prunes entries older than the retention window, rejects the key if it
   * was admitted less than the suppress window ago, otherwise records the
   * current time and admits.
   *
   * @return true if the caller should run the rewrite
   */
  [[nodiscard]] bool admit(const AssetIdentity& oldIdentity, const AssetIdentity& newIdentity);

  void setSuppressWindow(u64 windowMs);
  void setRetention(u64 retentionMs);
  [[nodiscard]] u64 suppressWindow() const;
  [[nodiscard]] u64 retention() const;

  [[nodiscard]] usize trackedCount() const;
  void clear();

  /// Steady-clock milliseconds
  [[nodiscard]] static u64 steadyNowMs();

private:
  using TransitionKey = std::pair<std::string, std::string>;

  Clock m_clock;
  u64 m_suppressWindowMs;
  u64 m_retentionMs;

  mutable std::mutex m_mutex;
  std::map<TransitionKey, u64> m_admitted;
};

} // namespace LinkKeeper::refs
