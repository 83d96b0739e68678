#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace olr {

/// @brief Terminal status of a resolution pass.
enum class Outcome { completed, cancelled, failed };

inline auto to_string(Outcome outcome) -> std::string {
  switch (outcome) {
    case Outcome::completed:
      return "completed";
    case Outcome::cancelled:
      return "cancelled";
    case Outcome::failed:
      return "failed";
  }
  return "unknown";
}

/// @brief Receives the progress of a pass and tells it when to stop.
///
/// report() is never called concurrently, even when groups are resolved by
/// several threads. is_cancelled() may be called from any worker.
class ProgressSink {
 public:
  virtual ~ProgressSink() = default;

  /// @brief Notifies that completed features out of total have been
  /// processed.
  virtual auto report(size_t completed, size_t total) -> void = 0;

  /// @brief Checked before processing each group. Once it returns true the
  /// pass stops after the groups in progress.
  [[nodiscard]] virtual auto is_cancelled() const -> bool = 0;
};

/// @brief Progress sink forwarding notifications to a callback, with a
/// cancellation flag that can be raised from another thread (or a signal
/// handler).
class CallbackProgress : public ProgressSink {
 public:
  using Callback = std::function<void(size_t, size_t)>;

  CallbackProgress() = default;

  explicit CallbackProgress(Callback callback)
      : callback_(std::move(callback)) {}

  auto report(size_t completed, size_t total) -> void override {
    if (callback_) {
      callback_(completed, total);
    }
  }

  [[nodiscard]] auto is_cancelled() const -> bool override {
    return cancelled_.load();
  }

  /// @brief Requests the cancellation of the pass.
  auto cancel() noexcept -> void { cancelled_.store(true); }

 private:
  Callback callback_{};
  std::atomic<bool> cancelled_{false};
};

}  // namespace olr
