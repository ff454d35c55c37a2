#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace jwlmerge::merge {

/*
  Caller-owned receiver of (progress 0-100, message) updates.

  Called on the merging thread. Implementations must return quickly;
  anything slow belongs behind a buffer (see BufferedProgressSink).
*/
class ProgressSink {
 public:
  virtual ~ProgressSink() = default;

  virtual void OnProgress(int progress, const std::string& message) = 0;
};

struct ProgressUpdate {
  int         progress = 0;
  std::string message;
};

class CallbackProgressSink final : public ProgressSink {
 public:
  using Callback = std::function<void(int, const std::string&)>;

  explicit CallbackProgressSink(Callback callback) : callback_(std::move(callback)) {
  }

  void OnProgress(int progress, const std::string& message) override {
    if (callback_) callback_(progress, message);
  }

 private:
  Callback callback_;
};

// Thread-safe queue; a poller on another thread drains it.
class BufferedProgressSink final : public ProgressSink {
 public:
  void OnProgress(int progress, const std::string& message) override;

  std::vector<ProgressUpdate> Drain();

  // Last update seen, or {0, ""} before the first one.
  ProgressUpdate Latest() const;

 private:
  mutable std::mutex         mutex_;
  std::deque<ProgressUpdate> pending_;
  ProgressUpdate             latest_;
};

/*
  Engine-side front of a sink.

  Clamps to [0, 100] and never lets the value go backwards, so the sink
  sees a non-decreasing sequence for the whole run. An empty message
  repeats the previous one. A null sink turns every call into a no-op.
*/
class ProgressReporter {
 public:
  explicit ProgressReporter(ProgressSink* sink) : sink_(sink) {
  }

  void Report(int progress, const std::string& message = {});

  int Current() const {
    return current_;
  }

 private:
  ProgressSink* sink_;
  int           current_ = 0;
  std::string   message_;
};

} // namespace jwlmerge::merge
