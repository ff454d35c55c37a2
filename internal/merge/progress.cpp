#include "internal/merge/progress.hpp"

#include <algorithm>
#include <iterator>

namespace jwlmerge::merge {

void BufferedProgressSink::OnProgress(int progress, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.push_back({progress, message});
  latest_ = pending_.back();
}

std::vector<ProgressUpdate> BufferedProgressSink::Drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ProgressUpdate> out(std::make_move_iterator(pending_.begin()), std::make_move_iterator(pending_.end()));
  pending_.clear();
  return out;
}

ProgressUpdate BufferedProgressSink::Latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

void ProgressReporter::Report(int progress, const std::string& message) {
  current_ = std::max(current_, std::clamp(progress, 0, 100));
  if (!message.empty()) message_ = message;
  if (sink_) sink_->OnProgress(current_, message_);
}

} // namespace jwlmerge::merge
