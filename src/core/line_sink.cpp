#include "core/line_sink.hpp"

namespace pingwatch::core {

void StreamLineSink::WriteLine(std::string_view line) {
  std::lock_guard<std::mutex> lock(mutex_);
  (*out_) << line << '\n';
  out_->flush();
}

void MemoryLineSink::WriteLine(std::string_view line) {
  std::lock_guard<std::mutex> lock(mutex_);
  lines_.emplace_back(line);
}

std::vector<std::string> MemoryLineSink::Lines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lines_;
}

} // namespace pingwatch::core
