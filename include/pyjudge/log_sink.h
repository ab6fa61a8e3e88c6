#ifndef INCLUDE_PYJUDGE_LOG_SINK_H_
#define INCLUDE_PYJUDGE_LOG_SINK_H_

#include <string>
#include <vector>

// Fixed-capacity buffer of diagnostic lines produced during one execution.
// Lines beyond the capacity are dropped whole.
class LogSink {
  size_t capacity_;
  std::vector<std::string> entries_;
 public:
  explicit LogSink(size_t capacity) : capacity_(capacity) {}

  // return false if the entry was dropped
  bool Append(std::string entry);
  void Clear() { entries_.clear(); }

  bool Full() const { return entries_.size() >= capacity_; }
  size_t Size() const { return entries_.size(); }
  size_t Capacity() const { return capacity_; }
  const std::vector<std::string>& Entries() const { return entries_; }
  std::vector<std::string> Take();
};

#endif  // INCLUDE_PYJUDGE_LOG_SINK_H_
