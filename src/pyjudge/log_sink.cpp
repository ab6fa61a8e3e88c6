#include <pyjudge/log_sink.h>

bool LogSink::Append(std::string entry) {
  if (Full()) return false;
  entries_.push_back(std::move(entry));
  return true;
}

std::vector<std::string> LogSink::Take() {
  std::vector<std::string> ret;
  ret.swap(entries_);
  return ret;
}
