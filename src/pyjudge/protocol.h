#ifndef PYJUDGE_PROTOCOL_H_
#define PYJUDGE_PROTOCOL_H_

#include <cstddef>

// Judge <-> runner channel. The judge writes the job document to the runner's
// kChannelFd and shuts down its write side; the runner answers on the same
// descriptor with newline-delimited JSON frames, each carrying a "type":
//   ready                      interpreter is up; the time limit starts now
//   clear                      log sink cleared before a case
//   log {text}                 one accepted log entry
//   expected {index, value}    reference value of a case
//   result {index, received, matched}
//   done {elapsed_ms}          all requested cases evaluated
//   fault {index, message, trace, elapsed_ms}
// "done" and "fault" are terminal. elapsed_ms is measured by the runner from
// "ready"; a fault raised before "ready" reports 0.

constexpr int kChannelFd = 3;
constexpr size_t kMaxFrameBytes = 16 << 20;

// pyjudge-jail reads its options from stdin as a long size and the bytes
constexpr long kMaxJailOptionsBytes = 1 << 20;
// pyjudge-jail could not set up the jail; otherwise it exits like the runner
constexpr int kJailErrorExit = 125;

#endif  // PYJUDGE_PROTOCOL_H_
