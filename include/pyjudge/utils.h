#ifndef INCLUDE_PYJUDGE_UTILS_H_
#define INCLUDE_PYJUDGE_UTILS_H_

#include <string>

#include <pyjudge/submission.h>

const char* VerdictToDesc(Verdict);
const char* VerdictToAbr(Verdict);
Verdict AbrToVerdict(const std::string&);

#endif  // INCLUDE_PYJUDGE_UTILS_H_
