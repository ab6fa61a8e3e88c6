#include <pyjudge/utils.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* VerdictToDesc, Verdict, ENUM_VERDICT_)
#undef X

#define X(...) X_RETURN_ARG1(Terminal, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* TerminalName, Terminal, ENUM_TERMINAL_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG3

static const char* kVerdictAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_VERDICT_
#undef X
};

const char* VerdictToAbr(Verdict verdict) {
  return kVerdictAbrTable[(int)verdict];
}

Verdict AbrToVerdict(const std::string& str) {
  for (int i = (int)Verdict::AC; i <= (int)Verdict::RF; i++) {
    if (str == kVerdictAbrTable[i]) return (Verdict)i;
  }
  return Verdict::NUL;
}
