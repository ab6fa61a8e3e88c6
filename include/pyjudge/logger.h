#ifndef INCLUDE_PYJUDGE_LOGGER_H_
#define INCLUDE_PYJUDGE_LOGGER_H_

// Set the log pattern and keep console sinks usable across fork()
void InitLogger();

#endif  // INCLUDE_PYJUDGE_LOGGER_H_
