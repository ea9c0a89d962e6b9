#pragma once
#include <string>

namespace procutil {

// Runs a command line through /bin/sh and returns captured stdout+stderr
// (merged). Returns "" on failure.
std::string run_capture_stdout(const std::string& cmdline);

// Runs a command line through /bin/sh and returns its exit status, or -1
// when the shell could not be started.
int run_wait_exitcode(const std::string& cmdline);

// Single-quotes an argument for /bin/sh.
std::string shell_quote(const std::string& arg);

} // namespace procutil
