#include "llm/ProcUtil.hpp"

#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace procutil {

std::string run_capture_stdout(const std::string& cmdline) {
    const std::string merged = "( " + cmdline + " ) 2>&1";

    FILE* pipe = ::popen(merged.c_str(), "r");
    if (!pipe) {
        return "";
    }

    std::string out;
    out.reserve(8192);

    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        out.append(buf, buf + n);
    }

    int status = ::pclose(pipe);
    if (status == -1) {
        return "";
    }
    return out;
}

int run_wait_exitcode(const std::string& cmdline) {
    int status = std::system(cmdline.c_str());
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace procutil
