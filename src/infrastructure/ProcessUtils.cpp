#include "infrastructure/ProcessUtils.hpp"
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace lyricflow::infrastructure {

namespace {

int NormalizeStatus(int status) {
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

} // namespace

std::string ProcessUtils::ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char ch : arg) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(ch);
        }
    }
    quoted += "'";
    return quoted;
}

int ProcessUtils::ExecCmd(const std::string& cmd) {
    return NormalizeStatus(std::system(cmd.c_str()));
}

int ProcessUtils::ExecReadLines(const std::string& cmd, const std::function<void(const std::string&)>& onLine) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        return -1;
    }

    char buffer[512];
    std::string line;
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        line += buffer;
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (onLine) onLine(line);
            line.clear();
        }
    }
    if (!line.empty() && onLine) {
        onLine(line);
    }
    return NormalizeStatus(pclose(pipe));
}

} // namespace lyricflow::infrastructure
