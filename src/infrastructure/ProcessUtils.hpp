#pragma once

#include <functional>
#include <string>

namespace lyricflow::infrastructure {

/**
 * @brief Helpers for running external command-line engines.
 */
class ProcessUtils {
public:
    /** @brief Wraps @p arg in single quotes for /bin/sh. */
    static std::string ShellQuote(const std::string& arg);

    /**
     * @brief Executes a system command.
     * @return Exit status as reported by the shell, -1 if it could not start.
     */
    static int ExecCmd(const std::string& cmd);

    /**
     * @brief Runs @p cmd and feeds each stdout line (without newline) to @p onLine.
     * @return Exit status, -1 if the pipe could not be opened.
     */
    static int ExecReadLines(const std::string& cmd, const std::function<void(const std::string&)>& onLine);
};

} // namespace lyricflow::infrastructure
