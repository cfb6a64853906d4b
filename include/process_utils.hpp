#ifndef PROCESS_UTILS_HPP
#define PROCESS_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace procutil {

/**
 * @brief Captured result of an external command.
 */
struct CommandResult {
    bool launched = false;  ///< Process was started
    bool timed_out = false; ///< Process was killed after the timeout expired
    int exit_code = -1;     ///< Exit status, or -1 when killed or never started
    std::string out;        ///< Captured standard output
    std::string err;        ///< Captured standard error
    std::string error;      ///< Launch failure description

    /** @return `true` when the command ran to completion with exit status 0. */
    bool ok() const { return launched && !timed_out && exit_code == 0; }

    /** @return Standard output followed by standard error. */
    std::string combined() const;
};

/// Variables added to (or overriding) the inherited environment of a child.
using Environment = std::map<std::string, std::string>;

/**
 * @brief Run an external program and wait for it, bounded by a timeout.
 *
 * The program is looked up on `PATH`. Standard input is connected to
 * `/dev/null`; standard output and error are captured. The child runs in its
 * own process group so that the whole group is killed when @p timeout
 * expires. A zero @p timeout waits indefinitely.
 *
 * The parent environment is never modified; @p env is merged into a copy
 * handed to the child.
 *
 * @param args    Program name followed by its arguments.
 * @param cwd     Working directory for the child; empty keeps the current one.
 * @param timeout Maximum run time.
 * @param env     Environment overlay.
 * @return Result describing how the process ended. Never throws for process
 *         failures; `launched` is `false` when the process could not start.
 */
CommandResult run_command(const std::vector<std::string>& args, const std::filesystem::path& cwd,
                          std::chrono::seconds timeout, const Environment& env = {});

} // namespace procutil

#endif // PROCESS_UTILS_HPP
