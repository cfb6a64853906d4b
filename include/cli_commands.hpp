#pragma once

#include "options.hpp"

struct RunResult;

namespace cli {

/** Exit codes returned by the program. */
enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_ROOT_ERROR = 1,
    EXIT_OPTIONS_ERROR = 2,
    EXIT_REPO_FAILURE = 3,
    EXIT_CANCELLED = 130
};

/**
 * @brief Configure the logging sinks named in @p opts.
 *
 * Warnings always reach standard error unless `--silent` is set; the file
 * and syslog sinks are only opened when requested.
 */
void setup_logging(const Options& opts);

/**
 * @brief Execute one synchronization run.
 *
 * Sets up logging, installs SIGINT/SIGTERM handlers, synchronizes every
 * repository under the root and prints progress and the final summary.
 * The JSON report and webhook are produced after the summary.
 *
 * @return `EXIT_OK`, `EXIT_REPO_FAILURE` when any repository failed,
 *         `EXIT_CANCELLED` after an interrupt or `EXIT_ROOT_ERROR` for an
 *         invalid root.
 */
int handle_sync_run(const Options& opts);

/**
 * @brief Map a finished run to the process exit code.
 */
int exit_code_for(const RunResult& result);

} // namespace cli
