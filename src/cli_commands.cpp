#include <atomic>
#include <csignal>
#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "report.hpp"
#include "report_export.hpp"
#include "run_coordinator.hpp"
#include "webhook_notifier.hpp"

namespace cli {

namespace {
std::atomic<bool>* g_running_ptr = nullptr;

void handle_signal(int) {
    if (g_running_ptr)
        g_running_ptr->store(false);
}

// Restores the default handlers when the run ends.
struct SignalScope {
    explicit SignalScope(std::atomic<bool>& running) {
        g_running_ptr = &running;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
    }
    ~SignalScope() {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        g_running_ptr = nullptr;
    }
    SignalScope(const SignalScope&) = delete;
    SignalScope& operator=(const SignalScope&) = delete;
};

void publish_results(const Options& opts, const RunResult& result) {
    if (!opts.json_report.empty()) {
        std::string err;
        if (write_json_report(result, opts.json_report, err))
            log_info("JSON report written to " + opts.json_report.string());
        else
            log_warning("Failed to write JSON report: " + err);
    }
    if (!opts.webhook_url.empty()) {
        std::optional<std::string> secret;
        if (!opts.webhook_secret.empty())
            secret = opts.webhook_secret;
        WebhookNotifier notifier(opts.webhook_url, secret);
        notifier.notify(result);
    }
}
} // namespace

void setup_logging(const Options& opts) {
    const LoggingOptions& log = opts.logging;
    set_log_level(log.log_level);
    set_json_logging(log.json_log);
    set_log_compression(log.compress_logs);
    if (!log.log_file.empty()) {
        init_logger(log.log_file, log.log_level, log.max_log_size, log.max_log_files);
        set_log_rotation(log.max_log_files);
        if (logger_initialized())
            log_info("Program started");
    }
    if (log.use_syslog)
        init_syslog(log.syslog_facility);
    set_console_logging(!opts.silent, LogLevel::WARNING);
}

int exit_code_for(const RunResult& result) {
    if (result.cancelled())
        return EXIT_CANCELLED;
    if (result.failures() > 0)
        return EXIT_REPO_FAILURE;
    return EXIT_OK;
}

int handle_sync_run(const Options& opts) {
    LoggerGuard logger_guard;
    setup_logging(opts);
    ReportColors colors = make_report_colors(colors_enabled(opts.no_colors));

    git::GatewayConfig gw_cfg;
    gw_cfg.timeout = opts.run.command_timeout;
    git::GitGateway gateway(gw_cfg);

    std::atomic<bool> running(true);
    SignalScope signals(running);

    ProgressCallback progress = [&](size_t index, size_t total, const SyncOutcome& outcome) {
        if (!opts.silent)
            std::cout << render_progress_line(index, total, outcome, colors) << std::endl;
    };

    RunResult result;
    try {
        result = run_sync(opts.run, gateway, progress, running);
    } catch (const RootPathError& e) {
        log_error(e.what());
        std::cerr << e.what() << std::endl;
        return EXIT_ROOT_ERROR;
    }

    if (!opts.silent) {
        if (opts.run.verbose)
            std::cout << render_summary_table(result.outcomes, colors, true);
        std::cout << render_footer(result, colors) << std::endl;
    }
    publish_results(opts, result);

    int code = exit_code_for(result);
    log_event(code == EXIT_OK ? LogLevel::INFO : LogLevel::WARNING, "Run finished",
              {{"repositories", std::to_string(result.outcomes.size())},
               {"failures", std::to_string(result.failures())},
               {"exit_code", std::to_string(code)}});
    return code;
}

} // namespace cli
