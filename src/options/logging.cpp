// options_logging.cpp
//
// Parse logging related flags/options.

#include <string>
#include <map>
#include <cctype>
#include <climits>
#include <cstdint>

#include "options.hpp"
#include "arg_parser.hpp"
#include "parse_utils.hpp"

static LogLevel parse_log_level(std::string val) {
    for (auto& c : val)
        c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    if (val == "DEBUG")
        return LogLevel::DEBUG;
    if (val == "INFO")
        return LogLevel::INFO;
    if (val == "WARNING" || val == "WARN")
        return LogLevel::WARNING;
    if (val == "ERROR")
        return LogLevel::ERR;
    throw OptionsError("Invalid log level: " + val);
}

void parse_logging_options(Options& opts, const ArgParser& parser, const ConfigMap& cfg_opts) {
    bool ok = false;
    LoggingOptions& log = opts.logging;
    if (auto val = option_value(parser, cfg_opts, "--log-file"))
        log.log_file = *val;
    if (auto val = option_value(parser, cfg_opts, "--log-level")) {
        if (val->empty())
            throw OptionsError("--log-level requires a value");
        log.log_level = parse_log_level(*val);
    }
    if (auto val = option_value(parser, cfg_opts, "--max-log-size")) {
        log.max_log_size = parse_bytes(*val, 0, SIZE_MAX, ok);
        if (!ok)
            throw OptionsError("Invalid value for --max-log-size");
    }
    if (auto val = option_value(parser, cfg_opts, "--max-log-files")) {
        log.max_log_files = parse_size_t(*val, 1, 100, ok);
        if (!ok)
            throw OptionsError("Invalid value for --max-log-files");
    }
    log.compress_logs = option_flag(parser, cfg_opts, "--compress-logs");
    log.json_log = option_flag(parser, cfg_opts, "--json-log");
    log.use_syslog = option_flag(parser, cfg_opts, "--syslog");
    if (auto val = option_value(parser, cfg_opts, "--syslog-facility")) {
        log.syslog_facility = static_cast<int>(parse_size_t(*val, 0, INT_MAX, ok));
        if (!ok)
            throw OptionsError("Invalid value for --syslog-facility");
    }
}
