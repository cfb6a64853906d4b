#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <filesystem>
#include <vector>
#include <string>
#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include "logger.hpp"
#include "repo_options.hpp"

class ArgParser;

/**
 * @brief Invalid command line or configuration. Maps to exit code 2.
 */
class OptionsError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool compress_logs = false;
    bool json_log = false;
    bool use_syslog = false;
    int syslog_facility = 0;
};

/**
 * @brief Everything that shapes one sync run. Built once, then read-only.
 */
struct RunOptions {
    std::filesystem::path root = ".";
    std::string prefix;
    std::vector<std::string> exclude;
    SyncSettings sync;
    bool verbose = false;
    size_t concurrency = 1;
    std::chrono::seconds command_timeout{300};
    std::map<std::string, RepoOptions> repo_settings; ///< Keyed by directory name
};

struct Options {
    RunOptions run;
    LoggingOptions logging;
    bool silent = false;
    bool no_colors = false;
    bool show_help = false;
    bool show_version = false;
    bool auto_config = false;
    std::filesystem::path config_file;
    std::filesystem::path json_report;
    std::string webhook_url;
    std::string webhook_secret;
};

/**
 * @brief Parse command line arguments into an Options structure.
 *
 * Configuration files named by `--config-yaml`/`--config-json`, or found by
 * `--auto-config`, are loaded first; flags on the command line override
 * their values.
 *
 * @throws OptionsError on unknown flags, malformed values, unknown
 *         configuration keys or conflicting settings.
 */
Options parse_options(int argc, char* argv[]);

/** @return Settings for the repository directory @p name. */
SyncSettings effective_settings(const RunOptions& run, const std::string& name);

/** @return `true` when a per-repository override excludes @p name. */
bool is_excluded(const RunOptions& run, const std::string& name);

// Helpers implemented in src/options/*.cpp

using ConfigMap = std::map<std::string, std::string>;

/**
 * @brief Boolean option from the command line or, failing that, the config.
 *
 * `--flag`, `--flag=yes` and a config value of `true`/`yes`/`1`/`on` enable
 * it. The command line wins over the config file.
 *
 * @throws OptionsError for a value that is not a boolean.
 */
bool option_flag(const ArgParser& parser, const ConfigMap& cfg, const std::string& key);

/**
 * @brief Valued option from the command line or, failing that, the config.
 *
 * @throws OptionsError when the flag is given without a value.
 */
std::optional<std::string> option_value(const ArgParser& parser, const ConfigMap& cfg,
                                        const std::string& key);

/// Read config files named on the command line or found by auto discovery.
void load_config_and_auto(const ArgParser& parser, const char* argv0,
                          std::map<std::string, std::string>& cfg_opts,
                          std::map<std::string, std::map<std::string, std::string>>& cfg_repo_opts,
                          std::filesystem::path& config_file);

void parse_logging_options(Options& opts, const ArgParser& parser,
                           const std::map<std::string, std::string>& cfg_opts);

void parse_repo_settings(Options& opts,
                         const std::map<std::string, std::map<std::string, std::string>>&
                             cfg_repo_opts);

#endif // OPTIONS_HPP
