#include "help_text.hpp"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <cstring>

const std::vector<OptionInfo>& option_table() {
    static const std::vector<OptionInfo> opts = {
        {"--root", "-o", "<path>", "Directory containing the repositories (default: .)",
         "Basics"},
        {"--prefix", "", "<text>", "Only sync directories whose name starts with text", "Basics"},
        {"--exclude", "", "<glob>", "Skip directories matching glob (repeatable)", "Basics"},
        {"--exclude-file", "", "<file>", "Read exclusion globs from file", "Basics"},
        {"--remote", "", "<name>", "Remote to fetch and pull from (default: origin)", "Basics"},
        {"--no-pull", "-n", "", "Fetch only, never pull", "Sync"},
        {"--skip-dirty", "-s", "", "Skip repositories with local changes", "Sync"},
        {"--stash-dirty", "-S", "", "Stash local changes around the pull", "Sync"},
        {"--use-rebase", "-r", "", "Pull with --rebase instead of --ff-only", "Sync"},
        {"--fetch-all", "-a", "", "Fetch every remote (alias --fetch-all-remotes)", "Sync"},
        {"--post-pull-hook", "", "<file>", "Executable run after a successful pull", "Sync"},
        {"--concurrency", "-c", "<n>", "Repositories processed in parallel (default: 1)",
         "Process"},
        {"--timeout", "", "<N[s|m|h]>", "Limit for each git command (default: 300s)",
         "Process"},
        {"--fetch-retries", "", "<n>", "Extra fetch attempts after a failure (default: 0)",
         "Process"},
        {"--retry-backoff", "", "<ms|s|m>", "Delay before the first fetch retry (default: 1s)",
         "Process"},
        {"--verbose", "-v", "", "Print the summary table and messages (alias --verbose-branches)",
         "Display"},
        {"--no-colors", "", "", "Disable ANSI colors", "Display"},
        {"--silent", "", "", "Suppress progress and summary output", "Display"},
        {"--json-report", "", "<file>", "Write the run summary as JSON", "Reports"},
        {"--webhook-url", "", "<url>", "POST the run summary as JSON to url", "Reports"},
        {"--webhook-secret", "", "<secret>", "Value for the X-Webhook-Secret header", "Reports"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--auto-config", "", "", "Look for .update-repos.yaml or .update-repos.json", "Config"},
        {"--log-file", "-l", "<path>", "File for general logs", "Logging"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR (default: INFO)",
         "Logging"},
        {"--json-log", "", "", "Write log entries as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep (default: 1)", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Log to syslog", "Logging"},
        {"--syslog-facility", "", "<n>", "Syslog facility", "Logging"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};
    return opts;
}

const std::map<std::string, std::string>& option_aliases() {
    static const std::map<std::string, std::string> aliases{
        {"--fetch-all-remotes", "--fetch-all"}, {"--verbose-branches", "--verbose"}};
    return aliases;
}

static std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

std::string help_text(const char* prog) {
    const auto& opts = option_table();
    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    std::ostringstream out;
    out << "update-repos - Synchronize every git repository under a directory\n";
    out << "Fetches each repository and fast-forwards, rebases, stashes or skips it.\n";
    out << "Configuration can be read from YAML or JSON files.\n\n";
    out << "Usage: " << prog << " [root] [options]\n";
    out << "       " << prog << " --root <path> [options]\n\n";
    const std::vector<std::string> order{"Basics",  "Sync",   "Process", "Display",
                                         "Reports", "Config", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        out << cat << ":\n";
        for (const auto* o : groups[cat]) {
            out << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
                << o->desc << "\n";
        }
        out << "\n";
    }
    out << "Exit codes: 0 success, 1 invalid root, 2 invalid arguments or config,\n";
    out << "            3 a repository failed, 130 interrupted.\n";
    return out.str();
}

void print_help(const char* prog) { std::cout << help_text(prog); }
