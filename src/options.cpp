#include <algorithm>
#include <chrono>
#include <cctype>
#include <filesystem>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "help_text.hpp"
#include "ignore_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

// Logging, config discovery and per-repository settings are parsed in
// src/options/logging.cpp, src/options/config.cpp and
// src/options/repo_settings.cpp.

bool option_flag(const ArgParser& parser, const ConfigMap& cfg, const std::string& key) {
    bool ok = false;
    if (parser.has_flag(key)) {
        bool v = parse_bool(parser.get_option(key), ok);
        if (!ok)
            throw OptionsError("Invalid value for " + key);
        return v;
    }
    auto it = cfg.find(key);
    if (it == cfg.end())
        return false;
    bool v = parse_bool(it->second, ok);
    if (!ok)
        throw OptionsError("Invalid value for " + key + " in config");
    return v;
}

std::optional<std::string> option_value(const ArgParser& parser, const ConfigMap& cfg,
                                        const std::string& key) {
    if (parser.has_flag(key)) {
        std::string v = parser.get_option(key);
        if (v.empty())
            throw OptionsError(key + " requires a value");
        return v;
    }
    auto it = cfg.find(key);
    if (it != cfg.end())
        return it->second;
    return std::nullopt;
}

static std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(item.begin(), std::find_if(item.begin(), item.end(), [](unsigned char c) {
                       return !std::isspace(c);
                   }));
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back())))
            item.pop_back();
        if (!item.empty())
            out.push_back(item);
    }
    return out;
}

/**
 * @brief Map config keys written with an alias name to the canonical flag.
 */
static ConfigMap canonical_config(const ConfigMap& cfg) {
    ConfigMap out;
    const auto& aliases = option_aliases();
    for (const auto& [k, v] : cfg) {
        auto it = aliases.find(k);
        out[it != aliases.end() ? it->second : k] = v;
    }
    return out;
}

Options parse_options(int argc, char* argv[]) {
    std::set<std::string> known;
    std::set<std::string> value_flags;
    std::map<char, std::string> short_opts;
    for (const auto& o : option_table()) {
        known.insert(o.long_flag);
        if (o.arg[0] != '\0')
            value_flags.insert(o.long_flag);
        if (o.short_flag[0] == '-' && o.short_flag[1] != '\0')
            short_opts[o.short_flag[1]] = o.long_flag;
    }
    ArgParser parser(argc, argv, known, short_opts, value_flags, option_aliases());

    Options opts;
    if (!parser.unknown_flags().empty()) {
        std::string list;
        for (const auto& f : parser.unknown_flags())
            list += (list.empty() ? "" : ", ") + f;
        throw OptionsError("Unknown option" +
                           std::string(parser.unknown_flags().size() > 1 ? "s: " : ": ") + list);
    }
    opts.show_help = parser.has_flag("--help");
    opts.show_version = parser.has_flag("--version");
    if (opts.show_help || opts.show_version)
        return opts;

    ConfigMap raw_cfg;
    std::map<std::string, ConfigMap> cfg_repo_opts;
    load_config_and_auto(parser, argc > 0 ? argv[0] : nullptr, raw_cfg, cfg_repo_opts,
                         opts.config_file);
    ConfigMap cfg_opts = canonical_config(raw_cfg);
    for (const auto& kv : cfg_opts) {
        if (!known.count(kv.first))
            throw OptionsError("Unknown option in config: " + kv.first);
    }
    opts.auto_config = option_flag(parser, cfg_opts, "--auto-config");

    bool ok = false;
    RunOptions& run = opts.run;

    // Root: --root, a single positional argument, the config file, or ".".
    const auto& pos = parser.positional();
    if (pos.size() > 1)
        throw OptionsError("Unexpected argument: " + pos[1]);
    if (parser.has_flag("--root") && !pos.empty())
        throw OptionsError("Root given both as argument and with --root");
    if (!pos.empty()) {
        run.root = pos.front();
    } else if (auto v = option_value(parser, cfg_opts, "--root")) {
        run.root = *v;
    }
    if (run.root.empty())
        throw OptionsError("--root requires a path");

    if (auto v = option_value(parser, cfg_opts, "--prefix"))
        run.prefix = *v;
    if (parser.has_flag("--exclude")) {
        for (const auto& v : parser.get_all_options("--exclude")) {
            for (auto& pat : split_list(v))
                run.exclude.push_back(pat);
        }
    } else if (cfg_opts.count("--exclude")) {
        run.exclude = split_list(cfg_opts["--exclude"]);
    }
    if (auto v = option_value(parser, cfg_opts, "--exclude-file")) {
        std::error_code ec;
        if (!fs::is_regular_file(*v, ec))
            throw OptionsError("Exclude file not found: " + *v);
        for (auto& pat : ignore::read_ignore_file(*v))
            run.exclude.push_back(pat);
    }

    SyncSettings& sync = run.sync;
    sync.no_pull = option_flag(parser, cfg_opts, "--no-pull");
    sync.skip_dirty = option_flag(parser, cfg_opts, "--skip-dirty");
    sync.stash_dirty = option_flag(parser, cfg_opts, "--stash-dirty");
    sync.use_rebase = option_flag(parser, cfg_opts, "--use-rebase");
    sync.fetch_all_remotes = option_flag(parser, cfg_opts, "--fetch-all");
    if (auto v = option_value(parser, cfg_opts, "--remote")) {
        if (v->empty())
            throw OptionsError("--remote requires a name");
        sync.remote = *v;
    }
    if (auto v = option_value(parser, cfg_opts, "--post-pull-hook"))
        sync.post_pull_hook = *v;
    if (sync.skip_dirty && sync.stash_dirty)
        throw OptionsError("--skip-dirty and --stash-dirty cannot be combined");

    run.verbose = option_flag(parser, cfg_opts, "--verbose");
    if (auto v = option_value(parser, cfg_opts, "--concurrency")) {
        run.concurrency = parse_size_t(*v, 1, 256, ok);
        if (!ok)
            throw OptionsError("Invalid value for --concurrency");
    }
    if (auto v = option_value(parser, cfg_opts, "--timeout")) {
        auto dur = parse_duration(*v, ok);
        if (!ok || dur.count() < 1)
            throw OptionsError("Invalid value for --timeout");
        run.command_timeout = dur;
    }
    sync.hook_timeout = run.command_timeout;
    if (auto v = option_value(parser, cfg_opts, "--fetch-retries")) {
        size_t retries = parse_size_t(*v, 0, 10, ok);
        if (!ok)
            throw OptionsError("Invalid value for --fetch-retries");
        sync.fetch_retry.max_attempts = static_cast<unsigned int>(retries + 1);
    }
    if (auto v = option_value(parser, cfg_opts, "--retry-backoff")) {
        auto ms = parse_time_ms(*v, ok);
        if (!ok)
            throw OptionsError("Invalid value for --retry-backoff");
        sync.fetch_retry.initial_backoff = ms;
    }

    opts.silent = option_flag(parser, cfg_opts, "--silent");
    opts.no_colors = option_flag(parser, cfg_opts, "--no-colors");
    if (auto v = option_value(parser, cfg_opts, "--json-report"))
        opts.json_report = *v;
    if (auto v = option_value(parser, cfg_opts, "--webhook-url"))
        opts.webhook_url = *v;
    if (auto v = option_value(parser, cfg_opts, "--webhook-secret"))
        opts.webhook_secret = *v;
    if (!opts.webhook_secret.empty() && opts.webhook_url.empty())
        throw OptionsError("--webhook-secret requires --webhook-url");

    parse_logging_options(opts, parser, cfg_opts);
    parse_repo_settings(opts, cfg_repo_opts);
    return opts;
}
