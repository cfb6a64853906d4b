// options_config.cpp
//
// Load configuration from YAML/JSON and auto-discovery.

#include <algorithm>
#include <filesystem>
#include <map>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

static void load_config_file(const fs::path& path, bool yaml, ConfigMap& cfg_opts,
                             std::map<std::string, ConfigMap>& cfg_repo_opts) {
    std::string err;
    bool loaded = yaml ? load_yaml_config(path.string(), cfg_opts, cfg_repo_opts, err)
                       : load_json_config(path.string(), cfg_opts, cfg_repo_opts, err);
    if (!loaded)
        throw OptionsError("Failed to load config " + path.string() + ": " + err);
}

void load_config_and_auto(const ArgParser& parser, const char* argv0, ConfigMap& cfg_opts,
                          std::map<std::string, ConfigMap>& cfg_repo_opts, fs::path& config_file) {
    if (parser.has_flag("--config-yaml")) {
        std::string cfg = parser.get_option("--config-yaml");
        if (cfg.empty())
            throw OptionsError("--config-yaml requires a file");
        load_config_file(cfg, true, cfg_opts, cfg_repo_opts);
        config_file = cfg;
    }
    if (parser.has_flag("--config-json")) {
        std::string cfg = parser.get_option("--config-json");
        if (cfg.empty())
            throw OptionsError("--config-json requires a file");
        load_config_file(cfg, false, cfg_opts, cfg_repo_opts);
        config_file = cfg;
    }

    auto cfg_flag_pre = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        std::string v = it->second;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return v == "" || v == "1" || v == "true" || v == "yes" || v == "on";
    };
    bool want_auto = parser.has_flag("--auto-config") || cfg_flag_pre("--auto-config");
    if (!want_auto)
        return;

    fs::path root_hint;
    if (parser.has_flag("--root"))
        root_hint = parser.get_option("--root");
    else if (!parser.positional().empty())
        root_hint = parser.positional().front();
    if (root_hint.empty() && cfg_opts.count("--root"))
        root_hint = cfg_opts["--root"];

    auto find_cfg = [](const fs::path& dir) -> fs::path {
        if (dir.empty())
            return {};
        std::error_code ec;
        fs::path y = dir / ".update-repos.yaml";
        if (fs::exists(y, ec))
            return y;
        fs::path j = dir / ".update-repos.json";
        if (fs::exists(j, ec))
            return j;
        return {};
    };
    fs::path exe_dir;
    if (argv0 && *argv0)
        exe_dir = fs::absolute(argv0).parent_path();
    fs::path cfg_path = find_cfg(root_hint);
    if (cfg_path.empty())
        cfg_path = find_cfg(fs::current_path());
    if (cfg_path.empty())
        cfg_path = find_cfg(exe_dir);
    if (cfg_path.empty())
        return;
    // Values from explicitly named files take precedence over discovered ones.
    ConfigMap found_opts;
    std::map<std::string, ConfigMap> found_repo_opts;
    load_config_file(cfg_path, cfg_path.extension() == ".yaml", found_opts, found_repo_opts);
    for (auto& [k, v] : found_opts)
        cfg_opts.emplace(k, v);
    for (auto& [repo, values] : found_repo_opts) {
        auto& dst = cfg_repo_opts[repo];
        for (auto& [k, v] : values)
            dst.emplace(k, v);
    }
    if (config_file.empty())
        config_file = cfg_path;
}
