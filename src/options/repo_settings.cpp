// options_repo_settings.cpp
//
// Parse per-repository override settings from configuration maps.

#include <map>
#include <set>
#include <string>

#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

SyncSettings apply_repo_options(const SyncSettings& base, const RepoOptions& repo) {
    SyncSettings s = base;
    s.no_pull = repo.no_pull.value_or(base.no_pull);
    s.skip_dirty = repo.skip_dirty.value_or(base.skip_dirty);
    s.stash_dirty = repo.stash_dirty.value_or(base.stash_dirty);
    // Choosing one dirty strategy for a repository turns off the other.
    if (repo.stash_dirty.value_or(false) && !repo.skip_dirty)
        s.skip_dirty = false;
    if (repo.skip_dirty.value_or(false) && !repo.stash_dirty)
        s.stash_dirty = false;
    s.use_rebase = repo.use_rebase.value_or(base.use_rebase);
    s.fetch_all_remotes = repo.fetch_all_remotes.value_or(base.fetch_all_remotes);
    s.remote = repo.remote.value_or(base.remote);
    s.post_pull_hook = repo.post_pull_hook.value_or(base.post_pull_hook);
    return s;
}

SyncSettings effective_settings(const RunOptions& run, const std::string& name) {
    auto it = run.repo_settings.find(name);
    if (it == run.repo_settings.end())
        return run.sync;
    return apply_repo_options(run.sync, it->second);
}

bool is_excluded(const RunOptions& run, const std::string& name) {
    auto it = run.repo_settings.find(name);
    return it != run.repo_settings.end() && it->second.exclude.value_or(false);
}

void parse_repo_settings(Options& opts, const std::map<std::string, ConfigMap>& cfg_repo_opts) {
    static const std::set<std::string> allowed{
        "--no-pull", "--skip-dirty", "--stash-dirty", "--use-rebase", "--fetch-all",
        "--fetch-all-remotes", "--exclude", "--remote", "--post-pull-hook"};
    for (const auto& [repo, values] : cfg_repo_opts) {
        RepoOptions ro;
        auto rflag = [&](const std::string& k) -> std::optional<bool> {
            auto it = values.find(k);
            if (it == values.end())
                return std::nullopt;
            bool ok = false;
            bool v = parse_bool(it->second, ok);
            if (!ok)
                throw OptionsError("Invalid per-repo " + k.substr(2) + " for " + repo);
            return v;
        };
        for (const auto& kv : values) {
            if (!allowed.count(kv.first))
                throw OptionsError("Unknown option in config for " + repo + ": " + kv.first);
        }
        ro.no_pull = rflag("--no-pull");
        ro.skip_dirty = rflag("--skip-dirty");
        ro.stash_dirty = rflag("--stash-dirty");
        ro.use_rebase = rflag("--use-rebase");
        ro.fetch_all_remotes = rflag("--fetch-all");
        if (!ro.fetch_all_remotes)
            ro.fetch_all_remotes = rflag("--fetch-all-remotes");
        ro.exclude = rflag("--exclude");
        if (values.count("--remote")) {
            std::string val = values.at("--remote");
            if (val.empty())
                throw OptionsError("Invalid per-repo remote for " + repo);
            ro.remote = val;
        }
        if (values.count("--post-pull-hook"))
            ro.post_pull_hook = fs::path(values.at("--post-pull-hook"));
        if (ro.skip_dirty.value_or(false) && ro.stash_dirty.value_or(false))
            throw OptionsError("skip-dirty and stash-dirty cannot be combined for " + repo);
        opts.run.repo_settings[repo] = ro;
    }
}
