#ifndef REPO_OPTIONS_HPP
#define REPO_OPTIONS_HPP

#include <chrono>
#include <optional>
#include <filesystem>
#include <string>

#include "retry_policy.hpp"

/**
 * @brief Sync behavior applied to one repository.
 */
struct SyncSettings {
    bool no_pull = false;
    bool skip_dirty = false;
    bool stash_dirty = false;
    bool use_rebase = false;
    bool fetch_all_remotes = false;
    std::string remote = "origin";
    std::filesystem::path post_pull_hook;
    std::chrono::seconds hook_timeout{300};
    RetryPolicy fetch_retry;
};

/**
 * @brief Overrides from the `repositories` section of a config file.
 */
struct RepoOptions {
    std::optional<bool> no_pull;
    std::optional<bool> skip_dirty;
    std::optional<bool> stash_dirty;
    std::optional<bool> use_rebase;
    std::optional<bool> fetch_all_remotes;
    std::optional<bool> exclude;
    std::optional<std::string> remote;
    std::optional<std::filesystem::path> post_pull_hook;
};

/** @return @p base with every override present in @p repo applied. */
SyncSettings apply_repo_options(const SyncSettings& base, const RepoOptions& repo);

#endif // REPO_OPTIONS_HPP
