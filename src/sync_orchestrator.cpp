#include "sync_orchestrator.hpp"

#include <optional>

#include "logger.hpp"
#include "sync_policy.hpp"

namespace fs = std::filesystem;

procutil::CommandResult run_post_pull_hook(const fs::path& hook, const fs::path& repo,
                                           const std::string& branch,
                                           std::chrono::seconds timeout) {
    fs::path exe = hook;
    if (exe.is_relative() && exe.has_parent_path()) {
        std::error_code ec;
        fs::path abs = fs::absolute(exe, ec);
        if (!ec)
            exe = abs;
    }
    procutil::Environment env{{"UPDATE_REPOS_REPO", repo.string()},
                              {"UPDATE_REPOS_BRANCH", branch}};
    return procutil::run_command({exe.string()}, repo, timeout, env);
}

/**
 * @brief Refresh ahead/behind counts; detached heads always count 0/0.
 *
 * @return Whether the remote counterpart of the branch exists, or
 *         `std::nullopt` when the counts could not be computed.
 */
static std::optional<bool> refresh_counts(Repository& repo, const SyncSettings& settings,
                                          git::VcsGateway& gateway) {
    repo.ahead = 0;
    repo.behind = 0;
    if (repo.detached)
        return false;
    if (!gateway.remote_branch_exists(repo.path, settings.remote, repo.branch))
        return false;
    auto counts = gateway.ahead_behind(repo.path, settings.remote, repo.branch);
    if (!counts.ok)
        return std::nullopt;
    repo.ahead = counts.ahead;
    repo.behind = counts.behind;
    return true;
}

static std::string count_failure(const Repository& repo, const SyncSettings& settings) {
    return "Unable to count commits against " + settings.remote + "/" + repo.branch;
}

static void restore_stash(SyncOutcome& out, const Repository& repo,
                          const git::StashRecord& record, git::VcsGateway& gateway) {
    try {
        out.stash = gateway.stash_pop(repo.path, record);
    } catch (const std::exception& e) {
        out.stash = StashOutcome::PopFailed;
        out.messages.push_back(std::string("Stash pop raised: ") + e.what());
    }
    switch (out.stash) {
    case StashOutcome::Restored:
        out.dirty_after = false;
        out.messages.push_back("Stash restored");
        return;
    case StashOutcome::Conflicts:
        out.messages.push_back("Stash pop reported conflicts; resolve manually");
        break;
    case StashOutcome::PopFailed:
        out.messages.push_back("Stash kept as \"" + record.message + "\"");
        break;
    case StashOutcome::None:
        return;
    }
    try {
        auto st = gateway.get_status(repo.path);
        // An unreadable tree after a stash problem is reported as dirty.
        out.dirty_after = !st.ok || st.dirty;
        if (!st.ok)
            out.messages.push_back("Dirty check failed: status unreadable");
    } catch (const std::exception& e) {
        out.dirty_after = true;
        out.messages.push_back(std::string("Dirty check failed: ") + e.what());
    }
}

static void run_pipeline(Repository& repo, const SyncSettings& settings,
                         git::VcsGateway& gateway, const RetrySleep& sleep, SyncOutcome& out,
                         std::optional<git::StashRecord>& stash) {
    auto st = gateway.get_status(repo.path);
    if (!st.ok) {
        out.status = SyncStatus::Error;
        out.messages.push_back("Unable to read repository status");
        return;
    }
    repo.branch = st.branch;
    repo.detached = st.detached;
    repo.dirty = st.dirty;
    out.branch = repo.branch;
    out.dirty_before = repo.dirty;
    repo.has_remote = gateway.has_remote(repo.path, settings.remote);
    out.has_remote = repo.has_remote;
    if (!repo.detached)
        out.remote_branch = settings.remote + "/" + repo.branch;

    Action pre = pre_fetch_action(policy_state(repo), settings);
    log_debug("Pre-fetch decision", {{"repo", repo.name}, {"action", action_name(pre)}});
    if (pre == Action::NoRemoteAbort || pre == Action::DirtySkip) {
        out.status = status_for(pre);
        return;
    }
    if (pre == Action::DirtyStash) {
        stash = gateway.stash_push(repo.path);
        if (stash)
            out.messages.push_back("Stashed local changes");
        else
            out.messages.push_back("Nothing stashed; continuing with local changes");
    }

    auto fetched = run_with_retry(
        settings.fetch_retry,
        [&] { return gateway.fetch(repo.path, settings.remote, settings.fetch_all_remotes); },
        [](bool ok) { return ok; }, sleep);
    if (!fetched.value) {
        out.status = SyncStatus::FetchFailed;
        out.messages.push_back("Fetch failed after " + std::to_string(fetched.attempts) +
                               (fetched.attempts == 1 ? " attempt" : " attempts"));
        return;
    }
    if (fetched.attempts > 1)
        out.messages.push_back("Fetch succeeded on attempt " + std::to_string(fetched.attempts));

    auto remote_branch = refresh_counts(repo, settings, gateway);
    if (!remote_branch) {
        out.status = SyncStatus::Error;
        out.messages.push_back(count_failure(repo, settings));
        return;
    }
    Action post = post_fetch_action(policy_state(repo, *remote_branch), settings);
    log_debug("Post-fetch decision", {{"repo", repo.name},
                                      {"action", action_name(post)},
                                      {"ahead", std::to_string(repo.ahead)},
                                      {"behind", std::to_string(repo.behind)}});
    if (is_terminal(post)) {
        out.status = status_for(post);
        return;
    }

    auto pulled = gateway.pull(repo.path, settings.remote, repo.branch, post == Action::Rebase);
    if (!pulled.ok) {
        out.status = classify_pull_failure(pulled);
        if (!pulled.note.empty())
            out.messages.push_back(pulled.note);
        return;
    }
    out.status = status_for(post);
    if (!refresh_counts(repo, settings, gateway))
        out.messages.push_back(count_failure(repo, settings) + " after the pull");

    if (!settings.post_pull_hook.empty()) {
        auto hook = run_post_pull_hook(settings.post_pull_hook, repo.path, repo.branch,
                                       settings.hook_timeout);
        if (!hook.ok()) {
            std::string why = hook.error.empty() ? "exit code " + std::to_string(hook.exit_code)
                                                 : hook.error;
            out.messages.push_back("Post-pull hook failed: " + why);
            log_warning("Post-pull hook failed: " + why, {{"repo", repo.name}});
        }
    }
}

SyncOutcome sync_repository(Repository& repo, const SyncSettings& settings,
                            git::VcsGateway& gateway, const RetrySleep& sleep) {
    SyncOutcome out;
    out.name = repo.name;
    out.path = repo.path;
    out.branch = repo.branch;
    out.remote = settings.remote;
    std::optional<git::StashRecord> stash;
    try {
        run_pipeline(repo, settings, gateway, sleep, out, stash);
    } catch (const std::exception& e) {
        out.status = SyncStatus::Error;
        out.messages.push_back(e.what());
        log_error(std::string("Sync failed: ") + e.what(), {{"repo", repo.name}});
    }
    if (stash)
        restore_stash(out, repo, *stash, gateway);

    out.ahead = repo.ahead;
    out.behind = repo.behind;
    out.pulled = pulled_state(out.status);
    log_info(status_label(out), {{"repo", repo.name},
                                 {"status", status_key(out.status)},
                                 {"pulled", pulled_text(out.pulled)}});
    return out;
}
