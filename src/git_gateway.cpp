#include "git_utils.hpp"
#include "logger.hpp"
#include "time_utils.hpp"

#include <sstream>
#include <unistd.h>

namespace git {

GitGateway::GitGateway(GatewayConfig config) : config_(std::move(config)) {}

procutil::CommandResult GitGateway::run_git(const fs::path& path,
                                            const std::vector<std::string>& args) {
    std::vector<std::string> cmd;
    cmd.reserve(args.size() + 3);
    cmd.push_back(config_.git_executable);
    cmd.push_back("-C");
    cmd.push_back(path.string());
    cmd.insert(cmd.end(), args.begin(), args.end());
    log_debug("Running git " + (args.empty() ? std::string() : args.front()),
              {{"repo", path.string()}});
    return procutil::run_command(cmd, path, config_.timeout, config_.env);
}

/**
 * @brief Describe why a git invocation failed, preferring marker lines.
 */
static std::string failure_note(const procutil::CommandResult& res) {
    if (!res.error.empty())
        return res.error;
    std::string all = res.combined();
    std::string marker = find_marker_line(all);
    if (!marker.empty())
        return marker;
    std::string line = first_line(all);
    if (!line.empty())
        return line;
    return "exit code " + std::to_string(res.exit_code);
}

bool GitGateway::is_repository(const fs::path& path) { return is_git_repo(path); }

WorkTreeStatus GitGateway::get_status(const fs::path& path) {
    std::string err;
    auto st = get_worktree_status(path, &err);
    if (!st) {
        log_warning("Unable to read repository status: " + err, {{"repo", path.string()}});
        WorkTreeStatus fallback;
        fallback.branch = "(detached)";
        fallback.detached = true;
        fallback.ok = false;
        return fallback;
    }
    return *st;
}

bool GitGateway::has_remote(const fs::path& path, const std::string& remote) {
    std::string err;
    bool found = remote_exists(path, remote, &err);
    if (!found && !err.empty())
        log_warning("Unable to read remotes: " + err, {{"repo", path.string()}});
    return found;
}

bool GitGateway::fetch(const fs::path& path, const std::string& remote, bool all_remotes) {
    std::vector<std::string> args{"fetch"};
    if (all_remotes) {
        args.push_back("--all");
        args.push_back("--prune");
    } else {
        args.push_back("--prune");
        args.push_back(remote);
    }
    auto res = run_git(path, args);
    std::string marker = find_marker_line(res.combined());
    if (res.ok() && marker.empty())
        return true;
    log_warning("Fetch failed: " + failure_note(res), {{"repo", path.string()}});
    return false;
}

bool GitGateway::remote_branch_exists(const fs::path& path, const std::string& remote,
                                      const std::string& branch) {
    return remote_tracking_branch_exists(path, remote, branch);
}

AheadBehind GitGateway::ahead_behind(const fs::path& path, const std::string& remote,
                                     const std::string& branch) {
    std::string err;
    auto counts = count_ahead_behind(path, remote, branch, &err);
    if (!counts) {
        log_warning("Unable to count commits against " + remote + "/" + branch + ": " + err,
                    {{"repo", path.string()}});
        AheadBehind failed;
        failed.ok = false;
        return failed;
    }
    return *counts;
}

void GitGateway::abort_rebase_if_needed(const fs::path& path) {
    std::string err;
    auto rebasing = rebase_in_progress(path, &err);
    if (!rebasing) {
        log_warning("Unable to read repository state: " + err, {{"repo", path.string()}});
        return;
    }
    if (!*rebasing)
        return;
    auto res = run_git(path, {"rebase", "--abort"});
    if (!res.ok())
        log_warning("Unable to abort rebase: " + failure_note(res), {{"repo", path.string()}});
    else
        log_info("Aborted conflicting rebase", {{"repo", path.string()}});
}

PullResult GitGateway::pull(const fs::path& path, const std::string& remote,
                            const std::string& branch, bool rebase) {
    PullResult result;
    auto res = run_git(path, {"pull", rebase ? "--rebase" : "--ff-only", remote, branch});
    std::string all = res.combined();
    std::string marker = find_marker_line(all);
    if (res.ok() && marker.empty()) {
        result.ok = true;
        result.note = first_line(res.out);
        return result;
    }
    result.tool_failure = !res.launched || res.timed_out || !res.error.empty();
    result.note = failure_note(res);
    log_warning("Pull failed: " + result.note, {{"repo", path.string()}});
    if (rebase)
        abort_rebase_if_needed(path);
    return result;
}

std::optional<StashRecord> GitGateway::stash_push(const fs::path& path) {
    StashRecord record;
    record.message = "update-repos autostash " + compact_timestamp() + " " +
                     std::to_string(static_cast<long>(getpid()));
    auto res = run_git(path, {"stash", "push", "--include-untracked", "-m", record.message});
    std::string all = res.combined();
    if (res.ok() && all.find("No local changes to save") != std::string::npos) {
        log_info("Nothing to stash", {{"repo", path.string()}});
        return std::nullopt;
    }
    if (!res.ok() || !find_marker_line(all).empty()) {
        log_warning("Stash failed: " + failure_note(res), {{"repo", path.string()}});
        return std::nullopt;
    }
    record.ref = "stash@{0}";
    return record;
}

StashOutcome GitGateway::stash_pop(const fs::path& path, const StashRecord& record) {
    // Other stashes may have been pushed since; locate ours by message.
    auto list = run_git(path, {"stash", "list", "--format=%gd%x09%gs"});
    if (!list.ok()) {
        log_warning("Unable to list stashes: " + failure_note(list), {{"repo", path.string()}});
        return StashOutcome::PopFailed;
    }
    std::string ref;
    std::istringstream ss(list.out);
    std::string line;
    while (std::getline(ss, line)) {
        auto tab = line.find('\t');
        if (tab == std::string::npos)
            continue;
        if (line.find(record.message, tab) != std::string::npos) {
            ref = line.substr(0, tab);
            break;
        }
    }
    if (ref.empty()) {
        log_warning("Stash entry not found: " + record.message, {{"repo", path.string()}});
        return StashOutcome::PopFailed;
    }
    auto res = run_git(path, {"stash", "pop", ref});
    std::string all = res.combined();
    if (has_conflict_marker(all)) {
        log_warning("Stash pop reported conflicts", {{"repo", path.string()}});
        return StashOutcome::Conflicts;
    }
    if (!res.ok() || !find_marker_line(all).empty()) {
        log_warning("Stash pop failed: " + failure_note(res), {{"repo", path.string()}});
        return StashOutcome::PopFailed;
    }
    return StashOutcome::Restored;
}

} // namespace git
