#ifndef REPO_HPP
#define REPO_HPP
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief A git working copy found under the scan root.
 *
 * Built by the scanner and refined in place by each step of the sync
 * pipeline. Ahead/behind counts are zero whenever the branch is detached or
 * has no remote counterpart.
 */
struct Repository {
    std::filesystem::path path; ///< Absolute path; identity of the repository
    std::string name;           ///< Last path segment
    std::string branch;         ///< Branch name or "(detached at <rev>)" / "(detached)"
    bool detached = false;      ///< HEAD does not point at a named branch
    bool has_remote = false;    ///< Configured upstream remote exists
    bool dirty = false;         ///< Working tree has tracked or untracked changes
    int ahead = 0;              ///< Local commits missing on the remote branch
    int behind = 0;             ///< Remote commits missing locally
};

/**
 * @brief Terminal classification of one repository's sync.
 */
enum class SyncStatus {
    Pending,         ///< Not processed yet
    NoOrigin,        ///< Remote missing; nothing attempted
    DirtySkipped,    ///< Dirty tree and skip requested
    FetchFailed,     ///< Fetch reported an error
    FetchOnly,       ///< Fetched; pulling disabled
    AlreadyUpToDate, ///< Nothing to integrate
    FastForwarded,   ///< Fast-forward pull succeeded
    Rebased,         ///< Rebase pull succeeded
    DetachedHead,    ///< Pull skipped on a detached HEAD
    NoRemoteBranch,  ///< Remote counterpart of the branch is missing
    PullFailed,      ///< Conflict or divergence during pull
    PullError,       ///< Pull could not run (timeout, tool failure)
    Cancelled,       ///< Run stopped before this repository started
    Error            ///< Unexpected failure inside the pipeline
};

/**
 * @brief Whether a pull happened.
 */
enum class PullState { No, Yes, Skipped, NoOrigin };

/**
 * @brief Result of restoring an automatic stash.
 */
enum class StashOutcome {
    None,      ///< No stash was created
    Restored,  ///< Stash popped cleanly
    Conflicts, ///< Pop reported conflict markers; tree left dirty
    PopFailed  ///< Pop failed for another reason; stash kept
};

/**
 * @brief Per-repository result of one run.
 */
struct SyncOutcome {
    std::string name;
    std::filesystem::path path;
    std::string branch;
    std::string remote;        ///< Configured remote name, e.g. "origin"
    std::string remote_branch; ///< e.g. "origin/main"; empty when detached
    bool dirty_before = false;
    std::optional<bool> dirty_after; ///< Re-checked state after a stash cycle
    PullState pulled = PullState::No;
    SyncStatus status = SyncStatus::Pending;
    StashOutcome stash = StashOutcome::None;
    bool has_remote = false;
    int ahead = 0;
    int behind = 0;
    std::vector<std::string> messages; ///< Stash notices and diagnostics, in order

    /** @return Dirty state after the run, falling back to the initial state. */
    bool dirty() const { return dirty_after.value_or(dirty_before); }
};

/**
 * @return Human readable label for @p status (without stash suffix).
 *         @p remote names the configured remote in the NoOrigin label.
 */
std::string status_text(SyncStatus status, const std::string& remote_branch = "",
                        const std::string& remote = "origin");

/** @return Full display label including any stash suffix. */
std::string status_label(const SyncOutcome& outcome);

/** @return "Yes", "No", "Skipped" or "NoOrigin". */
std::string pulled_text(PullState state);

/** @return Stable identifier for @p status, used in JSON output. */
std::string status_key(SyncStatus status);

/** @return Stable identifier for @p stash, used in JSON output. */
std::string stash_key(StashOutcome stash);

/** @return `true` for statuses counted as repository failures. */
bool is_failure(SyncStatus status);

#endif // REPO_HPP
