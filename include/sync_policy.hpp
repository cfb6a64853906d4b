#ifndef SYNC_POLICY_HPP
#define SYNC_POLICY_HPP

#include <string>

#include "git_utils.hpp"
#include "repo.hpp"
#include "repo_options.hpp"

/**
 * @brief Next step chosen for a repository.
 *
 * `DirtyStash` and `Proceed` continue to the fetch; every other value ends
 * the pipeline or selects the pull strategy.
 */
enum class Action {
    NoRemoteAbort,
    DirtySkip,
    DirtyStash,
    Proceed,
    FetchOnly,
    DetachedSkip,
    NoRemoteBranch,
    AlreadyUpToDate,
    FastForward,
    Rebase
};

/**
 * @brief Repository facts the decision functions look at.
 */
struct PolicyState {
    bool has_remote = false;
    bool dirty = false;
    bool detached = false;
    bool remote_branch_exists = true;
    int ahead = 0;
    int behind = 0;
};

PolicyState policy_state(const Repository& repo, bool remote_branch_exists = true);

/**
 * @brief Decision taken before any network access.
 *
 * Checks run in a fixed order: missing remote, then skip-dirty, then
 * stash-dirty. When both dirty options are set the skip wins.
 *
 * @return One of NoRemoteAbort, DirtySkip, DirtyStash or Proceed.
 */
Action pre_fetch_action(const PolicyState& state, const SyncSettings& settings);

/**
 * @brief Decision taken after a successful fetch.
 *
 * Order: pull disabled, detached HEAD, remote branch missing, nothing to
 * integrate (`behind == 0`), then the configured pull strategy.
 *
 * @return One of FetchOnly, DetachedSkip, NoRemoteBranch, AlreadyUpToDate,
 *         FastForward or Rebase.
 */
Action post_fetch_action(const PolicyState& state, const SyncSettings& settings);

/**
 * @brief Combined decision for a state that is already fetched.
 *
 * Returns the pre-fetch verdict when it is terminal, otherwise the post-fetch
 * one.
 */
Action decide(const PolicyState& state, const SyncSettings& settings);

/** @return `true` when @p action ends the pipeline without a pull. */
bool is_terminal(Action action);

/** @return Terminal status for @p action; `Pending` for non-terminal ones. */
SyncStatus status_for(Action action);

/**
 * @brief Classify a failed pull.
 *
 * A missing remote ref yields NoRemoteBranch, a tool failure (timeout or
 * launch error) yields PullError, anything else (conflict, divergence)
 * yields PullFailed.
 */
SyncStatus classify_pull_failure(const git::PullResult& result);

/** @return Pull state reported for a terminal @p status. */
PullState pulled_state(SyncStatus status);

/** @return Lower-case identifier for @p action, used in log fields. */
std::string action_name(Action action);

#endif // SYNC_POLICY_HPP
