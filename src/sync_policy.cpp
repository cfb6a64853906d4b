#include "sync_policy.hpp"

#include <algorithm>
#include <cctype>

PolicyState policy_state(const Repository& repo, bool remote_branch_exists) {
    PolicyState st;
    st.has_remote = repo.has_remote;
    st.dirty = repo.dirty;
    st.detached = repo.detached;
    st.remote_branch_exists = remote_branch_exists;
    st.ahead = repo.ahead;
    st.behind = repo.behind;
    return st;
}

Action pre_fetch_action(const PolicyState& state, const SyncSettings& settings) {
    if (!state.has_remote)
        return Action::NoRemoteAbort;
    if (state.dirty && settings.skip_dirty)
        return Action::DirtySkip;
    if (state.dirty && settings.stash_dirty)
        return Action::DirtyStash;
    return Action::Proceed;
}

Action post_fetch_action(const PolicyState& state, const SyncSettings& settings) {
    if (settings.no_pull)
        return Action::FetchOnly;
    if (state.detached)
        return Action::DetachedSkip;
    if (!state.remote_branch_exists)
        return Action::NoRemoteBranch;
    if (state.behind <= 0)
        return Action::AlreadyUpToDate;
    return settings.use_rebase ? Action::Rebase : Action::FastForward;
}

Action decide(const PolicyState& state, const SyncSettings& settings) {
    Action pre = pre_fetch_action(state, settings);
    if (pre != Action::Proceed && pre != Action::DirtyStash)
        return pre;
    return post_fetch_action(state, settings);
}

bool is_terminal(Action action) {
    switch (action) {
    case Action::DirtyStash:
    case Action::Proceed:
    case Action::FastForward:
    case Action::Rebase:
        return false;
    default:
        return true;
    }
}

SyncStatus status_for(Action action) {
    switch (action) {
    case Action::NoRemoteAbort:
        return SyncStatus::NoOrigin;
    case Action::DirtySkip:
        return SyncStatus::DirtySkipped;
    case Action::FetchOnly:
        return SyncStatus::FetchOnly;
    case Action::DetachedSkip:
        return SyncStatus::DetachedHead;
    case Action::NoRemoteBranch:
        return SyncStatus::NoRemoteBranch;
    case Action::AlreadyUpToDate:
        return SyncStatus::AlreadyUpToDate;
    case Action::FastForward:
        return SyncStatus::FastForwarded;
    case Action::Rebase:
        return SyncStatus::Rebased;
    case Action::DirtyStash:
    case Action::Proceed:
        break;
    }
    return SyncStatus::Pending;
}

SyncStatus classify_pull_failure(const git::PullResult& result) {
    if (result.tool_failure)
        return SyncStatus::PullError;
    std::string note = result.note;
    std::transform(note.begin(), note.end(), note.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (note.find("couldn't find remote ref") != std::string::npos ||
        note.find("no such ref was fetched") != std::string::npos)
        return SyncStatus::NoRemoteBranch;
    return SyncStatus::PullFailed;
}

PullState pulled_state(SyncStatus status) {
    switch (status) {
    case SyncStatus::NoOrigin:
        return PullState::NoOrigin;
    case SyncStatus::DirtySkipped:
    case SyncStatus::FetchOnly:
    case SyncStatus::DetachedHead:
    case SyncStatus::Cancelled:
        return PullState::Skipped;
    case SyncStatus::FastForwarded:
    case SyncStatus::Rebased:
        return PullState::Yes;
    default:
        return PullState::No;
    }
}

std::string action_name(Action action) {
    switch (action) {
    case Action::NoRemoteAbort:
        return "no_remote_abort";
    case Action::DirtySkip:
        return "dirty_skip";
    case Action::DirtyStash:
        return "dirty_stash";
    case Action::Proceed:
        return "proceed";
    case Action::FetchOnly:
        return "fetch_only";
    case Action::DetachedSkip:
        return "detached_skip";
    case Action::NoRemoteBranch:
        return "no_remote_branch";
    case Action::AlreadyUpToDate:
        return "already_up_to_date";
    case Action::FastForward:
        return "fast_forward";
    case Action::Rebase:
        return "rebase";
    }
    return "";
}
