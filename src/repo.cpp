#include "repo.hpp"

std::string status_text(SyncStatus status, const std::string& remote_branch,
                        const std::string& remote) {
    switch (status) {
    case SyncStatus::Pending:
        return "Pending";
    case SyncStatus::NoOrigin:
        return "No " + (remote.empty() ? std::string("origin") : remote) + " remote";
    case SyncStatus::DirtySkipped:
        return "Skipped (dirty)";
    case SyncStatus::FetchFailed:
        return "Fetch failed";
    case SyncStatus::FetchOnly:
        return "Fetched (pull disabled)";
    case SyncStatus::AlreadyUpToDate:
        return "Already up to date";
    case SyncStatus::FastForwarded:
        return "Fast-forwarded";
    case SyncStatus::Rebased:
        return "Rebased";
    case SyncStatus::DetachedHead:
        return "Detached HEAD (pull skipped)";
    case SyncStatus::NoRemoteBranch:
        return remote_branch.empty() ? "No remote branch" : "No remote branch " + remote_branch;
    case SyncStatus::PullFailed:
        return "Pull failed";
    case SyncStatus::PullError:
        return "Pull error";
    case SyncStatus::Cancelled:
        return "Cancelled";
    case SyncStatus::Error:
        return "Error";
    }
    return "";
}

std::string status_label(const SyncOutcome& outcome) {
    std::string label = status_text(outcome.status, outcome.remote_branch, outcome.remote);
    switch (outcome.stash) {
    case StashOutcome::None:
        break;
    case StashOutcome::Restored:
        label += " (Stash restored)";
        break;
    case StashOutcome::Conflicts:
        label += " (Stash conflicts)";
        break;
    case StashOutcome::PopFailed:
        label += " (Stash pop failed)";
        break;
    }
    return label;
}

std::string pulled_text(PullState state) {
    switch (state) {
    case PullState::No:
        return "No";
    case PullState::Yes:
        return "Yes";
    case PullState::Skipped:
        return "Skipped";
    case PullState::NoOrigin:
        return "NoOrigin";
    }
    return "";
}

std::string status_key(SyncStatus status) {
    switch (status) {
    case SyncStatus::Pending:
        return "pending";
    case SyncStatus::NoOrigin:
        return "no_origin";
    case SyncStatus::DirtySkipped:
        return "dirty_skipped";
    case SyncStatus::FetchFailed:
        return "fetch_failed";
    case SyncStatus::FetchOnly:
        return "fetch_only";
    case SyncStatus::AlreadyUpToDate:
        return "up_to_date";
    case SyncStatus::FastForwarded:
        return "fast_forwarded";
    case SyncStatus::Rebased:
        return "rebased";
    case SyncStatus::DetachedHead:
        return "detached_head";
    case SyncStatus::NoRemoteBranch:
        return "no_remote_branch";
    case SyncStatus::PullFailed:
        return "pull_failed";
    case SyncStatus::PullError:
        return "pull_error";
    case SyncStatus::Cancelled:
        return "cancelled";
    case SyncStatus::Error:
        return "error";
    }
    return "";
}

std::string stash_key(StashOutcome stash) {
    switch (stash) {
    case StashOutcome::None:
        return "none";
    case StashOutcome::Restored:
        return "restored";
    case StashOutcome::Conflicts:
        return "conflicts";
    case StashOutcome::PopFailed:
        return "pop_failed";
    }
    return "";
}

bool is_failure(SyncStatus status) {
    switch (status) {
    case SyncStatus::FetchFailed:
    case SyncStatus::NoRemoteBranch:
    case SyncStatus::PullFailed:
    case SyncStatus::PullError:
    case SyncStatus::Error:
        return true;
    default:
        return false;
    }
}
