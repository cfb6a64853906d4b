#ifndef SYNC_ORCHESTRATOR_HPP
#define SYNC_ORCHESTRATOR_HPP

#include <chrono>
#include <filesystem>
#include <string>

#include "git_utils.hpp"
#include "process_utils.hpp"
#include "repo.hpp"
#include "repo_options.hpp"
#include "retry_policy.hpp"

/**
 * @brief Drive one repository through the sync pipeline.
 *
 * Steps run strictly in order: status, pre-fetch decision, optional stash
 * push, fetch (retried per @c settings.fetch_retry), ahead/behind, post-fetch
 * decision, optional pull, ahead/behind again, optional post-pull hook, stash
 * pop and a final dirty check.
 *
 * A pushed stash is popped exactly once before returning, whatever happened
 * in between. Exceptions raised by a step end the pipeline with
 * `SyncStatus::Error` and are recorded in the outcome messages; they are
 * never rethrown.
 *
 * @param repo     Repository to process; refined in place.
 * @param settings Effective settings for this repository.
 * @param gateway  Version-control access.
 * @param sleep    Wait function used between fetch attempts.
 * @return Outcome for @p repo.
 */
SyncOutcome sync_repository(Repository& repo, const SyncSettings& settings,
                            git::VcsGateway& gateway, const RetrySleep& sleep = {});

/**
 * @brief Run a post-pull hook inside @p repo.
 *
 * The hook receives `UPDATE_REPOS_REPO` and `UPDATE_REPOS_BRANCH` in its
 * environment. A relative hook path containing a directory component is
 * resolved against the current directory.
 */
procutil::CommandResult run_post_pull_hook(const std::filesystem::path& hook,
                                           const std::filesystem::path& repo,
                                           const std::string& branch,
                                           std::chrono::seconds timeout);

#endif // SYNC_ORCHESTRATOR_HPP
