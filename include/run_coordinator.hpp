#ifndef RUN_COORDINATOR_HPP
#define RUN_COORDINATOR_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <vector>

#include "git_utils.hpp"
#include "options.hpp"
#include "repo.hpp"
#include "retry_policy.hpp"

/**
 * @brief The root path is missing or not a directory. Maps to exit code 1.
 */
class RootPathError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct RunResult {
    std::filesystem::path root;
    std::vector<SyncOutcome> outcomes; ///< Scan order
    std::chrono::milliseconds elapsed{0};

    size_t failures() const;
    bool cancelled() const;
};

/// Receives 1-based index, total count and the finished outcome.
using ProgressCallback = std::function<void(size_t, size_t, const SyncOutcome&)>;

/**
 * @brief Throw RootPathError unless @p root is an existing directory.
 */
void validate_root(const std::filesystem::path& root);

/**
 * @brief Scan the root and synchronize every repository found.
 *
 * The root is validated before the gateway is used. Repositories are
 * processed one after another, or by `options.concurrency` workers; in both
 * cases @p on_progress is called from one thread at a time, in scan order.
 *
 * Clearing @p running stops new repositories from starting. Repositories
 * already in progress finish normally; the remaining ones are reported as
 * `Cancelled`.
 *
 * @throws RootPathError when the root is invalid.
 */
RunResult run_sync(const RunOptions& options, git::VcsGateway& gateway,
                   const ProgressCallback& on_progress, std::atomic<bool>& running,
                   const RetrySleep& sleep = {});

#endif // RUN_COORDINATOR_HPP
