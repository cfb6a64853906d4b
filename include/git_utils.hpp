#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <chrono>
#include <string>
#include <filesystem>
#include <optional>
#include <vector>

#include "process_utils.hpp"
#include "repo.hpp"

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown. Nested
 * guards are allowed; libgit2 reference-counts initialization.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;

/**
 * @brief Branch and cleanliness of a working tree.
 */
struct WorkTreeStatus {
    std::string branch;    ///< Branch name, "(detached at <rev>)" or "(detached)"
    bool detached = false; ///< HEAD is not a named branch
    bool dirty = false;    ///< Tracked or untracked changes present
    bool ok = true;        ///< `false` when the status could not be read
};

struct AheadBehind {
    int ahead = 0;
    int behind = 0;
    bool ok = true; ///< `false` when the counts could not be computed
};

/**
 * @brief Outcome of a pull invocation.
 */
struct PullResult {
    bool ok = false;
    std::string note;          ///< First relevant output line
    bool tool_failure = false; ///< git could not run or timed out
};

/**
 * @brief An automatic stash created before synchronizing a dirty tree.
 */
struct StashRecord {
    std::string ref;     ///< Reference at creation time, e.g. "stash@{0}"
    std::string message; ///< Unique message used to locate the entry later
};

// ---------------------------------------------------------------------------
// libgit2 queries. These assume libgit2 is already initialized.
// ---------------------------------------------------------------------------

/**
 * @brief Determine whether the given path is a Git working copy.
 *
 * @param p Filesystem path to check.
 * @return `true` if @a p contains a `.git` directory or a `.git` file
 *         (linked worktrees and submodules).
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Read the current branch and dirty state.
 *
 * An unborn branch reports its symbolic name. A detached HEAD reports
 * "(detached at <7-char rev>)", or "(detached)" when the revision cannot be
 * resolved.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Status or `std::nullopt` if the repository cannot be read.
 */
std::optional<WorkTreeStatus> get_worktree_status(const fs::path& repo,
                                                  std::string* error = nullptr);

/**
 * @brief Check whether a rebase is in progress, including in linked worktrees.
 *
 * @return In-progress flag or `std::nullopt` if the repository cannot be read.
 */
std::optional<bool> rebase_in_progress(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Check whether a remote with the given name is configured.
 */
bool remote_exists(const fs::path& repo, const std::string& remote, std::string* error = nullptr);

/**
 * @brief Check for `refs/remotes/<remote>/<branch>`.
 */
bool remote_tracking_branch_exists(const fs::path& repo, const std::string& remote,
                                   const std::string& branch);

/**
 * @brief Count commits between `refs/heads/<branch>` and `refs/remotes/<remote>/<branch>`.
 *
 * @return Counts, `{0, 0}` when either reference is missing, or
 *         `std::nullopt` on a libgit2 failure.
 */
std::optional<AheadBehind> count_ahead_behind(const fs::path& repo, const std::string& remote,
                                              const std::string& branch,
                                              std::string* error = nullptr);

// ---------------------------------------------------------------------------
// Output scanning for the git command line tool.
// ---------------------------------------------------------------------------

/**
 * @brief Find the first line carrying an error marker.
 *
 * Markers: `error:`, `fatal:`, `CONFLICT`, `merge conflict`,
 * `divergent branches` and `Not possible to fast-forward`.
 *
 * @return The trimmed line, or an empty string when no marker is present.
 */
std::string find_marker_line(const std::string& output);

/** @return `true` when the output reports a merge conflict. */
bool has_conflict_marker(const std::string& output);

/** @return First non-empty trimmed line of @p output. */
std::string first_line(const std::string& output);

// ---------------------------------------------------------------------------
// Gateway
// ---------------------------------------------------------------------------

/**
 * @brief Synchronous access to the version-control operations of a sync run.
 *
 * Implementations never throw for expected failures. Every failure degrades
 * to a safe default (false, 0/0, nullopt, PopFailed) after logging a warning,
 * so callers must not read a default as success. Status and counts carry an
 * `ok` flag so a failed read can be told apart from a clean or level result.
 */
class VcsGateway {
  public:
    virtual ~VcsGateway() = default;

    virtual bool is_repository(const fs::path& path) = 0;
    virtual WorkTreeStatus get_status(const fs::path& path) = 0;
    virtual bool has_remote(const fs::path& path, const std::string& remote) = 0;
    /// Fetch with prune; all remotes or only @p remote.
    virtual bool fetch(const fs::path& path, const std::string& remote, bool all_remotes) = 0;
    virtual bool remote_branch_exists(const fs::path& path, const std::string& remote,
                                      const std::string& branch) = 0;
    /// `{0, 0}` for a detached HEAD or a missing remote branch.
    virtual AheadBehind ahead_behind(const fs::path& path, const std::string& remote,
                                     const std::string& branch) = 0;
    /// Fast-forward-only pull, or rebase pull when @p rebase is set.
    virtual PullResult pull(const fs::path& path, const std::string& remote,
                            const std::string& branch, bool rebase) = 0;
    /// Stash including untracked files; nullopt when nothing was stashed.
    virtual std::optional<StashRecord> stash_push(const fs::path& path) = 0;
    virtual StashOutcome stash_pop(const fs::path& path, const StashRecord& record) = 0;
};

struct GatewayConfig {
    std::string git_executable = "git";
    std::chrono::seconds timeout{300}; ///< Per-invocation limit; 0 disables it
    procutil::Environment env{{"GIT_TERMINAL_PROMPT", "0"},
                              {"GIT_MERGE_AUTOEDIT", "no"},
                              {"LC_ALL", "C"}};
};

/**
 * @brief Gateway backed by libgit2 for inspection and the `git` executable
 *        for fetch, pull and stash.
 */
class GitGateway : public VcsGateway {
  public:
    explicit GitGateway(GatewayConfig config = {});

    bool is_repository(const fs::path& path) override;
    WorkTreeStatus get_status(const fs::path& path) override;
    bool has_remote(const fs::path& path, const std::string& remote) override;
    bool fetch(const fs::path& path, const std::string& remote, bool all_remotes) override;
    bool remote_branch_exists(const fs::path& path, const std::string& remote,
                              const std::string& branch) override;
    AheadBehind ahead_behind(const fs::path& path, const std::string& remote,
                             const std::string& branch) override;
    PullResult pull(const fs::path& path, const std::string& remote, const std::string& branch,
                    bool rebase) override;
    std::optional<StashRecord> stash_push(const fs::path& path) override;
    StashOutcome stash_pop(const fs::path& path, const StashRecord& record) override;

    const GatewayConfig& config() const { return config_; }

  private:
    procutil::CommandResult run_git(const fs::path& path, const std::vector<std::string>& args);
    void abort_rebase_if_needed(const fs::path& path);

    GatewayConfig config_;
};

} // namespace git

#endif // GIT_UTILS_HPP
