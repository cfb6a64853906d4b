#include "git_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

using namespace std;

namespace git {

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    fs::path dot_git = p / ".git";
    if (fs::is_directory(dot_git, ec))
        return true;
    return fs::is_regular_file(dot_git, ec);
}

/**
 * @brief Convert a libgit2 object ID to a hexadecimal string.
 */
static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

static bool open_repo(const fs::path& repo, repo_ptr& out, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error);
        return false;
    }
    out.h = raw;
    return true;
}

/**
 * @brief Resolve the branch name for an attached HEAD, including unborn ones.
 */
static optional<string> attached_branch(git_repository* repo) {
    git_reference* raw_head = nullptr;
    if (git_reference_lookup(&raw_head, repo, "HEAD") != 0)
        return nullopt;
    reference_ptr head(raw_head);
    if (git_reference_type(head.get()) != GIT_REFERENCE_SYMBOLIC)
        return nullopt;
    const char* target = git_reference_symbolic_target(head.get());
    if (!target)
        return nullopt;
    string name = target;
    const string prefix = "refs/heads/";
    if (name.rfind(prefix, 0) == 0)
        name = name.substr(prefix.size());
    return name;
}

static optional<bool> worktree_dirty(git_repository* repo, string* error) {
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX;
    git_status_list* raw_list = nullptr;
    if (git_status_list_new(&raw_list, repo, &opts) != 0) {
        set_error(error);
        return nullopt;
    }
    status_list_ptr list(raw_list);
    return git_status_list_entrycount(list.get()) > 0;
}

optional<WorkTreeStatus> get_worktree_status(const fs::path& repo, string* error) {
    repo_ptr r;
    if (!open_repo(repo, r, error))
        return nullopt;
    WorkTreeStatus st;
    int detached = git_repository_head_detached(r.get());
    if (detached == 1) {
        st.detached = true;
        git_oid oid;
        if (git_reference_name_to_id(&oid, r.get(), "HEAD") == 0)
            st.branch = "(detached at " + oid_to_hex(oid).substr(0, 7) + ")";
        else
            st.branch = "(detached)";
    } else {
        auto name = attached_branch(r.get());
        if (name && !name->empty()) {
            st.branch = *name;
        } else {
            st.detached = true;
            st.branch = "(detached)";
        }
    }
    auto dirty = worktree_dirty(r.get(), error);
    if (!dirty)
        return nullopt;
    st.dirty = *dirty;
    return st;
}

optional<bool> rebase_in_progress(const fs::path& repo, string* error) {
    repo_ptr r;
    if (!open_repo(repo, r, error))
        return nullopt;
    switch (git_repository_state(r.get())) {
    case GIT_REPOSITORY_STATE_REBASE:
    case GIT_REPOSITORY_STATE_REBASE_INTERACTIVE:
    case GIT_REPOSITORY_STATE_REBASE_MERGE:
    case GIT_REPOSITORY_STATE_APPLY_MAILBOX_OR_REBASE:
        return true;
    default:
        return false;
    }
}

bool remote_exists(const fs::path& repo, const string& remote, string* error) {
    repo_ptr r;
    if (!open_repo(repo, r, error))
        return false;
    git_remote* raw_remote = nullptr;
    int rc = git_remote_lookup(&raw_remote, r.get(), remote.c_str());
    if (rc != 0) {
        if (rc != GIT_ENOTFOUND)
            set_error(error);
        return false;
    }
    remote_ptr remote_handle(raw_remote);
    return true;
}

bool remote_tracking_branch_exists(const fs::path& repo, const string& remote,
                                   const string& branch) {
    repo_ptr r;
    if (!open_repo(repo, r, nullptr))
        return false;
    git_oid oid;
    string ref = "refs/remotes/" + remote + "/" + branch;
    return git_reference_name_to_id(&oid, r.get(), ref.c_str()) == 0;
}

optional<AheadBehind> count_ahead_behind(const fs::path& repo, const string& remote,
                                         const string& branch, string* error) {
    repo_ptr r;
    if (!open_repo(repo, r, error))
        return nullopt;
    git_oid local_oid;
    git_oid remote_oid;
    string local_ref = "refs/heads/" + branch;
    string remote_ref = "refs/remotes/" + remote + "/" + branch;
    if (git_reference_name_to_id(&local_oid, r.get(), local_ref.c_str()) != 0 ||
        git_reference_name_to_id(&remote_oid, r.get(), remote_ref.c_str()) != 0)
        return AheadBehind{};
    size_t ahead = 0;
    size_t behind = 0;
    if (git_graph_ahead_behind(&ahead, &behind, r.get(), &local_oid, &remote_oid) != 0) {
        set_error(error);
        return nullopt;
    }
    return AheadBehind{static_cast<int>(ahead), static_cast<int>(behind)};
}

static string trim(const string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

static string lower(string s) {
    transform(s.begin(), s.end(), s.begin(),
              [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return s;
}

static bool line_has_marker(const string& line) {
    if (line.find("error:") != string::npos || line.find("fatal:") != string::npos)
        return true;
    if (line.find("CONFLICT") != string::npos)
        return true;
    string l = lower(line);
    return l.find("merge conflict") != string::npos ||
           l.find("divergent branches") != string::npos ||
           l.find("not possible to fast-forward") != string::npos;
}

string find_marker_line(const string& output) {
    istringstream ss(output);
    string line;
    while (getline(ss, line)) {
        if (line_has_marker(line))
            return trim(line);
    }
    return "";
}

bool has_conflict_marker(const string& output) {
    return output.find("CONFLICT") != string::npos ||
           lower(output).find("merge conflict") != string::npos;
}

string first_line(const string& output) {
    istringstream ss(output);
    string line;
    while (getline(ss, line)) {
        string t = trim(line);
        if (!t.empty())
            return t;
    }
    return "";
}

} // namespace git
