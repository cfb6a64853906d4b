#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "git_utils.hpp"
#include "repo.hpp"

namespace fs = std::filesystem;

namespace update_repos::test_support {

/**
 * In-memory gateway recording every call. Each repository is described by a
 * StubRepo keyed by absolute path.
 */
struct StubRepo {
    std::string branch = "main";
    bool detached = false;
    bool dirty = false;
    bool has_remote = true;
    bool remote_branch = true;
    int ahead = 0;
    int behind = 0;
    int fetch_failures = 0; ///< Fail this many fetches before succeeding
    bool pull_ok = true;
    std::string pull_note;
    bool pull_tool_failure = false;
    bool stash_has_changes = true;
    StashOutcome pop_result = StashOutcome::Restored;
    bool dirty_after_pop = false;
    bool throw_on_fetch = false;
    bool status_unreadable = false; ///< get_status reports a failed read
    bool counts_unreadable = false; ///< ahead_behind reports a failed read
};

class RecordingGateway : public git::VcsGateway {
  public:
    std::map<std::string, StubRepo> repos;
    std::vector<std::string> calls; ///< "op:<name>" in call order

    bool is_repository(const fs::path& path) override {
        std::lock_guard<std::mutex> lk(mtx_);
        calls.push_back("is_repository:" + path.filename().string());
        return repos.count(path.string()) > 0;
    }

    git::WorkTreeStatus get_status(const fs::path& path) override {
        std::lock_guard<std::mutex> lk(mtx_);
        calls.push_back("get_status:" + path.filename().string());
        StubRepo& r = repos.at(path.string());
        git::WorkTreeStatus st;
        st.branch = r.detached ? "(detached at abc1234)" : r.branch;
        st.detached = r.detached;
        st.dirty = r.dirty;
        st.ok = !r.status_unreadable;
        return st;
    }

    bool has_remote(const fs::path& path, const std::string&) override {
        std::lock_guard<std::mutex> lk(mtx_);
        calls.push_back("has_remote:" + path.filename().string());
        return repos.at(path.string()).has_remote;
    }

    bool fetch(const fs::path& path, const std::string&, bool all_remotes) override {
        std::lock_guard<std::mutex> lk(mtx_);
        calls.push_back(std::string(all_remotes ? "fetch_all:" : "fetch:") +
                        path.filename().string());
        StubRepo& r = repos.at(path.string());
        if (r.throw_on_fetch)
            throw std::runtime_error("fetch exploded");
        if (r.fetch_failures > 0) {
            --r.fetch_failures;
            return false;
        }
        return true;
    }

    bool remote_branch_exists(const fs::path& path, const std::string&,
                              const std::string&) override {
        std::lock_guard<std::mutex> lk(mtx_);
        calls.push_back("remote_branch_exists:" + path.filename().string());
        return repos.at(path.string()).remote_branch;
    }

    git::AheadBehind ahead_behind(const fs::path& path, const std::string&,
                                  const std::string&) override {
        std::lock_guard<std::mutex> lk(mtx_);
        calls.push_back("ahead_behind:" + path.filename().string());
        StubRepo& r = repos.at(path.string());
        git::AheadBehind ab;
        ab.ahead = r.ahead;
        ab.behind = r.behind;
        ab.ok = !r.counts_unreadable;
        return ab;
    }

    git::PullResult pull(const fs::path& path, const std::string&, const std::string&,
                         bool rebase) override {
        std::lock_guard<std::mutex> lk(mtx_);
        calls.push_back(std::string(rebase ? "pull_rebase:" : "pull:") +
                        path.filename().string());
        StubRepo& r = repos.at(path.string());
        git::PullResult res;
        res.ok = r.pull_ok;
        res.note = r.pull_note;
        res.tool_failure = r.pull_tool_failure;
        if (r.pull_ok)
            r.behind = 0;
        return res;
    }

    std::optional<git::StashRecord> stash_push(const fs::path& path) override {
        std::lock_guard<std::mutex> lk(mtx_);
        calls.push_back("stash_push:" + path.filename().string());
        StubRepo& r = repos.at(path.string());
        if (!r.stash_has_changes)
            return std::nullopt;
        r.dirty = false;
        return git::StashRecord{"stash@{0}", "update-repos autostash test"};
    }

    StashOutcome stash_pop(const fs::path& path, const git::StashRecord&) override {
        std::lock_guard<std::mutex> lk(mtx_);
        calls.push_back("stash_pop:" + path.filename().string());
        StubRepo& r = repos.at(path.string());
        r.dirty = r.pop_result == StashOutcome::Restored ? false : r.dirty_after_pop;
        return r.pop_result;
    }

    size_t count(const std::string& prefix) {
        std::lock_guard<std::mutex> lk(mtx_);
        size_t n = 0;
        for (const auto& c : calls) {
            if (c.rfind(prefix, 0) == 0)
                ++n;
        }
        return n;
    }

    void clear_calls() {
        std::lock_guard<std::mutex> lk(mtx_);
        calls.clear();
    }

  private:
    std::mutex mtx_;
};

/** Repository value for a stub entry at @p dir / @p name. */
inline Repository stub_repository(const fs::path& dir, const std::string& name) {
    Repository repo;
    repo.name = name;
    repo.path = dir / name;
    return repo;
}

} // namespace update_repos::test_support
