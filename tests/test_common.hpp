#pragma once
#include <catch2/catch_test_macros.hpp>
#include "arg_parser.hpp"
#include "git_utils.hpp"
#include "repo.hpp"
#include "logger.hpp"
#include "time_utils.hpp"
#include "config_utils.hpp"
#include "parse_utils.hpp"
#include "options.hpp"
#include "scanner.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>
#include <cstdlib>
#include <map>
#include <set>
#include <mutex>
#include <atomic>
#include <thread>
#include <chrono>
#include <string>
#include <vector>

#if !defined(REDIR)
#define REDIR " > /dev/null 2>&1"
#endif

static inline bool have_git() { return std::system("git --version " REDIR) == 0; }

namespace fs = std::filesystem;

namespace update_repos::test_support {
namespace detail {
inline bool remove_once(const fs::path& target, bool recursive, std::error_code& ec) {
    ec.clear();
    if (recursive) {
        fs::remove_all(target, ec);
        if (!ec)
            return true;
        if (ec == std::errc::no_such_file_or_directory)
            return true;
        return false;
    }
    fs::remove(target, ec);
    if (!ec)
        return true;
    if (ec == std::errc::no_such_file_or_directory)
        return true;
    return false;
}

inline void remove_with_retry(const fs::path& target, bool recursive) {
    std::error_code ec;
    if (remove_once(target, recursive, ec))
        return;
    INFO("Failed to remove '" << target.string() << "': " << ec.message());
    REQUIRE(false);
}
}  // namespace detail

inline void remove_path(const fs::path& target) {
    detail::remove_with_retry(target, false);
}

inline void remove_all(const fs::path& target) {
    detail::remove_with_retry(target, true);
}

/** Fresh empty directory under the system temp dir. */
inline fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline void write_file(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << text;
}

/** Run a git command inside @p dir with a fixed identity. */
inline int git_in(const fs::path& dir, const std::string& args) {
    std::string cmd = "git -C \"" + dir.string() +
                      "\" -c user.email=test@example.com -c user.name=Test "
                      "-c init.defaultBranch=main -c commit.gpgsign=false " +
                      args + REDIR;
    return std::system(cmd.c_str());
}

/**
 * Create a bare "remote" plus a clone with one commit on `main`.
 *
 * @return Path of the clone.
 */
inline fs::path make_cloned_repo(const fs::path& base, const std::string& name) {
    // Hidden names keep the fixtures out of directory scans of base.
    fs::path remote = base / ("." + name + "_remote.git");
    fs::path seed = base / ("." + name + "_seed");
    fs::path clone = base / name;
    fs::create_directories(remote);
    fs::create_directories(seed);
    git_in(remote, "init --bare -b main");
    git_in(seed, "init -b main");
    write_file(seed / "file.txt", "one\n");
    git_in(seed, "add file.txt");
    git_in(seed, "commit -m init");
    git_in(seed, "remote add origin \"" + remote.string() + "\"");
    git_in(seed, "push origin main");
    std::string cmd = "git clone \"" + remote.string() + "\" \"" + clone.string() + "\"" REDIR;
    std::system(cmd.c_str());
    // Stash and rebase run through the gateway without -c overrides.
    git_in(clone, "config user.email test@example.com");
    git_in(clone, "config user.name Test");
    git_in(clone, "config commit.gpgsign false");
    return clone;
}

/** Push a new commit to the remote of a repo made by make_cloned_repo(). */
inline void push_remote_commit(const fs::path& base, const std::string& name,
                               const std::string& text) {
    fs::path seed = base / ("." + name + "_seed");
    write_file(seed / "file.txt", text);
    git_in(seed, "commit -am update");
    git_in(seed, "push origin main");
}
}  // namespace update_repos::test_support

#ifndef FS_REMOVE
#define FS_REMOVE(path) ::update_repos::test_support::remove_path((path))
#endif
#ifndef FS_REMOVE_ALL
#define FS_REMOVE_ALL(path) ::update_repos::test_support::remove_all((path))
#endif
