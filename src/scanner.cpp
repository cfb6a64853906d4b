#include "scanner.hpp"

#include <system_error>

#include "ignore_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

std::vector<Repository> scan_repositories(const fs::path& root, const std::string& prefix,
                                          const std::vector<std::string>& exclude,
                                          git::VcsGateway& gateway) {
    std::vector<Repository> result;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        log_warning("Root directory not found: " + root.string());
        return result;
    }
    fs::path abs_root = fs::absolute(root, ec);
    if (ec) {
        ec.clear();
        abs_root = root;
    }
    abs_root = abs_root.lexically_normal();
    fs::path canonical_root = fs::weakly_canonical(abs_root, ec);
    if (ec) {
        ec.clear();
        canonical_root = abs_root;
    }
    auto within_root = [&](const fs::path& p) {
        auto norm = p.lexically_normal();
        auto root_it = canonical_root.begin();
        auto p_it = norm.begin();
        for (; root_it != canonical_root.end() && p_it != norm.end(); ++root_it, ++p_it) {
            if (*root_it != *p_it)
                return false;
        }
        return root_it == canonical_root.end();
    };

    fs::directory_iterator it(abs_root, fs::directory_options::skip_permission_denied, ec);
    fs::directory_iterator end;
    if (ec) {
        log_warning("Unable to list " + abs_root.string() + ": " + ec.message());
        return result;
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            ec.clear();
            continue;
        }
        fs::path p = it->path();
        std::string name = p.filename().string();
        if (name.empty() || name[0] == '.')
            continue;
        if (!prefix.empty() && name.rfind(prefix, 0) != 0)
            continue;
        if (ignore::matches(name, exclude)) {
            log_debug("Excluded " + name);
            continue;
        }
        fs::path target = p;
        if (fs::is_symlink(p, ec)) {
            fs::path resolved = fs::weakly_canonical(p, ec);
            if (ec || !within_root(resolved)) {
                if (ec)
                    ec.clear();
                log_debug("Skipping symlink outside root: " + name);
                continue;
            }
            target = resolved;
        }
        if (!fs::is_directory(target, ec)) {
            if (ec)
                ec.clear();
            continue;
        }
        if (!gateway.is_repository(target))
            continue;
        Repository repo;
        repo.path = p;
        repo.name = name;
        result.push_back(std::move(repo));
    }
    if (result.empty())
        log_warning("No repositories found under " + abs_root.string());
    else
        log_debug("Found " + std::to_string(result.size()) + " repositories");
    return result;
}
