#ifndef SCANNER_HPP
#define SCANNER_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "git_utils.hpp"
#include "repo.hpp"

/**
 * @brief Discover git working copies directly below @p root.
 *
 * A child directory is kept when its name starts with @p prefix, it matches
 * none of the @p exclude patterns and @p gateway recognizes it as a
 * repository. Symbolic links are followed only when they resolve inside
 * @p root. Hidden directories are skipped.
 *
 * A missing root or an empty result is not an error: a warning is logged and
 * an empty list returned.
 *
 * @return Repositories in directory enumeration order, with `path` absolute
 *         and `name` set to the directory name.
 */
std::vector<Repository> scan_repositories(const std::filesystem::path& root,
                                          const std::string& prefix,
                                          const std::vector<std::string>& exclude,
                                          git::VcsGateway& gateway);

#endif // SCANNER_HPP
