#ifndef IGNORE_UTILS_HPP
#define IGNORE_UTILS_HPP
#include <filesystem>
#include <string>
#include <vector>

namespace ignore {

/**
 * Read exclusion patterns from a file.
 *
 * Each non-empty, non-comment line is trimmed of leading and trailing
 * whitespace and kept as one pattern. Lines beginning with '#' are comments.
 * A trailing carriage return is stripped.
 *
 * Missing or unreadable files result in an empty list.
 */
std::vector<std::string> read_ignore_file(const std::filesystem::path& file);

/**
 * Check a directory name against exclusion patterns.
 *
 * Patterns without glob characters must equal @p name. Others are matched
 * with `fnmatch`, e.g. `tmp-*` or `*.bak`.
 */
bool matches(const std::string& name, const std::vector<std::string>& patterns);

} // namespace ignore

#endif // IGNORE_UTILS_HPP
