#ifndef REPORT_HPP
#define REPORT_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "repo.hpp"

struct RunResult;

/**
 * @brief Resolved ANSI color codes; all empty when colors are off.
 */
struct ReportColors {
    std::string reset;
    std::string green;
    std::string yellow;
    std::string red;
    std::string cyan;
    std::string gray;
    std::string bold;
};

/**
 * @brief Create a palette, or an empty one when @p enabled is false.
 */
ReportColors make_report_colors(bool enabled);

/**
 * @brief Decide whether to colorize standard output.
 *
 * @return `false` when @p no_colors is set or stdout is not a terminal.
 */
bool colors_enabled(bool no_colors);

/**
 * @brief Display family of an outcome; drives icon and color.
 */
enum class StatusCategory { UpToDate, Updated, Failure, Skipped, Neutral };

StatusCategory status_category(const SyncOutcome& outcome);

/** @return Icon for @p category, e.g. "✓". */
std::string category_icon(StatusCategory category);

/**
 * @brief Format one progress line: `[i/N] icon name (branch) - status`.
 */
std::string render_progress_line(size_t index, size_t total, const SyncOutcome& outcome,
                                 const ReportColors& colors);

/**
 * @brief Format the end-of-run table, sorted by repository name.
 *
 * Columns are Repository, Branch, Dirty, Pulled and Status. The Status
 * column is left out when every outcome is up to date. With
 * @p show_messages the messages of each repository follow the table.
 *
 * @return Table text, empty when there are no outcomes.
 */
std::string render_summary_table(const std::vector<SyncOutcome>& outcomes,
                                 const ReportColors& colors, bool show_messages = false);

/**
 * @brief Format `"<N> repositories processed in <elapsed>"` plus a failure count.
 */
std::string render_footer(const RunResult& result, const ReportColors& colors);

#endif // REPORT_HPP
