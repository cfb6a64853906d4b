#include "report.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <unistd.h>

#include "run_coordinator.hpp"
#include "time_utils.hpp"

ReportColors make_report_colors(bool enabled) {
    if (!enabled)
        return {};
    return {"\033[0m", "\033[32m", "\033[33m", "\033[31m", "\033[36m", "\033[90m", "\033[1m"};
}

bool colors_enabled(bool no_colors) { return !no_colors && isatty(STDOUT_FILENO) == 1; }

StatusCategory status_category(const SyncOutcome& outcome) {
    if (is_failure(outcome.status))
        return StatusCategory::Failure;
    if (outcome.stash == StashOutcome::Conflicts || outcome.stash == StashOutcome::PopFailed)
        return StatusCategory::Skipped;
    switch (outcome.status) {
    case SyncStatus::AlreadyUpToDate:
        return StatusCategory::UpToDate;
    case SyncStatus::FastForwarded:
    case SyncStatus::Rebased:
        return StatusCategory::Updated;
    case SyncStatus::DirtySkipped:
    case SyncStatus::DetachedHead:
    case SyncStatus::Cancelled:
        return StatusCategory::Skipped;
    default:
        return StatusCategory::Neutral;
    }
}

std::string category_icon(StatusCategory category) {
    switch (category) {
    case StatusCategory::UpToDate:
        return "✓";
    case StatusCategory::Updated:
        return "↓";
    case StatusCategory::Failure:
        return "✗";
    case StatusCategory::Skipped:
        return "○";
    case StatusCategory::Neutral:
        break;
    }
    return "•";
}

static const std::string& category_color(StatusCategory category, const ReportColors& c) {
    switch (category) {
    case StatusCategory::UpToDate:
    case StatusCategory::Updated:
        return c.green;
    case StatusCategory::Failure:
        return c.red;
    case StatusCategory::Skipped:
        return c.yellow;
    case StatusCategory::Neutral:
        break;
    }
    return c.cyan;
}

std::string render_progress_line(size_t index, size_t total, const SyncOutcome& outcome,
                                 const ReportColors& colors) {
    StatusCategory cat = status_category(outcome);
    const std::string& col = category_color(cat, colors);
    std::ostringstream out;
    out << colors.gray << "[" << index << "/" << total << "]" << colors.reset << " " << col
        << category_icon(cat) << colors.reset << " " << colors.bold << outcome.name
        << colors.reset;
    if (!outcome.branch.empty())
        out << " (" << outcome.branch << ")";
    out << " - " << col << status_label(outcome) << colors.reset;
    return out.str();
}

std::string render_summary_table(const std::vector<SyncOutcome>& outcomes,
                                  const ReportColors& colors, bool show_messages) {
    if (outcomes.empty())
        return "";
    std::vector<const SyncOutcome*> rows;
    rows.reserve(outcomes.size());
    for (const auto& o : outcomes)
        rows.push_back(&o);
    std::stable_sort(rows.begin(), rows.end(),
                     [](const SyncOutcome* a, const SyncOutcome* b) { return a->name < b->name; });

    const bool show_status = std::any_of(rows.begin(), rows.end(), [](const SyncOutcome* o) {
        return status_category(*o) != StatusCategory::UpToDate;
    });

    size_t w_name = std::string("Repository").size();
    size_t w_branch = std::string("Branch").size();
    const size_t w_dirty = std::string("Dirty").size();
    size_t w_pulled = std::string("Pulled").size();
    for (const auto* o : rows) {
        w_name = std::max(w_name, o->name.size());
        w_branch = std::max(w_branch, o->branch.size());
        w_pulled = std::max(w_pulled, pulled_text(o->pulled).size());
    }

    std::ostringstream out;
    out << std::left << colors.bold << std::setw(static_cast<int>(w_name)) << "Repository"
        << "  " << std::setw(static_cast<int>(w_branch)) << "Branch" << "  "
        << std::setw(static_cast<int>(w_dirty)) << "Dirty" << "  ";
    if (show_status)
        out << std::setw(static_cast<int>(w_pulled)) << "Pulled" << "  Status";
    else
        out << "Pulled";
    out << colors.reset << "\n";
    size_t rule = w_name + w_branch + w_dirty + w_pulled + 6;
    if (show_status)
        rule += 8;
    out << std::string(rule, '-') << "\n";

    for (const auto* o : rows) {
        out << std::setw(static_cast<int>(w_name)) << o->name << "  "
            << std::setw(static_cast<int>(w_branch)) << o->branch << "  "
            << std::setw(static_cast<int>(w_dirty)) << (o->dirty() ? "Yes" : "No") << "  ";
        if (show_status) {
            out << std::setw(static_cast<int>(w_pulled)) << pulled_text(o->pulled) << "  "
                << category_color(status_category(*o), colors) << status_label(*o)
                << colors.reset;
        } else {
            out << pulled_text(o->pulled);
        }
        out << "\n";
    }

    if (show_messages) {
        for (const auto* o : rows) {
            for (const auto& msg : o->messages)
                out << colors.gray << o->name << ": " << colors.reset << msg << "\n";
        }
    }
    return out.str();
}

std::string render_footer(const RunResult& result, const ReportColors& colors) {
    const size_t count = result.outcomes.size();
    std::ostringstream out;
    out << count << (count == 1 ? " repository" : " repositories") << " processed in "
        << format_elapsed(result.elapsed);
    size_t failed = result.failures();
    if (failed > 0)
        out << ", " << colors.red << failed << " failed" << colors.reset;
    if (result.cancelled())
        out << " " << colors.yellow << "(cancelled)" << colors.reset;
    return out.str();
}
