#include "report_export.hpp"

#include <fstream>

#include "run_coordinator.hpp"
#include "version.hpp"

using nlohmann::json;

json outcome_to_json(const SyncOutcome& outcome) {
    json j{{"name", outcome.name},
           {"path", outcome.path.string()},
           {"branch", outcome.branch},
           {"status", status_key(outcome.status)},
           {"label", status_label(outcome)},
           {"pulled", pulled_text(outcome.pulled)},
           {"has_remote", outcome.has_remote},
           {"dirty_before", outcome.dirty_before},
           {"ahead", outcome.ahead},
           {"behind", outcome.behind},
           {"stash", stash_key(outcome.stash)},
           {"messages", outcome.messages}};
    if (outcome.dirty_after)
        j["dirty_after"] = *outcome.dirty_after;
    else
        j["dirty_after"] = nullptr;
    if (!outcome.remote.empty())
        j["remote"] = outcome.remote;
    if (!outcome.remote_branch.empty())
        j["remote_branch"] = outcome.remote_branch;
    return j;
}

json run_result_to_json(const RunResult& result) {
    json repos = json::array();
    for (const auto& o : result.outcomes)
        repos.push_back(outcome_to_json(o));
    return json{{"version", UPDATE_REPOS_VERSION},
                {"root", result.root.string()},
                {"elapsed_ms", result.elapsed.count()},
                {"failures", result.failures()},
                {"cancelled", result.cancelled()},
                {"repositories", repos}};
}

std::string dump_json(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

bool write_json_report(const RunResult& result, const std::filesystem::path& path,
                       std::string& error) {
    std::string text;
    try {
        text = dump_json(run_result_to_json(result), 2);
    } catch (const json::exception& e) {
        error = std::string("Unable to serialize report: ") + e.what();
        return false;
    }
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        error = "Unable to open " + path.string();
        return false;
    }
    ofs << text << '\n';
    if (!ofs) {
        error = "Unable to write " + path.string();
        return false;
    }
    return true;
}
