#include "test_common.hpp"
#include "cli_commands.hpp"
#include "report.hpp"
#include "report_export.hpp"
#include "run_coordinator.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>

using nlohmann::json;

static SyncOutcome outcome(const std::string& name, SyncStatus status,
                           PullState pulled = PullState::No) {
    SyncOutcome o;
    o.name = name;
    o.path = "/srv/repos/" + name;
    o.branch = "main";
    o.remote_branch = "origin/main";
    o.has_remote = true;
    o.status = status;
    o.pulled = pulled;
    return o;
}

TEST_CASE("Status categories drive icons") {
    auto up = outcome("a", SyncStatus::AlreadyUpToDate);
    auto ff = outcome("b", SyncStatus::FastForwarded, PullState::Yes);
    auto bad = outcome("c", SyncStatus::PullFailed);
    auto skipped = outcome("d", SyncStatus::DirtySkipped, PullState::Skipped);
    auto fetched = outcome("e", SyncStatus::FetchOnly, PullState::Skipped);
    REQUIRE(status_category(up) == StatusCategory::UpToDate);
    REQUIRE(status_category(ff) == StatusCategory::Updated);
    REQUIRE(status_category(bad) == StatusCategory::Failure);
    REQUIRE(status_category(skipped) == StatusCategory::Skipped);
    REQUIRE(status_category(fetched) == StatusCategory::Neutral);
    REQUIRE(category_icon(StatusCategory::UpToDate) == "✓");
    REQUIRE(category_icon(StatusCategory::Failure) == "✗");

    ff.stash = StashOutcome::Conflicts;
    REQUIRE(status_category(ff) == StatusCategory::Skipped);
}

TEST_CASE("Progress line without colors") {
    auto o = outcome("api", SyncStatus::FastForwarded, PullState::Yes);
    o.stash = StashOutcome::Restored;
    std::string line = render_progress_line(2, 5, o, make_report_colors(false));
    REQUIRE(line == "[2/5] ↓ api (main) - Fast-forwarded (Stash restored)");
}

TEST_CASE("Progress line with colors wraps the status") {
    auto o = outcome("api", SyncStatus::PullError);
    ReportColors c = make_report_colors(true);
    std::string line = render_progress_line(1, 1, o, c);
    REQUIRE(line.find(c.red + "Pull error" + c.reset) != std::string::npos);
}

TEST_CASE("Summary table omits the status column when everything is up to date") {
    std::vector<SyncOutcome> all_ok{outcome("web", SyncStatus::AlreadyUpToDate),
                                    outcome("api", SyncStatus::AlreadyUpToDate)};
    std::string table = render_summary_table(all_ok, make_report_colors(false));
    REQUIRE(table.find("Status") == std::string::npos);
    REQUIRE(table.find("Pulled") != std::string::npos);
    REQUIRE(table.find("api") < table.find("web"));

    all_ok.push_back(outcome("db", SyncStatus::FetchFailed));
    std::string mixed = render_summary_table(all_ok, make_report_colors(false));
    REQUIRE(mixed.find("Status") != std::string::npos);
    REQUIRE(mixed.find("Fetch failed") != std::string::npos);
    REQUIRE(mixed.find("db") < mixed.find("web"));
}

TEST_CASE("Summary table dirty column and messages") {
    auto o = outcome("Hz", SyncStatus::FastForwarded, PullState::Yes);
    o.dirty_before = true;
    o.dirty_after = true;
    o.stash = StashOutcome::Conflicts;
    o.messages = {"Stashed local changes", "Stash pop reported conflicts; resolve manually"};
    std::string table = render_summary_table({o}, make_report_colors(false), true);
    REQUIRE(table.find("Yes") != std::string::npos);
    REQUIRE(table.find("Fast-forwarded (Stash conflicts)") != std::string::npos);
    REQUIRE(table.find("Hz: Stash pop reported conflicts; resolve manually") !=
            std::string::npos);
    REQUIRE(render_summary_table({}, make_report_colors(false)).empty());
}

TEST_CASE("Footer counts repositories and failures") {
    RunResult r;
    r.elapsed = std::chrono::milliseconds(1500);
    r.outcomes.push_back(outcome("a", SyncStatus::AlreadyUpToDate));
    REQUIRE(render_footer(r, make_report_colors(false)) == "1 repository processed in 1.50s");
    r.outcomes.push_back(outcome("b", SyncStatus::PullFailed));
    r.outcomes.push_back(outcome("c", SyncStatus::Cancelled, PullState::Skipped));
    REQUIRE(render_footer(r, make_report_colors(false)) ==
            "3 repositories processed in 1.50s, 1 failed (cancelled)");
}

TEST_CASE("Exit code reflects the run") {
    RunResult r;
    REQUIRE(cli::exit_code_for(r) == 0);
    r.outcomes.push_back(outcome("a", SyncStatus::DirtySkipped, PullState::Skipped));
    REQUIRE(cli::exit_code_for(r) == 0);
    r.outcomes.push_back(outcome("b", SyncStatus::NoRemoteBranch));
    REQUIRE(cli::exit_code_for(r) == 3);
    r.outcomes.push_back(outcome("c", SyncStatus::Cancelled, PullState::Skipped));
    REQUIRE(cli::exit_code_for(r) == 130);
}

TEST_CASE("JSON export of an outcome") {
    auto o = outcome("api", SyncStatus::Rebased, PullState::Yes);
    o.ahead = 1;
    o.messages = {"Stashed local changes", "Stash restored"};
    o.stash = StashOutcome::Restored;
    o.dirty_before = true;
    o.dirty_after = false;
    json j = outcome_to_json(o);
    REQUIRE(j["name"] == "api");
    REQUIRE(j["status"] == "rebased");
    REQUIRE(j["label"] == "Rebased (Stash restored)");
    REQUIRE(j["pulled"] == "Yes");
    REQUIRE(j["dirty_before"] == true);
    REQUIRE(j["dirty_after"] == false);
    REQUIRE(j["ahead"] == 1);
    REQUIRE(j["stash"] == "restored");
    REQUIRE(j["remote_branch"] == "origin/main");
    REQUIRE(j["messages"].size() == 2);

    SyncOutcome bare;
    bare.name = "x";
    json jb = outcome_to_json(bare);
    REQUIRE(jb["dirty_after"].is_null());
    REQUIRE_FALSE(jb.contains("remote_branch"));
}

TEST_CASE("JSON report file keeps scan order") {
    RunResult r;
    r.root = "/srv/repos";
    r.elapsed = std::chrono::milliseconds(42);
    r.outcomes.push_back(outcome("zeta", SyncStatus::AlreadyUpToDate));
    r.outcomes.push_back(outcome("alpha", SyncStatus::FetchFailed));
    fs::path file = fs::temp_directory_path() / "ur_report.json";
    std::string err;
    REQUIRE(write_json_report(r, file, err));
    std::ifstream ifs(file);
    json j;
    ifs >> j;
    REQUIRE(j["version"] == UPDATE_REPOS_VERSION);
    REQUIRE(j["root"] == "/srv/repos");
    REQUIRE(j["elapsed_ms"] == 42);
    REQUIRE(j["failures"] == 1);
    REQUIRE(j["cancelled"] == false);
    REQUIRE(j["repositories"][0]["name"] == "zeta");
    REQUIRE(j["repositories"][1]["name"] == "alpha");
    FS_REMOVE(file);

    REQUIRE_FALSE(write_json_report(r, "/nonexistent/dir/report.json", err));
    REQUIRE(err.find("Unable to open") != std::string::npos);
}

TEST_CASE("JSON report replaces bytes that are not UTF-8") {
    RunResult r;
    r.root = "/srv/caf\xe9";
    auto o = outcome("caf\xe9", SyncStatus::PullFailed);
    o.messages = {"CONFLICT (content): Merge conflict in r\xe9sum\xe9.txt"};
    r.outcomes.push_back(o);

    REQUIRE_NOTHROW(dump_json(run_result_to_json(r)));
    fs::path file = fs::temp_directory_path() / "ur_report_latin1.json";
    std::string err;
    REQUIRE(write_json_report(r, file, err));
    REQUIRE(err.empty());
    std::ifstream ifs(file);
    json j;
    ifs >> j;
    REQUIRE(j["root"] == "/srv/caf\xEF\xBF\xBD");
    REQUIRE(j["repositories"][0]["name"] == "caf\xEF\xBF\xBD");
    std::string msg = j["repositories"][0]["messages"][0];
    REQUIRE(msg.find("r\xEF\xBF\xBDsum\xEF\xBF\xBD.txt") != std::string::npos);
    FS_REMOVE(file);
}

TEST_CASE("JSON export names the configured remote") {
    auto o = outcome("api", SyncStatus::NoOrigin);
    o.has_remote = false;
    o.remote = "upstream";
    json j = outcome_to_json(o);
    REQUIRE(j["remote"] == "upstream");
    REQUIRE(j["label"] == "No upstream remote");
}
