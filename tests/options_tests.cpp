#include "test_common.hpp"
#include "help_text.hpp"

TEST_CASE("parse_options defaults") {
    const char* argv[] = {"prog"};
    Options opts = parse_options(1, const_cast<char**>(argv));
    REQUIRE(opts.run.root == fs::path("."));
    REQUIRE_FALSE(opts.run.sync.no_pull);
    REQUIRE_FALSE(opts.run.sync.skip_dirty);
    REQUIRE_FALSE(opts.run.sync.stash_dirty);
    REQUIRE_FALSE(opts.run.sync.use_rebase);
    REQUIRE_FALSE(opts.run.sync.fetch_all_remotes);
    REQUIRE(opts.run.sync.remote == "origin");
    REQUIRE(opts.run.concurrency == 1);
    REQUIRE(opts.run.command_timeout == std::chrono::seconds(300));
    REQUIRE(opts.run.sync.fetch_retry.max_attempts == 1);
    REQUIRE_FALSE(opts.run.verbose);
    REQUIRE(opts.logging.log_level == LogLevel::INFO);
}

TEST_CASE("parse_options positional root and flags") {
    const char* argv[] = {"prog", "/srv/repos", "--no-pull", "--use-rebase", "-v"};
    Options opts = parse_options(5, const_cast<char**>(argv));
    REQUIRE(opts.run.root == fs::path("/srv/repos"));
    REQUIRE(opts.run.sync.no_pull);
    REQUIRE(opts.run.sync.use_rebase);
    REQUIRE(opts.run.verbose);
}

TEST_CASE("parse_options root flag") {
    const char* argv[] = {"prog", "--root", "/srv/repos", "--skip-dirty"};
    Options opts = parse_options(4, const_cast<char**>(argv));
    REQUIRE(opts.run.root == fs::path("/srv/repos"));
    REQUIRE(opts.run.sync.skip_dirty);
}

TEST_CASE("parse_options root given twice") {
    const char* argv[] = {"prog", "/a", "--root", "/b"};
    REQUIRE_THROWS_AS(parse_options(4, const_cast<char**>(argv)), OptionsError);
    const char* argv2[] = {"prog", "/a", "/b"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv2)), OptionsError);
}

TEST_CASE("parse_options long aliases") {
    const char* argv[] = {"prog", "--fetch-all-remotes", "--verbose-branches"};
    Options opts = parse_options(3, const_cast<char**>(argv));
    REQUIRE(opts.run.sync.fetch_all_remotes);
    REQUIRE(opts.run.verbose);
}

TEST_CASE("parse_options short flags") {
    const char* argv[] = {"prog", "-nSa", "-c", "4"};
    Options opts = parse_options(4, const_cast<char**>(argv));
    REQUIRE(opts.run.sync.no_pull);
    REQUIRE(opts.run.sync.stash_dirty);
    REQUIRE(opts.run.sync.fetch_all_remotes);
    REQUIRE(opts.run.concurrency == 4);
}

TEST_CASE("parse_options rejects unknown flags and lists them") {
    const char* argv[] = {"prog", "--bogus", "--nope"};
    try {
        parse_options(3, const_cast<char**>(argv));
        FAIL("expected OptionsError");
    } catch (const OptionsError& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("--bogus") != std::string::npos);
        REQUIRE(msg.find("--nope") != std::string::npos);
    }
}

TEST_CASE("parse_options help and version short-circuit") {
    const char* argv[] = {"prog", "--help", "--concurrency", "0"};
    Options opts = parse_options(4, const_cast<char**>(argv));
    REQUIRE(opts.show_help);
    const char* argv2[] = {"prog", "-V"};
    Options opts2 = parse_options(2, const_cast<char**>(argv2));
    REQUIRE(opts2.show_version);
}

TEST_CASE("parse_options rejects skip-dirty with stash-dirty") {
    const char* argv[] = {"prog", "--skip-dirty", "--stash-dirty"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), OptionsError);
}

TEST_CASE("parse_options range checks") {
    const char* bad_conc[] = {"prog", "--concurrency", "0"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(bad_conc)), OptionsError);
    const char* bad_timeout[] = {"prog", "--timeout", "0"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(bad_timeout)), OptionsError);
    const char* bad_retries[] = {"prog", "--fetch-retries", "11"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(bad_retries)), OptionsError);
    const char* bad_level[] = {"prog", "--log-level", "LOUD"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(bad_level)), OptionsError);
    const char* bad_bool[] = {"prog", "--no-pull=perhaps"};
    REQUIRE_THROWS_AS(parse_options(2, const_cast<char**>(bad_bool)), OptionsError);
}

TEST_CASE("parse_options timing values") {
    const char* argv[] = {"prog", "--timeout", "2m", "--fetch-retries", "2", "--retry-backoff",
                          "250ms"};
    Options opts = parse_options(7, const_cast<char**>(argv));
    REQUIRE(opts.run.command_timeout == std::chrono::seconds(120));
    REQUIRE(opts.run.sync.hook_timeout == std::chrono::seconds(120));
    REQUIRE(opts.run.sync.fetch_retry.max_attempts == 3);
    REQUIRE(opts.run.sync.fetch_retry.initial_backoff == std::chrono::milliseconds(250));
}

TEST_CASE("parse_options exclude lists") {
    const char* argv[] = {"prog", "--exclude", "vendor", "--exclude", "tmp-*, old"};
    Options opts = parse_options(5, const_cast<char**>(argv));
    REQUIRE(opts.run.exclude == std::vector<std::string>{"vendor", "tmp-*", "old"});
}

TEST_CASE("parse_options exclude file") {
    fs::path dir = update_repos::test_support::make_temp_dir("ur_opts_exclude");
    update_repos::test_support::write_file(dir / "ignore.txt", "# comment\nbuild\n\nscratch-*\n");
    std::string file = (dir / "ignore.txt").string();
    const char* argv[] = {"prog", "--exclude-file", file.c_str()};
    Options opts = parse_options(3, const_cast<char**>(argv));
    REQUIRE(opts.run.exclude == std::vector<std::string>{"build", "scratch-*"});
    FS_REMOVE_ALL(dir);

    const char* missing[] = {"prog", "--exclude-file", "/nonexistent/ignore.txt"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(missing)), OptionsError);
}

TEST_CASE("parse_options webhook secret needs url") {
    const char* argv[] = {"prog", "--webhook-secret", "s3cret"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), OptionsError);
}

TEST_CASE("parse_options logging options") {
    const char* argv[] = {"prog",           "--log-file",      "run.log", "--log-level",
                          "debug",          "--max-log-size",  "1MB",     "--max-log-files",
                          "3",              "--compress-logs", "--json-log"};
    Options opts = parse_options(11, const_cast<char**>(argv));
    REQUIRE(opts.logging.log_file == "run.log");
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    REQUIRE(opts.logging.max_log_size == 1024 * 1024);
    REQUIRE(opts.logging.max_log_files == 3);
    REQUIRE(opts.logging.compress_logs);
    REQUIRE(opts.logging.json_log);
}

TEST_CASE("parse_options config file values and command line precedence") {
    fs::path dir = update_repos::test_support::make_temp_dir("ur_opts_cfg");
    fs::path cfg = dir / "cfg.yaml";
    update_repos::test_support::write_file(cfg, "root: /srv/from-config\n"
                                                "concurrency: 6\n"
                                                "fetch-all-remotes: true\n"
                                                "remote: upstream\n");
    std::string cfg_str = cfg.string();
    const char* argv[] = {"prog", "--config-yaml", cfg_str.c_str(), "--remote", "mirror"};
    Options opts = parse_options(5, const_cast<char**>(argv));
    REQUIRE(opts.run.root == fs::path("/srv/from-config"));
    REQUIRE(opts.run.concurrency == 6);
    REQUIRE(opts.run.sync.fetch_all_remotes);
    REQUIRE(opts.run.sync.remote == "mirror");
    REQUIRE(opts.config_file == cfg);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("parse_options rejects unknown config keys") {
    fs::path dir = update_repos::test_support::make_temp_dir("ur_opts_badcfg");
    fs::path cfg = dir / "cfg.json";
    update_repos::test_support::write_file(cfg, "{\"interval\": 5}");
    std::string cfg_str = cfg.string();
    const char* argv[] = {"prog", "--config-json", cfg_str.c_str()};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), OptionsError);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("parse_options missing config file") {
    const char* argv[] = {"prog", "--config-yaml", "/nonexistent/update-repos.yaml"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), OptionsError);
}

TEST_CASE("parse_options auto config in root") {
    fs::path dir = update_repos::test_support::make_temp_dir("ur_opts_auto");
    update_repos::test_support::write_file(dir / ".update-repos.yaml",
                                           "use-rebase: true\n"
                                           "repositories:\n"
                                           "  docs:\n"
                                           "    no-pull: true\n");
    std::string root = dir.string();
    const char* argv[] = {"prog", root.c_str(), "--auto-config"};
    Options opts = parse_options(3, const_cast<char**>(argv));
    REQUIRE(opts.auto_config);
    REQUIRE(opts.run.sync.use_rebase);
    REQUIRE(opts.config_file == dir / ".update-repos.yaml");
    REQUIRE(opts.run.repo_settings.count("docs") == 1);
    REQUIRE(opts.run.repo_settings["docs"].no_pull.value_or(false));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("per-repository settings override the global ones") {
    fs::path dir = update_repos::test_support::make_temp_dir("ur_opts_repo");
    fs::path cfg = dir / "cfg.yaml";
    update_repos::test_support::write_file(cfg, "skip-dirty: true\n"
                                                "repositories:\n"
                                                "  api:\n"
                                                "    stash-dirty: true\n"
                                                "    remote: upstream\n"
                                                "  legacy:\n"
                                                "    exclude: true\n");
    std::string cfg_str = cfg.string();
    const char* argv[] = {"prog", "--config-yaml", cfg_str.c_str()};
    Options opts = parse_options(3, const_cast<char**>(argv));

    SyncSettings api = effective_settings(opts.run, "api");
    REQUIRE(api.stash_dirty);
    REQUIRE_FALSE(api.skip_dirty);
    REQUIRE(api.remote == "upstream");

    SyncSettings other = effective_settings(opts.run, "other");
    REQUIRE(other.skip_dirty);
    REQUIRE(other.remote == "origin");

    REQUIRE(is_excluded(opts.run, "legacy"));
    REQUIRE_FALSE(is_excluded(opts.run, "api"));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("per-repository settings reject unknown keys and conflicts") {
    fs::path dir = update_repos::test_support::make_temp_dir("ur_opts_repo_bad");
    fs::path cfg = dir / "cfg.yaml";
    update_repos::test_support::write_file(cfg, "repositories:\n"
                                                "  api:\n"
                                                "    interval: 5\n");
    std::string cfg_str = cfg.string();
    const char* argv[] = {"prog", "--config-yaml", cfg_str.c_str()};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), OptionsError);

    update_repos::test_support::write_file(cfg, "repositories:\n"
                                                "  api:\n"
                                                "    skip-dirty: true\n"
                                                "    stash-dirty: true\n");
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), OptionsError);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("help text lists every option") {
    std::string text = help_text("update-repos");
    for (const auto& o : option_table())
        REQUIRE(text.find(o.long_flag) != std::string::npos);
    REQUIRE(text.find("Exit codes") != std::string::npos);
}
