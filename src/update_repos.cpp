/**
 * @file update_repos.cpp
 * @brief CLI entry point synchronizing every git repository under a root.
 *
 * Parses options, then runs one fetch/pull pass over the repositories found
 * directly below the root directory.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "run_coordinator.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @param argc Number of command-line arguments.
 * @param argv Array of command-line argument strings.
 * @return int `0` on success or when printing help/version, `1` for an
 *             invalid root or unexpected error, `2` for invalid arguments,
 *             `3` when any repository failed and `130` when interrupted.
 */
#ifndef UPDATE_REPOS_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    LoggerGuard logger_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argc > 0 ? argv[0] : "update-repos");
            return cli::EXIT_OK;
        }
        if (opts.show_version) {
            std::cout << UPDATE_REPOS_VERSION << "\n";
            return cli::EXIT_OK;
        }
        return cli::handle_sync_run(opts);
    } catch (const OptionsError& e) {
        std::cerr << e.what() << "\n";
        std::cerr << "Run with --help for usage.\n";
        return cli::EXIT_OPTIONS_ERROR;
    } catch (const RootPathError& e) {
        std::cerr << e.what() << "\n";
        return cli::EXIT_ROOT_ERROR;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
#endif // UPDATE_REPOS_NO_MAIN
