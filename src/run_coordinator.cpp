#include "run_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>

#include "logger.hpp"
#include "scanner.hpp"
#include "sync_orchestrator.hpp"

namespace fs = std::filesystem;

size_t RunResult::failures() const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                             [](const SyncOutcome& o) { return is_failure(o.status); }));
}

bool RunResult::cancelled() const {
    return std::any_of(outcomes.begin(), outcomes.end(),
                       [](const SyncOutcome& o) { return o.status == SyncStatus::Cancelled; });
}

void validate_root(const fs::path& root) {
    std::error_code ec;
    if (root.empty() || !fs::exists(root, ec))
        throw RootPathError("Root path does not exist: " + root.string());
    if (!fs::is_directory(root, ec))
        throw RootPathError("Root path is not a directory: " + root.string());
}

static SyncOutcome cancelled_outcome(const Repository& repo) {
    SyncOutcome out;
    out.name = repo.name;
    out.path = repo.path;
    out.status = SyncStatus::Cancelled;
    out.pulled = PullState::Skipped;
    return out;
}

RunResult run_sync(const RunOptions& options, git::VcsGateway& gateway,
                   const ProgressCallback& on_progress, std::atomic<bool>& running,
                   const RetrySleep& sleep) {
    validate_root(options.root);
    const auto start = std::chrono::steady_clock::now();
    RunResult result;
    result.root = options.root;

    std::vector<Repository> repos;
    for (auto& repo : scan_repositories(options.root, options.prefix, options.exclude, gateway)) {
        if (is_excluded(options, repo.name)) {
            log_debug("Excluded by repository settings: " + repo.name);
            continue;
        }
        repos.push_back(std::move(repo));
    }
    const size_t total = repos.size();
    log_info("Synchronizing " + std::to_string(total) + " repositories",
             {{"root", options.root.string()}});

    result.outcomes.resize(total);
    std::vector<char> ready(total, 0);
    size_t next_emit = 0;
    std::mutex mtx;
    std::exception_ptr first_error;

    std::atomic<size_t> next_index{0};
    auto worker = [&]() {
        try {
            while (true) {
                size_t idx = next_index.fetch_add(1);
                if (idx >= total)
                    break;
                Repository& repo = repos[idx];
                SyncOutcome outcome;
                if (running) {
                    outcome = sync_repository(repo, effective_settings(options, repo.name),
                                              gateway, sleep);
                } else {
                    outcome = cancelled_outcome(repo);
                }
                std::lock_guard<std::mutex> lk(mtx);
                result.outcomes[idx] = std::move(outcome);
                ready[idx] = 1;
                while (next_emit < total && ready[next_emit]) {
                    if (on_progress)
                        on_progress(next_emit + 1, total, result.outcomes[next_emit]);
                    ++next_emit;
                }
            }
        } catch (...) {
            std::lock_guard<std::mutex> lk(mtx);
            if (!first_error)
                first_error = std::current_exception();
            running = false;
        }
    };

    size_t concurrency = std::max<size_t>(1, std::min(options.concurrency, total));
    if (concurrency <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(concurrency);
        for (size_t i = 0; i < concurrency; ++i)
            threads.emplace_back(worker);
        for (auto& t : threads) {
            if (t.joinable())
                t.join();
        }
    }
    if (first_error)
        std::rethrow_exception(first_error);

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    log_info("Run complete", {{"repositories", std::to_string(total)},
                              {"failures", std::to_string(result.failures())},
                              {"elapsed_ms", std::to_string(result.elapsed.count())}});
    return result;
}
