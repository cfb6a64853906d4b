#ifndef RETRY_POLICY_HPP
#define RETRY_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <functional>
#include <thread>

/**
 * @brief Bounded retry schedule with exponential backoff.
 *
 * Attempt 1 runs immediately; attempt @c n (n >= 2) waits
 * `initial_backoff * multiplier^(n-2)`, capped at @c max_backoff.
 */
struct RetryPolicy {
    unsigned int max_attempts = 1;
    std::chrono::milliseconds initial_backoff{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds max_backoff{30000};

    /** @return Delay to wait before @p attempt (1-based). */
    std::chrono::milliseconds delay_before(unsigned int attempt) const {
        if (attempt <= 1)
            return std::chrono::milliseconds(0);
        double ms = static_cast<double>(initial_backoff.count());
        for (unsigned int i = 2; i < attempt; ++i)
            ms *= multiplier;
        ms = std::min(ms, static_cast<double>(max_backoff.count()));
        return std::chrono::milliseconds(static_cast<long long>(ms));
    }
};

template <typename T> struct RetryResult {
    T value;
    unsigned int attempts = 0;
};

using RetrySleep = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Run @p fn until @p succeeded accepts its result or attempts run out.
 *
 * @param policy    Attempt limit and backoff schedule.
 * @param fn        Operation returning a value of type T.
 * @param succeeded Predicate deciding whether a result ends the loop.
 * @param sleep     Wait function, replaceable in tests.
 * @return Last result produced and the number of attempts made.
 */
template <typename Fn, typename Pred>
auto run_with_retry(const RetryPolicy& policy, Fn&& fn, Pred&& succeeded,
                    const RetrySleep& sleep = {}) -> RetryResult<decltype(fn())> {
    RetryResult<decltype(fn())> result{fn(), 1};
    const unsigned int limit = std::max(1u, policy.max_attempts);
    while (!succeeded(result.value) && result.attempts < limit) {
        ++result.attempts;
        auto delay = policy.delay_before(result.attempts);
        if (sleep)
            sleep(delay);
        else
            std::this_thread::sleep_for(delay);
        result.value = fn();
    }
    return result;
}

#endif // RETRY_POLICY_HPP
