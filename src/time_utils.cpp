#include "time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

static std::tm local_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

std::string timestamp() {
    std::tm tm = local_now();
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string compact_timestamp() {
    std::tm tm = local_now();
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm);
    return std::string(buf);
}

std::string format_elapsed(std::chrono::milliseconds dur) {
    long long total_ms = dur.count() < 0 ? 0 : dur.count();
    long long minutes = total_ms / 60000;
    long long rem_ms = total_ms % 60000;
    char buf[32];
    if (minutes > 0)
        std::snprintf(buf, sizeof(buf), "%lldm%lld.%02llds", minutes, rem_ms / 1000,
                      (rem_ms % 1000) / 10);
    else
        std::snprintf(buf, sizeof(buf), "%lld.%02llds", rem_ms / 1000, (rem_ms % 1000) / 10);
    return std::string(buf);
}
