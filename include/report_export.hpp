#ifndef REPORT_EXPORT_HPP
#define REPORT_EXPORT_HPP

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "repo.hpp"

struct RunResult;

/** @return JSON object describing one repository outcome. */
nlohmann::json outcome_to_json(const SyncOutcome& outcome);

/**
 * @brief Serialize a finished run.
 *
 * Layout: `{version, root, elapsed_ms, failures, cancelled, repositories: [...]}`
 * with repositories in scan order.
 */
nlohmann::json run_result_to_json(const RunResult& result);

/**
 * @brief Render @p j as text.
 *
 * Bytes that are not valid UTF-8, such as Latin-1 directory names or file
 * names quoted by git, are replaced with U+FFFD instead of failing.
 *
 * @param indent Pretty-print indentation, or -1 for a compact document.
 */
std::string dump_json(const nlohmann::json& j, int indent = -1);

/**
 * @brief Write the run as pretty-printed JSON to @p path.
 *
 * @param error Receives a description on failure.
 * @return `true` when the file was written. Never throws.
 */
bool write_json_report(const RunResult& result, const std::filesystem::path& path,
                       std::string& error);

#endif // REPORT_EXPORT_HPP
