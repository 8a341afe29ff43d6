#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "column_contract.hpp"
#include "observation_table.hpp"

/**
 * @file column_validation.hpp
 * @brief Column quality statistics and report serialization.
 *
 * Missing values are expected in observation tables, so the report only
 * counts them; nothing here rejects or rewrites a table.
 */

namespace fmet
{

struct ColumnStats
{
    std::size_t total_count = 0;
    std::size_t finite_count = 0;
    std::size_t nan_count = 0;
    std::size_t inf_count = 0;
    std::size_t below_min_count = 0;
    std::size_t above_max_count = 0;
    double min_value = 0.0;
    double max_value = 0.0;
    double mean_value = 0.0;
    bool has_finite = false;
};

struct ColumnQualityEntry
{
    std::string column_id;
    std::string role;
    ColumnStats stats;
};

struct ColumnQualityReport
{
    std::string context;
    std::size_t row_count = 0;
    bool has_time_span = false;
    std::int64_t first_time_s = 0;
    std::int64_t last_time_s = 0;
    std::vector<ColumnQualityEntry> columns;
};

/**
 * @brief Computes statistics of one column against its contract bounds.
 */
ColumnStats compute_column_stats(const std::vector<double>& values, const ColumnContract& contract);

/**
 * @brief Builds the quality report for every contract column of a table.
 * @param table Observation table.
 * @param context Free-form label, usually the source path.
 */
ColumnQualityReport build_column_quality_report(const ObservationTable& table, const std::string& context);

/**
 * @brief Prints a one-line-per-column summary.
 */
void print_column_quality_summary(const ColumnQualityReport& report, std::ostream& os);

/**
 * @brief Serializes a quality report to JSON.
 */
std::string column_quality_report_to_json(const ColumnQualityReport& report);

/**
 * @brief Writes a quality report to a JSON file.
 */
bool write_column_quality_report_json(const ColumnQualityReport& report,
                                      const std::filesystem::path& path,
                                      std::string& error);

} // namespace fmet
