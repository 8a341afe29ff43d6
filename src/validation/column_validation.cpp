/**
 * @file column_validation.cpp
 * @brief Column statistics and JSON report output.
 */

#include "column_validation.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace fmet {
namespace {

bool has_bounds(const ColumnBounds& bounds) {
    return bounds.has_min || bounds.has_max;
}

/**
 * @brief Writes a double as JSON, mapping non-finite values to null.
 */
void write_json_number(std::ostream& os, double value) {
    if (!std::isfinite(value)) {
        os << "null";
        return;
    }
    os << value;
}

}

/**
 * @brief Accumulates counts and finite moments for one column.
 */
ColumnStats compute_column_stats(const std::vector<double>& values, const ColumnContract& contract) {
    ColumnStats stats;
    stats.total_count = values.size();

    const ColumnBounds& bounds = contract.default_bounds;
    const bool bounds_enabled = has_bounds(bounds);

    std::size_t finite_count = 0;
    std::size_t nan_count = 0;
    std::size_t inf_count = 0;
    std::size_t below_min_count = 0;
    std::size_t above_max_count = 0;
    double finite_sum = 0.0;
    double finite_min = std::numeric_limits<double>::infinity();
    double finite_max = -std::numeric_limits<double>::infinity();

    #pragma omp parallel for reduction(+:finite_count,nan_count,inf_count,below_min_count,above_max_count,finite_sum) reduction(min:finite_min) reduction(max:finite_max)
    for (long long i = 0; i < static_cast<long long>(values.size()); ++i) {
        const double value = values[static_cast<std::size_t>(i)];

        if (!std::isfinite(value)) {
            if (std::isnan(value)) {
                ++nan_count;
            } else {
                ++inf_count;
            }
            continue;
        }

        ++finite_count;
        finite_sum += value;
        finite_min = std::min(finite_min, value);
        finite_max = std::max(finite_max, value);

        if (bounds_enabled) {
            if (bounds.has_min && value < bounds.min_value) {
                ++below_min_count;
            }
            if (bounds.has_max && value > bounds.max_value) {
                ++above_max_count;
            }
        }
    }

    stats.finite_count = finite_count;
    stats.nan_count = nan_count;
    stats.inf_count = inf_count;
    stats.below_min_count = below_min_count;
    stats.above_max_count = above_max_count;

    stats.has_finite = stats.finite_count > 0;
    if (stats.has_finite) {
        stats.min_value = finite_min;
        stats.max_value = finite_max;
        stats.mean_value = finite_sum / static_cast<double>(stats.finite_count);
    }
    return stats;
}

ColumnQualityReport build_column_quality_report(const ObservationTable& table, const std::string& context) {
    ColumnQualityReport report;
    report.context = context;
    report.row_count = table.size();
    if (!table.empty()) {
        report.has_time_span = true;
        report.first_time_s = table.rows.front().time_s;
        report.last_time_s = table.rows.back().time_s;
    }

    for (const auto& contract : observation_column_contracts()) {
        ColumnQualityEntry entry;
        entry.column_id = contract.id;
        entry.role = to_string(contract.role);
        entry.stats = compute_column_stats(extract_column(table, contract), contract);
        report.columns.push_back(entry);
    }
    return report;
}

void print_column_quality_summary(const ColumnQualityReport& report, std::ostream& os) {
    os << "Rows: " << report.row_count << "\n";
    if (report.has_time_span) {
        os << "Time span: " << report.first_time_s << " .. " << report.last_time_s
           << " (" << (report.last_time_s - report.first_time_s) << " s)\n";
    }

    const auto old_flags = os.flags();
    const auto old_precision = os.precision();
    os << std::fixed << std::setprecision(3);
    for (const auto& entry : report.columns) {
        const ColumnStats& s = entry.stats;
        os << "  " << std::left << std::setw(11) << entry.column_id << std::right
           << " valid=" << s.finite_count << "/" << s.total_count
           << " nan=" << s.nan_count;
        if (s.has_finite) {
            os << " min=" << s.min_value << " max=" << s.max_value << " mean=" << s.mean_value;
        }
        const std::size_t out_of_bounds = s.below_min_count + s.above_max_count;
        if (out_of_bounds > 0) {
            os << " out_of_bounds=" << out_of_bounds;
        }
        os << "\n";
    }
    os.flags(old_flags);
    os.precision(old_precision);
}

/**
 * @brief Serializes a quality report to formatted JSON.
 */
std::string column_quality_report_to_json(const ColumnQualityReport& report) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    oss << "{\n";
    oss << "  \"context\": \"" << strutil::json_escape(report.context) << "\",\n";
    oss << "  \"row_count\": " << report.row_count << ",\n";
    if (report.has_time_span) {
        oss << "  \"first_time_s\": " << report.first_time_s << ",\n";
        oss << "  \"last_time_s\": " << report.last_time_s << ",\n";
    } else {
        oss << "  \"first_time_s\": null,\n";
        oss << "  \"last_time_s\": null,\n";
    }

    oss << "  \"columns\": [\n";
    for (std::size_t i = 0; i < report.columns.size(); ++i) {
        const auto& entry = report.columns[i];
        const auto& stats = entry.stats;
        oss << "    {\n";
        oss << "      \"column_id\": \"" << strutil::json_escape(entry.column_id) << "\",\n";
        oss << "      \"role\": \"" << strutil::json_escape(entry.role) << "\",\n";
        oss << "      \"total_count\": " << stats.total_count << ",\n";
        oss << "      \"finite_count\": " << stats.finite_count << ",\n";
        oss << "      \"nan_count\": " << stats.nan_count << ",\n";
        oss << "      \"inf_count\": " << stats.inf_count << ",\n";
        oss << "      \"below_min_count\": " << stats.below_min_count << ",\n";
        oss << "      \"above_max_count\": " << stats.above_max_count << ",\n";
        oss << "      \"min\": ";
        write_json_number(oss, stats.has_finite ? stats.min_value : std::nan(""));
        oss << ",\n      \"max\": ";
        write_json_number(oss, stats.has_finite ? stats.max_value : std::nan(""));
        oss << ",\n      \"mean\": ";
        write_json_number(oss, stats.has_finite ? stats.mean_value : std::nan(""));
        oss << "\n    }";
        if (i + 1 < report.columns.size()) {
            oss << ",";
        }
        oss << "\n";
    }
    oss << "  ]\n";
    oss << "}\n";
    return oss.str();
}

/**
 * @brief Writes a quality report JSON file to disk.
 */
bool write_column_quality_report_json(const ColumnQualityReport& report,
                                      const std::filesystem::path& path,
                                      std::string& error) {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error = "failed to create report directory '" + parent.string() + "': " + ec.message();
            return false;
        }
    }

    std::ofstream out(path);
    if (!out) {
        error = "failed to open report file for writing: " + path.string();
        return false;
    }

    out << column_quality_report_to_json(report);
    if (!out.good()) {
        error = "failed to write report file: " + path.string();
        return false;
    }

    return true;
}

}
