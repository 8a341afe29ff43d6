/**
 * @file text_table.cpp
 * @brief Implementation of the text observation table.
 */

#include "text_table.hpp"
#include "column_contract.hpp"
#include "string_utils.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <vector>

namespace fmet
{
namespace
{

constexpr char kSeparator = ',';

/**
 * @brief Parses one cell; empty cells and NaN spellings are missing values.
 */
bool parse_cell(const std::string& text, double& out)
{
    if (text.empty())
    {
        out = std::nan("");
        return true;
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE)
    {
        return false;
    }
    out = value;
    return true;
}

void write_cell(std::ostream& os, double value, int precision)
{
    if (std::isnan(value))
    {
        os << "NaN";
        return;
    }
    os << std::fixed << std::setprecision(precision) << value;
}

} // namespace

void format_text_table(const ObservationTable& table, std::ostream& os)
{
    const auto& columns = observation_column_contracts();

    for (std::size_t c = 0; c < columns.size(); ++c)
    {
        if (c > 0)
        {
            os << kSeparator;
        }
        os << columns[c].id;
    }
    os << '\n';

    for (const AggregatedRow& row : table.rows)
    {
        for (std::size_t c = 0; c < columns.size(); ++c)
        {
            if (c > 0)
            {
                os << kSeparator;
            }
            if (columns[c].id == "obs")
            {
                os << row.obs;
                continue;
            }
            write_cell(os, column_value(row, columns[c]), columns[c].text_precision);
        }
        os << '\n';
    }
}

void write_text_table(const ObservationTable& table, const std::filesystem::path& path)
{
    std::ofstream out(path);
    if (!out)
    {
        throw std::runtime_error("Failed to open text output for writing: " + path.string());
    }
    format_text_table(table, out);
    out.flush();
    if (!out.good())
    {
        throw std::runtime_error("Failed to write text output: " + path.string());
    }
}

ObservationTable parse_text_table(std::istream& in)
{
    std::string line;
    if (!std::getline(in, line))
    {
        throw std::runtime_error("Text table has no header row");
    }
    if (!line.empty() && line.back() == '\r')
    {
        line.pop_back();
    }

    std::vector<const ColumnContract*> header;
    for (const std::string& name : strutil::split_trimmed(line, kSeparator))
    {
        header.push_back(find_column_contract(name));
    }

    ObservationTable table;
    std::size_t line_number = 1;
    while (std::getline(in, line))
    {
        ++line_number;
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (strutil::trim_copy(line).empty())
        {
            continue;
        }

        const std::vector<std::string> cells = strutil::split_trimmed(line, kSeparator);
        if (cells.size() != header.size())
        {
            throw std::runtime_error("Text table line " + std::to_string(line_number) + " has " +
                                     std::to_string(cells.size()) + " cells, expected " +
                                     std::to_string(header.size()));
        }

        AggregatedRow row;
        for (std::size_t c = 0; c < cells.size(); ++c)
        {
            if (!header[c])
            {
                continue;
            }
            double value = 0.0;
            if (!parse_cell(cells[c], value))
            {
                throw std::runtime_error("Text table line " + std::to_string(line_number) +
                                         ": invalid value '" + cells[c] + "' in column " + header[c]->id);
            }
            try
            {
                set_column_value(row, *header[c], value);
            }
            catch (const std::runtime_error& e)
            {
                throw std::runtime_error("Text table line " + std::to_string(line_number) + ": " + e.what());
            }
        }
        table.rows.push_back(row);
    }
    return table;
}

ObservationTable read_text_table(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw std::runtime_error("Failed to open text table: " + path.string());
    }
    return parse_text_table(in);
}

} // namespace fmet
