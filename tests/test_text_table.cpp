#include "text_table.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace fmet;

namespace
{

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[text-table] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

ObservationTable sample_table()
{
    ObservationTable table;
    AggregatedRow a;
    a.obs = 1;
    a.time_s = 1646870382;
    a.latitude_deg = 47.1234567;
    a.longitude_deg = 8.5;
    a.altitude_m = 500.123;
    a.air_temperature_c = 22.0;
    a.relative_humidity_pct = 60.0;
    a.air_pressure = 1013.25;
    table.rows.push_back(a);

    AggregatedRow b;
    b.obs = 2;
    b.time_s = 1646870383;
    b.latitude_deg = -33.5;
    b.longitude_deg = -70.25;
    b.altitude_m = 12.0;
    b.dew_point_c = -1.5;
    table.rows.push_back(b);
    return table;
}

int test_exact_layout()
{
    int failures = 0;
    std::ostringstream oss;
    format_text_table(sample_table(), oss);

    std::istringstream lines(oss.str());
    std::string header;
    std::string row1;
    std::string row2;
    std::getline(lines, header);
    std::getline(lines, row1);
    std::getline(lines, row2);

    failures += expect_true(
        header == "obs,lat,lon,altitude,time,air_temp,dew_point,rel_hum,air_press,gpt,gpt_height,wind_speed,wind_dir",
        "header row: " + header);
    failures += expect_true(
        row1 == "1,47.1234567,8.5000000,500.12,1646870382.00,22.000000,NaN,60.000000,1013.250000,NaN,NaN,NaN,NaN",
        "first row: " + row1);
    failures += expect_true(
        row2 == "2,-33.5000000,-70.2500000,12.00,1646870383.00,NaN,-1.500000,NaN,NaN,NaN,NaN,NaN,NaN",
        "second row: " + row2);
    return failures;
}

int test_round_trip_keeps_keys()
{
    int failures = 0;
    const ObservationTable original = sample_table();

    const std::filesystem::path path = std::filesystem::temp_directory_path() / "flightmet_text_table_test.txt";
    write_text_table(original, path);
    const ObservationTable back = read_text_table(path);
    std::error_code ec;
    std::filesystem::remove(path, ec);

    failures += expect_true(back.size() == original.size(), "row count preserved");
    failures += expect_true(back.is_valid(), "read table is ordered");
    for (std::size_t i = 0; i < back.size() && i < original.size(); ++i)
    {
        failures += expect_true(back.rows[i].obs == original.rows[i].obs, "obs preserved");
        failures += expect_true(back.rows[i].time_s == original.rows[i].time_s, "time bucket preserved");
    }
    if (back.size() == 2)
    {
        failures += expect_true(std::abs(back.rows[0].latitude_deg - 47.1234567) < 1.0e-9, "latitude precision");
        failures += expect_true(std::isnan(back.rows[0].dew_point_c), "NaN token read as NaN");
        failures += expect_true(std::isnan(back.rows[1].wind_speed), "placeholder read as NaN");
    }
    return failures;
}

int test_malformed_input()
{
    int failures = 0;

    auto throws = [](const std::string& text) {
        std::istringstream in(text);
        try
        {
            (void)parse_text_table(in);
        }
        catch (const std::runtime_error&)
        {
            return true;
        }
        return false;
    };

    failures += expect_true(throws(""), "empty input must throw");
    failures += expect_true(throws("obs,time\n1,10,3\n"), "cell count mismatch must throw");
    failures += expect_true(throws("obs,time,lat\n1,10,north\n"), "non-numeric value must throw");
    failures += expect_true(throws("obs,time\n1e20,10\n"), "obs beyond int range must throw");
    failures += expect_true(throws("obs,time\n1,-1e30\n"), "time beyond key range must throw");

    std::istringstream partial("time,obs,extra\r\n10.00,1,abc\r\n\r\n11.00,2,x\r\n");
    const ObservationTable table = parse_text_table(partial);
    failures += expect_true(table.size() == 2, "blank lines skipped, CRLF accepted");
    failures += expect_true(table.size() == 2 && table.rows[1].time_s == 11 && table.rows[1].obs == 2,
                            "columns matched by header name");
    failures += expect_true(table.size() == 2 && std::isnan(table.rows[0].latitude_deg),
                            "absent columns stay NaN");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_exact_layout();
    failures += test_round_trip_keeps_keys();
    failures += test_malformed_input();

    if (failures > 0)
    {
        std::cerr << "[text-table] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[text-table] all checks passed" << std::endl;
    return 0;
}
