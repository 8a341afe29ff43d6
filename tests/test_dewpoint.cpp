#include "thermo/dewpoint.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fmet;

namespace
{

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[dewpoint] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-9)
{
    if (!(std::abs(actual - expected) <= tol))
    {
        std::cerr << "[dewpoint] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

int test_reference_values()
{
    int failures = 0;
    failures += expect_close(thermo::dewpoint_magnus(20.0, 50.0), 9.26, "dewpoint(20, 50)", 0.05);
    failures += expect_close(thermo::dewpoint_magnus(22.0, 60.0), 13.875, "dewpoint(22, 60)", 0.01);
    failures += expect_close(thermo::dewpoint_magnus(-10.0, 80.0), -12.797, "dewpoint(-10, 80)", 0.01);

    for (const double tc : {-30.0, 0.0, 15.5, 35.0})
    {
        failures += expect_close(thermo::dewpoint_magnus(tc, 100.0), tc,
                                 "saturated air dew point equals temperature at " + std::to_string(tc));
    }

    failures += expect_true(thermo::dewpoint_magnus(25.0, 30.0) < thermo::dewpoint_magnus(25.0, 70.0),
                            "dew point increases with humidity");
    return failures;
}

int test_humidity_clamp_and_nan()
{
    int failures = 0;
    failures += expect_close(thermo::dewpoint_magnus(20.0, 0.0), thermo::dewpoint_magnus(20.0, 0.1),
                             "humidity below 0.1 percent clamps");
    failures += expect_close(thermo::dewpoint_magnus(20.0, -5.0), thermo::dewpoint_magnus(20.0, 0.1),
                             "negative humidity clamps");
    failures += expect_close(thermo::dewpoint_magnus(20.0, 140.0), 20.0, "supersaturated humidity clamps to 100");
    failures += expect_true(std::isfinite(thermo::dewpoint_magnus(20.0, 0.0)), "zero humidity stays finite");

    failures += expect_true(std::isnan(thermo::dewpoint_magnus(20.0, std::nan(""))), "NaN humidity");
    failures += expect_true(std::isnan(thermo::dewpoint_magnus(std::nan(""), 50.0)), "NaN temperature");
    return failures;
}

int test_column_evaluation()
{
    int failures = 0;
    const std::vector<double> t = {20.0, std::nan(""), 22.0};
    const std::vector<double> rh = {50.0, 60.0, 100.0};
    const std::vector<double> td = thermo::dewpoint_column(t, rh);
    failures += expect_true(td.size() == 3, "column length");
    failures += expect_close(td[0], thermo::dewpoint_magnus(20.0, 50.0), "element 0");
    failures += expect_true(std::isnan(td[1]), "element 1 NaN");
    failures += expect_close(td[2], 22.0, "element 2 saturated");

    bool threw = false;
    try
    {
        (void)thermo::dewpoint_column({1.0, 2.0}, {50.0});
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    failures += expect_true(threw, "length mismatch must throw");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_reference_values();
    failures += test_humidity_clamp_and_nan();
    failures += test_column_evaluation();

    if (failures > 0)
    {
        std::cerr << "[dewpoint] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[dewpoint] all checks passed" << std::endl;
    return 0;
}
