#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <LegisSim/Sweep.h>
#include <LegisSim/Session.h>
#include <LegisSim/OutcomeTable.h>
#include <LegisSim/LegisLog.h>
#include <LegisSim/Errors.h>
#include "testing.h"

using namespace LEGIS;
using namespace std;

SweepSpec small_sweep() {
    SweepSpec spec;
    spec.base.chamber_size = 11;
    spec.base.majority_size = 6;
    spec.reps = 3;
    spec.seed = 4;
    spec.parameter = SWEEP_DISTANCE;
    spec.values = { 0.5, 1.0 };
    spec.output_filename = (filesystem::temp_directory_path() / "legissim_sweep_test" / "sweep.csv").string();
    return spec;
}

void series_simulate() {
    SweepDriver driver;
    THROWS(driver.simulate(), std::logic_error);

    driver.set_spec(small_sweep());
    THROWS(driver.write(), std::logic_error);
    THROWS(driver.report(), std::logic_error);

    driver.simulate();
    const Mat2D &table = driver.get_table();
    IS_TRUE(driver.has_results());
    IS_TRUE(table.rows() == 6 and table.cols() == NUM_COLUMNS);

    // grid order, then repetition order; repetition r of every value is seeded with seed + r
    const SweepSpec &spec = driver.get_spec();
    for (size_t i = 0; i < spec.size(); ++i) {
        for (size_t r = 0; r < spec.reps; ++r) {
            const size_t row = i * spec.reps + r;
            IS_TRUE(table(row, DISTANCE) == spec.values[i]);
            const Outcome out = run_repetition(spec.at(i), spec.seed, r);
            IS_TRUE(table(row, NUM_VOTES) == out.votes);
            IS_TRUE(table(row, INITIAL_VALUE) == out.initial_value);
            IS_TRUE(table(row, FINAL_VALUE) == out.final_value);
        }
    }
}

void series_overrides() {
    SweepDriver driver;
    driver.set_spec(small_sweep());
    driver.override_with(5, 100, nullopt);
    IS_TRUE(driver.get_spec().reps == 5);
    IS_TRUE(driver.get_spec().seed == 100);
    IS_TRUE(driver.get_spec().output_filename == small_sweep().output_filename);
    THROWS(driver.override_with(0, nullopt, nullopt), ConfigError);

    driver.simulate();
    IS_TRUE(driver.get_table().rows() == 10);
    IS_TRUE(driver.get_table()(0, NUM_VOTES) == run_repetition(driver.get_spec().at(0), 100, 0).votes);
}

void series_write_and_report() {
    SweepDriver driver;
    driver.set_spec(small_sweep());
    driver.simulate();

    const filesystem::path out = driver.get_spec().output_filename;
    filesystem::remove_all(out.parent_path());
    driver.write();
    IS_TRUE(filesystem::exists(out));

    ifstream ifs(out);
    size_t lines = 0;
    string line;
    while (getline(ifs, line)) { ++lines; }
    IS_TRUE(lines == 7);
    filesystem::remove_all(out.parent_path());

    ostringstream report;
    driver.report(0, report);
    IS_TRUE(report.str().find("Sweep over distance: 2 values x 3 repetitions") != string::npos);
    IS_TRUE(report.str().find("Number of Votes ~ Distance between Medians") != string::npos);
    IS_TRUE(LegisLog::swept_column(SWEEP_SIGMA) == MAJORITY_SIGMA);
    IS_TRUE(LegisLog::swept_column(SWEEP_PARTY_SIZE) == MAJORITY_SIZE);
}

void series_single_configuration() {
    SweepSpec spec = small_sweep();
    spec.parameter = NO_SWEEP;
    spec.values.clear();

    SweepDriver driver;
    driver.set_spec(spec);
    driver.simulate();
    IS_TRUE(driver.get_table().rows() == 3);
    IS_TRUE(driver.get_table()(0, DISTANCE) == 1.0);

    ostringstream report;
    driver.report(0, report);
    IS_TRUE(report.str().find("Simulation summary: 3 repetitions") != string::npos);
    IS_TRUE(report.str().find("Linear fit") == string::npos);
}

void series_divergent_sweep() {
    SweepSpec spec = small_sweep();
    spec.base.majority.error = 0.0;
    spec.base.majority.adj = 0.0;
    spec.base.minority.error = 0.0;
    spec.base.minority.adj = 0.0;
    spec.base.max_rounds = 20;

    SweepDriver strict;
    strict.set_spec(spec);
    THROWS(strict.simulate(), DivergenceError);

    spec.keep_going = true;
    SweepDriver lenient;
    lenient.set_spec(spec);
    lenient.simulate();
    IS_TRUE(lenient.get_table().rows() == 6);
    IS_TRUE(std::isnan(lenient.get_table()(0, FINAL_VALUE)));
    IS_TRUE(lenient.get_table()(0, NUM_VOTES) == 20);

    SweepSpec invalid = small_sweep();
    invalid.reps = 0;
    SweepDriver rejected;
    THROWS(rejected.set_spec(invalid), ConfigError);
}

int main() {
    series_simulate();
    series_overrides();
    series_write_and_report();
    series_single_configuration();
    series_divergent_sweep();
    return test_status();
}
