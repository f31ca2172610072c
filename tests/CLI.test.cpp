#include <LegisSim/CLI.h>
#include <optional>
#include <string>
#include <vector>

#include "testing.h"

using namespace LEGIS;
using namespace std;

// Records the *verbs* LEGIS::run() calls:
// - parse(a configuration file, a verbosity level)
// - override_with(optional reps, optional seed, optional output file)
// - simulate / write / report(a verbosity level)
struct MockDriver {
    vector<string> calls;
    optional<size_t> reps, seed;
    optional<string> output;

    void parse(const string &config_file, const size_t verbosity = 0) {
        calls.push_back("parse(" + config_file + ", " + to_string(verbosity) + ")");
    }
    void override_with(const optional<size_t> &r, const optional<size_t> &s, const optional<string> &o) {
        reps = r; seed = s; output = o;
    }
    void simulate(const size_t) { calls.push_back("simulate"); }
    void write(const size_t) { calls.push_back("write"); }
    void report(const size_t) { calls.push_back("report"); }
};

void series_help() {
    cerr << "Should print usage message:" << endl;
    const char* hargs[] = {"./CLI.test", "-h"};
    IS_TRUE(parse_args(2, hargs).config_file.empty());
    const char* lhargs[] = {"./CLI.test", "config.json", "-a", "--help"};
    IS_TRUE(parse_args(4, lhargs).config_file.empty());
}

void series_steps() {
    const char* dargs[] = {"./CLI.test", "config.json"};
    CLIArgs args = parse_args(2, dargs);
    IS_TRUE(args.config_file == "config.json");
    IS_TRUE((args.steps == vector<STEP>{ SIMULATE, WRITE }));
    IS_TRUE(args.verbose == 0);
    IS_TRUE(not args.reps.has_value() and not args.seed.has_value() and not args.output_file.has_value());

    const char* aargs[] = {"./CLI.test", "config.json", "-a"};
    args = parse_args(3, aargs);
    IS_TRUE((args.steps == vector<STEP>{ SIMULATE, WRITE, REPORT }));

    const char* rargs[] = {"./CLI.test", "config.json", "--simulate", "-r"};
    args = parse_args(4, rargs);
    IS_TRUE((args.steps == vector<STEP>{ SIMULATE, REPORT }));

    const char* wargs[] = {"./CLI.test", "config.json", "-s", "-w", "-w"};
    cerr << "Should warn about a repeated -w:" << endl;
    args = parse_args(5, wargs);
    IS_TRUE((args.steps == vector<STEP>{ SIMULATE, WRITE }));
}

void series_overrides() {
    const char* oargs[] = {"./CLI.test", "config.json", "-n", "250", "--seed", "0", "-o", "out/x.csv", "-v", "--verbose"};
    const CLIArgs args = parse_args(10, oargs);
    IS_TRUE(args.reps.value() == 250);
    IS_TRUE(args.seed.value() == 0);
    IS_TRUE(args.output_file.value() == "out/x.csv");
    IS_TRUE(args.verbose == 2);

    MockDriver driver;
    run(&driver, args);
    IS_TRUE(driver.calls.size() == 3);
    IS_TRUE(driver.calls[0] == "parse(config.json, 2)");
    IS_TRUE(driver.calls[1] == "simulate");
    IS_TRUE(driver.calls[2] == "write");
    IS_TRUE(driver.reps.value() == 250 and driver.seed.value() == 0 and driver.output.value() == "out/x.csv");
}

void series_run_all() {
    const char* aargs[] = {"./CLI.test", "config.json", "-a"};
    MockDriver driver;
    run(&driver, parse_args(3, aargs));
    IS_TRUE((driver.calls == vector<string>{ "parse(config.json, 0)", "simulate", "write", "report" }));
    IS_TRUE(not driver.reps.has_value());
}

int main() {
    series_help();
    series_steps();
    series_overrides();
    series_run_all();
    return test_status();
}
