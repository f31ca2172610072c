#ifndef LEGISSIM_CLI_H
#define LEGISSIM_CLI_H

#include <iostream>
#include <vector>
#include <optional>
#include <string>

namespace LEGIS {

// A "usage" function for the LegisSim CLI
// @param cmd the name of the executable
// @param msg an optional message to print before the usage
// @param status if non-zero, will exit with this status
void usage(
    const std::string &cmd,
    const std::string &msg = "",
    const int status = 0
);

// Steps of a sweep
// SIMULATE: run every repetition of every grid value
// WRITE: write the outcome table as CSV
// REPORT: summarize the outcome table (per grid value statistics, regressions on the swept value)
enum STEP { SIMULATE, WRITE, REPORT };

std::ostream& operator<<(std::ostream &os, const STEP &step);

// Container for the parsed command line arguments
// @var config_file the path to the configuration file
// @var steps the `STEP`s to perform
// @var reps, seed, output_file: overrides for the configuration file values
// @var verbose the verbosity level (0 = errors and warnings only, 1 = progress, 2 = every round)
struct CLIArgs {
    CLIArgs() = delete;
    CLIArgs(const std::string & cf) : config_file(cf) {};

    std::string config_file;                  // based on config file ...
    std::vector<STEP> steps = {};             // ... simulate and write, unless told otherwise
    std::optional<size_t> reps;               // ... with the configured repetitions
    std::optional<size_t> seed;               // ... and seed
    std::optional<std::string> output_file;   // ... to the configured output
    size_t verbose = 0;                       // ... quietly
};

// parses the args passed to main()
// @param argc the number of arguments (per typical main() signature)
// @param argv the arguments (per typical main() signature)
// @return for -h / --help, args with an empty `config_file`
CLIArgs parse_args(const size_t argc, const char * argv[]);

// Runs a sweep, for some object that implements the *verbs*:
// - parse(a string [configuration file path], a size_t [verbosity level])
// - override_with(optional reps, optional seed, optional output file)
// - simulate(a verbosity level)
// - write(a verbosity level)
// - report(a verbosity level)
template<typename Driver>
inline void run(
    Driver* driver, const CLIArgs &args
) {

    driver->parse(args.config_file, args.verbose);
    driver->override_with(args.reps, args.seed, args.output_file);

    if (args.verbose > 0) {
        std::cerr << "Running sweep as: " << std::endl;
        for (auto it = args.steps.begin(); it != args.steps.end(); it++) {
            if (it != args.steps.begin()) { std::cerr << " => "; }
            std::cerr << *it;
        }
        std::cerr << std::endl;
    }

    for (auto step : args.steps) {
        switch(step) {
            case SIMULATE: driver->simulate(args.verbose); break;
            case WRITE: driver->write(args.verbose); break;
            case REPORT: driver->report(args.verbose); break;
        }
    }

};

}

#endif // LEGISSIM_CLI_H
