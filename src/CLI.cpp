#include <LegisSim/CLI.h>

#include <cstdlib>
#include <cstring>
#include <algorithm>

using std::cerr;
using std::endl;
using std::string;

namespace LEGIS {

void usage(
    const string &cmd,
    const string &msg,
    const int status
) {
    const string ident = "\t";
    if (not msg.empty()) { cerr << msg << endl; }
    cerr << "Usage: " << cmd << " config.json [-option|--option (each space separated)]" << endl << endl;
    cerr << "Steps (default: -s -w):" << endl;
    cerr << ident << "-(-s)imulate : run every repetition for every value of the configured sweep." << endl;
    cerr << ident << "-(-w)rite    : write the outcome table as CSV; requires -s first." << endl;
    cerr << ident << "-(-r)eport   : print per-value statistics and fits of Number of Votes on the swept value; requires -s first." << endl;
    cerr << ident << "-(-a)ll      : implies -s -w -r." << endl;
    cerr << endl;
    cerr << "Overrides:" << endl;
    cerr << ident << "-n 1234      : number of repetitions per sweep value." << endl;
    cerr << ident << "--seed 1234  : seed of the first repetition; repetition i uses seed + i." << endl;
    cerr << ident << "-o out.csv   : output file." << endl;
    cerr << endl;
    cerr << "Auxilary options:" << endl;
    cerr << ident << "-(-h)elp     : print this message; ignore all other options." << endl;
    cerr << ident << "-(-v)erbose  : when working, be effusive; repeat (-v -v) to log every voting round." << endl;
    cerr << endl;
    cerr << "Example uses:" << endl;
    cerr << endl;
    cerr << "$ " << cmd << " examples/party_distance.json -a" << endl;
    cerr << "$ mpirun -np 8 " << cmd << " examples/intraparty.json -n 1000 -o simulation_output/intraparty_small.csv" << endl;
    if (status != 0) { exit(status); }
}

std::ostream& operator<<(std::ostream &os, const STEP &step) {
    switch (step) {
        case SIMULATE: os << "SIMULATE"; break;
        case WRITE: os << "WRITE"; break;
        case REPORT: os << "REPORT"; break;
        default: os << "UNDEFINED LEGIS::STEP"; break;
    }
    return os;
}

// non-exported helper function for finding argument flags
bool argcheck(const char * arg, const char * short_arg, const char * long_arg) {
    return (strcmp(arg, short_arg) == 0) or (strcmp(arg, long_arg) == 0);
}

// non-exported helper: the value following flag `argv[i]`, as an unsigned integer
size_t count_after(const size_t argc, const char * argv[], size_t &i, const size_t min_val) {
    const string cmd = string(argv[0]);
    const string flag = string(argv[i]);
    const string err = "Error: " + flag + " must be followed by " + (min_val > 0 ? "a positive" : "a non-negative") + " integer.";
    // this will occur if the flag is the last argument, i.e. no number provided after
    if (i == (argc - 1)) { usage(cmd, err, 103); }
    const char * val = argv[++i];
    char * end = nullptr;
    const unsigned long long parsed = strtoull(val, &end, 10);
    if ((val[0] == '-') or (end == val) or (*end != '\0') or (parsed < min_val)) { usage(cmd, err, 103); }
    return static_cast<size_t>(parsed);
}

CLIArgs parse_args(const size_t argc, const char * argv[]) {

    // assert argv[0] = this program
    const string cmd = string(argv[0]);

    // check for help requested
    auto has_flag = [&](const char * flag) {
        return std::find_if(argv, argv + argc, [&](const char * arg) { return strcmp(arg, flag) == 0; }) != argv + argc;
    };
    if (has_flag("-h") or has_flag("--help")) {
        usage(cmd);
        return CLIArgs("");
    }

    if (argc < 2) { usage(cmd, "Error: a configuration file is required.", 101); }

    auto args = CLIArgs(string(argv[1]));

    for (size_t i = 2; i < argc; i++) {

        if (argcheck(argv[i], "-s", "--simulate")) {
            if (not args.steps.empty()) {
                usage(cmd, "Error: -(-s)imulate must be the first step.", 102);
            } else {
                args.steps.push_back(SIMULATE);
            }
        } else if (argcheck(argv[i], "-w", "--write")) {
            if (std::find(args.steps.begin(), args.steps.end(), WRITE) != args.steps.end()) {
                cerr << "WARNING: -(-w)rite specified multiple times; ignoring redundant invocation." << endl;
            } else {
                args.steps.push_back(WRITE);
            }
        } else if (argcheck(argv[i], "-r", "--report")) {
            if (std::find(args.steps.begin(), args.steps.end(), REPORT) != args.steps.end()) {
                cerr << "WARNING: -(-r)eport specified multiple times; ignoring redundant invocation." << endl;
            } else {
                args.steps.push_back(REPORT);
            }
        } else if (argcheck(argv[i], "-a", "--all")) {
            if (args.steps.size() > 0) { usage(cmd, "Error: -(-a)ll must be the first step.", 102); }
            args.steps.push_back(SIMULATE);
            args.steps.push_back(WRITE);
            args.steps.push_back(REPORT);
        } else if (strcmp(argv[i], "-n") == 0) {
            args.reps.emplace(count_after(argc, argv, i, 1));
        } else if (strcmp(argv[i], "--seed") == 0) {
            args.seed.emplace(count_after(argc, argv, i, 0));
        } else if (strcmp(argv[i], "-o") == 0) {
            if (i == (argc - 1)) { usage(cmd, "Error: -o must be followed by a file name.", 103); }
            args.output_file.emplace(string(argv[++i]));
        } else if (argcheck(argv[i], "-v", "--verbose")) {
            args.verbose += 1;
        } else {
            usage(cmd, "Error: unrecognized argument: " + string(argv[i]), 104);
        }
    }

    if (args.steps.empty()) {
        args.steps = { SIMULATE, WRITE };
    } else if (args.steps.front() != SIMULATE) {
        usage(cmd, "Error: -(-w)rite and -(-r)eport require -(-s)imulate first.", 102);
    }

    return args;
};

} // namespace LEGIS
