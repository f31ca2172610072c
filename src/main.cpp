#include <iostream>
#include <stdexcept>

#include <LegisSim/CLI.h>
#include <LegisSim/Sweep.h>
#include <LegisSim/LegisMPI.h>
#include <LegisSim/Errors.h>

using std::cerr;
using std::endl;

int main(int argc, char* argv[]) {
    LEGIS::MPI_par mp;
    LEGIS::setup_mpi(mp, argc, argv);

    const LEGIS::CLIArgs args = LEGIS::parse_args(argc, const_cast<const char**>(argv));
    if (args.config_file.empty()) { LEGIS::teardown_mpi(); return 0; } // help requested

    int status = 0;
    LEGIS::SweepDriver driver(&mp);
    try {
        LEGIS::run(&driver, args);
    } catch (const LEGIS::ConfigError &e) {
        cerr << "ERROR: invalid configuration: " << e.what() << endl;
        status = 110;
    } catch (const LEGIS::DivergenceError &e) {
        cerr << "ERROR: " << e.what() << ". Raise `max_rounds` or set `keep_going` to record divergent repetitions." << endl;
        status = 120;
    } catch (const std::runtime_error &e) {
        cerr << "ERROR: " << e.what() << endl;
        status = 130;
    }

    LEGIS::teardown_mpi();
    return status;
}
