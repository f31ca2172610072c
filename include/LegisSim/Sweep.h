#ifndef LEGISSIM_SWEEP_H
#define LEGISSIM_SWEEP_H

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <LegisSim/TypeDefs.h>
#include <LegisSim/Config.h>
#include <LegisSim/MPIPar.h>

namespace LEGIS {

// Runs a parameter sweep: every grid value in a `SweepSpec` gets `reps` repetitions, and the
// per-value tables are stacked (grid order, then repetition order) into one outcome table.
//
// Implements the *verbs* used by `LEGIS::run()`:
//  - parse(configuration file path, verbosity)
//  - simulate(verbosity)
//  - write(verbosity)
//  - report(verbosity)
//
// With more than one MPI rank, the root rank schedules grid values and the other ranks simulate
// them; only the root holds the outcome table, so write() and report() are no-ops elsewhere.
class SweepDriver {
    public:
        SweepDriver(MPI_par *mp = nullptr) : _mp(mp) {}

        // @throws ConfigError if the configuration is missing or invalid
        void parse(const std::string &config_file, const size_t verbose = 0);

        // replaces a parsed (or set) spec
        // @throws ConfigError if `spec` is invalid
        void set_spec(const SweepSpec &spec);

        // command line overrides, applied on top of the configuration file
        // @throws ConfigError if `reps` is 0
        void override_with(
            const std::optional<size_t> &reps,
            const std::optional<size_t> &seed,
            const std::optional<std::string> &output_filename
        );

        // @throws std::logic_error if no spec has been set
        // @throws DivergenceError if a repetition diverges and `keep_going` is unset
        void simulate(const size_t verbose = 0);

        // writes the outcome table as CSV to `output_filename`
        // @throws std::logic_error if simulate() has not run
        void write(const size_t verbose = 0);

        // summary statistics and fits of the outcome table, on `os`
        // @throws std::logic_error if simulate() has not run
        void report(const size_t verbose = 0, std::ostream &os = std::cerr);

        const SweepSpec & get_spec() const { return _spec; }
        const Mat2D & get_table() const { return _table; }
        bool is_root() const { return (_mp == nullptr) or (_mp->mpi_rank == mpi_root); }
        bool has_results() const { return _simulated; }

    private:
        MPI_par *_mp;
        SweepSpec _spec;
        bool _parsed = false;
        bool _simulated = false;
        Mat2D _table;

        std::vector<Mat2D> _simulate_serial(const size_t verbose);
        void _require_results(const std::string &verb) const;
};

} // namespace LEGIS

#endif // LEGISSIM_SWEEP_H
