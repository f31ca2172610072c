#include <chrono>
#include <stdexcept>

#include <LegisSim/Sweep.h>
#include <LegisSim/Session.h>
#include <LegisSim/OutcomeTable.h>
#include <LegisSim/LegisMPI.h>
#include <LegisSim/LegisLog.h>
#include <LegisSim/Errors.h>

using std::cerr;
using std::endl;
using std::string;
using std::vector;

namespace LEGIS {

void SweepDriver::parse(const string &config_file, const size_t verbose) {
    if (verbose > 0 and is_root()) { cerr << "Reading configuration from " << config_file << endl; }
    set_spec(JsonConfig(config_file).sweep_spec());
}

void SweepDriver::set_spec(const SweepSpec &spec) {
    spec.validate();
    _spec = spec;
    _parsed = true;
    _simulated = false;
}

void SweepDriver::override_with(
    const std::optional<size_t> &reps,
    const std::optional<size_t> &seed,
    const std::optional<string> &output_filename
) {
    if (reps.has_value()) {
        if (reps.value() == 0) { throw ConfigError("reps must be positive"); }
        _spec.reps = reps.value();
    }
    if (seed.has_value()) { _spec.seed = seed.value(); }
    if (output_filename.has_value()) { _spec.output_filename = output_filename.value(); }
    _simulated = false;
}

vector<Mat2D> SweepDriver::_simulate_serial(const size_t verbose) {
    vector<Mat2D> tables;
    tables.reserve(_spec.size());
    for (size_t i = 0; i < _spec.size(); ++i) {
        if (verbose > 0 and _spec.parameter != NO_SWEEP) {
            cerr << "Simulating " << _spec.parameter << " = " << _spec.value_at(i)
                 << " (" << i + 1 << " of " << _spec.size() << ")" << endl;
        }
        tables.push_back(as_table(run_batch(_spec.at(i), _spec.reps, _spec.seed, _spec.keep_going, verbose)));
    }
    return tables;
}

void SweepDriver::simulate(const size_t verbose) {
    if (not _parsed) { throw std::logic_error("simulate() requires a configuration"); }

    const auto start = std::chrono::steady_clock::now();
    vector<Mat2D> tables;

    if (_mp != nullptr and _mp->mpi_size > 1) {
        if (is_root()) {
            tables = sweep_scheduler(_spec, _mp, verbose);
        } else {
            sweep_worker(_spec, _mp, verbose);
            return;
        }
    } else {
        tables = _simulate_serial(verbose);
    }

    _table = concatenate(tables);
    _simulated = true;

    if (verbose > 0) {
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
        cerr << "Simulated " << _table.rows() << " repetitions in " << elapsed.count() << " seconds" << endl;
    }
}

void SweepDriver::_require_results(const string &verb) const {
    if (not _simulated) { throw std::logic_error(verb + "() requires simulate() first"); }
}

void SweepDriver::write(const size_t verbose) {
    if (not is_root()) { return; }
    _require_results("write");
    write_csv(_table, _spec.output_filename);
    if (verbose > 0) { cerr << "Wrote " << _table.rows() << " rows to " << _spec.output_filename << endl; }
}

void SweepDriver::report(const size_t verbose, std::ostream &os) {
    if (not is_root()) { return; }
    _require_results("report");
    (void) verbose;
    LegisLog::sweep_report(_spec, _table, os);
}

} // namespace LEGIS
