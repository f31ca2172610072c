#include <cmath>
#include <iomanip>
#include <sstream>
#include <vector>

#include <LegisSim/LegisLog.h>

using std::endl;
using std::setw;
using std::string;
using std::vector;

namespace LEGIS {

COLUMN LegisLog::swept_column(const SWEEP_PAR par) {
    switch (par) {
        case SWEEP_PARTY_SIZE: return MAJORITY_SIZE;
        case SWEEP_DISTANCE: return DISTANCE;
        case SWEEP_SIGMA: return MAJORITY_SIGMA;      // both parties carry the same value
        case SWEEP_MAJORITY_SIGMA: return MAJORITY_SIGMA;
        case SWEEP_MINORITY_SIGMA: return MINORITY_SIGMA;
        case SWEEP_MAJORITY_ADJ: return MAJORITY_ADJ;
        case SWEEP_MINORITY_ADJ: return MINORITY_ADJ;
        default: return NUM_COLUMNS;
    }
}

void LegisLog::print_fit(
    const string &label,
    const LinearFit &fit,
    const size_t n,
    std::ostream &os
) {
    os << "    " << label << " (n = " << n << "):  slope " << setw(WIDTH) << fit.m
       << ", intercept " << setw(WIDTH) << fit.b << ", R^2 " << setw(WIDTH) << fit.rsq << "\n";
}

void LegisLog::_print_table_header(const SweepSpec &spec, std::ostream &os) {
    std::ostringstream par;
    par << spec.parameter;
    os << setw(WIDTH) << par.str().substr(0, WIDTH) << " | "
       << setw(WIDTH) << "reps" << setw(WIDTH) << "mean votes" << setw(WIDTH) << "med votes"
       << setw(WIDTH) << "max votes" << setw(WIDTH) << "mean yeas" << setw(WIDTH) << "mean final"
       << setw(WIDTH) << "init<=0" << endl;
}

void LegisLog::sweep_report(
    const SweepSpec &spec,
    const Mat2D &table,
    std::ostream &os
) {
    os << double_bar << endl;
    if (spec.parameter == NO_SWEEP) {
        os << "Simulation summary: " << table.rows() << " repetitions" << endl;
    } else {
        os << "Sweep over " << spec.parameter << ": " << spec.size() << " values x " << spec.reps << " repetitions" << endl;
    }
    os << double_bar << endl;
    _print_table_header(spec, os);

    for (size_t i = 0; i < spec.size(); ++i) {
        const size_t first = i * spec.reps;
        if (first + spec.reps > static_cast<size_t>(table.rows())) { break; }
        const auto block = table.middleRows(first, spec.reps);

        const Col votes = block.col(NUM_VOTES);
        size_t passed = 0, nonpositive = 0;
        float_type final_sum = 0.0;
        for (size_t r = 0; r < spec.reps; ++r) {
            if (not std::isnan(block(r, FINAL_VALUE))) { ++passed; final_sum += block(r, FINAL_VALUE); }
            if (block(r, INITIAL_VALUE) <= 0) { ++nonpositive; }
        }

        os << setw(WIDTH) << spec.value_at(i) << " | "
           << setw(WIDTH) << spec.reps
           << setw(WIDTH) << votes.mean()
           << setw(WIDTH) << median(votes)
           << setw(WIDTH) << votes.maxCoeff()
           << setw(WIDTH) << block.col(YEAS).mean()
           << setw(WIDTH) << (passed > 0 ? final_sum / passed : NAN)
           << setw(WIDTH) << static_cast<float_type>(nonpositive) / spec.reps << endl;
    }

    if (spec.parameter == NO_SWEEP) { return; }

    // Number of Votes ~ swept value, split on the sign of the initial proposal
    const COLUMN xcol = swept_column(spec.parameter);
    vector<double> x_lo, y_lo, x_hi, y_hi;
    for (size_t r = 0; r < static_cast<size_t>(table.rows()); ++r) {
        if (table(r, INITIAL_VALUE) <= 0) {
            x_lo.push_back(table(r, xcol)); y_lo.push_back(table(r, NUM_VOTES));
        } else {
            x_hi.push_back(table(r, xcol)); y_hi.push_back(table(r, NUM_VOTES));
        }
    }
    os << "Linear fit, Number of Votes ~ " << column_names()[xcol] << ":" << endl;
    print_fit("Initial Value <= 0", lin_reg(x_lo, y_lo), x_lo.size(), os);
    print_fit("Initial Value >  0", lin_reg(x_hi, y_hi), x_hi.size(), os);
}

} // namespace LEGIS
