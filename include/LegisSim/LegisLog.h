#ifndef LEGISSIM_LEGISLOG_H
#define LEGISSIM_LEGISLOG_H

#include <iostream>
#include <string>

#include <LegisSim/TypeDefs.h>
#include <LegisSim/Config.h>
#include <LegisSim/OutcomeTable.h>
#include <LegisSim/LegisUtil.h>

namespace LEGIS {

struct LegisLog {

    // Per grid value: repetitions, mean / median / max number of votes, mean yeas, mean final value
    // (over repetitions that passed), and the share of repetitions whose initial value was <= 0.
    // Then, when sweeping, the least-squares fit of number of votes on the swept value, separately
    // for initial values <= 0 and > 0.
    //
    // `table` must hold `spec.reps` consecutive rows per grid value, in grid order.
    static void sweep_report(
        const SweepSpec &spec,
        const Mat2D &table,
        std::ostream &os = std::cerr
    );

    static void print_fit(
        const std::string &label,
        const LinearFit &fit,
        const size_t n,
        std::ostream &os = std::cerr
    );

    // the table column recording the swept value
    static COLUMN swept_column(const SWEEP_PAR par);

    inline static const int WIDTH = 12;
    inline static const std::string double_bar = "=========================================================================================";

    private:
        LegisLog() {};

        static void _print_table_header(const SweepSpec &spec, std::ostream &os);

};

} // namespace LEGIS

#endif // LEGISSIM_LEGISLOG_H
