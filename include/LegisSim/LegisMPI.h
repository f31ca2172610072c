#ifndef LEGISSIM_LEGISMPI_H
#define LEGISSIM_LEGISMPI_H

#include <vector>

#include <LegisSim/TypeDefs.h>
#include <LegisSim/Config.h>
#include <LegisSim/MPIPar.h>

// add MPI management to the LEGIS namespace
namespace LEGIS {

    // Root rank: hands one grid value at a time to each worker rank, collects the batch table each
    // returns, and tells every worker to stop once the grid is exhausted.
    //
    // @return one table per grid value, in grid order
    std::vector<Mat2D> sweep_scheduler(
        const SweepSpec &spec,
        MPI_par *_mp,
        const size_t verbose = 0
    );

    // Non-root ranks: run `spec.reps` repetitions for each grid value received, until told to stop.
    void sweep_worker(
        const SweepSpec &spec,
        MPI_par *_mp,
        const size_t verbose = 0
    );

}

#endif // LEGISSIM_LEGISMPI_H
