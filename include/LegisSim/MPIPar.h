// split from LegisMPI.h so Sweep.h can hold an MPI_par without the scheduler declarations
#ifndef LEGISSIM_MPIPAR_H
#define LEGISSIM_MPIPAR_H

#ifdef USING_MPI
#include <mpi.h>
#endif // USING_MPI

namespace LEGIS {

    const int mpi_root = 0;

    struct MPI_par {
#ifdef USING_MPI
        MPI_Comm comm;
        MPI_Info info;
        int mpi_size, mpi_rank;
#else
        const static int mpi_size = 1;
        const static int mpi_rank = 0;
#endif // USING_MPI
    };

    // initializes MPI (when built with it) and fills `mp`; a no-op otherwise
    void setup_mpi(MPI_par &mp, int &argc, char **&argv);
    void teardown_mpi();

}

#endif // LEGISSIM_MPIPAR_H
