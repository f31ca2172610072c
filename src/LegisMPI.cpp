#include <iostream>
#include <vector>

#include <LegisSim/LegisMPI.h>
#include <LegisSim/OutcomeTable.h>
#include <LegisSim/Session.h>
#include <LegisSim/Errors.h>

// need a positive int that is very unlikely
// to be less than the number of grid values
#define STOP_TAG 10000000

using std::cerr;
using std::endl;
using std::vector;

namespace LEGIS {

    void setup_mpi(MPI_par &mp, int &argc, char **&argv) {
#ifdef USING_MPI
        mp.comm  = MPI_COMM_WORLD;
        mp.info  = MPI_INFO_NULL;

        MPI_Init(&argc, &argv);
        MPI_Comm_size(mp.comm, &mp.mpi_size);
        MPI_Comm_rank(mp.comm, &mp.mpi_rank);
#else
        (void) mp; (void) argc; (void) argv;
#endif
    }

    void teardown_mpi() {
#ifdef USING_MPI
        MPI_Finalize();
#endif
    }

    vector<Mat2D> sweep_scheduler(
        const SweepSpec &spec,
        MPI_par *_mp,
        const size_t verbose
    ) {
        vector<Mat2D> tables(spec.size());
#ifdef USING_MPI
        MPI_Status status;

        const int num_values = spec.size();
        const int ncell = spec.reps * NUM_COLUMNS;

        vector<long double> send_data(num_values); // the grid, one value per job
        for (int i = 0; i < num_values; i++) { send_data[i] = spec.value_at(i); }

        vector<long double> rec_buffer(ncell);
        auto store = [&]() {
            Mat2D &table = tables[status.MPI_TAG];
            table.resize(spec.reps, static_cast<size_t>(NUM_COLUMNS));
            for (int c = 0; c < ncell; ++c) { table.data()[c] = rec_buffer[c]; } // Mat2D is row-major
            if (verbose > 0) {
                cerr << "Received " << spec.reps << " repetitions for " << spec.parameter << " = "
                     << spec.value_at(status.MPI_TAG) << " from rank " << status.MPI_SOURCE << endl;
            }
        };

        // Seed the workers with the first 'num_workers' jobs
        int job_id = 0;
        // Don't send jobs that don't exist!
        for (int rank = 1; (rank < _mp->mpi_size) and (rank <= num_values); ++rank) {
            job_id = rank - 1;                   // which grid value
            MPI_Send(&send_data[job_id],         // message buffer
                    1,                           // number of elements
                    MPI_LONG_DOUBLE,             // data item is a long double
                    rank,                        // destination process rank
                    job_id,                      // message tag
                    _mp->comm);                  // always use this
        }

        // Receive a result from any worker and dispatch a new work request
        job_id++; // move cursor to next job to be sent
        while ( job_id < num_values ) {
            MPI_Recv(rec_buffer.data(),          // message buffer
                    ncell,                       // message size
                    MPI_LONG_DOUBLE,             // of type long double
                    MPI_ANY_SOURCE,              // receive from any sender
                    MPI_ANY_TAG,                 // any type of message
                    _mp->comm,                   // always use this
                    &status);                    // received message info
            store();

            MPI_Send(&send_data[job_id],         // message buffer
                    1,                           // number of elements
                    MPI_LONG_DOUBLE,             // data item is a long double
                    status.MPI_SOURCE,           // send it to the rank that just finished
                    job_id,                      // message tag
                    _mp->comm);                  // always use this
            job_id++; // move cursor
        }

        // receive results for outstanding work requests--there are exactly 'num_workers'
        // or 'num_values' left, whichever is smaller
        for (int rank = 1; (rank < _mp->mpi_size) and (rank <= num_values); ++rank) {
            MPI_Recv(rec_buffer.data(),
                    ncell,
                    MPI_LONG_DOUBLE,
                    MPI_ANY_SOURCE,
                    MPI_ANY_TAG,
                    _mp->comm,
                    &status);
            store();
        }

        // Tell all the workers they're done
        for (int rank = 1; rank < _mp->mpi_size; ++rank) {
            MPI_Send(0, 0, MPI_INT, rank, STOP_TAG, _mp->comm);
        }
#else
        (void) _mp; (void) verbose;
#endif
        return tables;
    }

    void sweep_worker(
        const SweepSpec &spec,
        MPI_par *_mp,
        const size_t verbose
    ) {
#ifdef USING_MPI
        MPI_Status status;
        long double value;
        vector<long double> local_data(spec.reps * NUM_COLUMNS);

        while (1) {
            MPI_Recv(&value, 1,
                    MPI_LONG_DOUBLE,
                    mpi_root,
                    MPI_ANY_TAG,
                    _mp->comm,
                    &status);

            // Check the tag of the received message.
            if (status.MPI_TAG == STOP_TAG) { return; }

            const SessionConfig config = apply_sweep(spec.base, spec.parameter, static_cast<float_type>(value));

            Mat2D table;
            try {
                table = as_table(run_batch(config, spec.reps, spec.seed, spec.keep_going, verbose > 1 ? verbose : 0));
            } catch (const DivergenceError &e) {
                cerr << "ERROR: rank " << _mp->mpi_rank << ", " << spec.parameter << " = " << value << ": "
                     << e.what() << ". Set `keep_going` to record divergent repetitions instead." << endl;
                MPI_Abort(_mp->comm, -301);
                return;
            }

            for (size_t c = 0; c < local_data.size(); ++c) { local_data[c] = table.data()[c]; }

            MPI_Send(local_data.data(), local_data.size(),
                    MPI_LONG_DOUBLE,
                    mpi_root,
                    status.MPI_TAG,
                    _mp->comm);
        }
#else
        (void) spec; (void) _mp; (void) verbose;
#endif
    }

}
