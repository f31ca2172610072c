#ifndef LEGISSIM_SESSION_H
#define LEGISSIM_SESSION_H

#include <iostream>
#include <memory>
#include <vector>
#include <gsl/gsl_rng.h>

#include <LegisSim/TypeDefs.h>
#include <LegisSim/SessionConfig.h>
#include <LegisSim/Legislator.h>
#include <LegisSim/Party.h>

namespace LEGIS {

// INITIALIZING: parties seated, roster sorted, median + proposer chosen
// VOTING: proposals being tallied; the round counter gives the position
// PASSED: a majority was reached; terminal
enum STATE { INITIALIZING, VOTING, PASSED };

std::ostream& operator<<(std::ostream &os, const STATE &state);

// One row of the outcome table, plus bookkeeping that is not persisted
struct Outcome {
    float_type initial_value = 0.0;
    float_type final_value = 0.0;   // NaN if the repetition never passed
    size_t votes = 0;
    size_t yeas = 0;
    size_t majority_size = 0;
    float_type distance = 0.0;
    float_type majority_sigma = 0.0;
    float_type majority_adj = 0.0;
    float_type minority_sigma = 0.0;
    float_type minority_adj = 0.0;

    float_type proposer_ideal = 0.0;
    bool passed = false;
};

// A `Session` is one repetition of the proposal / vote cycle.
//
// Construction performs INITIALIZING with its own generator, seeded with `seed`; afterwards the
// session is in VOTING and `vote_round()` / `run()` advance it. Roster, chamber size and median all
// belong to the session.
//
// Conventions follow the rest of the library:
//  - internal state fields: _field_name
//  - public methods: method_name()
class Session {
    public:
        Session(
            const SessionConfig &config, const unsigned long int seed,
            const size_t verbose = 0, std::ostream &log = std::cerr
        );

        Session(const Session &) = delete;
        Session & operator=(const Session &) = delete;

        // the passing rule: a strict majority of the chamber's seats
        static bool passes(const size_t yeas, const size_t chamber_size) { return 2 * yeas > chamber_size; }

        // Runs one VOTING round: the proposer's best response is put to every legislator (the proposer
        // included), the proposer's own ballot always counts as yea, and every ballot adds fatigue.
        // On a pass, fatigue is reset and the session moves to PASSED; on a failure, the proposer is
        // kept or redrawn per the configured PROPOSER rule.
        //
        // @return true if the proposal passed
        // @throws std::logic_error if called once PASSED
        bool vote_round();

        // Votes until PASSED.
        //
        // @return the outcome record for this repetition
        // @throws DivergenceError if `max_rounds` rounds fail
        Outcome run();

        // the record as of now; `passed` is false (and `final_value` NaN) until PASSED
        Outcome outcome() const;

        STATE get_state() const { return _state; }
        size_t get_rounds() const { return _rounds; }
        size_t get_last_yeas() const { return _last_yeas; }
        float_type get_last_proposal() const { return _last_proposal; }
        float_type get_median_ideal() const { return _median_ideal; }
        float_type get_initial_value() const { return _initial_value; }
        const Legislator & get_proposer() const { return *_proposer; }
        const std::vector<Legislator*> & get_roster() const { return _roster.members; }
        const Party & get_majority() const { return *_majority; }
        const Party & get_minority() const { return *_minority; }
        const SessionConfig & get_config() const { return _config; }

    private:
        const SessionConfig _config;
        const size_t _verbose;
        std::ostream &_log;

        std::unique_ptr<gsl_rng, decltype(&gsl_rng_free)> _rng;
        Roster _roster;
        std::unique_ptr<Party> _majority;
        std::unique_ptr<Party> _minority;

        STATE _state = INITIALIZING;
        float_type _median_ideal = 0.0;
        Legislator* _proposer = nullptr;
        float_type _initial_value = 0.0;
        size_t _rounds = 0;
        size_t _last_yeas = 0;
        float_type _last_proposal = 0.0;

        void _choose_proposer();
        size_t _tally(const float_type proposal);
};

// Runs repetition `rep` with seed `base_seed + rep`.
//
// @throws ConfigError if `config` is invalid
// @throws DivergenceError if the session hits its round cap
Outcome run_repetition(
    const SessionConfig &config, const unsigned long int base_seed, const size_t rep,
    const size_t verbose = 0
);

// Runs repetitions 0 .. reps-1 in order.
//
// @param keep_going: if true, a divergent repetition is reported on `log` and recorded
// (passed = false) rather than ending the batch
// @throws ConfigError if `config` is invalid
// @throws DivergenceError if a repetition diverges and `keep_going` is false
std::vector<Outcome> run_batch(
    const SessionConfig &config, const size_t reps, const unsigned long int base_seed,
    const bool keep_going = false, const size_t verbose = 0, std::ostream &log = std::cerr
);

} // namespace LEGIS

#endif // LEGISSIM_SESSION_H
