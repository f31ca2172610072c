#include <cmath>
#include <limits>
#include <stdexcept>

#include <LegisSim/Session.h>
#include <LegisSim/LegisUtil.h>
#include <LegisSim/Errors.h>

using std::endl;
using std::vector;

namespace LEGIS {

std::ostream& operator<<(std::ostream &os, const STATE &state) {
    switch (state) {
        case INITIALIZING: os << "INITIALIZING"; break;
        case VOTING: os << "VOTING"; break;
        case PASSED: os << "PASSED"; break;
        default: os << "UNDEFINED LEGIS::STATE"; break;
    }
    return os;
}

// non-exported helper: configuration must be checked before anything is seated
const SessionConfig & _validated(const SessionConfig &config) {
    config.validate();
    return config;
}

Session::Session(
    const SessionConfig &config, const unsigned long int seed,
    const size_t verbose, std::ostream &log
) : _config(_validated(config)), _verbose(verbose), _log(log),
    _rng(gsl_rng_alloc(gsl_rng_taus2), &gsl_rng_free), _roster(_config.chamber_size) {

    gsl_rng_set(_rng.get(), seed);

    // majority is seated first; the minority takes whatever seats remain
    _majority = std::make_unique<Party>(
        "majority", _config.majority_size, _config.majority_mu(), _config.majority,
        _roster, _rng.get(), _config.clip_rule, _log
    );
    _minority = std::make_unique<Party>(
        "minority", _config.minority_size(), _config.minority_mu(), _config.minority,
        _roster, _rng.get(), _config.clip_rule, _log
    );

    sort_by_ideal(_roster.members);
    _median_ideal = median_ideal(_roster.members);

    _choose_proposer();
    _initial_value = _proposer->find_proposal(_median_ideal);
    _last_proposal = _initial_value;

    if (_verbose > 1) {
        _log << "Session seed " << seed << ": median ideal " << _median_ideal
             << ", proposer ideal point " << _proposer->get_ideal() << endl;
    }

    _state = VOTING;
}

void Session::_choose_proposer() {
    _proposer = _roster.members[gsl_rng_uniform_int(_rng.get(), _roster.size())];
}

size_t Session::_tally(const float_type proposal) {
    size_t yeas = 0;
    for (Legislator* member : _roster.members) {
        // every member casts a ballot, so fatigue accrues to the proposer too
        const bool yea = member->vote(proposal);
        if (yea or member == _proposer) { ++yeas; }
    }
    return yeas;
}

bool Session::vote_round() {
    if (_state != VOTING) {
        throw std::logic_error("vote_round() called on a session that has already passed");
    }

    _last_proposal = _proposer->find_proposal(_median_ideal);
    _last_yeas = _tally(_last_proposal);
    ++_rounds;

    const bool passed = passes(_last_yeas, _config.chamber_size);

    if (_verbose > 1) {
        _log << "Round " << _rounds << ": proposing " << _last_proposal
             << (passed ? " passed." : " failed.")
             << "  Yeas- " << _last_yeas << " Nays- " << _roster.size() - _last_yeas << endl;
    }

    if (passed) {
        _majority->reset_fatigue();
        _minority->reset_fatigue();
        _state = PASSED;
    } else if (_config.proposer_rule == ROTATE) {
        _choose_proposer();
    }

    return passed;
}

Outcome Session::run() {
    while (_state == VOTING) {
        if (_rounds >= _config.max_rounds) { throw DivergenceError(_rounds, _last_yeas); }
        vote_round();
    }
    return outcome();
}

Outcome Session::outcome() const {
    Outcome out;
    out.initial_value  = _initial_value;
    out.passed         = (_state == PASSED);
    out.final_value    = out.passed ? _last_proposal : std::numeric_limits<float_type>::quiet_NaN();
    out.votes          = _rounds;
    out.yeas           = _last_yeas;
    out.majority_size  = _config.majority_size;
    out.distance       = _config.distance;
    out.majority_sigma = _config.majority.sigma;
    out.majority_adj   = _config.majority.adj;
    out.minority_sigma = _config.minority.sigma;
    out.minority_adj   = _config.minority.adj;
    out.proposer_ideal = _proposer->get_ideal();
    return out;
}

Outcome run_repetition(
    const SessionConfig &config, const unsigned long int base_seed, const size_t rep,
    const size_t verbose
) {
    Session session(config, base_seed + rep, verbose);
    return session.run();
}

vector<Outcome> run_batch(
    const SessionConfig &config, const size_t reps, const unsigned long int base_seed,
    const bool keep_going, const size_t verbose, std::ostream &log
) {
    config.validate();
    vector<Outcome> outcomes;
    outcomes.reserve(reps);
    for (size_t rep = 0; rep < reps; ++rep) {
        Session session(config, base_seed + rep, verbose, log);
        try {
            outcomes.push_back(session.run());
        } catch (const DivergenceError &e) {
            if (not keep_going) { throw; }
            log << "ERROR: repetition " << rep + 1 << " (seed " << base_seed + rep << "): " << e.what()
                << "; recording it as not passed." << endl;
            outcomes.push_back(session.outcome());
        }
    }
    return outcomes;
}

} // namespace LEGIS
