#ifndef LEGISSIM_PARTY_H
#define LEGISSIM_PARTY_H

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <gsl/gsl_rng.h>

#include <LegisSim/Legislator.h>
#include <LegisSim/SessionConfig.h>

namespace LEGIS {

// Repetition-scoped index of every legislator seated, across parties.
// Does not own its members; the parties do.
struct Roster {
    explicit Roster(const size_t seat_count) : seats(seat_count) { members.reserve(seats); }

    const size_t seats;
    std::vector<Legislator*> members;

    size_t size() const { return members.size(); }
    size_t remaining() const { return seats - members.size(); }
    bool full() const { return members.size() >= seats; }
};

// A Party draws `size` ideal points from Normal(mu, sigma), clips them onto the policy line,
// and seats a Legislator for each, until it has asked for `size` or the roster is full.
// Running out of seats is not an error: the party is simply smaller than requested.
class Party {
    public:
        Party(
            const std::string &label,
            const size_t size, const float_type mu, const PartySpec &spec,
            Roster &roster, const gsl_rng* RNG,
            const CLIP clip_rule = HISTORICAL,
            std::ostream &log = std::cerr
        );

        const std::string & get_label() const { return _label; }
        size_t requested() const { return _size; }
        size_t size() const { return _members.size(); }
        bool underfilled() const { return _members.size() < _size; }
        float_type get_mu() const { return _mu; }
        const PartySpec & get_spec() const { return _spec; }

        const Legislator & member(const size_t idx) const { return *_members.at(idx); }

        // restore every member's acceptance radius to the party's configured error
        void reset_fatigue();

    private:
        const std::string _label;
        const size_t _size;
        const float_type _mu;
        const PartySpec _spec;
        std::vector<std::unique_ptr<Legislator>> _members;
};

} // namespace LEGIS

#endif // LEGISSIM_PARTY_H
