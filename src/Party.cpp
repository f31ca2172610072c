#include <algorithm>
#include <gsl/gsl_randist.h>

#include <LegisSim/Party.h>
#include <LegisSim/LegisUtil.h>

namespace LEGIS {

Party::Party(
    const std::string &label,
    const size_t size, const float_type mu, const PartySpec &spec,
    Roster &roster, const gsl_rng* RNG,
    const CLIP clip_rule,
    std::ostream &log
) : _label(label), _size(size), _mu(mu), _spec(spec) {
    _members.reserve(std::min(_size, roster.remaining()));
    for (size_t i = 0; i < _size; ++i) {
        if (roster.full()) {
            log << "WARNING: all " << roster.seats << " seats are filled; " << _label << " party seated "
                << _members.size() << " of " << _size << " requested members." << std::endl;
            break;
        }
        const float_type ideal = clip_ideal(gsl_ran_gaussian(RNG, _spec.sigma) + _mu, clip_rule);
        _members.push_back(std::make_unique<Legislator>(i, ideal, _spec.error, _spec.adj));
        roster.members.push_back(_members.back().get());
    }
}

void Party::reset_fatigue() {
    for (auto & member : _members) { member->reset_error(); }
}

} // namespace LEGIS
