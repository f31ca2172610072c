#ifndef LEGISSIM_LEGISLATOR_H
#define LEGISSIM_LEGISLATOR_H

#include <cstddef>
#include <LegisSim/TypeDefs.h>

namespace LEGIS {

// A Legislator is an agent on the one-dimensional policy line [-1, 1].
//
// Design goals:
//  - the ideal point never changes after construction
//  - the acceptance radius (`error`) only grows during a repetition, by `adj` per ballot cast
//  - voting and proposing share one acceptance predicate
class Legislator {
    public:
        Legislator(const size_t id, const float_type ideal, const float_type error, const float_type adj) :
            _id(id), _ideal(ideal), _initial_error(error), _error(error), _adj(adj) {}

        size_t get_id() const { return _id; }
        float_type get_ideal() const { return _ideal; }
        float_type get_error() const { return _error; }
        float_type get_adj() const { return _adj; }
        float_type get_initial_error() const { return _initial_error; }

        // lower / upper edge of the current acceptance window
        float_type lower() const { return _ideal - _error; }
        float_type upper() const { return _ideal + _error; }

        // true iff `point` is within [ideal - error, ideal + error]; no side effects
        bool accepts(const float_type point) const { return (lower() <= point) and (point <= upper()); }

        // cast a ballot on `proposed`, judged with the radius *before* this ballot;
        // fatigue accrues whether the ballot is yea or nay
        bool vote(const float_type proposed);

        // the point closest to `median_ideal` that this legislator would still accept:
        // the median itself if acceptable, otherwise the nearer edge of the window
        float_type find_proposal(const float_type median_ideal) const;

        void reset_error() { _error = _initial_error; }

    private:
        const size_t _id;
        const float_type _ideal;
        const float_type _initial_error;
        float_type _error;
        const float_type _adj;
};

} // namespace LEGIS

#endif // LEGISSIM_LEGISLATOR_H
