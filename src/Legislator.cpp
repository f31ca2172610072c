#include <LegisSim/Legislator.h>

namespace LEGIS {

bool Legislator::vote(const float_type proposed) {
    const bool yea = accepts(proposed);
    _error += _adj;
    return yea;
}

float_type Legislator::find_proposal(const float_type median_ideal) const {
    if (accepts(median_ideal)) {
        return median_ideal;
    } else if (median_ideal < lower()) {
        return lower();
    } else {
        return upper();
    }
}

} // namespace LEGIS
