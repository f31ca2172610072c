#include <cmath>
#include <sstream>

#include <LegisSim/SessionConfig.h>
#include <LegisSim/Errors.h>

using std::string;
using std::stringstream;

namespace LEGIS {

std::ostream& operator<<(std::ostream &os, const CLIP &rule) {
    switch (rule) {
        case HISTORICAL: os << "HISTORICAL"; break;
        case SYMMETRIC: os << "SYMMETRIC"; break;
        default: os << "UNDEFINED LEGIS::CLIP"; break;
    }
    return os;
}

std::ostream& operator<<(std::ostream &os, const PROPOSER &rule) {
    switch (rule) {
        case PERSIST: os << "PERSIST"; break;
        case ROTATE: os << "ROTATE"; break;
        default: os << "UNDEFINED LEGIS::PROPOSER"; break;
    }
    return os;
}

CLIP parse_clip(const string &name) {
    if (name == "HISTORICAL") {
        return HISTORICAL;
    } else if (name == "SYMMETRIC") {
        return SYMMETRIC;
    } else {
        throw ConfigError("unknown clip_rule: " + name + " (expected HISTORICAL or SYMMETRIC)");
    }
}

PROPOSER parse_proposer(const string &name) {
    if (name == "PERSIST") {
        return PERSIST;
    } else if (name == "ROTATE") {
        return ROTATE;
    } else {
        throw ConfigError("unknown proposer_rule: " + name + " (expected PERSIST or ROTATE)");
    }
}

// non-exported helper: checks one party's distribution / fatigue values
void _validate_party(const PartySpec &party, const string &label) {
    stringstream ss;
    if (not (std::isfinite(party.sigma) and party.sigma > 0)) {
        ss << label << " sigma must be > 0; got " << party.sigma;
    } else if (not (std::isfinite(party.error) and party.error >= 0)) {
        ss << label << " error must be >= 0; got " << party.error;
    } else if (not (std::isfinite(party.adj) and party.adj >= 0)) {
        ss << label << " adj must be >= 0; got " << party.adj;
    }
    if (not ss.str().empty()) { throw ConfigError(ss.str()); }
}

void SessionConfig::validate() const {
    if (chamber_size == 0) {
        throw ConfigError("chamber_size must be positive");
    }
    if (majority_size > chamber_size) {
        throw ConfigError(
            "majority_party_size (" + std::to_string(majority_size) +
            ") exceeds chamber_size (" + std::to_string(chamber_size) + ")"
        );
    }
    if (not std::isfinite(distance)) {
        throw ConfigError("distance must be finite");
    }
    if (max_rounds == 0) {
        throw ConfigError("max_rounds must be positive");
    }
    _validate_party(majority, "majority");
    _validate_party(minority, "minority");
}

} // namespace LEGIS
