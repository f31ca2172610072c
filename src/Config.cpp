#include <cmath>
#include <limits>
#include <sstream>

#include <LegisSim/Config.h>
#include <LegisSim/LegisUtil.h>
#include <LegisSim/Errors.h>

using std::string;
using std::vector;

namespace LEGIS {

std::ostream& operator<<(std::ostream &os, const SWEEP_PAR &par) {
    switch (par) {
        case NO_SWEEP: os << "none"; break;
        case SWEEP_PARTY_SIZE: os << "majority_party_size"; break;
        case SWEEP_DISTANCE: os << "distance"; break;
        case SWEEP_SIGMA: os << "sigma"; break;
        case SWEEP_MAJORITY_SIGMA: os << "majority_sigma"; break;
        case SWEEP_MINORITY_SIGMA: os << "minority_sigma"; break;
        case SWEEP_MAJORITY_ADJ: os << "majority_adj"; break;
        case SWEEP_MINORITY_ADJ: os << "minority_adj"; break;
        default: os << "UNDEFINED LEGIS::SWEEP_PAR"; break;
    }
    return os;
}

SWEEP_PAR parse_sweep_par(const string &name) {
    for (SWEEP_PAR par : { SWEEP_PARTY_SIZE, SWEEP_DISTANCE, SWEEP_SIGMA,
                           SWEEP_MAJORITY_SIGMA, SWEEP_MINORITY_SIGMA, SWEEP_MAJORITY_ADJ, SWEEP_MINORITY_ADJ }) {
        std::ostringstream oss;
        oss << par;
        if (oss.str() == name) { return par; }
    }
    throw ConfigError("unknown sweep parameter: " + name);
}

// non-exported helper: a non-negative integer count
size_t _as_count(const float_type val, const string &what) {
    if (not (std::isfinite(val) and val >= 0 and val == std::round(val))) {
        std::ostringstream oss;
        oss << what << " must be a non-negative integer; got " << val;
        throw ConfigError(oss.str());
    }
    return static_cast<size_t>(val);
}

SessionConfig apply_sweep(const SessionConfig &base, const SWEEP_PAR par, const float_type value) {
    SessionConfig config = base;
    switch (par) {
        case NO_SWEEP: break;
        case SWEEP_PARTY_SIZE: config.majority_size = _as_count(value, "majority_party_size"); break;
        case SWEEP_DISTANCE: config.distance = value; break;
        case SWEEP_SIGMA: config.majority.sigma = value; config.minority.sigma = value; break;
        case SWEEP_MAJORITY_SIGMA: config.majority.sigma = value; break;
        case SWEEP_MINORITY_SIGMA: config.minority.sigma = value; break;
        case SWEEP_MAJORITY_ADJ: config.majority.adj = value; break;
        case SWEEP_MINORITY_ADJ: config.minority.adj = value; break;
    }
    return config;
}

SessionConfig SweepSpec::at(const size_t idx) const {
    if (idx >= size()) { throw std::out_of_range("sweep index out of range"); }
    return (parameter == NO_SWEEP) ? base : apply_sweep(base, parameter, values[idx]);
}

float_type SweepSpec::value_at(const size_t idx) const {
    if (idx >= size()) { throw std::out_of_range("sweep index out of range"); }
    return (parameter == NO_SWEEP) ? std::numeric_limits<float_type>::quiet_NaN() : values[idx];
}

void SweepSpec::validate() const {
    if (reps == 0) { throw ConfigError("reps must be positive"); }
    if (parameter != NO_SWEEP and values.empty()) { throw ConfigError("sweep has no values"); }
    for (size_t i = 0; i < size(); ++i) { at(i).validate(); }
}

Json::Value parse_json(const string & json_text) {
    Json::Value root;
    Json::Reader reader;
    if ( !reader.parse( json_text, root ) ) {
        throw ConfigError("failed to parse configuration\n" + reader.getFormattedErrorMessages());
    }
    if (not root.isObject()) { throw ConfigError("configuration must be a JSON object"); }
    return root;
}

JsonConfig::JsonConfig(const string & filename) {
    if (not file_exists(filename)) { throw ConfigError("file does not exist: " + filename); }
    _root = parse_json(slurp(filename));
}

JsonConfig JsonConfig::from_text(const string & json_text) {
    JsonConfig config;
    config._root = parse_json(json_text);
    return config;
}

// non-exported helpers for typed access with defaults; negative counts are caught here rather
// than wrapping around in a size_t
size_t _get_count(const Json::Value &par, const string &key, const size_t default_val) {
    if (not par.isMember(key)) { return default_val; }
    return _as_count(par[key].asDouble(), key);
}

// seeds are read as exact integers; a double would round anything above 2^53
unsigned long int _get_seed(const Json::Value &par) {
    if (not par.isMember("seed")) { return 0; }
    const Json::Value &seed = par["seed"];
    if (not seed.isUInt64()) { throw ConfigError("seed must be a non-negative integer"); }
    return seed.asUInt64();
}

PartySpec _get_party(const Json::Value &par, const string &key) {
    PartySpec spec;
    if (par.isMember(key)) {
        const Json::Value &party = par[key];
        if (not party.isObject()) { throw ConfigError("`" + key + "` must be an object"); }
        spec.sigma = party.get("sigma", spec.sigma).asDouble();
        spec.error = party.get("error", spec.error).asDouble();
        spec.adj   = party.get("adj", spec.adj).asDouble();
    }
    return spec;
}

SweepSpec JsonConfig::sweep_spec() const {
    SweepSpec spec;
    try {
        if (not _root.isMember("reps")) { throw ConfigError("`reps` must be specified in configuration file"); }
        spec.reps = _get_count(_root, "reps", 0);
        spec.seed = _get_seed(_root);
        spec.keep_going = _root.get("keep_going", false).asBool();
        spec.output_filename = _root.get("output_filename", spec.output_filename).asString();

        SessionConfig &base = spec.base;
        base.chamber_size  = _get_count(_root, "chamber_size", base.chamber_size);
        base.majority_size = _get_count(_root, "majority_party_size", base.majority_size);
        base.distance      = _root.get("distance", base.distance).asDouble();
        base.majority      = _get_party(_root, "majority");
        base.minority      = _get_party(_root, "minority");
        base.max_rounds    = _get_count(_root, "max_rounds", base.max_rounds);
        base.proposer_rule = parse_proposer(_root.get("proposer_rule", "PERSIST").asString());
        base.clip_rule     = parse_clip(_root.get("clip_rule", "HISTORICAL").asString());

        if (_root.isMember("sweep")) {
            const Json::Value &sweep = _root["sweep"];
            if (not sweep.isObject()) { throw ConfigError("`sweep` must be an object"); }
            spec.parameter = parse_sweep_par(sweep["parameter"].asString());
            if (sweep.isMember("vals")) {
                spec.values = ::as_vector<float_type>(sweep["vals"]);
            } else {
                if (not (sweep.isMember("par1") and sweep.isMember("par2"))) {
                    throw ConfigError("`sweep` needs either `vals` or both `par1` and `par2`");
                }
                spec.values = grid(
                    sweep["par1"].asDouble(), sweep["par2"].asDouble(), sweep.get("step", 1.0).asDouble()
                );
            }
        }
    } catch (const Json::Exception &e) {
        throw ConfigError(string("mistyped configuration value: ") + e.what());
    }

    spec.validate();
    return spec;
}

} // namespace LEGIS
