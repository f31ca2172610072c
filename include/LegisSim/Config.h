#ifndef LEGISSIM_CONFIG_H
#define LEGISSIM_CONFIG_H

#include <string>
#include <vector>
#include <json/json.h>

#include <LegisSim/TypeDefs.h>
#include <LegisSim/SessionConfig.h>

template <NumericType T>
std::vector<T> as_vector(const Json::Value & val) {
    std::vector<T> extracted_vals;
    if (val.isArray()) { for (const Json::Value & jv : val) {
        extracted_vals.push_back( jv.as<T>() ); // NB, jsoncpp handles cast failures
    } } else {
        extracted_vals.push_back( val.as<T>() );
    }
    return extracted_vals;
}

namespace LEGIS {

// which SessionConfig field a sweep varies; SIGMA sets both parties' spread
enum SWEEP_PAR {
    NO_SWEEP,
    SWEEP_PARTY_SIZE, SWEEP_DISTANCE, SWEEP_SIGMA,
    SWEEP_MAJORITY_SIGMA, SWEEP_MINORITY_SIGMA, SWEEP_MAJORITY_ADJ, SWEEP_MINORITY_ADJ
};

std::ostream& operator<<(std::ostream &os, const SWEEP_PAR &par);

// @throws ConfigError on unknown names
SWEEP_PAR parse_sweep_par(const std::string &name);

// @return a copy of `base` with the swept field set to `value`
// @throws ConfigError if `value` cannot be assigned (e.g. a fractional party size)
SessionConfig apply_sweep(const SessionConfig &base, const SWEEP_PAR par, const float_type value);

// A full sweep: the base session, the grid it is varied over, and how much to run per grid value.
struct SweepSpec {
    SessionConfig base;
    size_t reps = 0;
    unsigned long int seed = 0;
    bool keep_going = false;
    SWEEP_PAR parameter = NO_SWEEP;
    std::vector<float_type> values;    // empty unless sweeping
    std::string output_filename = "simulation_output/output.csv";

    // number of grid values; a sweep-less spec has exactly one
    size_t size() const { return (parameter == NO_SWEEP) ? 1 : values.size(); }

    // the session configuration at grid position `idx`
    SessionConfig at(const size_t idx) const;

    // the swept value at grid position `idx` (NaN without a sweep)
    float_type value_at(const size_t idx) const;

    // @throws ConfigError unless every grid value yields a valid session and reps > 0
    void validate() const;
};

struct Config {
    virtual ~Config() {}
    virtual SweepSpec sweep_spec() const = 0;
};

// Configuration read from a JSON document, e.g.
//
//  { "reps": 10000, "seed": 0, "chamber_size": 101, "majority_party_size": 51, "distance": 1,
//    "majority": { "sigma": 0.1, "error": 0.02, "adj": 0.01 },
//    "minority": { "sigma": 0.1, "error": 0.02, "adj": 0.01 },
//    "sweep": { "parameter": "distance", "par1": 0.0, "par2": 2.0, "step": 0.05 },
//    "output_filename": "simulation_output/output_party_distance.csv" }
struct JsonConfig : public Config {
    // @throws ConfigError if the file is missing or is not valid JSON
    explicit JsonConfig(const std::string & filename);

    // @throws ConfigError if `json_text` is not valid JSON
    static JsonConfig from_text(const std::string & json_text);

    // @throws ConfigError on missing / mistyped / invalid values
    SweepSpec sweep_spec() const override;

    private:
        JsonConfig() {}
        Json::Value _root;
};

// @throws ConfigError if `json_text` does not parse
Json::Value parse_json(const std::string & json_text);

} // namespace LEGIS

#endif // LEGISSIM_CONFIG_H
