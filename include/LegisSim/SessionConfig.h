#ifndef LEGISSIM_SESSIONCONFIG_H
#define LEGISSIM_SESSIONCONFIG_H

#include <cstddef>
#include <iostream>
#include <string>

#include <LegisSim/TypeDefs.h>

namespace LEGIS {

// How out-of-bounds ideal point draws are mapped back onto the policy line.
// HISTORICAL: > 1 => 1, < -1 => 0 (reproduces archived output)
// SYMMETRIC:  > 1 => 1, < -1 => -1
enum CLIP { HISTORICAL, SYMMETRIC };

// Who proposes after a failed vote.
// PERSIST: the proposer chosen at initialization keeps proposing
// ROTATE: a new proposer is drawn uniformly after every failed vote
enum PROPOSER { PERSIST, ROTATE };

std::ostream& operator<<(std::ostream &os, const CLIP &rule);
std::ostream& operator<<(std::ostream &os, const PROPOSER &rule);

// @throws ConfigError on unknown names
CLIP parse_clip(const std::string &name);
PROPOSER parse_proposer(const std::string &name);

// distribution and fatigue parameters shared by every member of a party
struct PartySpec {
    float_type sigma = 0.1;
    float_type error = 0.02;
    float_type adj   = 0.01;
};

// Everything one repetition needs, other than its seed.
// Party means sit at +/- distance / 2; the minority requests the seats the majority leaves.
struct SessionConfig {
    size_t chamber_size = 101;
    size_t majority_size = 51;
    float_type distance = 1.0;
    PartySpec majority;
    PartySpec minority;
    size_t max_rounds = 100000;
    PROPOSER proposer_rule = PERSIST;
    CLIP clip_rule = HISTORICAL;

    size_t minority_size() const { return chamber_size - majority_size; }
    float_type majority_mu() const { return distance / 2.0; }
    float_type minority_mu() const { return -distance / 2.0; }

    // @throws ConfigError describing the first problem found
    void validate() const;
};

} // namespace LEGIS

#endif // LEGISSIM_SESSIONCONFIG_H
