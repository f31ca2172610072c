#ifndef LEGISSIM_ERRORS_H
#define LEGISSIM_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace LEGIS {

// raised before any repetition runs, when a configuration cannot describe a valid chamber
struct ConfigError : public std::invalid_argument {
    explicit ConfigError(const std::string & msg) : std::invalid_argument(msg) {}
};

// raised when a session reaches its round cap without a majority
struct DivergenceError : public std::runtime_error {
    DivergenceError(const size_t rounds, const size_t last_yeas) :
        std::runtime_error(
            "no majority after " + std::to_string(rounds) + " rounds (last tally: " +
            std::to_string(last_yeas) + " yeas)"
        ), rounds(rounds), last_yeas(last_yeas) {}

    const size_t rounds;
    const size_t last_yeas;
};

} // namespace LEGIS

#endif // LEGISSIM_ERRORS_H
