#ifndef LEGISSIM_LEGISUTIL_H
#define LEGISSIM_LEGISUTIL_H

#include <string>
#include <vector>

#include <LegisSim/TypeDefs.h>
#include <LegisSim/SessionConfig.h>

namespace LEGIS {

    class Legislator;

    struct LinearFit {
        double m;
        double b;
        double rsq;
    };

    std::string slurp(const std::string &filename);
    bool file_exists(const std::string &filename);

    // maps a raw ideal point draw onto the policy line, according to `rule`
    float_type clip_ideal(const float_type draw, const CLIP rule);

    // ideal point of the legislator at index `roster.size() / 2`;
    // assumes `roster` is already sorted ascending by ideal point
    float_type median_ideal(const std::vector<Legislator*> &roster);

    // sorts a roster ascending by ideal point; ties keep their party / creation order
    void sort_by_ideal(std::vector<Legislator*> &roster);

    // conventional median (mean of the middle pair for even sizes)
    float_type median(const Col &data);

    LinearFit lin_reg(const std::vector<double> &x, const std::vector<double> &y);

    // evenly spaced values par1, par1 + step, ... not exceeding par2 (tolerant of rounding);
    // a zero step yields just par1
    // @throws ConfigError if step < 0 or par2 < par1
    std::vector<float_type> grid(const float_type par1, const float_type par2, const float_type step);

    inline std::vector<float_type> as_vector(const Col &data) {
        return std::vector<float_type>(data.data(), data.data() + data.size());
    }

}

#endif // LEGISSIM_LEGISUTIL_H
