#include <algorithm>
#include <cassert>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <LegisSim/LegisUtil.h>
#include <LegisSim/Legislator.h>
#include <LegisSim/Errors.h>

using std::string;
using std::vector;
using std::ifstream;
using std::stringstream;
using std::pow;
using std::sqrt;

namespace LEGIS {

    string slurp(const string &filename) {
        ifstream ifs(filename.c_str());
        stringstream sstr;
        sstr << ifs.rdbuf();
        return sstr.str();
    }

    bool file_exists(const string &filename) {
        ifstream infile(filename.c_str());
        return infile.good();
    }

    float_type clip_ideal(const float_type draw, const CLIP rule) {
        if (draw > 1.0) {
            return 1.0;
        } else if (draw < -1.0) {
            return (rule == HISTORICAL) ? 0.0 : -1.0;
        } else {
            return draw;
        }
    }

    float_type median_ideal(const vector<Legislator*> &roster) {
        if (roster.empty()) { throw std::out_of_range("median_ideal of an empty roster"); }
        return roster[roster.size() / 2]->get_ideal();
    }

    void sort_by_ideal(vector<Legislator*> &roster) {
        std::stable_sort(roster.begin(), roster.end(),
            [](const Legislator* a, const Legislator* b) { return a->get_ideal() < b->get_ideal(); }
        );
    }

    float_type median(const Col &data) {
        assert(data.size() > 0);
        // copy & sort data
        vector<float_type> vdata = as_vector(data);
        const size_t n = vdata.size();
        std::sort(vdata.begin(), vdata.end());

        if (n % 2 == 0) {
            return (vdata[n / 2 - 1] + vdata[n / 2]) / 2;
        } else {
            return vdata[n / 2];
        }
    }

    LinearFit lin_reg(const vector<double> &x, const vector<double> &y) {
        assert( x.size() == y.size() );
        LinearFit fit = { 0.0, 0.0, 0.0 };
        const size_t n = x.size();
        double sumx = 0.0;                        /* sum of x                      */
        double sumx2 = 0.0;                       /* sum of x**2                   */
        double sumxy = 0.0;                       /* sum of x * y                  */
        double sumy = 0.0;                        /* sum of y                      */
        double sumy2 = 0.0;                       /* sum of y**2                   */

        for (size_t i = 0; i < n; i++) {
            sumx  += x[i];
            sumx2 += pow(x[i], 2);
            sumxy += x[i] * y[i];
            sumy  += y[i];
            sumy2 += pow(y[i], 2);
        }

        const double denom = n * sumx2 - pow(sumx, 2);
        if (n == 0 or denom == 0) {
            // singular; no single-x fit exists
            return fit;
        }

        fit.m = (n * sumxy  -  sumx * sumy) / denom;
        fit.b = (sumy * sumx2  -  sumx * sumxy) / denom;
        const double yvar = sumy2 - pow(sumy, 2) / n;
        if (yvar > 0) {
            fit.rsq = pow((sumxy - sumx * sumy / n) / sqrt((sumx2 - pow(sumx, 2) / n) * yvar), 2);
        }
        return fit;
    }

    vector<float_type> grid(const float_type par1, const float_type par2, const float_type step) {
        if (step < 0) { throw ConfigError("sweep step must be >= 0"); }
        if (par2 < par1) { throw ConfigError("sweep par2 must be >= par1"); }
        if (step == 0) { return { par1 }; }

        // tolerance keeps e.g. 0.0:2.0:0.05 from dropping its last value
        const size_t count = static_cast<size_t>(std::floor((par2 - par1) / step + 1e-9)) + 1;
        vector<float_type> vals(count);
        for (size_t i = 0; i < count; ++i) { vals[i] = par1 + i * step; }
        return vals;
    }

}
