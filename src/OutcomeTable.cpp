#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <LegisSim/OutcomeTable.h>

using std::string;
using std::vector;

namespace LEGIS {

const vector<string> & column_names() {
    static const vector<string> names = {
        "Initial Value", "Final Value", "Number of Votes", "Yeas",
        "Majority Party Size", "Distance between Medians",
        "Majority St. Dev.", "Majority Round Adjustment",
        "Minority St. Dev.", "Minority Round Adjustment"
    };
    return names;
}

bool is_integral(const COLUMN col) {
    return (col == NUM_VOTES) or (col == YEAS) or (col == MAJORITY_SIZE);
}

Row as_row(const Outcome &outcome) {
    Row row(NUM_COLUMNS);
    row[INITIAL_VALUE]  = outcome.initial_value;
    row[FINAL_VALUE]    = outcome.final_value;
    row[NUM_VOTES]      = static_cast<float_type>(outcome.votes);
    row[YEAS]           = static_cast<float_type>(outcome.yeas);
    row[MAJORITY_SIZE]  = static_cast<float_type>(outcome.majority_size);
    row[DISTANCE]       = outcome.distance;
    row[MAJORITY_SIGMA] = outcome.majority_sigma;
    row[MAJORITY_ADJ]   = outcome.majority_adj;
    row[MINORITY_SIGMA] = outcome.minority_sigma;
    row[MINORITY_ADJ]   = outcome.minority_adj;
    return row;
}

Mat2D as_table(const vector<Outcome> &outcomes) {
    Mat2D table(outcomes.size(), static_cast<size_t>(NUM_COLUMNS));
    for (size_t i = 0; i < outcomes.size(); ++i) { table.row(i) = as_row(outcomes[i]); }
    return table;
}

Mat2D concatenate(const vector<Mat2D> &tables) {
    size_t nrows = 0;
    for (const Mat2D &t : tables) { nrows += t.rows(); }
    Mat2D all(nrows, static_cast<size_t>(NUM_COLUMNS));
    size_t r = 0;
    for (const Mat2D &t : tables) {
        all.middleRows(r, t.rows()) = t;
        r += t.rows();
    }
    return all;
}

// shortest text that reads back as exactly `val`
string _format_real(const float_type val) {
    char buffer[32];
    const std::to_chars_result res = std::to_chars(buffer, buffer + sizeof(buffer), val);
    return string(buffer, res.ptr);
}

void write_csv(const Mat2D &table, std::ostream &os) {
    for (const string &name : column_names()) { os << "," << name; }
    os << "\n";

    for (size_t r = 0; r < static_cast<size_t>(table.rows()); ++r) {
        os << r + 1;
        for (size_t c = 0; c < static_cast<size_t>(table.cols()); ++c) {
            const float_type val = table(r, c);
            os << ",";
            if (std::isnan(val)) { continue; }
            if (is_integral(static_cast<COLUMN>(c))) {
                os << static_cast<long long>(std::llround(val));
            } else {
                os << _format_real(val);
            }
        }
        os << "\n";
    }
}

void write_csv(const Mat2D &table, const string &filename) {
    const std::filesystem::path path(filename);
    if (path.has_parent_path()) { std::filesystem::create_directories(path.parent_path()); }

    std::ofstream ofs(filename);
    if (not ofs) { throw std::runtime_error("unable to open " + filename + " for writing"); }
    write_csv(table, ofs);
}

} // namespace LEGIS
