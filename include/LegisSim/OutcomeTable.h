#ifndef LEGISSIM_OUTCOMETABLE_H
#define LEGISSIM_OUTCOMETABLE_H

#include <ostream>
#include <string>
#include <vector>

#include <LegisSim/TypeDefs.h>
#include <LegisSim/Session.h>

namespace LEGIS {

// column order of the outcome table; rows are repetitions
enum COLUMN {
    INITIAL_VALUE, FINAL_VALUE, NUM_VOTES, YEAS,
    MAJORITY_SIZE, DISTANCE,
    MAJORITY_SIGMA, MAJORITY_ADJ, MINORITY_SIGMA, MINORITY_ADJ,
    NUM_COLUMNS
};

// header labels, in COLUMN order
const std::vector<std::string> & column_names();

// true for columns holding counts (written without a decimal part)
bool is_integral(const COLUMN col);

Row as_row(const Outcome &outcome);
Mat2D as_table(const std::vector<Outcome> &outcomes);

// stacks tables in the order given
Mat2D concatenate(const std::vector<Mat2D> &tables);

// Comma separated, header row with an empty first cell, then one line per row prefixed by its
// 1-based index. NaN cells (repetitions that never passed) are written as empty fields; real cells
// in the shortest form that reads back as the same double.
void write_csv(const Mat2D &table, std::ostream &os);

// As above, to `filename`; missing parent directories are created.
// @throws std::runtime_error if the file cannot be opened
void write_csv(const Mat2D &table, const std::string &filename);

} // namespace LEGIS

#endif // LEGISSIM_OUTCOMETABLE_H
