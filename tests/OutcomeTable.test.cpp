#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <LegisSim/OutcomeTable.h>
#include "testing.h"

using namespace LEGIS;
using namespace std;

Outcome sample_outcome(const double initial, const size_t votes) {
    Outcome out;
    out.initial_value = initial;
    out.final_value = 0.125;
    out.votes = votes;
    out.yeas = 51;
    out.majority_size = 51;
    out.distance = 1.0;
    out.majority_sigma = 0.1;
    out.majority_adj = 0.01;
    out.minority_sigma = 0.1;
    out.minority_adj = 0.01;
    out.passed = true;
    return out;
}

vector<string> lines_of(const string &text) {
    vector<string> lines;
    istringstream iss(text);
    string line;
    while (getline(iss, line)) { lines.push_back(line); }
    return lines;
}

void series_columns() {
    IS_TRUE(column_names().size() == NUM_COLUMNS);
    IS_TRUE(column_names()[INITIAL_VALUE] == "Initial Value");
    IS_TRUE(column_names()[NUM_VOTES] == "Number of Votes");
    IS_TRUE(column_names()[DISTANCE] == "Distance between Medians");
    IS_TRUE(column_names()[MINORITY_ADJ] == "Minority Round Adjustment");
    IS_TRUE(is_integral(NUM_VOTES) and is_integral(YEAS) and is_integral(MAJORITY_SIZE));
    IS_TRUE(not is_integral(FINAL_VALUE) and not is_integral(DISTANCE));

    const Row row = as_row(sample_outcome(-0.25, 7));
    IS_TRUE(row.size() == NUM_COLUMNS);
    IS_TRUE(row[INITIAL_VALUE] == -0.25);
    IS_TRUE(row[NUM_VOTES] == 7);
    IS_TRUE(row[MAJORITY_SIGMA] == 0.1);
}

void series_concatenate() {
    const Mat2D first = as_table({ sample_outcome(0.1, 1), sample_outcome(0.2, 2) });
    const Mat2D second = as_table({ sample_outcome(0.3, 3) });
    IS_TRUE(first.rows() == 2 and first.cols() == NUM_COLUMNS);

    const Mat2D all = concatenate({ first, second });
    IS_TRUE(all.rows() == 3);
    IS_TRUE(all(0, NUM_VOTES) == 1 and all(1, NUM_VOTES) == 2 and all(2, NUM_VOTES) == 3);
    IS_TRUE(concatenate({}).rows() == 0);
}

void series_csv() {
    Outcome diverged = sample_outcome(-0.5, 100);
    diverged.final_value = NAN;
    diverged.passed = false;
    const Mat2D table = as_table({ sample_outcome(0.25, 4), diverged });

    ostringstream oss;
    write_csv(table, oss);
    const vector<string> lines = lines_of(oss.str());

    IS_TRUE(lines.size() == 3);
    IS_TRUE(lines[0] == ",Initial Value,Final Value,Number of Votes,Yeas,Majority Party Size,Distance between Medians,"
                        "Majority St. Dev.,Majority Round Adjustment,Minority St. Dev.,Minority Round Adjustment");
    IS_TRUE(lines[1] == "1,0.25,0.125,4,51,51,1,0.1,0.01,0.1,0.01");
    IS_TRUE(lines[2] == "2,-0.5,,100,51,51,1,0.1,0.01,0.1,0.01");
}

vector<string> cells_of(const string &line) {
    vector<string> cells;
    istringstream iss(line);
    string cell;
    while (getline(iss, cell, ',')) { cells.push_back(cell); }
    return cells;
}

void series_csv_precision() {
    Outcome out = sample_outcome(0.1234567890123456, 12);
    out.final_value = -0.54876543210987654;
    out.distance = 2.0 / 3.0;
    out.majority_sigma = 1e-7 / 3.0;
    out.minority_adj = 0.1 + 0.2;
    const Mat2D table = as_table({ out });

    ostringstream oss;
    write_csv(table, oss);
    const vector<string> cells = cells_of(lines_of(oss.str())[1]);
    IS_TRUE(cells.size() == NUM_COLUMNS + 1);

    // every written value reads back as the in-memory double
    for (size_t c = 0; c < NUM_COLUMNS; ++c) {
        IS_TRUE(strtod(cells[c + 1].c_str(), nullptr) == table(0, c));
    }
    IS_TRUE(cells[1 + INITIAL_VALUE] == "0.1234567890123456");
    IS_TRUE(cells[1 + MINORITY_ADJ] == "0.30000000000000004");
}

void series_csv_file() {
    const filesystem::path dir = filesystem::temp_directory_path() / "legissim_outcome_test";
    filesystem::remove_all(dir);
    const filesystem::path file = dir / "nested" / "output.csv";

    write_csv(as_table({ sample_outcome(0.25, 4) }), file.string());
    IS_TRUE(filesystem::exists(file));

    ifstream ifs(file);
    stringstream content;
    content << ifs.rdbuf();
    IS_TRUE(lines_of(content.str()).size() == 2);

    filesystem::remove_all(dir);
}

int main() {
    series_columns();
    series_concatenate();
    series_csv();
    series_csv_precision();
    series_csv_file();
    return test_status();
}
