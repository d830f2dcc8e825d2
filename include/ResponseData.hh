#ifndef RESPONSEDATA_HH
#define RESPONSEDATA_HH

#include <istream>
#include <string>
#include <vector>
#include <Eigen/Dense>

// Raw tabular input as read from a CSV file: header plus string cells
struct RawTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    int GetNRows() const { return int(rows.size()); }
    int GetNCols() const { return int(header.size()); }
};

// Read a comma separated table with a header row.
// If drop_id_column is set and the first header names a respondent id
// (contains "id", "student", "person" or "subject"), that column is dropped.
RawTable ParseResponseCsv(std::istream & in, bool drop_id_column = true);
RawTable ReadResponseCsv(const std::string & filename, bool drop_id_column = true);

// Output of DataValidator::Validate
struct ValidatedData {
    Eigen::MatrixXd responses;          // cleaned respondents x items, NaN = missing
    int original_rows;                  // respondents before cleaning
    int original_cols;                  // items before cleaning (== responses.cols())
    std::vector<std::string> item_names;  // header of the raw table
    std::vector<int> kept_rows;         // raw row index of every cleaned row

    int GetNRespondents() const { return int(responses.rows()); }
    int GetNItems() const { return int(responses.cols()); }
};

class DataValidator {
private:
    int min_rows;    // minimum number of informative rows
    int printlvl;

public:
    DataValidator();

    void SetMinRows(int n) { min_rows = n; }
    int GetMinRows() const { return min_rows; }
    void SetPrintLevel(int lvl) { printlvl = lvl; }

    // Parse cells into {0, 1, NaN} and drop rows that are all correct or
    // all incorrect. Throws SchemaError / InsufficientDataError.
    ValidatedData Validate(const RawTable & table) const;

    // Parse one cell. Returns false if the cell is not a score or missing.
    static bool ParseCell(const std::string & cell, double & value);
};

#endif // RESPONSEDATA_HH
