#include "ResponseData.hh"
#include "IrtErrors.hh"
#include "IrtTypes.hh"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <set>
#include <sstream>

namespace {

std::string Trim(const std::string & s)
{
    size_t first = 0;
    size_t last = s.size();
    while (first < last && std::isspace((unsigned char)s[first])) first++;
    while (last > first && std::isspace((unsigned char)s[last - 1])) last--;
    std::string out = s.substr(first, last - first);
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
        out = out.substr(1, out.size() - 2);
    }
    return out;
}

std::string ToLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::vector<std::string> SplitLine(const std::string & line)
{
    std::vector<std::string> cells;
    std::string cell;
    std::stringstream ss(line);
    while (std::getline(ss, cell, ',')) cells.push_back(Trim(cell));
    // trailing empty cell after a final comma
    if (!line.empty() && line.back() == ',') cells.push_back("");
    return cells;
}

bool IsIdHeader(const std::string & name)
{
    std::string lower = ToLower(name);
    const char * terms[] = {"id", "student", "person", "subject"};
    for (const char * term : terms) {
        if (lower.find(term) != std::string::npos) return true;
    }
    return false;
}

// Distinct cell value for error reports: numbers by value, then other text
struct SeenValue {
    bool numeric;
    double number;
    std::string text;

    explicit SeenValue(const std::string & cell) : numeric(false), number(0.0), text(cell)
    {
        std::stringstream ss(cell);
        double x;
        ss >> x;
        if (!ss.fail() && ss.eof()) {
            numeric = true;
            number = x;
            std::stringstream out;
            out << x;
            text = out.str();
        }
    }

    bool operator<(const SeenValue & other) const
    {
        if (numeric != other.numeric) return numeric;
        if (numeric) return number < other.number;
        return text < other.text;
    }
};

} // namespace

RawTable ParseResponseCsv(std::istream & in, bool drop_id_column)
{
    RawTable table;
    std::string line;

    // Header: first non-empty line
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!Trim(line).empty()) break;
    }
    if (Trim(line).empty()) {
        throw SchemaError("Response table is empty");
    }
    table.header = SplitLine(line);

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (Trim(line).empty()) continue;
        table.rows.push_back(SplitLine(line));
    }

    if (drop_id_column && table.header.size() > 1 && IsIdHeader(table.header[0])) {
        table.header.erase(table.header.begin());
        for (auto & row : table.rows) {
            if (!row.empty()) row.erase(row.begin());
        }
    }
    return table;
}

RawTable ReadResponseCsv(const std::string & filename, bool drop_id_column)
{
    std::ifstream in(filename.c_str());
    if (!in.good()) {
        throw RequestError("Cannot open response file: " + filename);
    }
    return ParseResponseCsv(in, drop_id_column);
}

DataValidator::DataValidator() : min_rows(10), printlvl(0) {}

bool DataValidator::ParseCell(const std::string & cell, double & value)
{
    std::string s = ToLower(Trim(cell));
    if (s.empty() || s == "na" || s == "nan" || s == ".") {
        value = kMissing;
        return true;
    }
    std::stringstream ss(s);
    double x;
    ss >> x;
    if (ss.fail() || !ss.eof()) return false;
    if (x == 0.0 || x == 1.0) {
        value = x;
        return true;
    }
    return false;
}

ValidatedData DataValidator::Validate(const RawTable & table) const
{
    int nitem = table.GetNCols();
    int nrow = table.GetNRows();
    if (nitem == 0) {
        throw SchemaError("Response table has no item columns");
    }

    // ===== STEP 1: Parse and check every cell =====
    Eigen::MatrixXd raw(nrow, nitem);
    std::set<SeenValue> seenvalues;   // distinct non-missing cell values
    bool foundbad = false;

    for (int irow = 0; irow < nrow; irow++) {
        const std::vector<std::string> & row = table.rows[irow];
        if (int(row.size()) != nitem) {
            std::stringstream msg;
            msg << "Row " << (irow + 1) << " has " << row.size()
                << " cells, expected " << nitem;
            throw SchemaError(msg.str());
        }
        for (int j = 0; j < nitem; j++) {
            double x;
            bool ok = ParseCell(row[j], x);
            if (!ok || !IsMissing(x)) seenvalues.insert(SeenValue(Trim(row[j])));
            if (!ok) {
                foundbad = true;
                continue;
            }
            raw(irow, j) = x;
        }
    }

    if (foundbad) {
        // Report every distinct value found, like "Found: 0, 1, 2"
        std::stringstream msg;
        msg << "Responses must be 0/1. Found: ";
        bool first = true;
        for (const auto & v : seenvalues) {
            if (!first) msg << ", ";
            msg << v.text;
            first = false;
        }
        throw SchemaError(msg.str());
    }

    // ===== STEP 2: Keep rows with 0 < sum < nitem =====
    ValidatedData out;
    out.original_rows = nrow;
    out.original_cols = nitem;
    out.item_names = table.header;

    for (int irow = 0; irow < nrow; irow++) {
        double rowsum = 0.0;
        for (int j = 0; j < nitem; j++) {
            if (!IsMissing(raw(irow, j))) rowsum += raw(irow, j);
        }
        if (rowsum > 0.0 && rowsum < double(nitem)) out.kept_rows.push_back(irow);
    }

    int nkept = int(out.kept_rows.size());
    if (printlvl > 0) {
        printf("After filtering: %d of %d rows are informative.\n", nkept, nrow);
    }
    if (nkept < min_rows) {
        std::stringstream msg;
        msg << "Not enough valid response patterns after filtering ("
            << nkept << " rows, need at least " << min_rows << ")";
        throw InsufficientDataError(msg.str());
    }

    out.responses.resize(nkept, nitem);
    for (int i = 0; i < nkept; i++) out.responses.row(i) = raw.row(out.kept_rows[i]);

    return out;
}
