// Header-keyed CSV sections as found in profile archives.
#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace Scox::Archive {

class CsvRow {
public:
    CsvRow(std::unordered_map<std::string, std::string> fields, int line);

    bool has(const std::string& column) const;
    // Throws Scox::SchemaError when the column is missing.
    const std::string& get(const std::string& column) const;
    // Empty cells read as fallback; malformed numbers throw Scox::SchemaError.
    int getInt(const std::string& column, int fallback = 0) const;
    bool getFlag(const std::string& column) const;
    int line() const { return line_; }

private:
    std::unordered_map<std::string, std::string> fields_;
    int line_{0};
};

class CsvTable {
public:
    // Quoted cells may contain the delimiter; "" escapes a quote. Blank lines are skipped.
    static CsvTable parse(const std::string& text, char delimiter = ',');

    const std::vector<CsvRow>& rows() const { return rows_; }

private:
    std::vector<std::string> header_;
    std::vector<CsvRow> rows_;
};

std::vector<std::string> splitCsvLine(const std::string& line, char delimiter);
std::string trim(const std::string& s);
// Throws Scox::SchemaError naming context when text is not an integer.
int parseInt(const std::string& text, const std::string& context);

}  // namespace Scox::Archive
