#include "CsvTable.h"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "../core/Errors.h"

namespace Scox::Archive {

std::string trim(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

int parseInt(const std::string& text, const std::string& context) {
    const std::string t = trim(text);
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(t, &consumed);
    } catch (const std::exception&) {
        throw SchemaError("Invalid integer '" + text + "' in " + context);
    }
    if (consumed != t.size()) throw SchemaError("Invalid integer '" + text + "' in " + context);
    return value;
}

std::vector<std::string> splitCsvLine(const std::string& line, char delimiter) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cell += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == delimiter) {
            cells.push_back(trim(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }
    cells.push_back(trim(cell));
    return cells;
}

CsvRow::CsvRow(std::unordered_map<std::string, std::string> fields, int line)
    : fields_(std::move(fields)), line_(line) {}

bool CsvRow::has(const std::string& column) const { return fields_.count(column) > 0; }

const std::string& CsvRow::get(const std::string& column) const {
    auto it = fields_.find(column);
    if (it == fields_.end()) {
        throw SchemaError("Missing column '" + column + "' on line " + std::to_string(line_));
    }
    return it->second;
}

int CsvRow::getInt(const std::string& column, int fallback) const {
    const std::string& raw = get(column);
    if (raw.empty()) return fallback;
    return parseInt(raw, "column '" + column + "' on line " + std::to_string(line_));
}

bool CsvRow::getFlag(const std::string& column) const {
    if (!has(column)) return false;
    std::string raw = get(column);
    std::transform(raw.begin(), raw.end(), raw.begin(), [](unsigned char c) { return std::tolower(c); });
    return raw == "1" || raw == "true" || raw == "yes";
}

CsvTable CsvTable::parse(const std::string& text, char delimiter) {
    CsvTable table;
    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    bool haveHeader = false;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        // Byte order mark left by spreadsheet exports.
        if (lineNo == 1 && line.rfind("\xEF\xBB\xBF", 0) == 0) line.erase(0, 3);
        if (trim(line).empty()) continue;
        auto cells = splitCsvLine(line, delimiter);
        if (!haveHeader) {
            table.header_ = std::move(cells);
            haveHeader = true;
            continue;
        }
        std::unordered_map<std::string, std::string> fields;
        for (std::size_t i = 0; i < table.header_.size(); ++i) {
            fields[table.header_[i]] = i < cells.size() ? cells[i] : std::string{};
        }
        table.rows_.emplace_back(std::move(fields), lineNo);
    }
    return table;
}

}  // namespace Scox::Archive
