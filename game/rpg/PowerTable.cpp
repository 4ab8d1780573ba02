#include "PowerTable.h"

#include <algorithm>
#include <cctype>

#include "../../engine/core/Errors.h"
#include "../../engine/core/Logger.h"
#include "Profile.h"

namespace Insmv {

using Scox::Archive::parseInt;
using Scox::Archive::trim;

namespace {
std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Strips one pair of enclosing delimiters ("[...]", "{...}") if present.
std::string unwrap(const std::string& text, char open, char close) {
    std::string t = trim(text);
    if (t.size() >= 2 && t.front() == open && t.back() == close) t = t.substr(1, t.size() - 2);
    return trim(t);
}

std::vector<std::string> splitOn(const std::string& text, const std::string& separators) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (separators.find(c) != std::string::npos) {
            if (!trim(current).empty()) parts.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!trim(current).empty()) parts.push_back(trim(current));
    return parts;
}

bool parseFlag(const std::string& text) {
    const std::string t = lowered(trim(text));
    return t == "1" || t == "true" || t == "yes";
}
}  // namespace

std::vector<int> parseFaceList(const std::string& text) {
    std::vector<int> faces;
    for (const auto& part : splitOn(unwrap(text, '[', ']'), ",")) {
        faces.push_back(parseInt(part, "power table face list '" + text + "'"));
    }
    return faces;
}

std::vector<PowerCandidate> parseCandidates(const std::string& text) {
    std::vector<PowerCandidate> out;
    for (const auto& entry : splitOn(unwrap(text, '{', '}'), "|")) {
        const auto open = entry.find(":[");
        const auto close = entry.rfind(']');
        if (open == std::string::npos || close == std::string::npos || close < open) {
            throw Scox::SchemaError("Malformed power entry '" + entry + "'");
        }
        PowerCandidate c{};
        c.name = trim(entry.substr(0, open));
        const std::string body = entry.substr(open + 2, close - open - 2);
        const auto firstComma = body.find(',');
        const auto secondComma = firstComma == std::string::npos ? std::string::npos : body.find(',', firstComma + 1);
        if (c.name.empty() || secondComma == std::string::npos) {
            throw Scox::SchemaError("Malformed power entry '" + entry + "'");
        }
        c.flat = parseFlag(body.substr(0, firstComma));
        const std::string rank = trim(body.substr(firstComma + 1, secondComma - firstComma - 1));
        c.rank = rank.empty() ? 0 : parseInt(rank, "power entry '" + entry + "'");
        c.cost = trim(body.substr(secondComma + 1));
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<std::pair<std::string, int>> parseBonus(const std::string& text) {
    std::vector<std::pair<std::string, int>> out;
    for (const auto& entry : splitOn(unwrap(text, '{', '}'), "|,")) {
        const auto colon = entry.rfind(':');
        if (colon == std::string::npos) throw Scox::SchemaError("Malformed bonus entry '" + entry + "'");
        out.emplace_back(trim(entry.substr(0, colon)), parseInt(entry.substr(colon + 1), "bonus entry '" + entry + "'"));
    }
    return out;
}

std::vector<PowerTableRow> parsePowerTableRows(const Scox::Archive::CsvTable& table) {
    std::vector<PowerTableRow> rows;
    for (const auto& r : table.rows()) {
        PowerTableRow row{};
        row.faces = parseFaceList(r.get("value"));
        if (row.faces.empty()) {
            throw Scox::SchemaError("Power table row on line " + std::to_string(r.line()) + " has no face");
        }
        row.powers = parseCandidates(r.get("powers"));
        row.pp = r.getInt("pp", 0);
        if (r.has("bonus")) row.bonus = parseBonus(r.get("bonus"));
        if (row.pp < 0) throw Scox::SchemaError("Negative pp award on line " + std::to_string(r.line()));
        for (const auto& [name, award] : row.bonus) {
            if (award < 0) throw Scox::SchemaError("Negative bonus for " + name + " on line " + std::to_string(r.line()));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

PowerTable PowerTable::generate(const std::vector<PowerTableRow>& rows, const std::optional<std::string>& superior) {
    PowerTable table;
    const std::string superiorKey = superior ? lowered(*superior) : std::string{};
    for (const auto& row : rows) {
        PowerTableEntry entry{};
        entry.powers = row.powers;
        entry.pp = row.pp;
        if (superior) {
            for (const auto& [name, award] : row.bonus) {
                if (lowered(name) == superiorKey) entry.pp = award;
            }
        }
        for (int face : row.faces) table.faces_[face] = entry;
    }
    return table;
}

const PowerTableEntry* PowerTable::entryFor(int face) const {
    auto it = faces_.find(face);
    return it != faces_.end() ? &it->second : nullptr;
}

int drawPowers(Profile& profile, int count, std::mt19937& rng) {
    if (!profile.powerTable || profile.powerTable->empty()) {
        throw Scox::PreconditionError("Power table has not been generated");
    }
    Value* pool = profile.values.find("PP");
    if (!pool) throw Scox::SchemaError("Side value PP not found.");

    std::vector<int> keys;
    for (const auto& [face, _] : profile.powerTable->faces()) keys.push_back(face);
    std::uniform_int_distribution<std::size_t> pick(0, keys.size() - 1);

    int successes = 0;
    while (successes < count) {
        const int face = keys[pick(rng)];
        const PowerTableEntry& entry = *profile.powerTable->entryFor(face);
        const bool collision = std::any_of(entry.powers.begin(), entry.powers.end(),
                                           [&](const PowerCandidate& c) { return profile.powers.contains(c.name); });
        if (collision) {
            Scox::logInfo("Power draw stopped on face " + std::to_string(face) + " after " +
                          std::to_string(successes) + " success(es): power already owned.");
            break;
        }
        pool->rank += entry.pp;
        for (const auto& c : entry.powers) {
            const int slot = static_cast<int>(profile.powers.size());
            profile.powers.insert(c.name, Scox::Values::makePower(c.name, c.flat, c.rank, c.cost, slot));
        }
        ++successes;
    }
    return successes;
}

}  // namespace Insmv
