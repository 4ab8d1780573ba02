// Archetype power table: die faces mapped to power grants and a PP award.
#pragma once

#include <map>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "../../engine/archive/CsvTable.h"

namespace Insmv {

struct Profile;

struct PowerCandidate {
    std::string name;
    bool flat{false};  // flat grants become invariant powers
    int rank{0};
    std::string cost;
};

// One source row; a row may cover several faces.
struct PowerTableRow {
    std::vector<int> faces;
    std::vector<PowerCandidate> powers;
    int pp{0};
    // Superior name -> PP award replacing pp.
    std::vector<std::pair<std::string, int>> bonus;
};

struct PowerTableEntry {
    std::vector<PowerCandidate> powers;
    int pp{0};
};

class PowerTable {
public:
    // A face declared by several rows keeps the last row.
    static PowerTable generate(const std::vector<PowerTableRow>& rows, const std::optional<std::string>& superior);

    const std::map<int, PowerTableEntry>& faces() const { return faces_; }
    const PowerTableEntry* entryFor(int face) const;
    void setFace(int face, PowerTableEntry entry) { faces_[face] = std::move(entry); }
    bool empty() const { return faces_.empty(); }

private:
    std::map<int, PowerTableEntry> faces_;
};

// Columns value;powers;pp;bonus, e.g. "[1,2]", "{Charme:[0,2,1 PP]|Vol:[1,0,2 PP]}", "2", "{Scox:3}".
std::vector<PowerTableRow> parsePowerTableRows(const Scox::Archive::CsvTable& table);
std::vector<int> parseFaceList(const std::string& text);
std::vector<PowerCandidate> parseCandidates(const std::string& text);
std::vector<std::pair<std::string, int>> parseBonus(const std::string& text);

// Draws until count successes or the first collision with an owned power,
// which ends the whole draw. Returns the number of successes.
// Throws Scox::PreconditionError when the profile has no generated table.
int drawPowers(Profile& profile, int count, std::mt19937& rng);

}  // namespace Insmv
