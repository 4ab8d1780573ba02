// Archetype power table parsing, generation and draws.
#include <cassert>
#include <random>
#include <set>
#include <sstream>

#include "../engine/archive/CsvTable.h"
#include "../engine/core/Errors.h"
#include "../engine/core/Logger.h"
#include "../game/rpg/PowerTable.h"
#include "../game/rpg/Profile.h"

using namespace Insmv;
using Scox::Archive::CsvTable;

namespace {
Profile profileWithTable(const std::string& tableText, const std::optional<std::string>& superior = std::nullopt) {
    Profile p;
    initializeCatalogue(p);
    p.superior = superior;
    p.powerTable = PowerTable::generate(parsePowerTableRows(CsvTable::parse(tableText, ';')), superior);
    return p;
}
}  // namespace

int main() {
    std::ostringstream log;
    Scox::Logger::setStream(&log);

    // Cell parsers.
    {
        assert((parseFaceList("[1, 2,3]") == std::vector<int>{1, 2, 3}));
        assert((parseFaceList("4") == std::vector<int>{4}));

        auto candidates = parseCandidates("{Charme:[0,2,1 PP/tour]|Vol:[1,0,2 PP, par cible]}");
        assert(candidates.size() == 2);
        assert(candidates[0].name == "Charme" && !candidates[0].flat && candidates[0].rank == 2);
        assert(candidates[0].cost == "1 PP/tour");
        assert(candidates[1].flat && candidates[1].cost == "2 PP, par cible");
        assert(parseCandidates("{}").empty());

        auto bonus = parseBonus("{Scox:3|Baal:1}");
        assert(bonus.size() == 2 && bonus[0].first == "Scox" && bonus[1].second == 1);

        bool threw = false;
        try {
            parseCandidates("{Charme}");
        } catch (const Scox::SchemaError&) {
            threw = true;
        }
        assert(threw);
    }

    // Row validation.
    {
        bool threw = false;
        try {
            parsePowerTableRows(CsvTable::parse("value;powers;pp;bonus\n[1];{};-1;\n", ';'));
        } catch (const Scox::SchemaError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            parsePowerTableRows(CsvTable::parse("value;powers;pp;bonus\n[];{};1;\n", ';'));
        } catch (const Scox::SchemaError&) {
            threw = true;
        }
        assert(threw);
    }

    // Generation: faces expanded, superior bonus overrides pp, later rows win.
    {
        const std::string text =
            "value;powers;pp;bonus\n"
            "[1,2];{Charme:[0,2,1 PP]};1;{SCOX:3|Baal:2}\n"
            "[3];{};2;\n"
            "[2];{Vol:[1,0,2 PP]};1;\n";
        const auto rows = parsePowerTableRows(CsvTable::parse(text, ';'));
        PowerTable withScox = PowerTable::generate(rows, std::string("Scox"));
        assert(withScox.faces().size() == 3);
        assert(withScox.entryFor(1)->pp == 3);
        assert(withScox.entryFor(2)->powers[0].name == "Vol");
        assert(withScox.entryFor(2)->pp == 1);
        assert(withScox.entryFor(3)->powers.empty());
        assert(withScox.entryFor(4) == nullptr);

        PowerTable plain = PowerTable::generate(rows, std::nullopt);
        assert(plain.entryFor(1)->pp == 1);
    }

    // Drawing requires a generated table.
    {
        Profile p;
        initializeCatalogue(p);
        std::mt19937 rng(1);
        bool threw = false;
        try {
            drawPowers(p, 2, rng);
        } catch (const Scox::PreconditionError&) {
            threw = true;
        }
        assert(threw);

        p.powerTable = PowerTable{};
        threw = false;
        try {
            drawPowers(p, 1, rng);
        } catch (const Scox::PreconditionError&) {
            threw = true;
        }
        assert(threw);
    }

    // A collision on the first draw aborts with nothing granted.
    {
        Profile p = profileWithTable("value;powers;pp;bonus\n[1,2,3];{Charme:[0,2,1 PP]};2;\n");
        p.powers.insert("Charme", Scox::Values::makePower("Charme", false, 1, "", 0));
        const int poolBefore = p.values.find("PP")->rank;
        std::mt19937 rng(42);
        assert(drawPowers(p, 2, rng) == 0);
        assert(p.values.find("PP")->rank == poolBefore);
        assert(p.powers.size() == 1);
        assert(p.powers.find("Charme")->value.baseRank == 2);
        assert(log.str().find("Power draw stopped") != std::string::npos);
    }

    // A collision after one success keeps the first grant.
    {
        Profile p = profileWithTable("value;powers;pp;bonus\n[1];{Aura:[1,0,1 PP]};2;\n");
        std::mt19937 rng(7);
        assert(drawPowers(p, 2, rng) == 1);
        assert(p.values.find("PP")->rank == 2);
        const Power* aura = p.powers.find("Aura");
        assert(aura && aura->invariant && aura->slot == 0);
    }

    // Faces without powers never collide.
    {
        Profile p = profileWithTable("value;powers;pp;bonus\n[1,2];{};1;{Scox:2}\n", std::string("Scox"));
        std::mt19937 rng(3);
        assert(drawPowers(p, 3, rng) == 3);
        assert(p.values.find("PP")->rank == 6);
        assert(p.powers.empty());
    }

    // Over many seeds: pool never shrinks and powers are never duplicated.
    {
        const std::string text =
            "value;powers;pp;bonus\n"
            "[1];{A:[0,1,1 PP]};1;\n"
            "[2];{B:[0,2,1 PP]|C:[1,0,]};0;\n"
            "[3];{D:[0,3,2 PP]};2;\n"
            "[4];{};1;\n";
        for (unsigned seed = 0; seed < 50; ++seed) {
            Profile p = profileWithTable(text);
            std::mt19937 rng(seed);
            const int drawn = drawPowers(p, 2, rng);
            assert(drawn >= 1 && drawn <= 2);
            assert(p.values.find("PP")->rank >= 0);
            std::set<std::string> names;
            int slot = 0;
            for (const auto& [key, power] : p.powers) {
                assert(names.insert(key).second);
                assert(power.slot == slot++);
            }
            if (const Power* b = p.powers.find("B")) {
                assert(b->value.baseRank == 4);
                assert(p.powers.contains("C"));
            }
        }
    }

    Scox::Logger::setStream(nullptr);
    return 0;
}
