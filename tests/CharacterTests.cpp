// Character creation pipeline, derived values and sheet export.
#include <cassert>
#include <cmath>
#include <random>
#include <sstream>
#include <string>

#include "../engine/archive/ProfileArchive.h"
#include "../engine/core/Errors.h"
#include "../engine/core/Logger.h"
#include "../game/export/SheetExport.h"
#include "../game/rpg/Character.h"

using namespace Insmv;
using Scox::Archive::MemoryArchive;

namespace {
MemoryArchive emptyArchive(const std::string& identity) {
    MemoryArchive archive(identity);
    archive.setSection("attributes", "Name,Rank\n")
        .setSection("values", "Name,Rank\n")
        .setSection("primary_skills", "Name,Rank\n")
        .setSection("secondary_skills", "Name,Rank\n")
        .setSection("exotic_skills", "Name,Rank\n")
        .setSection("powers", "Name,Rank,Cost,Invariant\n");
    return archive;
}

int side(const Character& c, const char* key) { return c.sideValues().find(key)->fullRank(); }
}  // namespace

int main() {
    std::ostringstream log;
    Scox::Logger::setStream(&log);

    // Default demon: every attribute at 2.
    {
        Character c("Test", Nature::Demon);
        c.recompute();
        assert(side(c, "PF") == 4);
        assert(side(c, "PP") == 4);
        assert(side(c, "BL") == 4 && side(c, "BG") == 8 && side(c, "BF") == 12 && side(c, "MS") == 16);
        assert(c.primarySkills().find("Combat")->value().baseRank == 2);
        assert(c.exoticSkills().find("Chance")->value().baseRank == 2);
        assert(c.superiorLabel() == "?");
    }

    // Demon with Force 3: wound 5 gives 5 / 10 / 15 / 20.
    {
        Character c("Brute", Nature::Demon);
        assert(c.incrementAttribute("Force"));
        assert(c.incrementAttribute("Force"));
        assert(!c.incrementAttribute("Charisme"));
        c.recompute();
        assert(std::abs(c.attributes().find("Force")->realRank() - 3.0f) < 0.001f);
        assert(side(c, "BL") == 5 && side(c, "BG") == 10 && side(c, "BF") == 15 && side(c, "MS") == 20);
        assert(side(c, "PF") == 5);
        assert(c.primarySkills().find("Combat")->value().baseRank == 3);
    }

    // Angel with Force 2.5: wound 5.5 is floored after each multiplication.
    {
        Character c("Gardien", Nature::Angel);
        c.incrementAttribute("Force");
        c.recompute();
        assert(side(c, "BL") == 5 && side(c, "BG") == 11 && side(c, "BF") == 16 && side(c, "MS") == 22);
        assert(side(c, "PF") == 4);

        // Idempotent.
        c.recompute();
        assert(side(c, "BG") == 11);
        assert(c.primarySkills().find("Combat")->value().baseRank == 2);
    }

    // Full pipeline with in-memory templates.
    {
        MemoryArchive superior = emptyArchive("Baal");
        superior.setSection("attributes", "Name,Rank\nForce,2\n")
            .setSection("powers", "Name,Rank,Cost,Invariant\nFeu,2,1 PP,\n");
        MemoryArchive archetype = emptyArchive("Combattant");
        archetype.setSection("primary_skills", "Name,Rank\nCombat,1\nCombat_spe,2\n")
            .setSection("secondary_skills", "Name,Rank\nLangues_Anglais,1\n")
            .setSection("table_demon", "value;powers;pp;bonus\n[1,2];{};1;{Baal:2}\n");

        std::mt19937 rng(11);
        Character c = Character::create("Zagam", Nature::Demon, archetype, superior, rng);
        assert(c.name() == "Zagam");
        assert(c.superior() && *c.superior() == "Baal");
        assert(c.powerTable() && c.powerTable()->entryFor(1)->pp == 2);
        assert(c.sideValues().find("PP")->rank == 4);
        assert(side(c, "PP") == 8);
        assert(side(c, "BL") == 5);
        assert(c.powers().find("Feu")->value.baseRank == 4);

        const Skill* combat = c.primarySkills().find("Combat");
        assert(combat->value().baseRank == 3 && combat->rank() == 1);
        assert(combat->specialization()->rank() == 2);
        assert(combat->specialization()->fullRank() >= combat->fullRank());
        assert(c.secondarySkills().find("Langues")->varieties().size() == 1);

        std::ostringstream text;
        Export::exportText(c, text);
        const std::string out = text.str();
        assert(out.rfind("Zagam - Grade 0 - Baal\n", 0) == 0);
        assert(out.find("Attributs : Force 3, Agilité 2,") != std::string::npos);
        assert(out.find("Valeurs annexes : 8 PP, 5 PF, BL 5 / BG 10 / BF 15 / MS 20\n") != std::string::npos);
        assert(out.find("Combat 2 (Spécialité 2+)") != std::string::npos);
        assert(out.find("Langues 1+ (Anglais)") != std::string::npos);
        assert(out.find("Crochetage") == std::string::npos);
        assert(out.find("Pouvoirs : Feu 2\n\n") != std::string::npos);

        std::ostringstream sheet;
        Export::printSheet(c, sheet);
        assert(sheet.str().find("Zagam") != std::string::npos);
        assert(sheet.str().find("Talents secondaires") != std::string::npos);
    }

    // Short draws only warn; schema errors abort creation.
    {
        MemoryArchive superior = emptyArchive("Baal");
        superior.setSection("powers", "Name,Rank,Cost,Invariant\nFeu,1,,\n");
        MemoryArchive archetype = emptyArchive("Pyromane");
        archetype.setSection("table_demon", "value;powers;pp;bonus\n[1];{Feu:[0,1,1 PP]};1;\n");
        std::mt19937 rng(5);
        Character c = Character::create("Ifrit", Nature::Demon, archetype, superior, rng);
        assert(c.powers().size() == 1);
        assert(log.str().find("only 0 of 2") != std::string::npos);

        MemoryArchive broken = emptyArchive("Brisé");
        broken.setSection("exotic_skills", "Name,Rank\nTelepathie,1\n");
        bool threw = false;
        try {
            Character::create("Raté", Nature::Demon, archetype, broken, rng);
        } catch (const Scox::SchemaError&) {
            threw = true;
        }
        assert(threw);
    }

    // Manual edits.
    {
        Character c("Edit", Nature::Angel);
        c.recompute();
        assert(c.incrementSkill(SkillSection::Primary, "Combat", true));
        assert(c.incrementSkill(SkillSection::Primary, "Combat"));
        assert(c.primarySkills().find("Combat")->rank() == 1);
        assert(c.decrementSkill(SkillSection::Primary, "Combat", true));
        assert(c.primarySkills().find("Combat")->specialization()->rank() == 1);
        assert(!c.incrementSkill(SkillSection::Primary, "Voler"));

        assert(c.renameSpecialization(SkillSection::Primary, "Combat", "Épée"));
        assert(c.primarySkills().find("Combat")->specialization()->name() == "Épée");
        assert(!c.renameSpecialization(SkillSection::Primary, "Course", "Sprint"));
        assert(c.warnings().size() == 1);

        assert(c.addVariety(SkillSection::Secondary, "Langues", "Russe"));
        assert(c.removeVariety(SkillSection::Secondary, "Langues", "Russe"));
        assert(!c.addVariety(SkillSection::Secondary, "Crochetage", "Serrures"));
        assert(c.warnings().size() == 2);

        assert(c.decrementAttribute("Foi"));
        assert(c.attributes().find("Foi")->value.rank == 0);
    }

    // Fixed-width sheet entries.
    {
        assert(Export::formatEntry("Force", std::string("2 "), 14) == "Force ----- 2 ");
        assert(Export::utf8Length(Export::formatEntry("Agilité", std::string("3+"), 14)) == 14);
        assert(Export::formatEntry("Regard", std::nullopt, 10) == "Regard    ");
        assert(Export::utf8Length("Épée") == 4);
    }

    Scox::Logger::setStream(nullptr);
    return 0;
}
