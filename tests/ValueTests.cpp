// Rank arithmetic, specialization ceiling and usability rules.
#include <cassert>
#include <cmath>
#include <random>
#include <vector>

#include "../engine/values/Value.h"

using namespace Scox::Values;

namespace {
Attribute makeAttribute(int baseRank) {
    Attribute a{};
    a.name = "Force";
    a.value.baseRank = baseRank;
    return a;
}

SkillTraits specificTraits() {
    SkillTraits t{};
    t.specific = true;
    return t;
}
}  // namespace

int main() {
    // Half-point display: Force 4 -> "2 ", two increments -> "3 ", odd -> "3+".
    {
        Attribute force = makeAttribute(4);
        assert(std::abs(force.realRank() - 2.0f) < 0.001f);
        assert(force.displayRank() && *force.displayRank() == "2 ");
        force.incrementRank();
        force.incrementRank();
        assert(force.fullRank() == 6);
        assert(std::abs(force.realRank() - 3.0f) < 0.001f);
        assert(*force.displayRank() == "3 ");
        force.incrementRank();
        assert(*force.displayRank() == "3+");
        assert(halfPointRank(1) == "0+");
    }

    // Invariant attributes never move and have no display rank.
    {
        Attribute fixed = makeAttribute(4);
        fixed.invariant = true;
        for (int i = 0; i < 5; ++i) fixed.incrementRank();
        fixed.increaseRank(3);
        fixed.decrementRank();
        assert(fixed.value.rank == 0);
        assert(!fixed.displayRank().has_value());
    }

    // Decrement stops at zero; bulk decrease clamps at zero.
    {
        Attribute a = makeAttribute(4);
        a.incrementRank();
        a.decrementRank();
        a.decrementRank();
        assert(a.value.rank == 0);
        a.increaseRank(-5);
        assert(a.value.rank == 0);
    }

    // Specialization ceiling: master only rises below its specialization.
    {
        Attribute force = makeAttribute(4);
        Skill combat("Combat", "Force", specificTraits());
        assert(combat.isSpecific());
        assert(combat.specialization()->master() == &combat);
        combat.computeBaseRank(&force);
        assert(combat.value().baseRank == 2);
        assert(combat.specialization()->value().baseRank == 2);

        combat.incrementRank();
        assert(combat.rank() == 0);
        combat.specialization()->incrementRank();
        combat.incrementRank();
        assert(combat.rank() == 1);
        combat.incrementRank();
        assert(combat.rank() == 1);
        // Specialization may not fall to its master's level.
        combat.specialization()->decrementRank();
        assert(combat.specialization()->rank() == 1);
    }

    // Invariant holds under any sequence of unit edits.
    {
        Attribute force = makeAttribute(5);
        Skill skill("Tir", "Perception", specificTraits());
        skill.computeBaseRank(&force);
        std::mt19937 rng(1234);
        std::uniform_int_distribution<int> op(0, 3);
        for (int i = 0; i < 2000; ++i) {
            switch (op(rng)) {
                case 0:
                    skill.incrementRank();
                    break;
                case 1:
                    skill.decrementRank();
                    break;
                case 2:
                    skill.specialization()->incrementRank();
                    break;
                default:
                    skill.specialization()->decrementRank();
                    break;
            }
            assert(skill.specialization()->fullRank() >= skill.fullRank());
            assert(skill.rank() >= 0);
            assert(skill.specialization()->rank() >= 0);
        }
    }

    // Bulk increase only adds; recompute restores the specialization floor.
    {
        Attribute force = makeAttribute(4);
        Skill combat("Combat", "Force", specificTraits());
        combat.increaseRank(4);
        assert(combat.rank() == 4);
        assert(combat.specialization()->rank() == 0);
        combat.specialization()->increaseRank(2);
        assert(combat.specialization()->rank() == 2);
        combat.specialization()->increaseRank(-10);
        assert(combat.specialization()->rank() == 0);

        combat.computeBaseRank(&force);
        assert(combat.specialization()->fullRank() == combat.fullRank());
        assert(combat.specialization()->rank() == 4);
        combat.computeBaseRank(&force);
        assert(combat.specialization()->rank() == 4);

        // Order of the two bulk changes does not matter.
        Skill a("Combat", "Force", specificTraits());
        a.increaseRank(2);
        a.specialization()->increaseRank(3);
        Skill b("Combat", "Force", specificTraits());
        b.specialization()->increaseRank(3);
        b.increaseRank(2);
        assert(a.rank() == b.rank());
        assert(a.specialization()->rank() == 3 && b.specialization()->rank() == 3);
    }

    // Governed base rank is floor(full / 2) and recompute is idempotent.
    {
        Attribute force = makeAttribute(7);
        Skill skill("Combat", "Force", specificTraits());
        skill.computeBaseRank(&force);
        assert(skill.value().baseRank == 3);
        skill.computeBaseRank(&force);
        assert(skill.value().baseRank == 3);
        assert(skill.specialization()->value().baseRank == 3);

        Skill chance("Chance", "", SkillTraits{});
        chance.computeBaseRank(nullptr);
        assert(chance.value().baseRank == kUngovernedBaseRank);

        SkillTraits invariant{};
        invariant.invariant = true;
        Skill gift("Don", "Force", invariant);
        gift.computeBaseRank(&force);
        assert(gift.value().baseRank == 0);
        gift.incrementRank();
        assert(gift.rank() == 0);
        assert(!gift.displayRank().has_value());
    }

    // Usability of acquired skills.
    {
        SkillTraits acquired{};
        acquired.acquired = true;
        Skill lockpick("Crochetage", "Agilite", acquired);
        assert(!lockpick.isUsable());
        lockpick.incrementRank();
        assert(lockpick.isUsable());

        SkillTraits acquiredSpecific = acquired;
        acquiredSpecific.specific = true;
        Skill medicine("Médecine", "Perception", acquiredSpecific);
        assert(!medicine.isUsable());
        medicine.specialization()->incrementRank();
        assert(medicine.isUsable());

        SkillTraits acquiredMultiple = acquired;
        acquiredMultiple.multiple = true;
        Skill languages("Langues", "Volonte", acquiredMultiple);
        assert(!languages.isSpecific());
        assert(!languages.isUsable());
        assert(languages.addVariety("Anglais"));
        assert(languages.isUsable());

        Skill run("Course", "Agilite", SkillTraits{});
        assert(run.isUsable());
    }

    // Single-slot varieties keep the first entry; a repeat is numbered.
    {
        SkillTraits hobbyTraits{};
        hobbyTraits.multiple = true;
        hobbyTraits.singleSlot = true;
        Skill hobby("Hobby", "Presence", hobbyTraits);
        assert(hobby.addVariety("Peche"));
        assert(!hobby.addVariety("Cuisine"));
        assert(hobby.addVariety("Peche"));
        assert((hobby.varieties() == std::vector<std::string>{"Peche", "Peche 2"}));
        assert(hobby.removeVariety("Peche 2"));
        assert(!hobby.removeVariety("Cuisine"));

        Skill plain("Course", "Agilite", SkillTraits{});
        assert(!plain.addVariety("Sprint"));
    }

    // Copies and moves re-bind the specialization back-reference.
    {
        Skill original("Combat", "Force", specificTraits());
        original.specialization()->setName("Épée");
        original.specialization()->increaseRank(3);
        Skill copy = original;
        assert(copy.specialization() != original.specialization());
        assert(copy.specialization()->master() == &copy);
        assert(copy.specialization()->name() == "Épée");
        assert(copy.specialization()->rank() == 3);

        std::vector<Skill> skills;
        for (int i = 0; i < 20; ++i) skills.push_back(original);
        for (const auto& s : skills) assert(s.specialization()->master() == &s);

        Skill moved = std::move(copy);
        assert(moved.specialization()->master() == &moved);
    }

    // Pretty form used by text exports.
    {
        Attribute force = makeAttribute(6);
        Skill combat("Combat", "Force", specificTraits());
        combat.computeBaseRank(&force);
        assert(combat.prettyString() == "Combat 1+");
        combat.specialization()->setName("Épée");
        combat.specialization()->increaseRank(2);
        assert(combat.prettyString() == "Combat 1+ (Épée 2+)");

        SkillTraits multiple{};
        multiple.multiple = true;
        Skill languages("Langues", "Volonte", multiple);
        languages.computeBaseRank(&force);
        languages.addVariety("Anglais");
        languages.addVariety("Russe");
        languages.increaseRank(1);
        assert(languages.prettyString() == "Langues 2 (Anglais, Russe)");
    }

    // Powers: ranked ones store twice the table rank, flat ones are invariant.
    {
        Power charm = makePower("Charme", false, 2, "1 PP/tour", 0);
        assert(charm.value.baseRank == 4);
        assert(*charm.displayRank() == "2 ");
        Power fly = makePower("Vol", true, 3, "2 PP", 1);
        assert(fly.value.baseRank == 0);
        assert(!fly.displayRank().has_value());
        assert(fly.slot == 1);
    }

    return 0;
}
