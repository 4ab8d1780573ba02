// Fixed INS-MV 4 catalogue: attributes, skills and side values every character starts with.
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Insmv {

enum class Nature { Angel, Demon };

std::optional<Nature> parseNature(std::string_view text);  // case-insensitive
std::string natureName(Nature nature);                      // "Angel" / "Demon"
// Wound base bonus added to Force: 3 for angels, 2 for demons.
int woundBonus(Nature nature);

enum class SkillSection { Primary, Secondary, Exotic };

struct AttributeDef {
    std::string key;
    std::string name;
};

struct SkillDef {
    std::string key;
    std::string name;
    std::string governing;  // attribute key, empty = flat base rank
    bool specific{false};
    bool multiple{false};
    bool invariant{false};
    bool acquired{false};
    bool singleSlot{false};
};

constexpr int kAttributeBaseRank = 4;

// Stable lists in sheet order.
const std::vector<AttributeDef>& attributeDefinitions();
const std::vector<SkillDef>& skillDefinitions(SkillSection section);
const std::vector<std::string>& sideValueKeys();

std::string sectionName(SkillSection section);  // "primary_skills", ...

}  // namespace Insmv
