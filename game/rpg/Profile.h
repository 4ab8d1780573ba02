// Character sheet data: catalogue maps plus template bookkeeping.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../../engine/core/NamedMap.h"
#include "../../engine/values/Value.h"
#include "Catalogue.h"
#include "PowerTable.h"

namespace Insmv {

using Scox::NamedMap;
using Scox::Values::Attribute;
using Scox::Values::Power;
using Scox::Values::Skill;
using Scox::Values::Value;

struct Profile {
    Nature nature{Nature::Demon};
    // Identity of the loaded superior template.
    std::optional<std::string> superior;

    NamedMap<Attribute> attributes;
    NamedMap<Value> values;  // PF, PP, BL, BG, BF, MS
    NamedMap<Skill> primarySkills;
    NamedMap<Skill> secondarySkills;
    NamedMap<Skill> exoticSkills;
    NamedMap<Power> powers;

    // Built by archetype loads only.
    std::optional<PowerTable> powerTable;
    // Soft inconsistencies met while merging templates.
    std::vector<std::string> warnings;

    NamedMap<Skill>& skills(SkillSection section);
    const NamedMap<Skill>& skills(SkillSection section) const;
};

// Fills the fixed catalogue with its default ranks.
void initializeCatalogue(Profile& profile);

Skill makeSkill(const SkillDef& def);

}  // namespace Insmv
