#include "Profile.h"

namespace Insmv {

NamedMap<Skill>& Profile::skills(SkillSection section) {
    switch (section) {
        case SkillSection::Primary:
            return primarySkills;
        case SkillSection::Secondary:
            return secondarySkills;
        case SkillSection::Exotic:
        default:
            return exoticSkills;
    }
}

const NamedMap<Skill>& Profile::skills(SkillSection section) const {
    switch (section) {
        case SkillSection::Primary:
            return primarySkills;
        case SkillSection::Secondary:
            return secondarySkills;
        case SkillSection::Exotic:
        default:
            return exoticSkills;
    }
}

Skill makeSkill(const SkillDef& def) {
    Scox::Values::SkillTraits traits{};
    traits.specific = def.specific;
    traits.multiple = def.multiple;
    traits.invariant = def.invariant;
    traits.acquired = def.acquired;
    traits.singleSlot = def.singleSlot;
    return Skill(def.name, def.governing, traits);
}

void initializeCatalogue(Profile& profile) {
    for (const auto& def : attributeDefinitions()) {
        Attribute a{};
        a.name = def.name;
        a.value.baseRank = kAttributeBaseRank;
        profile.attributes.insert(def.key, a);
    }
    for (SkillSection section : {SkillSection::Primary, SkillSection::Secondary, SkillSection::Exotic}) {
        auto& skills = profile.skills(section);
        for (const auto& def : skillDefinitions(section)) {
            skills.insert(def.key, makeSkill(def));
        }
    }
    for (const auto& key : sideValueKeys()) {
        profile.values.insert(key, Value{});
    }
}

}  // namespace Insmv
