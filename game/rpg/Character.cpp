#include "Character.h"

#include <cmath>

#include "../../engine/core/Errors.h"
#include "../../engine/core/Logger.h"
#include "ProfileStore.h"

namespace Insmv {

Character::Character(std::string name, Nature nature, int level) : name_(std::move(name)), level_(level) {
    profile_.nature = nature;
    initializeCatalogue(profile_);
}

Character::Character(std::string name, int level, Profile profile)
    : name_(std::move(name)), level_(level), profile_(std::move(profile)) {}

Character Character::create(std::string name,
                            Nature nature,
                            const Scox::Archive::ProfileArchive& archetype,
                            const Scox::Archive::ProfileArchive& superior,
                            std::mt19937& rng,
                            int level) {
    Character c(std::move(name), nature, level);
    c.applyProfile(superior, false);
    c.applyProfile(archetype, true);
    const int drawn = c.drawPowers(kArchetypePowerDraws, rng);
    if (drawn < kArchetypePowerDraws) {
        Scox::logWarn(c.name_ + ": only " + std::to_string(drawn) + " of " +
                      std::to_string(kArchetypePowerDraws) + " archetype power draws succeeded.");
    }
    c.recompute();
    Scox::logInfo("Created " + natureName(nature) + " " + c.name_ + " (" + c.superiorLabel() + ", " +
                  archetype.identity() + ").");
    return c;
}

void Character::applyProfile(const Scox::Archive::ProfileArchive& archive, bool isArchetype) {
    loadProfile(profile_, archive, isArchetype);
}

int Character::drawPowers(int count, std::mt19937& rng) { return Insmv::drawPowers(profile_, count, rng); }

void Character::recompute() {
    for (SkillSection section : {SkillSection::Primary, SkillSection::Secondary, SkillSection::Exotic}) {
        for (auto& [key, skill] : profile_.skills(section)) {
            const Attribute* governing = nullptr;
            if (!skill.governing().empty()) {
                governing = profile_.attributes.find(skill.governing());
                if (!governing) {
                    throw Scox::SchemaError("Attribute " + skill.governing() + " governing " + key + " not found.");
                }
            }
            skill.computeBaseRank(governing);
        }
    }

    auto real = [&](const std::string& key) {
        const Attribute* a = profile_.attributes.find(key);
        if (!a) throw Scox::SchemaError("Attribute " + key + " not found.");
        return a->realRank();
    };
    auto side = [&](const std::string& key) -> Value& {
        Value* v = profile_.values.find(key);
        if (!v) throw Scox::SchemaError("Value " + key + " not found.");
        return *v;
    };

    const float force = real("Force");
    const float volonte = real("Volonte");
    const float foi = real("Foi");
    side("PF").baseRank = static_cast<int>(std::floor(force + volonte));
    side("PP").baseRank = static_cast<int>(std::floor(foi + volonte));

    const float wound = force + static_cast<float>(woundBonus(profile_.nature));
    side("BL").baseRank = static_cast<int>(std::floor(wound));
    side("BG").baseRank = static_cast<int>(std::floor(2.0f * wound));
    side("BF").baseRank = static_cast<int>(std::floor(3.0f * wound));
    side("MS").baseRank = static_cast<int>(std::floor(4.0f * wound));
}

bool Character::incrementAttribute(const std::string& key) {
    Attribute* a = profile_.attributes.find(key);
    if (!a) return false;
    a->incrementRank();
    return true;
}

bool Character::decrementAttribute(const std::string& key) {
    Attribute* a = profile_.attributes.find(key);
    if (!a) return false;
    a->decrementRank();
    return true;
}

Skill* Character::findSkill(SkillSection section, const std::string& key, bool specialization) {
    Skill* skill = profile_.skills(section).find(key);
    if (!skill || !specialization) return skill;
    return skill->specialization();
}

bool Character::incrementSkill(SkillSection section, const std::string& key, bool specialization) {
    Skill* skill = findSkill(section, key, specialization);
    if (!skill) return false;
    skill->incrementRank();
    return true;
}

bool Character::decrementSkill(SkillSection section, const std::string& key, bool specialization) {
    Skill* skill = findSkill(section, key, specialization);
    if (!skill) return false;
    skill->decrementRank();
    return true;
}

bool Character::renameSpecialization(SkillSection section, const std::string& key, std::string name) {
    Skill* skill = profile_.skills(section).find(key);
    if (!skill) return false;
    if (!skill->isSpecific()) {
        addWarning("Skill " + key + " is not specific; specialization name ignored.");
        return false;
    }
    skill->specialization()->setName(std::move(name));
    return true;
}

bool Character::addVariety(SkillSection section, const std::string& key, const std::string& variety) {
    Skill* skill = profile_.skills(section).find(key);
    if (!skill) return false;
    if (!skill->isMultiple()) {
        addWarning("Skill " + key + " is not multiple; variety '" + variety + "' ignored.");
        return false;
    }
    return skill->addVariety(variety);
}

bool Character::removeVariety(SkillSection section, const std::string& key, const std::string& variety) {
    Skill* skill = profile_.skills(section).find(key);
    if (!skill) return false;
    if (!skill->isMultiple()) {
        addWarning("Skill " + key + " is not multiple; variety '" + variety + "' ignored.");
        return false;
    }
    return skill->removeVariety(variety);
}

void Character::addWarning(const std::string& message) {
    Scox::logWarn(message);
    profile_.warnings.push_back(message);
}

}  // namespace Insmv
