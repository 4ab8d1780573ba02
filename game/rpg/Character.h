// Non-player character composed from the catalogue, a superior and an archetype.
#pragma once

#include <optional>
#include <random>
#include <string>
#include <vector>

#include "../../engine/archive/ProfileArchive.h"
#include "Profile.h"

namespace Insmv {

// Successful archetype draws each new character receives.
constexpr int kArchetypePowerDraws = 2;

class Character {
public:
    // Fresh character with the default catalogue and no template applied.
    Character(std::string name, Nature nature, int level = 0);
    // Rebuilds a character from persisted state.
    Character(std::string name, int level, Profile profile);

    // Full creation pipeline: superior, archetype, power draws, recompute.
    // Any Scox::SchemaError aborts creation.
    static Character create(std::string name,
                            Nature nature,
                            const Scox::Archive::ProfileArchive& archetype,
                            const Scox::Archive::ProfileArchive& superior,
                            std::mt19937& rng,
                            int level = 0);

    void applyProfile(const Scox::Archive::ProfileArchive& archive, bool isArchetype);
    int drawPowers(int count, std::mt19937& rng);

    // Sets every derived base rank from the current attributes. Call after
    // any template load or manual rank edit.
    void recompute();

    const std::string& name() const { return name_; }
    int level() const { return level_; }
    Nature nature() const { return profile_.nature; }
    const std::optional<std::string>& superior() const { return profile_.superior; }
    // Superior name for display, "?" when none was loaded.
    std::string superiorLabel() const { return profile_.superior.value_or("?"); }

    const NamedMap<Attribute>& attributes() const { return profile_.attributes; }
    const NamedMap<Value>& sideValues() const { return profile_.values; }
    const NamedMap<Skill>& primarySkills() const { return profile_.primarySkills; }
    const NamedMap<Skill>& secondarySkills() const { return profile_.secondarySkills; }
    const NamedMap<Skill>& exoticSkills() const { return profile_.exoticSkills; }
    const NamedMap<Skill>& skills(SkillSection section) const { return profile_.skills(section); }
    const NamedMap<Power>& powers() const { return profile_.powers; }
    const std::optional<PowerTable>& powerTable() const { return profile_.powerTable; }
    const std::vector<std::string>& warnings() const { return profile_.warnings; }
    const Profile& profile() const { return profile_; }

    // Manual edits. Rank edits return false only for unknown keys; guarded
    // no-ops (invariant, specialization ceiling) are silent and return true.
    // Name edits on a skill that is neither specific nor multiple record a
    // warning and return false.
    bool incrementAttribute(const std::string& key);
    bool decrementAttribute(const std::string& key);
    bool incrementSkill(SkillSection section, const std::string& key, bool specialization = false);
    bool decrementSkill(SkillSection section, const std::string& key, bool specialization = false);
    bool renameSpecialization(SkillSection section, const std::string& key, std::string name);
    bool addVariety(SkillSection section, const std::string& key, const std::string& variety);
    bool removeVariety(SkillSection section, const std::string& key, const std::string& variety);

private:
    Skill* findSkill(SkillSection section, const std::string& key, bool specialization);
    void addWarning(const std::string& message);

    std::string name_;
    int level_{0};
    Profile profile_;
};

}  // namespace Insmv
