// Merges profile archives (superior and archetype templates) into a profile.
#pragma once

#include <string>

#include "../../engine/archive/CsvTable.h"
#include "../../engine/archive/ProfileArchive.h"
#include "Profile.h"

namespace Insmv {

// Loads every section of the archive into the profile. Non-archetype loads
// record the archive identity as the superior; archetype loads build the
// nature-specific power table instead. Throws Scox::SchemaError on unknown
// names, duplicate powers and missing sections; sections merged before the
// failure stay applied.
void loadProfile(Profile& profile, const Scox::Archive::ProfileArchive& archive, bool isArchetype);

// Section merges, in load order.
void mergeAttributes(Profile& profile, const Scox::Archive::CsvTable& table);
void mergeSideValues(Profile& profile, const Scox::Archive::CsvTable& table);
void mergePrimarySkills(Profile& profile, const Scox::Archive::CsvTable& table);
void mergeSecondarySkills(Profile& profile, const Scox::Archive::CsvTable& table);
void mergeExoticSkills(Profile& profile, const Scox::Archive::CsvTable& table);
void mergePowers(Profile& profile, const Scox::Archive::CsvTable& table);

// Outcome of looking a secondary-skill row name up in the catalogue.
enum class SkillLookup {
    Found,           // exact key
    Specialization,  // <skill>_<suffix> on a specific skill
    Variety,         // <skill>_<suffix> on a multiple skill
    Ignored,         // <skill>_<suffix> on a skill that is neither
    Creatable,       // unknown name, becomes a new acquired skill
};

struct SkillLookupResult {
    SkillLookup kind{SkillLookup::Creatable};
    std::string key;     // catalogue key (or the row name when Creatable)
    std::string suffix;  // text after the separating underscore
};

SkillLookupResult resolveSecondarySkill(const NamedMap<Skill>& skills, const std::string& rowName);

// Section holding the archetype's power table for a nature.
std::string powerTableSection(Nature nature);

}  // namespace Insmv
