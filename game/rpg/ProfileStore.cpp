#include "ProfileStore.h"

#include <algorithm>

#include "../../engine/core/Errors.h"
#include "../../engine/core/Logger.h"

namespace Insmv {

using Scox::Archive::CsvTable;
using Scox::SchemaError;

namespace {
struct SplitName {
    std::string key;
    std::string suffix;
};

// Longest catalogue key followed by '_' (keys may contain underscores themselves).
std::optional<SplitName> splitKnownPrefix(const NamedMap<Skill>& skills, const std::string& rowName) {
    for (auto pos = rowName.rfind('_'); pos != std::string::npos && pos > 0; pos = rowName.rfind('_', pos - 1)) {
        std::string prefix = rowName.substr(0, pos);
        if (skills.contains(prefix)) return SplitName{std::move(prefix), rowName.substr(pos + 1)};
    }
    return std::nullopt;
}

void mergeKnownSkills(NamedMap<Skill>& skills, const CsvTable& table, const char* label) {
    for (const auto& row : table.rows()) {
        const std::string& name = row.get("Name");
        if (Skill* skill = skills.find(name)) {
            skill->increaseRank(row.getInt("Rank"));
        } else {
            throw SchemaError(std::string(label) + " " + name + " not found.");
        }
    }
}

std::string displayName(std::string rowName) {
    std::replace(rowName.begin(), rowName.end(), '_', ' ');
    return rowName;
}

CsvTable readSection(const Scox::Archive::ProfileArchive& archive, const std::string& section, char delimiter = ',') {
    auto text = archive.readSection(section);
    if (!text) throw SchemaError("Section " + section + " missing from profile " + archive.identity() + ".");
    return CsvTable::parse(*text, delimiter);
}
}  // namespace

std::string powerTableSection(Nature nature) {
    return nature == Nature::Angel ? "table_angel" : "table_demon";
}

void mergeAttributes(Profile& profile, const CsvTable& table) {
    for (const auto& row : table.rows()) {
        const std::string& name = row.get("Name");
        Attribute* attr = profile.attributes.find(name);
        if (!attr) throw SchemaError("Attribute " + name + " not found.");
        attr->increaseRank(row.getInt("Rank"));
    }
}

void mergeSideValues(Profile& profile, const CsvTable& table) {
    for (const auto& row : table.rows()) {
        const std::string& name = row.get("Name");
        Value* value = profile.values.find(name);
        if (!value) throw SchemaError("Value " + name + " not found.");
        value->rank = std::max(0, row.getInt("Rank"));
    }
}

void mergePrimarySkills(Profile& profile, const CsvTable& table) {
    for (const auto& row : table.rows()) {
        const std::string& name = row.get("Name");
        const int rank = row.getInt("Rank");
        if (Skill* skill = profile.primarySkills.find(name)) {
            skill->increaseRank(rank);
            continue;
        }
        auto split = splitKnownPrefix(profile.primarySkills, name);
        Skill* master = split && split->suffix == "spe" ? profile.primarySkills.find(split->key) : nullptr;
        if (!master || !master->isSpecific()) throw SchemaError("Skill " + name + " not found.");
        master->specialization()->increaseRank(rank);
    }
}

SkillLookupResult resolveSecondarySkill(const NamedMap<Skill>& skills, const std::string& rowName) {
    if (skills.contains(rowName)) return {SkillLookup::Found, rowName, {}};
    auto split = splitKnownPrefix(skills, rowName);
    if (!split) return {SkillLookup::Creatable, rowName, {}};
    const Skill& skill = *skills.find(split->key);
    if (skill.isSpecific()) return {SkillLookup::Specialization, split->key, split->suffix};
    if (skill.isMultiple()) return {SkillLookup::Variety, split->key, split->suffix};
    return {SkillLookup::Ignored, split->key, split->suffix};
}

void mergeSecondarySkills(Profile& profile, const CsvTable& table) {
    auto& skills = profile.secondarySkills;
    for (const auto& row : table.rows()) {
        const std::string& name = row.get("Name");
        const int rank = row.getInt("Rank");
        const SkillLookupResult lookup = resolveSecondarySkill(skills, name);
        switch (lookup.kind) {
            case SkillLookup::Found:
                skills.find(lookup.key)->increaseRank(rank);
                break;
            case SkillLookup::Specialization:
                skills.find(lookup.key)->specialization()->increaseRank(rank);
                break;
            case SkillLookup::Variety: {
                Skill& skill = *skills.find(lookup.key);
                skill.addVariety(lookup.suffix);
                skill.increaseRank(rank);
                break;
            }
            case SkillLookup::Ignored: {
                const std::string msg = "Skill " + lookup.key +
                                        " is neither specific nor multiple; specialization or variety '" +
                                        lookup.suffix + "' is ignored.";
                Scox::logWarn(msg);
                profile.warnings.push_back(msg);
                break;
            }
            case SkillLookup::Creatable: {
                Scox::Values::SkillTraits traits{};
                traits.acquired = true;
                Skill& created = skills.insert(name, Skill(displayName(name), "", traits));
                created.increaseRank(rank);
                break;
            }
        }
    }
}

void mergeExoticSkills(Profile& profile, const CsvTable& table) {
    mergeKnownSkills(profile.exoticSkills, table, "Skill");
}

void mergePowers(Profile& profile, const CsvTable& table) {
    for (const auto& row : table.rows()) {
        const std::string& name = row.get("Name");
        if (profile.powers.contains(name)) throw SchemaError("Power " + name + " is already defined.");
        const bool invariant = row.getFlag("Invariant");
        const int rank = invariant ? 0 : row.getInt("Rank");
        const std::string cost = row.has("Cost") ? row.get("Cost") : std::string{};
        const int slot = static_cast<int>(profile.powers.size());
        profile.powers.insert(name, Scox::Values::makePower(name, invariant, rank, cost, slot));
    }
}

void loadProfile(Profile& profile, const Scox::Archive::ProfileArchive& archive, bool isArchetype) {
    mergeAttributes(profile, readSection(archive, "attributes"));
    mergeSideValues(profile, readSection(archive, "values"));
    mergePrimarySkills(profile, readSection(archive, sectionName(SkillSection::Primary)));
    mergeSecondarySkills(profile, readSection(archive, sectionName(SkillSection::Secondary)));
    mergeExoticSkills(profile, readSection(archive, sectionName(SkillSection::Exotic)));
    mergePowers(profile, readSection(archive, "powers"));
    if (isArchetype) {
        const auto rows = parsePowerTableRows(readSection(archive, powerTableSection(profile.nature), ';'));
        profile.powerTable = PowerTable::generate(rows, profile.superior);
        Scox::logInfo("Archetype " + archive.identity() + " loaded (" +
                      std::to_string(profile.powerTable->faces().size()) + " power table faces).");
    } else {
        profile.superior = archive.identity();
        Scox::logInfo("Superior " + archive.identity() + " loaded.");
    }
}

}  // namespace Insmv
