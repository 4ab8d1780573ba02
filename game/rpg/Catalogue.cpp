#include "Catalogue.h"

#include <algorithm>
#include <cctype>

namespace Insmv {

namespace {
// Field order: key, name, governing, specific, multiple, invariant, acquired, singleSlot.
const std::vector<SkillDef> kPrimarySkills = {
    {"Acrobatie", "Acrobatie", "Agilite", true, false, false, false, false},
    {"Aisance_sociale", "Aisance sociale", "Presence", true, false, false, false, false},
    {"Baratin", "Baratin", "Presence", true, false, false, false, false},
    {"Combat", "Combat", "Force", true, false, false, false, false},
    {"Corps_a_corps", "Corps à corps", "Force", true, false, false, false, false},
    {"Course", "Course", "Agilite", false, false, false, false, false},
    {"Defense", "Défense", "Agilite", true, false, false, false, false},
    {"Discretion", "Discrétion", "Agilite", true, false, false, false, false},
    {"Esquive", "Esquive", "Agilite", true, false, false, false, false},
    {"Fouille", "Fouille", "Perception", true, false, false, false, false},
    {"Intimidation", "Intimidation", "Volonte", true, false, false, false, false},
    {"Lancer", "Lancer", "Agilite", true, false, false, false, false},
    {"Seduction", "Séduction", "Presence", true, false, false, false, false},
    {"Tir", "Tir", "Perception", true, false, false, false, false},
    {"Vigilance", "Vigilance", "Perception", true, false, false, false, false},
};

const std::vector<SkillDef> kSecondarySkills = {
    {"Art", "Art", "Presence", false, true, false, false, false},
    {"Conduite", "Conduite", "Agilite", false, true, false, false, false},
    {"Crochetage", "Crochetage", "Agilite", false, false, false, true, false},
    {"Culture_generale", "Culture générale", "Volonte", false, false, false, false, false},
    {"Electronique", "Électronique", "Perception", false, false, false, true, false},
    {"Hobby", "Hobby", "Presence", false, true, false, true, true},
    {"Informatique", "Informatique", "Perception", false, false, false, true, false},
    {"Langues", "Langues", "Volonte", false, true, false, true, false},
    {"Mecanique", "Mécanique", "Perception", false, false, false, true, false},
    {"Medecine", "Médecine", "Perception", true, false, false, true, false},
    {"Metier", "Métier", "Perception", false, true, false, true, true},
    {"Premiers_soins", "Premiers soins", "Perception", false, false, false, false, false},
    {"Sciences", "Sciences", "Volonte", true, false, false, true, false},
};

const std::vector<SkillDef> kExoticSkills = {
    {"Chance", "Chance", "", false, false, false, false, false},
    {"Emprise", "Emprise", "Volonte", false, false, false, true, false},
    {"Feeling", "Feeling", "", false, false, false, true, false},
    {"Hypnose", "Hypnose", "Volonte", false, false, false, true, false},
    {"Occultisme", "Occultisme", "Foi", true, false, false, true, false},
};
}  // namespace

std::optional<Nature> parseNature(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "angel" || lowered == "ange") return Nature::Angel;
    if (lowered == "demon" || lowered == "démon") return Nature::Demon;
    return std::nullopt;
}

std::string natureName(Nature nature) { return nature == Nature::Angel ? "Angel" : "Demon"; }

int woundBonus(Nature nature) { return nature == Nature::Angel ? 3 : 2; }

const std::vector<AttributeDef>& attributeDefinitions() {
    static const std::vector<AttributeDef> kDefs = {
        {"Force", "Force"},           {"Agilite", "Agilité"},   {"Perception", "Perception"},
        {"Volonte", "Volonté"},       {"Presence", "Présence"}, {"Foi", "Foi"},
    };
    return kDefs;
}

const std::vector<SkillDef>& skillDefinitions(SkillSection section) {
    switch (section) {
        case SkillSection::Primary:
            return kPrimarySkills;
        case SkillSection::Secondary:
            return kSecondarySkills;
        case SkillSection::Exotic:
        default:
            return kExoticSkills;
    }
}

const std::vector<std::string>& sideValueKeys() {
    static const std::vector<std::string> kKeys = {"PF", "PP", "BL", "BG", "BF", "MS"};
    return kKeys;
}

std::string sectionName(SkillSection section) {
    switch (section) {
        case SkillSection::Primary:
            return "primary_skills";
        case SkillSection::Secondary:
            return "secondary_skills";
        case SkillSection::Exotic:
        default:
            return "exotic_skills";
    }
}

}  // namespace Insmv
