#include "CharacterStore.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "../../engine/core/Logger.h"

namespace Insmv::Meta {

using nlohmann::json;

namespace {
json valueToJson(const Value& v) { return json{{"baseRank", v.baseRank}, {"rank", v.rank}}; }

Value valueFromJson(const json& j) {
    Value v{};
    v.baseRank = j.at("baseRank").get<int>();
    v.rank = j.at("rank").get<int>();
    return v;
}

json skillToJson(const std::string& key, const Skill& s) {
    const auto& t = s.traits();
    json j = valueToJson(s.value());
    j["key"] = key;
    j["name"] = s.name();
    j["governing"] = s.governing();
    j["traits"] = json{{"specific", t.specific},
                       {"multiple", t.multiple},
                       {"invariant", t.invariant},
                       {"acquired", t.acquired},
                       {"singleSlot", t.singleSlot}};
    j["varieties"] = s.varieties();
    if (const Skill* spec = s.specialization()) {
        json sj = valueToJson(spec->value());
        sj["name"] = spec->name();
        j["specialization"] = sj;
    }
    return j;
}

Skill skillFromJson(const json& j) {
    const json& tj = j.at("traits");
    Scox::Values::SkillTraits traits{};
    traits.specific = tj.value("specific", false);
    traits.multiple = tj.value("multiple", false);
    traits.invariant = tj.value("invariant", false);
    traits.acquired = tj.value("acquired", false);
    traits.singleSlot = tj.value("singleSlot", false);
    Skill s(j.at("name").get<std::string>(), j.value("governing", ""), traits);
    s.value() = valueFromJson(j);
    s.setVarieties(j.value("varieties", std::vector<std::string>{}));
    if (j.contains("specialization") && s.specialization()) {
        const json& sj = j["specialization"];
        s.specialization()->setName(sj.at("name").get<std::string>());
        s.specialization()->value() = valueFromJson(sj);
    }
    return s;
}

json skillsToJson(const NamedMap<Skill>& skills) {
    json arr = json::array();
    for (const auto& [key, skill] : skills) arr.push_back(skillToJson(key, skill));
    return arr;
}

void skillsFromJson(const json& arr, NamedMap<Skill>& out) {
    for (const auto& j : arr) out.insert(j.at("key").get<std::string>(), skillFromJson(j));
}

json candidatesToJson(const std::vector<PowerCandidate>& powers) {
    json arr = json::array();
    for (const auto& c : powers) {
        arr.push_back(json{{"name", c.name}, {"flat", c.flat}, {"rank", c.rank}, {"cost", c.cost}});
    }
    return arr;
}

std::vector<PowerCandidate> candidatesFromJson(const json& arr) {
    std::vector<PowerCandidate> out;
    for (const auto& j : arr) {
        PowerCandidate c{};
        c.name = j.at("name").get<std::string>();
        c.flat = j.value("flat", false);
        c.rank = j.value("rank", 0);
        c.cost = j.value("cost", "");
        out.push_back(std::move(c));
    }
    return out;
}
}  // namespace

json characterToJson(const Character& character) {
    json j;
    j["version"] = kCharacterFormatVersion;
    j["name"] = character.name();
    j["level"] = character.level();
    j["nature"] = natureName(character.nature());
    j["superior"] = character.superior() ? json(*character.superior()) : json(nullptr);

    json attrs = json::array();
    for (const auto& [key, a] : character.attributes()) {
        json aj = valueToJson(a.value);
        aj["key"] = key;
        aj["name"] = a.name;
        aj["invariant"] = a.invariant;
        attrs.push_back(aj);
    }
    j["attributes"] = attrs;

    json values = json::array();
    for (const auto& [key, v] : character.sideValues()) {
        json vj = valueToJson(v);
        vj["key"] = key;
        values.push_back(vj);
    }
    j["values"] = values;

    j["primarySkills"] = skillsToJson(character.primarySkills());
    j["secondarySkills"] = skillsToJson(character.secondarySkills());
    j["exoticSkills"] = skillsToJson(character.exoticSkills());

    json powers = json::array();
    for (const auto& [key, p] : character.powers()) {
        json pj = valueToJson(p.value);
        pj["key"] = key;
        pj["name"] = p.name;
        pj["cost"] = p.cost;
        pj["invariant"] = p.invariant;
        pj["slot"] = p.slot;
        powers.push_back(pj);
    }
    j["powers"] = powers;

    if (character.powerTable()) {
        json table = json::array();
        for (const auto& [face, entry] : character.powerTable()->faces()) {
            table.push_back(json{{"face", face}, {"pp", entry.pp}, {"powers", candidatesToJson(entry.powers)}});
        }
        j["powerTable"] = table;
    } else {
        j["powerTable"] = nullptr;
    }
    j["warnings"] = character.warnings();
    return j;
}

std::optional<Character> characterFromJson(const json& j) {
    try {
        Profile profile;
        auto nature = parseNature(j.at("nature").get<std::string>());
        if (!nature) return std::nullopt;
        profile.nature = *nature;
        if (j.contains("superior") && j["superior"].is_string()) profile.superior = j["superior"].get<std::string>();

        for (const auto& aj : j.at("attributes")) {
            Attribute a{};
            a.name = aj.at("name").get<std::string>();
            a.invariant = aj.value("invariant", false);
            a.value = valueFromJson(aj);
            profile.attributes.insert(aj.at("key").get<std::string>(), a);
        }
        for (const auto& vj : j.at("values")) {
            profile.values.insert(vj.at("key").get<std::string>(), valueFromJson(vj));
        }
        skillsFromJson(j.at("primarySkills"), profile.primarySkills);
        skillsFromJson(j.at("secondarySkills"), profile.secondarySkills);
        skillsFromJson(j.at("exoticSkills"), profile.exoticSkills);
        for (const auto& pj : j.at("powers")) {
            Power p{};
            p.name = pj.at("name").get<std::string>();
            p.cost = pj.value("cost", "");
            p.invariant = pj.value("invariant", false);
            p.slot = pj.value("slot", 0);
            p.value = valueFromJson(pj);
            profile.powers.insert(pj.at("key").get<std::string>(), p);
        }
        if (j.contains("powerTable") && j["powerTable"].is_array()) {
            PowerTable table;
            for (const auto& fj : j["powerTable"]) {
                PowerTableEntry entry{};
                entry.pp = fj.value("pp", 0);
                entry.powers = candidatesFromJson(fj.at("powers"));
                table.setFace(fj.at("face").get<int>(), std::move(entry));
            }
            profile.powerTable = std::move(table);
        }
        profile.warnings = j.value("warnings", std::vector<std::string>{});
        return Character(j.at("name").get<std::string>(), j.value("level", 0), std::move(profile));
    } catch (const json::exception& e) {
        Scox::logError(std::string("Malformed character data: ") + e.what());
        return std::nullopt;
    }
}

bool isValidCharacterName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find_first_of("/\\") == std::string::npos;
}

CharacterStore::CharacterStore(std::string directory) : directory_(std::move(directory)) {}

std::string CharacterStore::pathFor(const std::string& name) const {
    return (std::filesystem::path(directory_) / (name + ".json")).string();
}

bool CharacterStore::save(const Character& character) const {
    if (!isValidCharacterName(character.name())) {
        Scox::logError("Invalid character name '" + character.name() + "'");
        return false;
    }
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        Scox::logError("Cannot create team folder " + directory_ + ": " + ec.message());
        return false;
    }
    std::ofstream f(pathFor(character.name()), std::ios::trunc);
    if (!f) return false;
    f << characterToJson(character).dump(2) << '\n';
    return f.good();
}

std::optional<Character> CharacterStore::load(const std::string& name) const {
    if (!isValidCharacterName(name)) return std::nullopt;
    std::ifstream f(pathFor(name));
    if (!f.is_open()) return std::nullopt;
    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        Scox::logError("Cannot parse " + pathFor(name) + ": " + e.what());
        return std::nullopt;
    }
    return characterFromJson(j);
}

bool CharacterStore::remove(const std::string& name) const {
    if (!isValidCharacterName(name)) return false;
    std::error_code ec;
    return std::filesystem::remove(pathFor(name), ec);
}

bool CharacterStore::exists(const std::string& name) const {
    return isValidCharacterName(name) && std::filesystem::exists(pathFor(name));
}

std::vector<std::string> CharacterStore::list() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) return names;
    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            names.push_back(entry.path().stem().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace Insmv::Meta
