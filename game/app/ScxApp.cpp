#include "ScxApp.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <ostream>
#include <random>

#include "../../engine/archive/ProfileArchive.h"
#include "../../engine/core/Errors.h"
#include "../../engine/core/Logger.h"
#include "../export/SheetExport.h"
#include "../meta/CharacterStore.h"
#include "../rpg/Character.h"

namespace Insmv {

namespace {
// Value of --key=value, if given.
std::optional<std::string> option(const std::vector<std::string>& args, const std::string& key) {
    const std::string prefix = "--" + key + "=";
    for (const auto& a : args) {
        if (a.rfind(prefix, 0) == 0) return a.substr(prefix.size());
    }
    return std::nullopt;
}

bool hasFlag(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), "--" + flag) != args.end();
}

std::vector<std::string> positionals(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    for (const auto& a : args) {
        if (a.rfind("--", 0) != 0) out.push_back(a);
    }
    return out;
}

std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<int> parseNumber(const std::string& text) {
    try {
        std::size_t consumed = 0;
        const long long v = std::stoll(text, &consumed);
        if (consumed != text.size()) return std::nullopt;
        return static_cast<int>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}
}  // namespace

ScxApp::ScxApp(std::filesystem::path home, std::ostream& out) : home_(std::move(home)), out_(out) {}

bool ScxApp::initialize() {
    if (auto loaded = Meta::ConfigLoader::loadFromFile(configPath())) {
        config_ = *loaded;
        if (config_.profilesRoot.empty()) config_.profilesRoot = Meta::ConfigLoader::defaults(home_).profilesRoot;
        return true;
    }
    if (std::filesystem::exists(configPath())) {
        Scox::logError("Refusing to overwrite unreadable config " + configPath().string());
        return false;
    }
    config_ = Meta::ConfigLoader::defaults(home_);
    std::error_code ec;
    std::filesystem::create_directories(config_.teams["default"], ec);
    if (ec) {
        Scox::logError("Cannot create default team folder: " + ec.message());
        return false;
    }
    return saveConfig();
}

int ScxApp::run(const std::vector<std::string>& rawArgs) {
    std::vector<std::string> args;
    for (const auto& a : rawArgs) {
        if (a == "--quiet") {
            Scox::Logger::setMinimumLevel(Scox::LogLevel::Warning);
        } else {
            args.push_back(a);
        }
    }
    if (args.empty()) return usage();
    const std::vector<std::string> rest(args.begin() + 1, args.end());
    if (args[0] == "team") return runTeam(rest);
    if (args[0] == "character") return runCharacter(rest);
    return usage();
}

int ScxApp::runTeam(const std::vector<std::string>& args) {
    const auto pos = positionals(args);
    if (pos.empty()) return usage();
    const std::string& cmd = pos[0];
    if (cmd == "list") return listTeams();
    if (pos.size() < 2) return usage();
    if (cmd == "create") return createTeam(pos[1], pos.size() > 2 ? std::optional<std::string>(pos[2]) : std::nullopt);
    if (cmd == "select") return selectTeam(pos[1]);
    if (cmd == "delete") {
        if (!hasFlag(args, "yes")) {
            out_ << "Deleting team '" << pos[1] << "' removes its folder; add --yes to confirm.\n";
            return 1;
        }
        return deleteTeam(pos[1]);
    }
    return usage();
}

int ScxApp::runCharacter(const std::vector<std::string>& args) {
    const auto pos = positionals(args);
    if (pos.empty()) return usage();
    const std::string& cmd = pos[0];
    if (cmd == "list") return listCharacters();
    if (pos.size() < 2) return usage();
    if (cmd == "create") return createCharacter(args);
    if (cmd == "show") return showCharacter(pos[1]);
    if (cmd == "delete") {
        if (!hasFlag(args, "yes")) {
            out_ << "Add --yes to confirm deletion of '" << pos[1] << "'.\n";
            return 1;
        }
        return deleteCharacter(pos[1]);
    }
    if (cmd == "export" && pos.size() >= 3) return exportCharacter(pos[1], pos[2]);
    return usage();
}

int ScxApp::createTeam(const std::string& name, const std::optional<std::string>& location) {
    if (config_.teams.count(name)) {
        out_ << name << " already exists.\n";
        return 1;
    }
    const std::filesystem::path dir = std::filesystem::path(location.value_or(home_.string())) / name;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        Scox::logError("Cannot create " + dir.string() + ": " + ec.message());
        return 1;
    }
    config_.teams[name] = dir.string();
    config_.selected = name;
    return saveConfig() ? 0 : 1;
}

int ScxApp::selectTeam(const std::string& name) {
    if (!config_.teams.count(name)) {
        out_ << name << " does not exist in current list of teams.\n";
        return 1;
    }
    config_.selected = name;
    return saveConfig() ? 0 : 1;
}

int ScxApp::deleteTeam(const std::string& name) {
    auto it = config_.teams.find(name);
    if (it == config_.teams.end()) {
        out_ << name << " does not exist in current list of teams.\n";
        return 1;
    }
    const std::string location = it->second;
    config_.teams.erase(it);
    std::error_code ec;
    if (std::filesystem::remove_all(location, ec) > 0 && !ec) {
        out_ << "Team '" << name << "' deleted.\n";
    } else {
        out_ << location << " not found. Entry removed from the list of teams.\n";
    }
    if (config_.selected == name) {
        config_.selected = config_.teams.empty() ? std::string{} : config_.teams.begin()->first;
    }
    out_ << "Selected team: " << (config_.selected.empty() ? "None" : config_.selected) << '\n';
    return saveConfig() ? 0 : 1;
}

int ScxApp::listTeams() {
    for (const auto& [name, folder] : config_.teams) {
        out_ << name << " (" << folder << ")" << (name == config_.selected ? " *" : "") << '\n';
    }
    return 0;
}

std::optional<std::string> ScxApp::teamFolder() const {
    if (const std::string* folder = config_.selectedFolder()) return *folder;
    out_ << "No team selected.\n";
    return std::nullopt;
}

int ScxApp::createCharacter(const std::vector<std::string>& args) {
    const auto folder = teamFolder();
    if (!folder) return 1;
    const std::string name = positionals(args).at(1);
    if (!Meta::isValidCharacterName(name)) {
        out_ << "Character names may not contain path separators.\n";
        return 2;
    }

    const auto nature = parseNature(option(args, "nature").value_or("demon"));
    if (!nature) {
        out_ << "Nature must be 'angel' or 'demon'.\n";
        return 2;
    }
    const std::string superiorName = option(args, "superior").value_or("Scox");
    const std::string archetypeName = option(args, "archetype").value_or("Corrupteur");
    const auto level = parseNumber(option(args, "level").value_or("0"));
    if (!level || *level < 0) {
        out_ << "Level must be a non-negative integer.\n";
        return 2;
    }

    const std::filesystem::path root(config_.profilesRoot);
    Scox::Archive::DirectoryArchive superior(root / (*nature == Nature::Angel ? "angels" : "demons") /
                                             lowered(superiorName));
    Scox::Archive::DirectoryArchive archetype(root / "archetypes" / lowered(archetypeName));
    if (!superior.exists()) {
        out_ << "Unknown superior " << superiorName << " (" << superior.root().string() << ").\n";
        return 1;
    }
    if (!archetype.exists()) {
        out_ << "Unknown archetype " << archetypeName << " (" << archetype.root().string() << ").\n";
        return 1;
    }

    std::mt19937 rng;
    if (auto seed = option(args, "seed")) {
        auto parsed = parseNumber(*seed);
        if (!parsed) {
            out_ << "Seed must be an integer.\n";
            return 2;
        }
        rng.seed(static_cast<std::mt19937::result_type>(*parsed));
    } else {
        std::random_device rd;
        rng.seed(rd());
    }

    try {
        Character c = Character::create(name, *nature, archetype, superior, rng, *level);
        Meta::CharacterStore store(*folder);
        if (!store.save(c)) {
            Scox::logError("Cannot save " + store.pathFor(name));
            return 1;
        }
        out_ << "Created " << name << " in " << store.pathFor(name) << '\n';
    } catch (const Scox::SchemaError& e) {
        Scox::logError(std::string("Character creation aborted: ") + e.what());
        return 1;
    } catch (const Scox::PreconditionError& e) {
        Scox::logError(std::string("Character creation aborted: ") + e.what());
        return 1;
    }
    return 0;
}

int ScxApp::deleteCharacter(const std::string& name) {
    const auto folder = teamFolder();
    if (!folder) return 1;
    if (!Meta::CharacterStore(*folder).remove(name)) {
        out_ << name << " does not exist in selected team.\n";
        return 1;
    }
    return 0;
}

int ScxApp::listCharacters() {
    const auto folder = teamFolder();
    if (!folder) return 1;
    Meta::CharacterStore store(*folder);
    for (const auto& name : store.list()) {
        if (auto c = store.load(name)) {
            out_ << c->name() << " - " << c->superiorLabel() << '\n';
        } else {
            Scox::logWarn("Skipping unreadable character file " + store.pathFor(name));
        }
    }
    return 0;
}

int ScxApp::showCharacter(const std::string& name) {
    const auto folder = teamFolder();
    if (!folder) return 1;
    auto c = Meta::CharacterStore(*folder).load(name);
    if (!c) {
        out_ << name << " does not exist in selected team.\n";
        return 1;
    }
    Export::printSheet(*c, out_);
    return 0;
}

int ScxApp::exportCharacter(const std::string& name, const std::string& file) {
    const auto folder = teamFolder();
    if (!folder) return 1;
    auto c = Meta::CharacterStore(*folder).load(name);
    if (!c) {
        out_ << name << " does not exist in selected team.\n";
        return 1;
    }
    std::ofstream f(file, std::ios::app);
    if (!f) {
        Scox::logError("Cannot open " + file);
        return 1;
    }
    Export::exportText(*c, f);
    return f.good() ? 0 : 1;
}

bool ScxApp::saveConfig() { return Meta::ConfigLoader::saveToFile(config_, configPath()); }

int ScxApp::usage() {
    out_ << "usage: scx [--quiet] team (create <name> [location] | select <name> | delete <name> --yes | list)\n"
            "       scx character (create <name> [--nature=angel|demon] [--superior=Scox]\n"
            "                      [--archetype=Corrupteur] [--level=N] [--seed=N]\n"
            "                     | delete <name> --yes | list | show <name> | export <name> <file>)\n";
    return 2;
}

}  // namespace Insmv
