// Command-line front end: team folders and character creation/listing/export.
#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "../meta/ScoxConfig.h"

namespace Insmv {

class ScxApp {
public:
    ScxApp(std::filesystem::path home, std::ostream& out);

    // Loads home/config.json or writes a default one.
    bool initialize();
    // args excludes the program name; --quiet drops info logging. Returns the process exit code.
    int run(const std::vector<std::string>& args);

    const Meta::ScoxConfig& config() const { return config_; }
    std::filesystem::path configPath() const { return home_ / "config.json"; }

private:
    int runTeam(const std::vector<std::string>& args);
    int runCharacter(const std::vector<std::string>& args);

    int createTeam(const std::string& name, const std::optional<std::string>& location);
    int selectTeam(const std::string& name);
    int deleteTeam(const std::string& name);
    int listTeams();

    int createCharacter(const std::vector<std::string>& args);
    int deleteCharacter(const std::string& name);
    int listCharacters();
    int showCharacter(const std::string& name);
    int exportCharacter(const std::string& name, const std::string& file);

    std::optional<std::string> teamFolder() const;
    bool saveConfig();
    int usage();

    std::filesystem::path home_;
    std::ostream& out_;
    Meta::ScoxConfig config_{};
};

}  // namespace Insmv
