// User configuration: teams (character folders) and profile archive location.
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace Insmv::Meta {

struct ScoxConfig {
    std::string selected{"default"};
    std::map<std::string, std::string> teams;  // team name -> folder
    std::string profilesRoot;                 // holds demons/, angels/, archetypes/

    const std::string* selectedFolder() const;
};

// $SCOX_HOME, else ~/.scox-gen.
std::filesystem::path scoxHome();

class ConfigLoader {
public:
    // std::nullopt when the file is missing or malformed.
    static std::optional<ScoxConfig> loadFromFile(const std::filesystem::path& path);
    static bool saveToFile(const ScoxConfig& config, const std::filesystem::path& path);
    // A single "default" team under home; profiles from $SCOX_PROFILES or home/profiles.
    static ScoxConfig defaults(const std::filesystem::path& home);
};

}  // namespace Insmv::Meta
