// JSON persistence of characters inside a team folder.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../rpg/Character.h"

namespace Insmv::Meta {

constexpr int kCharacterFormatVersion = 1;

// Names become file stems: no path separators, not empty, not "." or "..".
bool isValidCharacterName(const std::string& name);

class CharacterStore {
public:
    explicit CharacterStore(std::string directory);

    // Invalid names are refused (false / std::nullopt) and never touch the disk.
    bool save(const Character& character) const;
    std::optional<Character> load(const std::string& name) const;
    bool remove(const std::string& name) const;
    bool exists(const std::string& name) const;
    // Character names found in the folder, sorted.
    std::vector<std::string> list() const;

    std::string pathFor(const std::string& name) const;

private:
    std::string directory_;
};

// The full object graph, specializations nested under their master.
nlohmann::json characterToJson(const Character& character);
// std::nullopt on missing keys or wrong types.
std::optional<Character> characterFromJson(const nlohmann::json& j);

}  // namespace Insmv::Meta
