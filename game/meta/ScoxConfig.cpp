#include "ScoxConfig.h"

#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Insmv::Meta {

const std::string* ScoxConfig::selectedFolder() const {
    auto it = teams.find(selected);
    return it != teams.end() ? &it->second : nullptr;
}

std::filesystem::path scoxHome() {
    if (const char* env = std::getenv("SCOX_HOME"); env && *env) return std::filesystem::path(env);
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home && *home ? home : ".") / ".scox-gen";
}

ScoxConfig ConfigLoader::defaults(const std::filesystem::path& home) {
    ScoxConfig cfg{};
    cfg.selected = "default";
    cfg.teams["default"] = (home / "default").string();
    if (const char* env = std::getenv("SCOX_PROFILES"); env && *env) {
        cfg.profilesRoot = env;
    } else {
        cfg.profilesRoot = (home / "profiles").string();
    }
    return cfg;
}

std::optional<ScoxConfig> ConfigLoader::loadFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        Scox::logError("Malformed config " + path.string() + ": " + e.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        Scox::logError("Config " + path.string() + " is not a JSON object.");
        return std::nullopt;
    }

    ScoxConfig cfg{};
    cfg.selected = j.value("selected", cfg.selected);
    cfg.profilesRoot = j.value("profilesRoot", "");
    if (j.contains("teams") && j["teams"].is_object()) {
        for (const auto& kv : j["teams"].items()) {
            if (kv.value().is_string()) cfg.teams[kv.key()] = kv.value().get<std::string>();
        }
    }
    return cfg;
}

bool ConfigLoader::saveToFile(const ScoxConfig& config, const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    nlohmann::json j;
    j["selected"] = config.selected;
    j["teams"] = config.teams;
    j["profilesRoot"] = config.profilesRoot;
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        Scox::logError("Cannot write config " + path.string());
        return false;
    }
    out << j.dump(2) << '\n';
    return out.good();
}

}  // namespace Insmv::Meta
