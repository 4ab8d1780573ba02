// Sources of named tabular sections (attributes, skills, powers, ...).
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace Scox::Archive {

class ProfileArchive {
public:
    virtual ~ProfileArchive() = default;

    // Human-readable template name ("Scox", "Corrupteur").
    virtual std::string identity() const = 0;
    // Raw text of a section, std::nullopt when the archive lacks it.
    virtual std::optional<std::string> readSection(const std::string& section) const = 0;
};

// Directory holding one <section>.csv file per section.
class DirectoryArchive : public ProfileArchive {
public:
    explicit DirectoryArchive(std::filesystem::path root);

    std::string identity() const override;
    std::optional<std::string> readSection(const std::string& section) const override;

    const std::filesystem::path& root() const { return root_; }
    bool exists() const;

private:
    std::filesystem::path root_;
};

// Sections held in memory; used by tests and by callers that build profiles on the fly.
class MemoryArchive : public ProfileArchive {
public:
    explicit MemoryArchive(std::string identity);

    MemoryArchive& setSection(const std::string& section, std::string text);

    std::string identity() const override { return identity_; }
    std::optional<std::string> readSection(const std::string& section) const override;

private:
    std::string identity_;
    std::map<std::string, std::string> sections_;
};

// "scox" -> "Scox".
std::string capitalize(std::string name);

}  // namespace Scox::Archive
