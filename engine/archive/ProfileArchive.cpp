#include "ProfileArchive.h"

#include <cctype>
#include <fstream>
#include <iterator>

namespace Scox::Archive {

std::string capitalize(std::string name) {
    if (!name.empty()) name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    return name;
}

DirectoryArchive::DirectoryArchive(std::filesystem::path root) : root_(std::move(root)) {}

std::string DirectoryArchive::identity() const {
    std::filesystem::path p = root_;
    if (!p.has_filename()) p = p.parent_path();
    return capitalize(p.stem().string());
}

bool DirectoryArchive::exists() const { return std::filesystem::is_directory(root_); }

std::optional<std::string> DirectoryArchive::readSection(const std::string& section) const {
    const auto path = root_ / (section + ".csv");
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

MemoryArchive::MemoryArchive(std::string identity) : identity_(std::move(identity)) {}

MemoryArchive& MemoryArchive::setSection(const std::string& section, std::string text) {
    sections_[section] = std::move(text);
    return *this;
}

std::optional<std::string> MemoryArchive::readSection(const std::string& section) const {
    auto it = sections_.find(section);
    if (it == sections_.end()) return std::nullopt;
    return it->second;
}

}  // namespace Scox::Archive
