#include "SheetExport.h"

#include <algorithm>
#include <ostream>
#include <utility>
#include <vector>

namespace Insmv::Export {

namespace {
const char* kVertical = "│";
const char* kBranch = "├";
const char* kLast = "└";
const char* kDash = "─";

std::string rstrip(std::string s) {
    while (!s.empty() && s.back() == ' ') s.pop_back();
    return s;
}

std::string repeat(const char* piece, int n) {
    std::string out;
    for (int i = 0; i < n; ++i) out += piece;
    return out;
}

// First n code points of s.
std::string utf8Prefix(const std::string& s, std::size_t n) {
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (count == n) break;
            ++count;
        }
        ++i;
    }
    return s.substr(0, i);
}

std::string joinUsableSkills(const NamedMap<Skill>& skills, std::string acc) {
    for (const auto& [key, skill] : skills) {
        if (!skill.isUsable()) continue;
        if (!acc.empty()) acc += ", ";
        acc += skill.prettyString();
    }
    return acc;
}

void printSkills(const NamedMap<Skill>& skills, std::ostream& out) {
    std::string last;
    for (const auto& [key, skill] : skills) {
        if (skill.isUsable()) last = key;
    }
    for (const auto& [key, skill] : skills) {
        if (!skill.isUsable()) continue;
        const bool isLast = key == last;
        out << kVertical << "   " << (isLast ? kLast : kBranch) << kDash << kDash << ' '
            << formatEntry(skill.name(), skill.displayRank(), 37) << '\n';
        const char* spacing = isLast ? " " : kVertical;
        if (const Skill* spec = skill.specialization()) {
            out << kVertical << "   " << spacing << "   " << kLast << kDash << kDash << ' '
                << formatEntry(spec->name(), spec->displayRank(), 33) << '\n';
        } else if (skill.isMultiple()) {
            const auto& varieties = skill.varieties();
            for (std::size_t i = 0; i < varieties.size(); ++i) {
                const bool lastVariety = i + 1 == varieties.size();
                out << kVertical << "   " << spacing << "   " << (lastVariety ? kLast : kBranch) << kDash << kDash
                    << ' ' << varieties[i] << '\n';
            }
        }
    }
}
}  // namespace

std::size_t utf8Length(const std::string& s) {
    std::size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::string formatEntry(const std::string& name, const std::optional<std::string>& rank, std::size_t width) {
    std::string label = name + ' ';
    if (!rank) {
        label = utf8Prefix(label, width);
        return label + std::string(width - utf8Length(label), ' ');
    }
    const std::string value = ' ' + *rank;
    const std::size_t room = width > utf8Length(value) ? width - utf8Length(value) : 0;
    label = utf8Prefix(label, room);
    return label + std::string(room - utf8Length(label), '-') + value;
}

void exportText(const Character& character, std::ostream& out) {
    out << character.name() << " - Grade " << character.level() << " - " << character.superiorLabel() << '\n';

    std::string attrs;
    for (const auto& [key, a] : character.attributes()) {
        if (!attrs.empty()) attrs += ", ";
        attrs += a.name;
        if (auto rank = a.displayRank()) attrs += " " + rstrip(*rank);
    }
    out << "Attributs : " << attrs << '\n';

    auto side = [&](const char* key) {
        const Value* v = character.sideValues().find(key);
        return v ? v->displayRank() : std::string("?");
    };
    out << "Valeurs annexes : " << side("PP") << " PP, " << side("PF") << " PF, "
        << "BL " << side("BL") << " / BG " << side("BG") << " / BF " << side("BF") << " / MS " << side("MS")
        << '\n';

    std::string skills = joinUsableSkills(character.primarySkills(), {});
    skills = joinUsableSkills(character.exoticSkills(), skills);
    skills = joinUsableSkills(character.secondarySkills(), skills);
    out << "Talents : " << skills << '\n';

    std::string powers;
    for (const auto& [key, p] : character.powers()) {
        if (!powers.empty()) powers += ", ";
        powers += p.name;
        if (auto rank = p.displayRank()) powers += rstrip(" " + *rank);
    }
    out << "Pouvoirs : " << powers << "\n\n";
}

void printSheet(const Character& character, std::ostream& out) {
    out << "\n\n";
    out << "┌" << kDash << kDash << ' ' << character.name() << ' ' << kDash << " Grade " << character.level()
        << ' ' << kDash << ' ' << character.superiorLabel() << '\n';
    out << kVertical << '\n';
    out << kBranch << kDash << kDash << " Attributs " << repeat(kDash, 11) << " Valeurs annexes\n";

    std::vector<const Attribute*> attrs;
    for (const auto& [key, a] : character.attributes()) attrs.push_back(&a);
    std::vector<std::pair<std::string, const Value*>> values;
    for (const auto& [key, v] : character.sideValues()) values.emplace_back(key, &v);
    const std::size_t rows = std::min(attrs.size(), values.size());
    for (std::size_t i = 0; i < rows; ++i) {
        const char* branch = i + 1 == rows ? kLast : kBranch;
        out << kVertical << "   " << branch << kDash << kDash << ' '
            << formatEntry(attrs[i]->name, attrs[i]->displayRank(), 14) << "    " << branch << kDash << kDash << ' '
            << formatEntry(values[i].first, values[i].second->displayRank(), 14) << '\n';
    }

    out << kVertical << '\n' << kBranch << kDash << kDash << " Talents principaux\n";
    printSkills(character.primarySkills(), out);
    out << kVertical << '\n' << kBranch << kDash << kDash << " Talents exotiques\n";
    printSkills(character.exoticSkills(), out);
    out << kVertical << '\n' << kBranch << kDash << kDash << " Talents secondaires\n";
    printSkills(character.secondarySkills(), out);
    out << kVertical << '\n' << kLast << kDash << kDash << " Pouvoirs\n";

    std::size_t index = 0;
    for (const auto& [key, p] : character.powers()) {
        const bool lastPower = ++index == character.powers().size();
        out << "    " << (lastPower ? kLast : kBranch) << kDash << kDash << ' ' << formatEntry(p.name, p.displayRank(), 37)
            << '\n';
    }
    out << "\n\n";
}

}  // namespace Insmv::Export
