// Plain-text and console renderings of a character sheet.
#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include "../rpg/Character.h"

namespace Insmv::Export {

// One paragraph: identity line, attributes, side values, usable skills, powers.
void exportText(const Character& character, std::ostream& out);

// Box-drawing tree for terminals.
void printSheet(const Character& character, std::ostream& out);

// "Force ------ 2" padded with '-' to width code points; no rank pads with spaces.
std::string formatEntry(const std::string& name, const std::optional<std::string>& rank, std::size_t width);

std::size_t utf8Length(const std::string& s);

}  // namespace Insmv::Export
