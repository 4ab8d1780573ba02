// Fatal error kinds raised while composing characters.
#pragma once

#include <stdexcept>
#include <string>

namespace Scox {

// Archive content does not match the catalogue (unknown name, duplicate power,
// missing section, malformed number). Already merged sections stay applied.
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& what) : std::runtime_error(what) {}
};

// An operation was called before its inputs exist (e.g. drawing powers
// before an archetype table was generated).
class PreconditionError : public std::logic_error {
public:
    explicit PreconditionError(const std::string& what) : std::logic_error(what) {}
};

}  // namespace Scox
