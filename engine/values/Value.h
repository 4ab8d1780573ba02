// Rank-bearing values: side values, attributes, skills and powers.
// Attributes, skills and powers count in half points (two ranks = one game point).
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Scox::Values {

// Flat skill base rank when no governing attribute applies.
constexpr int kUngovernedBaseRank = 2;

struct Value {
    int baseRank{0};  // derived, rewritten by recompute
    int rank{0};      // invested, never negative

    int fullRank() const { return baseRank + rank; }

    // Whole-point display used by side values.
    std::string displayRank() const { return std::to_string(fullRank()); }

    void increment() { ++rank; }
    void decrement() {
        if (rank > 0) --rank;
    }
    void increase(int step);
};

// "2 " for an even full rank of 4, "2+" for 5.
std::string halfPointRank(int fullRank);

struct Attribute {
    std::string name;
    bool invariant{false};
    Value value{};

    int fullRank() const { return value.fullRank(); }
    float realRank() const { return static_cast<float>(value.fullRank()) / 2.0f; }
    // Absent for invariant attributes.
    std::optional<std::string> displayRank() const;

    void incrementRank();
    void decrementRank();
    void increaseRank(int step);
};

struct SkillTraits {
    bool specific{false};
    bool multiple{false};
    bool invariant{false};
    bool acquired{false};
    // Multiple skill keeping one variety (Hobby, Métier).
    bool singleSlot{false};
};

// Skill with an optional owned specialization. The specialization keeps a
// non-owning pointer to its master; copies and moves re-bind it.
// Invariant: specialization()->fullRank() >= fullRank().
class Skill {
public:
    Skill() = default;
    Skill(std::string name, std::string governing, SkillTraits traits);
    Skill(const Skill& other);
    Skill& operator=(const Skill& other);
    Skill(Skill&& other) noexcept;
    Skill& operator=(Skill&& other) noexcept;
    ~Skill() = default;

    const std::string& name() const { return name_; }
    void setName(std::string name) { name_ = std::move(name); }
    // Key of the governing attribute, empty when ungoverned.
    const std::string& governing() const { return governing_; }
    const SkillTraits& traits() const { return traits_; }

    bool isInvariant() const { return traits_.invariant; }
    bool isAcquired() const { return traits_.acquired; }
    bool isSpecific() const { return specialization_ != nullptr; }
    bool isMultiple() const { return traits_.multiple; }

    Value& value() { return value_; }
    const Value& value() const { return value_; }
    int fullRank() const { return value_.fullRank(); }
    int rank() const { return value_.rank; }
    float realRank() const { return static_cast<float>(value_.fullRank()) / 2.0f; }
    std::optional<std::string> displayRank() const;

    Skill* specialization() { return specialization_.get(); }
    const Skill* specialization() const { return specialization_.get(); }
    const Skill* master() const { return master_; }

    const std::vector<std::string>& varieties() const { return varieties_; }
    // Returns true when the variety was recorded.
    bool addVariety(const std::string& variety);
    bool removeVariety(const std::string& variety);
    // Restores a persisted list verbatim.
    void setVarieties(std::vector<std::string> varieties);

    void incrementRank();
    void decrementRank();
    // Bulk change used by profile merges. Adds step (clamped at 0) without the
    // per-unit ceiling; computeBaseRank restores the invariant afterwards.
    void increaseRank(int step);

    // governing may be null for ungoverned skills. Cascades into the
    // specialization and raises it back to the master's full rank if needed.
    void computeBaseRank(const Attribute* governing);

    bool isUsable() const;

    // "Combat 3 (Épée 4)", "Langues 2 (Anglais, Russe)".
    std::string prettyString() const;

private:
    void liftSpecialization();

    std::string name_;
    std::string governing_;
    SkillTraits traits_{};
    Value value_{};
    std::vector<std::string> varieties_;
    std::unique_ptr<Skill> specialization_;
    Skill* master_{nullptr};
};

struct Power {
    std::string name;
    std::string cost;
    bool invariant{false};
    int slot{0};  // ordinal at insertion, used for sheet layout
    Value value{};

    int fullRank() const { return value.fullRank(); }
    std::optional<std::string> displayRank() const;
};

// Ranked powers store twice the table rank.
Power makePower(std::string name, bool invariant, int tableRank, std::string cost, int slot);

}  // namespace Scox::Values
