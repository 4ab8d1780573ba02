#include "Value.h"

#include <algorithm>
#include <cmath>

namespace Scox::Values {

namespace {
const char* kDefaultSpecializationName = "Spécialité";

std::string trimRight(std::string s) {
    while (!s.empty() && s.back() == ' ') s.pop_back();
    return s;
}
}  // namespace

void Value::increase(int step) { rank = std::max(0, rank + step); }

std::string halfPointRank(int fullRank) {
    std::string out = std::to_string(fullRank / 2);
    out += (fullRank % 2 != 0) ? '+' : ' ';
    return out;
}

// --- Attribute ---

std::optional<std::string> Attribute::displayRank() const {
    if (invariant) return std::nullopt;
    return halfPointRank(value.fullRank());
}

void Attribute::incrementRank() {
    if (invariant) return;
    value.increment();
}

void Attribute::decrementRank() {
    if (invariant) return;
    value.decrement();
}

void Attribute::increaseRank(int step) {
    if (invariant) return;
    value.increase(step);
}

// --- Skill ---

Skill::Skill(std::string name, std::string governing, SkillTraits traits)
    : name_(std::move(name)), governing_(std::move(governing)), traits_(traits) {
    if (traits_.specific && !traits_.multiple) {
        SkillTraits specTraits{};
        specTraits.invariant = traits_.invariant;
        specTraits.acquired = true;
        specialization_ = std::make_unique<Skill>(kDefaultSpecializationName, governing_, specTraits);
        specialization_->master_ = this;
    }
    // A skill is never both specific and multiple.
    traits_.specific = specialization_ != nullptr;
}

Skill::Skill(const Skill& other)
    : name_(other.name_),
      governing_(other.governing_),
      traits_(other.traits_),
      value_(other.value_),
      varieties_(other.varieties_) {
    if (other.specialization_) {
        specialization_ = std::make_unique<Skill>(*other.specialization_);
        specialization_->master_ = this;
    }
}

Skill& Skill::operator=(const Skill& other) {
    if (this == &other) return *this;
    Skill copy(other);
    *this = std::move(copy);
    return *this;
}

Skill::Skill(Skill&& other) noexcept
    : name_(std::move(other.name_)),
      governing_(std::move(other.governing_)),
      traits_(other.traits_),
      value_(other.value_),
      varieties_(std::move(other.varieties_)),
      specialization_(std::move(other.specialization_)) {
    if (specialization_) specialization_->master_ = this;
}

Skill& Skill::operator=(Skill&& other) noexcept {
    if (this == &other) return *this;
    name_ = std::move(other.name_);
    governing_ = std::move(other.governing_);
    traits_ = other.traits_;
    value_ = other.value_;
    varieties_ = std::move(other.varieties_);
    specialization_ = std::move(other.specialization_);
    if (specialization_) specialization_->master_ = this;
    return *this;
}

std::optional<std::string> Skill::displayRank() const {
    if (traits_.invariant) return std::nullopt;
    return halfPointRank(value_.fullRank());
}

bool Skill::addVariety(const std::string& variety) {
    if (!traits_.multiple || variety.empty()) return false;
    if (traits_.singleSlot && !varieties_.empty()) {
        // Only a repeat of the held variety is kept, numbered after it.
        if (varieties_.front() != variety) return false;
        varieties_.push_back(variety + " " + std::to_string(varieties_.size() + 1));
        return true;
    }
    varieties_.push_back(variety);
    return true;
}

bool Skill::removeVariety(const std::string& variety) {
    auto it = std::find(varieties_.begin(), varieties_.end(), variety);
    if (it == varieties_.end()) return false;
    varieties_.erase(it);
    return true;
}

void Skill::setVarieties(std::vector<std::string> varieties) { varieties_ = std::move(varieties); }

void Skill::incrementRank() {
    if (traits_.invariant) return;
    if (specialization_ && specialization_->fullRank() <= fullRank()) return;
    value_.increment();
}

void Skill::decrementRank() {
    if (value_.rank == 0 || traits_.invariant) return;
    if (master_ && master_->fullRank() >= fullRank()) return;
    value_.decrement();
}

void Skill::increaseRank(int step) {
    if (traits_.invariant) return;
    value_.increase(step);
}

void Skill::liftSpecialization() {
    if (!specialization_) return;
    const int gap = fullRank() - specialization_->fullRank();
    if (gap > 0) specialization_->value_.rank += gap;
}

void Skill::computeBaseRank(const Attribute* governing) {
    if (traits_.invariant) {
        value_.baseRank = 0;
    } else if (governing) {
        value_.baseRank = static_cast<int>(std::floor(static_cast<float>(governing->fullRank()) / 2.0f));
    } else {
        value_.baseRank = kUngovernedBaseRank;
    }
    if (specialization_) {
        specialization_->computeBaseRank(governing);
        liftSpecialization();
    }
}

bool Skill::isUsable() const {
    if (!traits_.acquired || value_.rank != 0) return true;
    if (specialization_ && specialization_->isUsable()) return true;
    if (traits_.multiple && !varieties_.empty()) return true;
    return false;
}

std::string Skill::prettyString() const {
    std::string out = name_;
    if (auto rank = displayRank()) out += " " + trimRight(*rank);
    if (specialization_ && specialization_->fullRank() > fullRank()) {
        out += " (" + specialization_->name_;
        if (auto rank = specialization_->displayRank()) out += " " + trimRight(*rank);
        out += ")";
    } else if (traits_.multiple && !varieties_.empty()) {
        out += " (";
        for (std::size_t i = 0; i < varieties_.size(); ++i) {
            if (i > 0) out += ", ";
            out += varieties_[i];
        }
        out += ")";
    }
    return out;
}

// --- Power ---

std::optional<std::string> Power::displayRank() const {
    if (invariant) return std::nullopt;
    return halfPointRank(value.fullRank());
}

Power makePower(std::string name, bool invariant, int tableRank, std::string cost, int slot) {
    Power p{};
    p.name = std::move(name);
    p.cost = std::move(cost);
    p.invariant = invariant;
    p.slot = slot;
    p.value.baseRank = invariant ? 0 : 2 * tableRank;
    return p;
}

}  // namespace Scox::Values
