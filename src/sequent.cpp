// ============================================================================
// sequent.cpp — Sequent selection, mutation, printing and parsing
// ============================================================================

#include "seqprover/sequent.hpp"
#include "seqprover/parser.hpp"
#include "seqprover/utils.hpp"

#include <algorithm>
#include <initializer_list>
#include <utility>

namespace seqprover {

const char* side_name(Side s) noexcept {
    switch (s) {
        case Side::Antecedent: return "antecedent";
        case Side::Consequent: return "consequent";
    }
    return "?";
}

// ── Sequent ─────────────────────────────────────────────────────────────────

Sequent::Sequent(std::vector<Formula> antecedent,
                 std::vector<Formula> consequent)
    : ant_(std::move(antecedent)), con_(std::move(consequent)) {}

const std::vector<Formula>& Sequent::side(Side s) const noexcept {
    return s == Side::Antecedent ? ant_ : con_;
}

std::vector<Formula>& Sequent::side_mut(Side s) noexcept {
    return s == Side::Antecedent ? ant_ : con_;
}

std::size_t Sequent::complexity() const noexcept {
    std::size_t total = 0;
    for (const auto& f : ant_) total += f.complexity();
    for (const auto& f : con_) total += f.complexity();
    return total;
}

bool Sequent::is_atomic() const noexcept {
    return !first_complex_proposition().has_value();
}

std::optional<Coordinates> Sequent::first_complex_proposition() const noexcept {
    for (Side s : {Side::Antecedent, Side::Consequent}) {
        const auto& members = side(s);
        for (std::size_t i = 0; i < members.size(); ++i) {
            if (members[i].complexity() > 0) return Coordinates{s, i};
        }
    }
    return std::nullopt;
}

Formula Sequent::remove_at(Side s, std::size_t index) {
    auto& members = side_mut(s);
    if (index >= members.size()) {
        throw std::out_of_range("remove_at: index " + std::to_string(index) +
                                " out of range for " + side_name(s) +
                                " of size " + std::to_string(members.size()));
    }
    Formula out = std::move(members[index]);
    members.erase(members.begin() + static_cast<std::ptrdiff_t>(index));
    return out;
}

void Sequent::push(Side s, Formula f) {
    side_mut(s).push_back(std::move(f));
}

void Sequent::mix(Sequent other) {
    for (auto& f : other.ant_) ant_.push_back(std::move(f));
    for (auto& f : other.con_) con_.push_back(std::move(f));
}

std::vector<std::string> Sequent::names() const {
    std::vector<std::string> out;
    for (Side s : {Side::Antecedent, Side::Consequent}) {
        for (const auto& f : side(s)) {
            for (auto& name : f.names()) {
                if (std::find(out.begin(), out.end(), name) == out.end()) {
                    out.push_back(std::move(name));
                }
            }
        }
    }
    return out;
}

std::string Sequent::to_string() const {
    auto render = [](const std::vector<Formula>& members) {
        std::vector<std::string> parts;
        parts.reserve(members.size());
        for (const auto& f : members) parts.push_back(f.to_string());
        return join(parts, ", ");
    };

    std::string lhs = render(ant_);
    std::string rhs = render(con_);
    std::string out = lhs.empty() ? std::string(kTurnstile)
                                  : lhs + " " + std::string(kTurnstile);
    if (!rhs.empty()) out += " " + rhs;
    return out;
}

// ── SequentError ────────────────────────────────────────────────────────────

SequentError::SequentError(Kind kind, std::string fragment,
                           const std::string& message)
    : std::runtime_error(message), kind_(kind), fragment_(std::move(fragment)) {}

const char* sequent_error_kind_name(SequentError::Kind k) noexcept {
    switch (k) {
        case SequentError::Kind::TurnstileCount: return "TurnstileCount";
        case SequentError::Kind::InvalidFormula: return "InvalidFormula";
    }
    return "?";
}

// ── parse_sequent ───────────────────────────────────────────────────────────

namespace {

std::vector<Formula> parse_side(const std::string& text, const Parser& parser) {
    std::vector<Formula> members;
    if (trim(text).empty()) return members;

    for (const auto& piece : split(text, ",")) {
        try {
            members.push_back(parser.parse(piece));
        } catch (const FormulaError& e) {
            throw SequentError(SequentError::Kind::InvalidFormula,
                               e.fragment(), e.what());
        }
    }
    return members;
}

}  // namespace

Sequent parse_sequent(std::string_view input, std::uint32_t line) {
    const std::size_t turnstiles = count_occurrences(input, kTurnstile);
    if (turnstiles != 1) {
        throw SequentError(SequentError::Kind::TurnstileCount,
                           std::string(input),
                           std::to_string(line) + ": ERROR: expected one '" +
                               std::string(kTurnstile) + "', found " +
                               std::to_string(turnstiles));
    }

    const auto sides = split(input, kTurnstile);
    Parser parser(line);
    return Sequent(parse_side(sides[0], parser), parse_side(sides[1], parser));
}

}  // namespace seqprover
