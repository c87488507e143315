// ============================================================================
// seqprover/sequent.hpp — Sequents: the unit of proof search
// ============================================================================
//
// A sequent  A1, ..., An |~ C1, ..., Cm  holds two ordered formula lists:
// the antecedent (assumed true) and the consequent (at least one to be
// shown).  Logically both sides are multisets; the order is kept only so
// that rule selection, and therefore the proof tree, is deterministic.
//
// Only the decomposition engine mutates sequents.  Copying a Sequent
// deep-clones every member formula.
//
// ============================================================================

#ifndef SEQPROVER_SEQUENT_HPP
#define SEQPROVER_SEQUENT_HPP

#include "seqprover/ast.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace seqprover {

/// Separator between antecedent and consequent in sequent text.
inline constexpr std::string_view kTurnstile = "|~";

// ── Side ────────────────────────────────────────────────────────────────────

enum class Side : std::uint8_t {
    Antecedent,
    Consequent
};

const char* side_name(Side s) noexcept;

// ── Coordinates ─────────────────────────────────────────────────────────────

struct Coordinates {
    Side        side = Side::Antecedent;
    std::size_t index = 0;

    bool operator==(const Coordinates& o) const noexcept {
        return side == o.side && index == o.index;
    }
};

// ── Sequent ─────────────────────────────────────────────────────────────────

class Sequent {
public:
    Sequent() = default;
    Sequent(std::vector<Formula> antecedent, std::vector<Formula> consequent);

    const std::vector<Formula>& antecedent() const noexcept { return ant_; }
    const std::vector<Formula>& consequent() const noexcept { return con_; }
    const std::vector<Formula>& side(Side s) const noexcept;

    /// Sum of the complexities of every member on both sides.
    std::size_t complexity() const noexcept;

    /// True if every member is an atom.
    bool is_atomic() const noexcept;

    /// Position of the first member with complexity > 0: antecedent left to
    /// right, then consequent left to right.  nullopt if atomic.
    std::optional<Coordinates> first_complex_proposition() const noexcept;

    /// Detach and return a member.  Throws std::out_of_range for a bad
    /// index.
    Formula remove_at(Side s, std::size_t index);
    Formula remove_at(const Coordinates& at) { return remove_at(at.side, at.index); }

    void push_left(Formula f) { ant_.push_back(std::move(f)); }
    void push_right(Formula f) { con_.push_back(std::move(f)); }
    void push(Side s, Formula f);

    /// Append both sides of `other` to this sequent.
    void mix(Sequent other);

    /// Every <name> mentioned by any member, first occurrence order, no
    /// duplicates.
    std::vector<std::string> names() const;

    /// "A, B |~ C, D"
    std::string to_string() const;

    bool operator==(const Sequent& o) const noexcept {
        return ant_ == o.ant_ && con_ == o.con_;
    }
    bool operator!=(const Sequent& o) const noexcept { return !(*this == o); }

private:
    std::vector<Formula>& side_mut(Side s) noexcept;

    std::vector<Formula> ant_;
    std::vector<Formula> con_;
};

// ── SequentError ────────────────────────────────────────────────────────────

class SequentError : public std::runtime_error {
public:
    enum class Kind : std::uint8_t {
        TurnstileCount,     // not exactly one |~
        InvalidFormula      // a member failed to parse
    };

    SequentError(Kind kind, std::string fragment, const std::string& message);

    Kind kind() const noexcept { return kind_; }
    const std::string& fragment() const noexcept { return fragment_; }

private:
    Kind        kind_;
    std::string fragment_;
};

const char* sequent_error_kind_name(SequentError::Kind k) noexcept;

// ── parse_sequent ───────────────────────────────────────────────────────────
// "A, B |~ C, D": comma-separated formula lists joined by one turnstile.
// Either side may be empty.  Throws SequentError.

Sequent parse_sequent(std::string_view input, std::uint32_t line = 1);

}  // namespace seqprover

#endif  // SEQPROVER_SEQUENT_HPP
