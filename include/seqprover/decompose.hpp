// ============================================================================
// seqprover/decompose.hpp — Sequent-calculus decomposition engine
// ============================================================================
//
// One decomposition step removes the first complex member of a sequent
// (see Sequent::first_complex_proposition) and replaces the sequent by an
// AND-OR tree of parent sequents:
//
//   Branch  (OR):  the sequent is provable if ANY leaf is.
//   Leaf    (AND): a leaf certifies the sequent if ALL its parents are
//                  provable.
//
// Rule table (χ removed from `side`; Γ ⊢ Δ is what remains):
//
//   ~A    ant   Γ ⊢ Δ,A
//   ~A    con   Γ,A ⊢ Δ
//   A>B   ant   Γ ⊢ Δ,A    AND   Γ,B ⊢ Δ
//   A>B   con   Γ,A ⊢ Δ,B
//   A&B   ant   Γ,A,B ⊢ Δ
//   A&B   con   Γ ⊢ Δ,A    AND   Γ ⊢ Δ,B
//   AvB   ant   Γ,A ⊢ Δ    AND   Γ,B ⊢ Δ
//   AvB   con   Γ ⊢ Δ,A,B
//   ∃vP   con   OR over names n:  Γ ⊢ Δ,P[v:=n]          (reusable)
//   ∀vP   ant   OR over names n:  Γ,P[v:=n] ⊢ Δ          (reusable)
//   ∃vP   ant   Γ,P[v:=e] ⊢ Δ,   e fresh                 (eigenvariable)
//   ∀vP   con   Γ ⊢ Δ,P[v:=e],   e fresh                 (eigenvariable)
//
// The reusable rules try every name in P.names() ∪ names(Γ ⊢ Δ), in first
// occurrence order, or one fresh name if there is none.  They are applied
// once: the quantified formula is consumed and is not revisited when a
// deeper branch introduces new names, so the search is not complete for
// formulas that need the same universal instantiated twice.
//
// ============================================================================

#ifndef SEQPROVER_DECOMPOSE_HPP
#define SEQPROVER_DECOMPOSE_HPP

#include "seqprover/ast.hpp"
#include "seqprover/names.hpp"
#include "seqprover/sequent.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace seqprover {

// ── RuleKind ────────────────────────────────────────────────────────────────
// Left = the principal formula was on the antecedent, Right = consequent.

enum class RuleKind : std::uint8_t {
    NegationLeft,
    NegationRight,
    ConditionalLeft,
    ConditionalRight,
    ConjunctionLeft,
    ConjunctionRight,
    DisjunctionLeft,
    DisjunctionRight,
    UniversalLeft,      // reusable
    UniversalRight,     // eigenvariable
    ExistentialLeft,    // eigenvariable
    ExistentialRight    // reusable
};

const char* rule_kind_name(RuleKind k) noexcept;

/// The rule for a principal formula of kind `k` on `side`.  `k` must not be
/// Atom.
RuleKind rule_for(NodeKind k, Side side) noexcept;

/// True for ∃-left and ∀-right.
bool is_eigenvariable_rule(RuleKind k) noexcept;

/// True for ∀-left and ∃-right: instantiated once per known name and not
/// revisited when deeper steps introduce new names.
bool is_reusable_rule(RuleKind k) noexcept;

// ── Leaf / Branch ───────────────────────────────────────────────────────────

struct Leaf {
    std::vector<Sequent> parents;   // all must be provable
    std::string          witness;   // name substituted by a quantifier rule
};

struct Branch {
    RuleKind          rule = RuleKind::NegationLeft;
    std::string       principal;    // rendering of the decomposed formula
    std::vector<Leaf> leaves;       // any one suffices
};

// ── Decomposer ──────────────────────────────────────────────────────────────

class Decomposer {
public:
    explicit Decomposer(NameSupply& names);

    /// Apply one rule to the first complex member of `sequent`.  Returns
    /// nullopt if the sequent is atomic: provability must then be settled
    /// by the closure check.
    std::optional<Branch> decompose(Sequent sequent) const;

private:
    Branch decompose_negation(Sequent sequent, Side side,
                              Formula negatum) const;
    Branch decompose_conditional(Sequent sequent, Side side, Formula lhs,
                                 Formula rhs) const;
    Branch decompose_conjunction(Sequent sequent, Side side, Formula lhs,
                                 Formula rhs) const;
    Branch decompose_disjunction(Sequent sequent, Side side, Formula lhs,
                                 Formula rhs) const;
    Branch decompose_quantifier(Sequent sequent, NodeKind kind, Side side,
                                const std::string& variable,
                                Formula predicate) const;

    /// P.names() ∪ sequent.names() without duplicates.
    std::vector<std::string> candidate_names(const Sequent& sequent,
                                             const Formula& predicate) const;

    NameSupply& names_;
};

}  // namespace seqprover

#endif  // SEQPROVER_DECOMPOSE_HPP
