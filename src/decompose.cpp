// ============================================================================
// decompose.cpp — Sequent-calculus rules
// ============================================================================
//
// Every rule consumes the sequent it is given.  Rules with two parents copy
// the remaining sequent once (a deep clone) and mutate each copy
// independently, so no formula instance is ever shared between parents.
//
// ============================================================================

#include "seqprover/decompose.hpp"

#include <algorithm>
#include <utility>

namespace seqprover {

// ── rule_kind_name ──────────────────────────────────────────────────────────

const char* rule_kind_name(RuleKind k) noexcept {
    switch (k) {
        case RuleKind::NegationLeft:     return "~L";
        case RuleKind::NegationRight:    return "~R";
        case RuleKind::ConditionalLeft:  return ">L";
        case RuleKind::ConditionalRight: return ">R";
        case RuleKind::ConjunctionLeft:  return "&L";
        case RuleKind::ConjunctionRight: return "&R";
        case RuleKind::DisjunctionLeft:  return "vL";
        case RuleKind::DisjunctionRight: return "vR";
        case RuleKind::UniversalLeft:    return "∀L";
        case RuleKind::UniversalRight:   return "∀R";
        case RuleKind::ExistentialLeft:  return "∃L";
        case RuleKind::ExistentialRight: return "∃R";
    }
    return "?";
}

RuleKind rule_for(NodeKind k, Side side) noexcept {
    const bool left = (side == Side::Antecedent);
    switch (k) {
        case NodeKind::Negation:
            return left ? RuleKind::NegationLeft : RuleKind::NegationRight;
        case NodeKind::Conditional:
            return left ? RuleKind::ConditionalLeft : RuleKind::ConditionalRight;
        case NodeKind::Conjunction:
            return left ? RuleKind::ConjunctionLeft : RuleKind::ConjunctionRight;
        case NodeKind::Disjunction:
            return left ? RuleKind::DisjunctionLeft : RuleKind::DisjunctionRight;
        case NodeKind::Universal:
            return left ? RuleKind::UniversalLeft : RuleKind::UniversalRight;
        case NodeKind::Existential:
            return left ? RuleKind::ExistentialLeft : RuleKind::ExistentialRight;
        case NodeKind::Atom:
            break;
    }
    return RuleKind::NegationLeft;
}

bool is_eigenvariable_rule(RuleKind k) noexcept {
    return k == RuleKind::ExistentialLeft || k == RuleKind::UniversalRight;
}

bool is_reusable_rule(RuleKind k) noexcept {
    return k == RuleKind::UniversalLeft || k == RuleKind::ExistentialRight;
}

namespace {

Leaf one_parent(Sequent s, std::string witness = {}) {
    Leaf leaf;
    leaf.parents.push_back(std::move(s));
    leaf.witness = std::move(witness);
    return leaf;
}

Leaf two_parents(Sequent first, Sequent second) {
    Leaf leaf;
    leaf.parents.push_back(std::move(first));
    leaf.parents.push_back(std::move(second));
    return leaf;
}

Side opposite(Side s) noexcept {
    return s == Side::Antecedent ? Side::Consequent : Side::Antecedent;
}

}  // namespace

// ── Decomposer ──────────────────────────────────────────────────────────────

Decomposer::Decomposer(NameSupply& names) : names_(names) {}

std::optional<Branch> Decomposer::decompose(Sequent sequent) const {
    auto at = sequent.first_complex_proposition();
    if (!at) return std::nullopt;

    Formula chi = sequent.remove_at(*at);
    const NodeKind kind = chi.kind();
    const std::string principal = chi.to_string();

    Branch branch;
    switch (kind) {
        case NodeKind::Negation:
            branch = decompose_negation(std::move(sequent), at->side,
                                        chi.take_child(0));
            break;
        case NodeKind::Conditional: {
            Formula lhs = chi.take_child(0);
            Formula rhs = chi.take_child(1);
            branch = decompose_conditional(std::move(sequent), at->side,
                                           std::move(lhs), std::move(rhs));
            break;
        }
        case NodeKind::Conjunction: {
            Formula lhs = chi.take_child(0);
            Formula rhs = chi.take_child(1);
            branch = decompose_conjunction(std::move(sequent), at->side,
                                           std::move(lhs), std::move(rhs));
            break;
        }
        case NodeKind::Disjunction: {
            Formula lhs = chi.take_child(0);
            Formula rhs = chi.take_child(1);
            branch = decompose_disjunction(std::move(sequent), at->side,
                                           std::move(lhs), std::move(rhs));
            break;
        }
        case NodeKind::Universal:
        case NodeKind::Existential: {
            const std::string variable = chi.variable();
            branch = decompose_quantifier(std::move(sequent), kind, at->side,
                                          variable, chi.take_child(0));
            break;
        }
        case NodeKind::Atom:
            // first_complex_proposition() never selects an atom.
            return std::nullopt;
    }

    branch.rule = rule_for(kind, at->side);
    branch.principal = principal;
    return branch;
}

// ── Negation ────────────────────────────────────────────────────────────────
// The negatum crosses the turnstile.

Branch Decomposer::decompose_negation(Sequent sequent, Side side,
                                      Formula negatum) const {
    sequent.push(opposite(side), std::move(negatum));
    Branch b;
    b.leaves.push_back(one_parent(std::move(sequent)));
    return b;
}

// ── Conditional ─────────────────────────────────────────────────────────────

Branch Decomposer::decompose_conditional(Sequent sequent, Side side,
                                         Formula lhs, Formula rhs) const {
    Branch b;
    if (side == Side::Antecedent) {
        Sequent first = sequent;
        first.push_right(std::move(lhs));
        sequent.push_left(std::move(rhs));
        b.leaves.push_back(two_parents(std::move(first), std::move(sequent)));
    } else {
        sequent.push_left(std::move(lhs));
        sequent.push_right(std::move(rhs));
        b.leaves.push_back(one_parent(std::move(sequent)));
    }
    return b;
}

// ── Conjunction ─────────────────────────────────────────────────────────────

Branch Decomposer::decompose_conjunction(Sequent sequent, Side side,
                                         Formula lhs, Formula rhs) const {
    Branch b;
    if (side == Side::Antecedent) {
        sequent.push_left(std::move(lhs));
        sequent.push_left(std::move(rhs));
        b.leaves.push_back(one_parent(std::move(sequent)));
    } else {
        Sequent first = sequent;
        first.push_right(std::move(lhs));
        sequent.push_right(std::move(rhs));
        b.leaves.push_back(two_parents(std::move(first), std::move(sequent)));
    }
    return b;
}

// ── Disjunction ─────────────────────────────────────────────────────────────

Branch Decomposer::decompose_disjunction(Sequent sequent, Side side,
                                         Formula lhs, Formula rhs) const {
    Branch b;
    if (side == Side::Antecedent) {
        Sequent first = sequent;
        first.push_left(std::move(lhs));
        sequent.push_left(std::move(rhs));
        b.leaves.push_back(two_parents(std::move(first), std::move(sequent)));
    } else {
        sequent.push_right(std::move(lhs));
        sequent.push_right(std::move(rhs));
        b.leaves.push_back(one_parent(std::move(sequent)));
    }
    return b;
}

// ── Quantifiers ─────────────────────────────────────────────────────────────
// The instantiated predicate stays on the side the quantifier came from.

Branch Decomposer::decompose_quantifier(Sequent sequent, NodeKind kind,
                                        Side side, const std::string& variable,
                                        Formula predicate) const {
    Branch b;

    if (is_eigenvariable_rule(rule_for(kind, side))) {
        std::string eigen = names_.fresh(candidate_names(sequent, predicate));
        predicate.instantiate(variable, eigen);
        sequent.push(side, std::move(predicate));
        b.leaves.push_back(one_parent(std::move(sequent), std::move(eigen)));
        return b;
    }

    std::vector<std::string> candidates = candidate_names(sequent, predicate);
    if (candidates.empty()) {
        candidates.push_back(names_.fresh({}));
    }

    b.leaves.reserve(candidates.size());
    for (const auto& name : candidates) {
        Sequent parent = sequent;
        parent.push(side, predicate.instantiated(variable, name));
        b.leaves.push_back(one_parent(std::move(parent), name));
    }
    return b;
}

std::vector<std::string> Decomposer::candidate_names(
    const Sequent& sequent, const Formula& predicate) const {
    std::vector<std::string> out;
    auto add = [&out](std::string name) {
        if (std::find(out.begin(), out.end(), name) == out.end()) {
            out.push_back(std::move(name));
        }
    };
    for (auto& name : predicate.names()) add(std::move(name));
    for (auto& name : sequent.names()) add(std::move(name));
    return out;
}

}  // namespace seqprover
