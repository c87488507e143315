// ============================================================================
// seqprover/z3_solver.hpp — Z3 wrapper for propositional validity checks
// ============================================================================
//
// Quantifier-free formulas are encoded propositionally: every distinct Atom
// text becomes one Boolean constant, and the connectives map onto Z3's
// Boolean operators.  A sequent Γ ⊢ Δ is valid iff Γ ∧ ¬(∨Δ) is UNSAT.
//
// Usage:
//   Z3Checker checker;
//   if (checker.add_sequent_negation(sequent) &&
//       checker.check() == Z3Result::UNSAT) {
//       // sequent is propositionally valid
//   }
//
// Quantified formulas are never encoded.  Z3 is only an oracle for the
// propositional layer; it does not reason about names or instances.
//
// ============================================================================

#ifndef SEQPROVER_Z3_SOLVER_HPP
#define SEQPROVER_Z3_SOLVER_HPP

#include "seqprover/ast.hpp"
#include "seqprover/sequent.hpp"

#include <z3++.h>

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace seqprover {

// ── Z3Result ────────────────────────────────────────────────────────────────

enum class Z3Result {
    SAT,
    UNSAT,
    UNKNOWN
};

const char* z3_result_to_string(Z3Result r) noexcept;

// ── Z3Checker ───────────────────────────────────────────────────────────────
// Owns one Z3 context and solver.  Not thread-safe: each search task that
// needs Z3 creates its own checker.

class Z3Checker {
public:
    Z3Checker();

    /// Assert a formula.  Returns false (nothing asserted) if it contains a
    /// quantifier.
    bool add_formula(const Formula& f);

    /// Assert an atom literal by its text.
    void add_boolean_literal(const std::string& atom_text, bool positive);

    /// Assert every antecedent member and the negation of every consequent
    /// member.  Returns false (nothing asserted) if any member is
    /// quantified.
    bool add_sequent_negation(const Sequent& s);

    Z3Result check();

    /// Reset the solver to empty state.
    void reset();

    /// Atom valuation of the last SAT check, e.g. "{A = true, B = false}".
    std::string get_model();

private:
    // nullopt if the formula contains a quantifier.
    std::optional<z3::expr> to_z3_bool(const Formula& f);

    z3::expr get_bool_var(const std::string& atom_text);

    z3::context ctx_;
    z3::solver  solver_;

    // Ordered so that models print deterministically.
    std::map<std::string, std::unique_ptr<z3::expr>> bool_vars_;
};

}  // namespace seqprover

#endif  // SEQPROVER_Z3_SOLVER_HPP
