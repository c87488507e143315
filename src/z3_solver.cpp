// ============================================================================
// z3_solver.cpp — Implementation of the Z3 propositional checker
// ============================================================================

#include "seqprover/z3_solver.hpp"

#include <vector>

namespace seqprover {

const char* z3_result_to_string(Z3Result r) noexcept {
    switch (r) {
        case Z3Result::SAT:     return "SAT";
        case Z3Result::UNSAT:   return "UNSAT";
        case Z3Result::UNKNOWN: return "UNKNOWN";
    }
    return "?";
}

// ── Z3Checker ───────────────────────────────────────────────────────────────

Z3Checker::Z3Checker() : ctx_(), solver_(ctx_) {}

void Z3Checker::reset() {
    solver_.reset();
    bool_vars_.clear();
}

z3::expr Z3Checker::get_bool_var(const std::string& atom_text) {
    auto it = bool_vars_.find(atom_text);
    if (it != bool_vars_.end()) {
        return *it->second;
    }
    auto var = std::make_unique<z3::expr>(ctx_.bool_const(atom_text.c_str()));
    z3::expr result = *var;
    bool_vars_[atom_text] = std::move(var);
    return result;
}

void Z3Checker::add_boolean_literal(const std::string& atom_text, bool positive) {
    z3::expr atom = get_bool_var(atom_text);
    if (positive) {
        solver_.add(atom);
    } else {
        solver_.add(!atom);
    }
}

std::optional<z3::expr> Z3Checker::to_z3_bool(const Formula& f) {
    switch (f.kind()) {
        case NodeKind::Atom:
            return get_bool_var(f.text());

        case NodeKind::Negation: {
            auto child = to_z3_bool(f.child(0));
            if (!child) return std::nullopt;
            return !(*child);
        }

        case NodeKind::Conjunction: {
            auto lhs = to_z3_bool(f.left());
            auto rhs = to_z3_bool(f.right());
            if (!lhs || !rhs) return std::nullopt;
            return (*lhs) && (*rhs);
        }

        case NodeKind::Disjunction: {
            auto lhs = to_z3_bool(f.left());
            auto rhs = to_z3_bool(f.right());
            if (!lhs || !rhs) return std::nullopt;
            return (*lhs) || (*rhs);
        }

        case NodeKind::Conditional: {
            auto lhs = to_z3_bool(f.left());
            auto rhs = to_z3_bool(f.right());
            if (!lhs || !rhs) return std::nullopt;
            return z3::implies(*lhs, *rhs);
        }

        // Names range over an unbounded domain; not propositional.
        case NodeKind::Universal:
        case NodeKind::Existential:
            return std::nullopt;
    }

    return std::nullopt;
}

bool Z3Checker::add_formula(const Formula& f) {
    auto expr = to_z3_bool(f);
    if (!expr) {
        return false;
    }
    solver_.add(*expr);
    return true;
}

bool Z3Checker::add_sequent_negation(const Sequent& s) {
    // Encode everything before asserting anything.
    std::vector<z3::expr> encoded;
    for (const auto& f : s.antecedent()) {
        auto expr = to_z3_bool(f);
        if (!expr) return false;
        encoded.push_back(*expr);
    }
    for (const auto& f : s.consequent()) {
        auto expr = to_z3_bool(f);
        if (!expr) return false;
        encoded.push_back(!(*expr));
    }

    for (const auto& e : encoded) {
        solver_.add(e);
    }
    return true;
}

Z3Result Z3Checker::check() {
    z3::check_result result = solver_.check();

    switch (result) {
        case z3::sat:
            return Z3Result::SAT;
        case z3::unsat:
            return Z3Result::UNSAT;
        case z3::unknown:
            return Z3Result::UNKNOWN;
    }

    return Z3Result::UNKNOWN;
}

std::string Z3Checker::get_model() {
    if (solver_.check() != z3::sat) {
        return "(no model available)";
    }

    z3::model model = solver_.get_model();
    std::string result = "{";
    bool first = true;

    for (const auto& entry : bool_vars_) {
        if (!first) {
            result += ", ";
        }
        first = false;

        z3::expr value = model.eval(*entry.second, true);
        result += entry.first + " = " + value.to_string();
    }

    result += "}";
    return result;
}

}  // namespace seqprover
