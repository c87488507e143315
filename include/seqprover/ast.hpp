// ============================================================================
// seqprover/ast.hpp — Abstract Syntax Tree for first-order formulas
// ============================================================================
//
// Design notes:
//
//   A formula is a closed tagged union over seven node kinds.  Every node
//   owns its children directly (std::unique_ptr), so a tree is acyclic and
//   strictly top-down: copying a Formula deep-clones it, and two sibling
//   proof branches never observe each other's substitutions.
//
//   Node kinds:
//     - Atom        : opaque predicate text, may embed <x> / <name> tokens
//     - Negation    : child[0]
//     - Conjunction : child[0] & child[1]
//     - Disjunction : child[0] v child[1]
//     - Conditional : child[0] > child[1]
//     - Universal   : ∀<var> child[0]
//     - Existential : ∃<var> child[0]
//
//   Placeholders embedded in Atom text:
//     <x>      one lowercase letter      a bindable variable
//     <name>   two or more lowercase     a constant already in play
//
// ============================================================================

#ifndef SEQPROVER_AST_HPP
#define SEQPROVER_AST_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace seqprover {

// ── NodeKind ────────────────────────────────────────────────────────────────

enum class NodeKind : std::uint8_t {
    Atom,

    // Propositional connectives
    Negation,
    Conjunction,
    Disjunction,
    Conditional,

    // Quantifiers
    Universal,
    Existential
};

/// Human-readable string for a NodeKind.
const char* node_kind_name(NodeKind k) noexcept;

// ── Connective metadata ─────────────────────────────────────────────────────
// Each connective has a symbol and a word spelling, both accepted by the
// parser.  The symbol is used for canonical rendering.  Atom has no
// connective spelling (empty strings, arity 0).

const char* connective_symbol(NodeKind k) noexcept;
const char* connective_word(NodeKind k) noexcept;
std::size_t connective_arity(NodeKind k) noexcept;

inline bool is_binary(NodeKind k) noexcept {
    return k == NodeKind::Conjunction || k == NodeKind::Disjunction ||
           k == NodeKind::Conditional;
}

inline bool is_quantifier(NodeKind k) noexcept {
    return k == NodeKind::Universal || k == NodeKind::Existential;
}

// ── FormulaError ────────────────────────────────────────────────────────────
// Raised by the parser and by the arity-checked builders.  fragment() is
// the exact piece of text (or connective token) that could not be
// interpreted.

class FormulaError : public std::runtime_error {
public:
    enum class Kind : std::uint8_t {
        EmptyString,        // nothing left after deparenthesising
        MalformedString,    // missing operand, bad bound variable
        InvalidConnective,  // token is not a connective keyword
        IncorrectArity      // builder got the wrong number of children
    };

    FormulaError(Kind kind, std::string fragment, const std::string& message);

    Kind kind() const noexcept { return kind_; }
    const std::string& fragment() const noexcept { return fragment_; }

private:
    Kind        kind_;
    std::string fragment_;
};

const char* formula_error_kind_name(FormulaError::Kind k) noexcept;

// ── Formula ─────────────────────────────────────────────────────────────────

class Formula {
public:
    // ── Constructors ────────────────────────────────────────────────────
    static Formula atom(std::string text);
    static Formula negation(Formula negatum);
    static Formula conjunction(Formula lhs, Formula rhs);
    static Formula disjunction(Formula lhs, Formula rhs);
    static Formula conditional(Formula lhs, Formula rhs);
    static Formula universal(std::string variable, Formula predicate);
    static Formula existential(std::string variable, Formula predicate);

    /// Arity-checked builder.  For Atom, `text` is the atom text and
    /// `children` must be empty; for quantifiers, `text` is the bound
    /// variable.  Throws FormulaError(IncorrectArity) on a count mismatch
    /// and FormulaError(MalformedString) for a bound variable that is not
    /// one lower-case letter.
    static Formula make(NodeKind kind, std::vector<Formula> children,
                        std::string text = {});

    /// Builder keyed by a connective spelling ("&", "and", "∀", ...).
    /// Throws FormulaError(InvalidConnective) for an unknown token.
    static Formula from_connective(std::string_view token,
                                   std::vector<Formula> children,
                                   std::string variable = {});

    Formula(const Formula& other);
    Formula& operator=(const Formula& other);
    Formula(Formula&&) noexcept = default;
    Formula& operator=(Formula&&) noexcept = default;
    ~Formula() = default;

    // ── Accessors ───────────────────────────────────────────────────────
    NodeKind kind() const noexcept { return kind_; }

    /// Atom text (Atom only).
    const std::string& text() const noexcept { return text_; }

    /// Bound variable, without angle brackets (quantifiers only).
    const std::string& variable() const noexcept { return text_; }

    const Formula& child(std::size_t i) const;
    const Formula& left() const { return child(0); }
    const Formula& right() const { return child(1); }

    /// Move a child out of this node.  The node is left in a valid but
    /// unspecified state and must not be queried afterwards.
    Formula take_child(std::size_t i);

    /// Direct propositional content: the children, or the atom itself.
    std::vector<const Formula*> content() const;

    // ── Structural queries ──────────────────────────────────────────────

    /// Longest path of connectives/quantifiers; 0 for atoms.
    std::size_t complexity() const noexcept;

    bool is_atomic() const noexcept { return kind_ == NodeKind::Atom; }

    /// Every <name> token (two or more lowercase letters) embedded in the
    /// atoms of this subtree, left to right.
    std::vector<std::string> names() const;

    /// Every <x> token (one lowercase letter), left to right.
    std::vector<std::string> variables() const;

    /// True if a quantifier somewhere in this subtree binds `variable`.
    bool rebinds(const std::string& variable) const;

    // ── Substitution ────────────────────────────────────────────────────

    /// Replace every <variable> with <name> in all atom text, in place.
    /// Nested quantifiers that rebind `variable` are NOT skipped.
    void instantiate(const std::string& variable, const std::string& name);

    /// Substituted deep clone; *this is untouched.
    Formula instantiated(const std::string& variable,
                         const std::string& name) const;

    // ── Pretty-print ────────────────────────────────────────────────────
    // Canonical, fully parenthesised rendering that re-parses to an equal
    // tree:  ~(A)   (A & B)   (A v B)   (A > B)   ∀<x>(P)   ∃<x>(P)
    std::string to_string() const;

    bool operator==(const Formula& o) const noexcept;
    bool operator!=(const Formula& o) const noexcept { return !(*this == o); }

private:
    Formula(NodeKind kind, std::string text);

    void collect_placeholders(bool want_names,
                              std::vector<std::string>& out) const;

    NodeKind                 kind_ = NodeKind::Atom;
    std::string              text_;          // atom text or bound variable
    std::unique_ptr<Formula> children_[2];
};

}  // namespace seqprover

#endif  // SEQPROVER_AST_HPP
