// ============================================================================
// ast.cpp — Implementation of the formula AST, substitution and printing
// ============================================================================

#include "seqprover/ast.hpp"
#include "seqprover/lexer.hpp"

#include <algorithm>
#include <utility>

namespace seqprover {

// ── node_kind_name ──────────────────────────────────────────────────────────

const char* node_kind_name(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::Atom:        return "Atom";
        case NodeKind::Negation:    return "Negation";
        case NodeKind::Conjunction: return "Conjunction";
        case NodeKind::Disjunction: return "Disjunction";
        case NodeKind::Conditional: return "Conditional";
        case NodeKind::Universal:   return "Universal";
        case NodeKind::Existential: return "Existential";
    }
    return "?";
}

// ── Connective metadata ─────────────────────────────────────────────────────

const char* connective_symbol(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::Atom:        return "";
        case NodeKind::Negation:    return "~";
        case NodeKind::Conjunction: return "&";
        case NodeKind::Disjunction: return "v";
        case NodeKind::Conditional: return ">";
        case NodeKind::Universal:   return "∀";
        case NodeKind::Existential: return "∃";
    }
    return "";
}

const char* connective_word(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::Atom:        return "";
        case NodeKind::Negation:    return "not";
        case NodeKind::Conjunction: return "and";
        case NodeKind::Disjunction: return "or";
        case NodeKind::Conditional: return "implies";
        case NodeKind::Universal:   return "forall";
        case NodeKind::Existential: return "exists";
    }
    return "";
}

std::size_t connective_arity(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::Atom:
            return 0;
        case NodeKind::Negation:
        case NodeKind::Universal:
        case NodeKind::Existential:
            return 1;
        case NodeKind::Conjunction:
        case NodeKind::Disjunction:
        case NodeKind::Conditional:
            return 2;
    }
    return 0;
}

// ── FormulaError ────────────────────────────────────────────────────────────

FormulaError::FormulaError(Kind kind, std::string fragment,
                           const std::string& message)
    : std::runtime_error(message), kind_(kind), fragment_(std::move(fragment)) {}

const char* formula_error_kind_name(FormulaError::Kind k) noexcept {
    switch (k) {
        case FormulaError::Kind::EmptyString:       return "EmptyString";
        case FormulaError::Kind::MalformedString:   return "MalformedString";
        case FormulaError::Kind::InvalidConnective: return "InvalidConnective";
        case FormulaError::Kind::IncorrectArity:    return "IncorrectArity";
    }
    return "?";
}

// ── Construction ────────────────────────────────────────────────────────────

Formula::Formula(NodeKind kind, std::string text)
    : kind_(kind), text_(std::move(text)) {}

Formula::Formula(const Formula& other)
    : kind_(other.kind_), text_(other.text_) {
    for (std::size_t i = 0; i < 2; ++i) {
        if (other.children_[i]) {
            children_[i] = std::make_unique<Formula>(*other.children_[i]);
        }
    }
}

Formula& Formula::operator=(const Formula& other) {
    if (this != &other) {
        Formula copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Formula Formula::atom(std::string text) {
    return Formula(NodeKind::Atom, std::move(text));
}

Formula Formula::negation(Formula negatum) {
    Formula f(NodeKind::Negation, {});
    f.children_[0] = std::make_unique<Formula>(std::move(negatum));
    return f;
}

Formula Formula::conjunction(Formula lhs, Formula rhs) {
    Formula f(NodeKind::Conjunction, {});
    f.children_[0] = std::make_unique<Formula>(std::move(lhs));
    f.children_[1] = std::make_unique<Formula>(std::move(rhs));
    return f;
}

Formula Formula::disjunction(Formula lhs, Formula rhs) {
    Formula f(NodeKind::Disjunction, {});
    f.children_[0] = std::make_unique<Formula>(std::move(lhs));
    f.children_[1] = std::make_unique<Formula>(std::move(rhs));
    return f;
}

Formula Formula::conditional(Formula lhs, Formula rhs) {
    Formula f(NodeKind::Conditional, {});
    f.children_[0] = std::make_unique<Formula>(std::move(lhs));
    f.children_[1] = std::make_unique<Formula>(std::move(rhs));
    return f;
}

Formula Formula::universal(std::string variable, Formula predicate) {
    Formula f(NodeKind::Universal, std::move(variable));
    f.children_[0] = std::make_unique<Formula>(std::move(predicate));
    return f;
}

Formula Formula::existential(std::string variable, Formula predicate) {
    Formula f(NodeKind::Existential, std::move(variable));
    f.children_[0] = std::make_unique<Formula>(std::move(predicate));
    return f;
}

namespace {

Formula make_binary_node(NodeKind kind, Formula lhs, Formula rhs) {
    switch (kind) {
        case NodeKind::Conjunction:
            return Formula::conjunction(std::move(lhs), std::move(rhs));
        case NodeKind::Disjunction:
            return Formula::disjunction(std::move(lhs), std::move(rhs));
        default:
            return Formula::conditional(std::move(lhs), std::move(rhs));
    }
}

}  // namespace

// ── make ────────────────────────────────────────────────────────────────────

Formula Formula::make(NodeKind kind, std::vector<Formula> children,
                      std::string text) {
    const std::size_t arity = connective_arity(kind);
    if (children.size() != arity) {
        throw FormulaError(
            FormulaError::Kind::IncorrectArity, node_kind_name(kind),
            std::string(node_kind_name(kind)) + " requires " +
                std::to_string(arity) + " subformula(s), not " +
                std::to_string(children.size()));
    }

    if (is_quantifier(kind) &&
        !(text.size() == 1 && text[0] >= 'a' && text[0] <= 'z')) {
        throw FormulaError(
            FormulaError::Kind::MalformedString, text,
            std::string(node_kind_name(kind)) +
                " requires a single lower-case bound variable, not '" + text +
                "'");
    }

    switch (kind) {
        case NodeKind::Atom:
            return atom(std::move(text));
        case NodeKind::Negation:
            return negation(std::move(children[0]));
        case NodeKind::Conjunction:
        case NodeKind::Disjunction:
        case NodeKind::Conditional:
            return make_binary_node(kind, std::move(children[0]),
                                    std::move(children[1]));
        case NodeKind::Universal:
            return universal(std::move(text), std::move(children[0]));
        case NodeKind::Existential:
            return existential(std::move(text), std::move(children[0]));
    }
    return atom(std::move(text));
}

Formula Formula::from_connective(std::string_view token,
                                 std::vector<Formula> children,
                                 std::string variable) {
    auto kind = token_node_kind(classify_word(token));
    if (!kind) {
        throw FormulaError(FormulaError::Kind::InvalidConnective,
                           std::string(token),
                           "invalid connective '" + std::string(token) + "'");
    }
    return make(*kind, std::move(children), std::move(variable));
}

// ── Accessors ───────────────────────────────────────────────────────────────

const Formula& Formula::child(std::size_t i) const {
    if (i >= 2 || !children_[i]) {
        throw std::out_of_range(std::string(node_kind_name(kind_)) +
                                " has no child " + std::to_string(i));
    }
    return *children_[i];
}

Formula Formula::take_child(std::size_t i) {
    if (i >= 2 || !children_[i]) {
        throw std::out_of_range(std::string(node_kind_name(kind_)) +
                                " has no child " + std::to_string(i));
    }
    Formula out = std::move(*children_[i]);
    children_[i].reset();
    return out;
}

std::vector<const Formula*> Formula::content() const {
    if (kind_ == NodeKind::Atom) return {this};
    std::vector<const Formula*> out;
    for (const auto& c : children_) {
        if (c) out.push_back(c.get());
    }
    return out;
}

// ── Structural queries ──────────────────────────────────────────────────────

std::size_t Formula::complexity() const noexcept {
    switch (kind_) {
        case NodeKind::Atom:
            return 0;
        case NodeKind::Negation:
        case NodeKind::Universal:
        case NodeKind::Existential:
            return 1 + children_[0]->complexity();
        case NodeKind::Conjunction:
        case NodeKind::Disjunction:
        case NodeKind::Conditional:
            return 1 + std::max(children_[0]->complexity(),
                                children_[1]->complexity());
    }
    return 0;
}

void Formula::collect_placeholders(bool want_names,
                                   std::vector<std::string>& out) const {
    if (kind_ == NodeKind::Atom) {
        auto found = scan_placeholders(text_, want_names
                                                  ? PlaceholderKind::Name
                                                  : PlaceholderKind::Variable);
        out.insert(out.end(), std::make_move_iterator(found.begin()),
                   std::make_move_iterator(found.end()));
        return;
    }
    for (const auto& c : children_) {
        if (c) c->collect_placeholders(want_names, out);
    }
}

std::vector<std::string> Formula::names() const {
    std::vector<std::string> out;
    collect_placeholders(true, out);
    return out;
}

std::vector<std::string> Formula::variables() const {
    std::vector<std::string> out;
    collect_placeholders(false, out);
    return out;
}

bool Formula::rebinds(const std::string& variable) const {
    if (is_quantifier(kind_) && text_ == variable) return true;
    for (const auto& c : children_) {
        if (c && c->rebinds(variable)) return true;
    }
    return false;
}

// ── Substitution ────────────────────────────────────────────────────────────

void Formula::instantiate(const std::string& variable,
                          const std::string& name) {
    if (kind_ == NodeKind::Atom) {
        text_ = replace_placeholder(text_, variable, name);
        return;
    }
    for (auto& c : children_) {
        if (c) c->instantiate(variable, name);
    }
}

Formula Formula::instantiated(const std::string& variable,
                              const std::string& name) const {
    Formula copy(*this);
    copy.instantiate(variable, name);
    return copy;
}

// ── to_string ───────────────────────────────────────────────────────────────

std::string Formula::to_string() const {
    switch (kind_) {
        case NodeKind::Atom:
            return text_;
        case NodeKind::Negation:
            return "~(" + children_[0]->to_string() + ")";
        case NodeKind::Conjunction:
        case NodeKind::Disjunction:
        case NodeKind::Conditional:
            return "(" + children_[0]->to_string() + " " +
                   connective_symbol(kind_) + " " +
                   children_[1]->to_string() + ")";
        case NodeKind::Universal:
        case NodeKind::Existential:
            return std::string(connective_symbol(kind_)) + "<" + text_ +
                   ">(" + children_[0]->to_string() + ")";
    }
    return "<?>";
}

// ── Equality ────────────────────────────────────────────────────────────────

bool Formula::operator==(const Formula& o) const noexcept {
    if (kind_ != o.kind_ || text_ != o.text_) return false;
    for (std::size_t i = 0; i < 2; ++i) {
        const bool mine = static_cast<bool>(children_[i]);
        const bool theirs = static_cast<bool>(o.children_[i]);
        if (mine != theirs) return false;
        if (mine && !(*children_[i] == *o.children_[i])) return false;
    }
    return true;
}

}  // namespace seqprover
