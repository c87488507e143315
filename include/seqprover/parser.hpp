// ============================================================================
// seqprover/parser.hpp — Word-level parser for first-order formulas
// ============================================================================
//
// Grammar (informal):
//
//   formula  ::= '(' formula ')'
//              | NEG formula
//              | QUANT '<x>' formula
//              | words BIN words          (first BIN at depth 0 splits)
//              | words                   (atom)
//
//   NEG      ::= '~' | 'not'
//   QUANT    ::= '∃' | 'exists' | '∀' | 'forall'
//   BIN      ::= '&' | 'and' | 'v' | 'or' | '>' | 'implies'
//
// There is NO precedence table.  Unary prefixes are recognised first and
// take the whole remaining text as their operand; otherwise the leftmost
// binary keyword at parenthesis depth 0 is the main connective.  Any other
// grouping must be written with explicit parentheses:
//
//   A & B v C       =   A & (B v C)
//   ~ A & B         =   ~(A & B)
//   (~ A) & B       =   (~(A)) & B
//
// The symbolic prefixes may be glued to their operand, which is how the
// canonical rendering prints them:  ~(A)   ∀<x>(P <x>)
// Only these two shapes are prefixes; ~A, ~ish or ∀x are atom words.
// A glued prefix binds only its own word group, so a binary keyword at
// depth 0 still splits the text first:
//
//   ~(A) & B        =   (~(A)) & B
//   ∀<x>(P <x>) v B =   (∀<x>(P <x>)) v B
//
// ============================================================================

#ifndef SEQPROVER_PARSER_HPP
#define SEQPROVER_PARSER_HPP

#include "seqprover/ast.hpp"
#include "seqprover/lexer.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace seqprover {

// ── Parser ──────────────────────────────────────────────────────────────────
// Stateless apart from the line number used in error messages.  Throws
// FormulaError with the format:  <line>: ERROR: <msg>

class Parser {
public:
    explicit Parser(std::uint32_t line = 1);

    /// Parse a complete formula.
    Formula parse(std::string_view input) const;

private:
    // A unary prefix found at the start of the text, with everything that
    // follows it rejoined into one string.
    struct Prefix {
        NodeKind    kind;
        std::string rest;
        bool        glued = false;   // symbol attached to the next word
    };

    std::optional<Prefix> find_prefix(const std::vector<Token>& tokens) const;

    Formula parse_negation(const std::string& operand,
                           const std::string& full) const;
    Formula parse_quantifier(NodeKind kind, const std::string& rest,
                             bool glued, const std::string& full) const;
    std::optional<Formula> parse_binary(const std::vector<Token>& tokens,
                                        const std::string& full) const;

    [[noreturn]] void error(FormulaError::Kind kind, const std::string& fragment,
                            const std::string& msg) const;

    std::uint32_t line_;
};

// ── Convenience free function ───────────────────────────────────────────────
// Parse a single formula from a string.

Formula parse_formula(std::string_view input, std::uint32_t line = 1);

}  // namespace seqprover

#endif  // SEQPROVER_PARSER_HPP
