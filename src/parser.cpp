// ============================================================================
// parser.cpp — Word-level formula parser
// ============================================================================
//
// Implementation notes
// --------------------
//
// parse() works on one level of the formula at a time:
//
//   1. trim and deparenthesize the text (repeated until stable);
//   2. a negation prefix takes the rest of the text as its negatum;
//   3. a quantifier prefix must be followed by a bound variable <x>, and
//      takes the rest as its predicate;
//   4. otherwise the first binary keyword at depth 0 splits the words;
//   5. otherwise the whole text is an atom.
//
// A glued symbolic prefix (~(A), ∀<x>(P)) swaps steps 2-3 and 4, so that
// the canonical rendering "(~(A) & B)" reads back as a conjunction.
//
// Every sub-text is parsed by a recursive call to parse(), so one
// malformed subformula fails the whole formula.
//
// ============================================================================

#include "seqprover/parser.hpp"
#include "seqprover/utils.hpp"

#include <utility>

namespace seqprover {

namespace {

// Trim and deparenthesize until neither changes the text, so that
// "( (A) )" and "(A)" both reduce to "A".
std::string strip(std::string_view text) {
    std::string current = trim(std::string(text));
    for (;;) {
        std::string next = trim(deparenthesize(current));
        if (next == current) return current;
        current = std::move(next);
    }
}

// Rest of the first word after `skip` bytes, followed by the other words.
std::string rest_after(const std::vector<Token>& tokens, std::size_t skip) {
    std::string rest = tokens.front().text.substr(skip);
    std::string tail = join_tokens(tokens, 1, tokens.size());
    if (!rest.empty() && !tail.empty()) rest += ' ';
    rest += tail;
    return rest;
}

bool starts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.substr(0, prefix.size()) == prefix;
}

// `symbol` immediately followed by <x>(
bool glued_quantifier(std::string_view word, std::string_view symbol) noexcept {
    if (!starts_with(word, symbol)) return false;
    const std::string_view after = word.substr(symbol.size());
    return after.size() >= 4 && is_bound_variable_token(after.substr(0, 3)) &&
           after[3] == '(';
}

}  // namespace

// ── Constructor ─────────────────────────────────────────────────────────────

Parser::Parser(std::uint32_t line) : line_(line) {}

// ── Error helper ────────────────────────────────────────────────────────────

void Parser::error(FormulaError::Kind kind, const std::string& fragment,
                   const std::string& msg) const {
    throw FormulaError(kind, fragment,
                       std::to_string(line_) + ": ERROR: " + msg);
}

// ── parse ───────────────────────────────────────────────────────────────────

Formula Parser::parse(std::string_view input) const {
    const std::string text = strip(input);
    if (text.empty()) {
        error(FormulaError::Kind::EmptyString, "", "empty formula");
    }

    const std::vector<Token> tokens = tokenise(text);
    if (tokens.empty()) {
        error(FormulaError::Kind::EmptyString, "", "empty formula");
    }

    if (auto prefix = find_prefix(tokens)) {
        if (prefix->glued) {
            if (auto binary = parse_binary(tokens, text)) {
                return std::move(*binary);
            }
        }
        if (prefix->kind == NodeKind::Negation) {
            return parse_negation(prefix->rest, text);
        }
        return parse_quantifier(prefix->kind, prefix->rest, prefix->glued,
                                text);
    }

    if (auto binary = parse_binary(tokens, text)) {
        return std::move(*binary);
    }

    return Formula::atom(text);
}

// ── find_prefix ─────────────────────────────────────────────────────────────
// A prefix is either a standalone keyword as the first word, or one of the
// symbols glued in canonical form: ~( or ∃<x>( / ∀<x>(.  Any other word
// starting with a symbol (~ish, ~A, ∀x) belongs to an atom.

std::optional<Parser::Prefix>
Parser::find_prefix(const std::vector<Token>& tokens) const {
    const Token& first = tokens.front();

    switch (first.kind) {
        case TokenKind::Negation:
        case TokenKind::Existential:
        case TokenKind::Universal:
            return Prefix{*token_node_kind(first.kind),
                          join_tokens(tokens, 1, tokens.size()), false};
        default:
            break;
    }

    if (first.kind != TokenKind::Word) return std::nullopt;

    const std::string_view word(first.text);
    if (starts_with(word, kNegationSymbol) &&
        starts_with(word.substr(kNegationSymbol.size()), "(")) {
        return Prefix{NodeKind::Negation,
                      rest_after(tokens, kNegationSymbol.size()), true};
    }
    if (glued_quantifier(word, kExistentialSymbol)) {
        return Prefix{NodeKind::Existential,
                      rest_after(tokens, kExistentialSymbol.size()), true};
    }
    if (glued_quantifier(word, kUniversalSymbol)) {
        return Prefix{NodeKind::Universal,
                      rest_after(tokens, kUniversalSymbol.size()), true};
    }
    return std::nullopt;
}

// ── parse_negation ──────────────────────────────────────────────────────────

Formula Parser::parse_negation(const std::string& operand,
                               const std::string& full) const {
    if (strip(operand).empty()) {
        error(FormulaError::Kind::MalformedString, full,
              "negation without operand in '" + full + "'");
    }
    return Formula::negation(parse(operand));
}

// ── parse_quantifier ────────────────────────────────────────────────────────
// `rest` must open with a bound variable of exact shape <x>.  After a
// standalone keyword <x> is its own word; after a glued symbol it is glued
// to the opening parenthesis of the predicate.

Formula Parser::parse_quantifier(NodeKind kind, const std::string& rest,
                                 bool glued, const std::string& full) const {
    const std::string_view view(rest);
    const bool well_formed =
        view.size() >= 3 && is_bound_variable_token(view.substr(0, 3)) &&
        (glued ? (view.size() > 3 && view[3] == '(')
               : (view.size() == 3 || view[3] == ' '));
    if (!well_formed) {
        error(FormulaError::Kind::MalformedString, full,
              "quantifier requires a bound variable <x> in '" + full + "'");
    }

    std::string variable(1, view[1]);
    std::string predicate(view.substr(3));
    if (strip(predicate).empty()) {
        error(FormulaError::Kind::MalformedString, full,
              "quantifier without predicate in '" + full + "'");
    }

    std::vector<Formula> operands;
    operands.push_back(parse(predicate));
    return Formula::make(kind, std::move(operands), std::move(variable));
}

// ── parse_binary ────────────────────────────────────────────────────────────
// Leftmost binary keyword at depth 0 wins.  The depth of a word is taken
// after counting its own parentheses, so "(A" is at depth 1.

std::optional<Formula> Parser::parse_binary(const std::vector<Token>& tokens,
                                            const std::string& full) const {
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const Token& t = tokens[i];
        if (t.depth != 0) continue;

        auto kind = token_node_kind(t.kind);
        if (!kind || !is_binary(*kind)) continue;

        std::string left = join_tokens(tokens, 0, i);
        std::string right = join_tokens(tokens, i + 1, tokens.size());
        if (strip(left).empty() || strip(right).empty()) {
            error(FormulaError::Kind::MalformedString, full,
                  "connective '" + t.text + "' is missing an operand in '" +
                      full + "'");
        }

        std::vector<Formula> operands;
        operands.push_back(parse(left));
        operands.push_back(parse(right));
        return Formula::from_connective(t.text, std::move(operands));
    }
    return std::nullopt;
}

// ── Convenience free function ───────────────────────────────────────────────

Formula parse_formula(std::string_view input, std::uint32_t line) {
    Parser parser(line);
    return parser.parse(input);
}

}  // namespace seqprover
