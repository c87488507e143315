// ============================================================================
// seqprover/lexer.hpp — Word scanner for the formula input language
// ============================================================================
//
// The formula language is whitespace-tokenised: a formula is a sequence of
// words, and a word is a connective keyword or a piece of atom text.  The
// lexer classifies each word and records the parenthesis nesting depth
// reached after it, which is all the parser needs to find a top-level
// connective.
//
// Recognised keywords (symbol / word):
//   Negation      ~   not
//   Conjunction   &   and
//   Disjunction   v   or
//   Conditional   >   implies
//   Existential   ∃   exists
//   Universal     ∀   forall
//
// The same file holds the two text scanners the AST relies on:
// deparenthesize() and scan_placeholders().
//
// ============================================================================

#ifndef SEQPROVER_LEXER_HPP
#define SEQPROVER_LEXER_HPP

#include "seqprover/ast.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace seqprover {

// ── Symbol spellings ────────────────────────────────────────────────────────

inline constexpr std::string_view kNegationSymbol    = "~";
inline constexpr std::string_view kExistentialSymbol = "∃";
inline constexpr std::string_view kUniversalSymbol   = "∀";

// ── TokenKind ───────────────────────────────────────────────────────────────

enum class TokenKind : std::uint8_t {
    Word,           // atom text
    Negation,       // ~ / not
    Conjunction,    // & / and
    Disjunction,    // v / or
    Conditional,    // > / implies
    Existential,    // ∃ / exists
    Universal,      // ∀ / forall
    Eof
};

/// Human-readable name for debugging.
const char* token_kind_name(TokenKind k) noexcept;

/// Keyword → formula kind.  nullopt for Word and Eof.
std::optional<NodeKind> token_node_kind(TokenKind k) noexcept;

/// Classify one whitespace-free word.  Only exact keyword spellings match.
TokenKind classify_word(std::string_view word) noexcept;

// ── Token ───────────────────────────────────────────────────────────────────

struct Token {
    TokenKind   kind = TokenKind::Eof;
    std::string text;
    std::size_t index = 0;   // position in the word sequence
    int         depth = 0;   // parenthesis depth after this word
};

// ── Lexer ───────────────────────────────────────────────────────────────────
// Produces one Token per whitespace-separated word.  Repeated calls after
// the last word keep returning Eof.

class Lexer {
public:
    explicit Lexer(std::string_view source);

    /// Return the next token.
    Token next();

    /// Peek at the next token without consuming it.
    const Token& peek();

private:
    Token read_word();

    std::string_view src_;
    std::size_t      idx_ = 0;
    std::size_t      count_ = 0;
    int              depth_ = 0;
    bool             has_peeked_ = false;
    Token            peeked_;
};

// ── tokenise ────────────────────────────────────────────────────────────────
// Convenience: every word of `source`, without the trailing Eof.

std::vector<Token> tokenise(std::string_view source);

/// Join tokens [begin, end) with single spaces.
std::string join_tokens(const std::vector<Token>& tokens, std::size_t begin,
                        std::size_t end);

// ── Parentheses ─────────────────────────────────────────────────────────────

/// Net '(' minus ')' count of `text`.
int paren_balance(std::string_view text) noexcept;

/// Repeatedly strip one outer pair of parentheses while that pair is
/// connected, i.e. the depth counter does not return to zero before the
/// final character.  "(A) & (B)" is returned unchanged.  Idempotent.
std::string deparenthesize(std::string_view text);

// ── Placeholders ────────────────────────────────────────────────────────────

enum class PlaceholderKind : std::uint8_t {
    Variable,   // <x>
    Name        // <name>
};

/// Contents of every <...> span made only of lowercase ASCII letters whose
/// length matches `kind` (1 for Variable, 2+ for Name), left to right.
std::vector<std::string> scan_placeholders(std::string_view text,
                                           PlaceholderKind kind);

/// Replace every "<from>" in `text` with "<to>".
std::string replace_placeholder(std::string_view text, std::string_view from,
                                std::string_view to);

/// True for a word of exact shape <x>, x one lowercase letter.
bool is_bound_variable_token(std::string_view word) noexcept;

/// True for two or more lowercase letters (the shape of a <name>).
bool is_name_text(std::string_view text) noexcept;

}  // namespace seqprover

#endif  // SEQPROVER_LEXER_HPP
