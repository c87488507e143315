// ============================================================================
// lexer.cpp — Word scanner, deparenthesisation and placeholder scanning
// ============================================================================

#include "seqprover/lexer.hpp"

#include <array>
#include <cctype>

namespace seqprover {

namespace {

// ── Keyword table ───────────────────────────────────────────────────────────
// Immutable, initialised once at compile time.

struct KeywordEntry {
    std::string_view spelling;
    TokenKind        kind;
};

constexpr std::array<KeywordEntry, 12> kKeywords{{
    {"~",       TokenKind::Negation},
    {"not",     TokenKind::Negation},
    {"&",       TokenKind::Conjunction},
    {"and",     TokenKind::Conjunction},
    {"v",       TokenKind::Disjunction},
    {"or",      TokenKind::Disjunction},
    {">",       TokenKind::Conditional},
    {"implies", TokenKind::Conditional},
    {"∃",       TokenKind::Existential},
    {"exists",  TokenKind::Existential},
    {"∀",       TokenKind::Universal},
    {"forall",  TokenKind::Universal},
}};

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_lower(char c) noexcept {
    return c >= 'a' && c <= 'z';
}

}  // namespace

// ── token_kind_name ─────────────────────────────────────────────────────────

const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::Word:        return "word";
        case TokenKind::Negation:    return "negation";
        case TokenKind::Conjunction: return "conjunction";
        case TokenKind::Disjunction: return "disjunction";
        case TokenKind::Conditional: return "conditional";
        case TokenKind::Existential: return "existential";
        case TokenKind::Universal:   return "universal";
        case TokenKind::Eof:         return "EOF";
    }
    return "?";
}

std::optional<NodeKind> token_node_kind(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::Negation:    return NodeKind::Negation;
        case TokenKind::Conjunction: return NodeKind::Conjunction;
        case TokenKind::Disjunction: return NodeKind::Disjunction;
        case TokenKind::Conditional: return NodeKind::Conditional;
        case TokenKind::Existential: return NodeKind::Existential;
        case TokenKind::Universal:   return NodeKind::Universal;
        case TokenKind::Word:
        case TokenKind::Eof:
            return std::nullopt;
    }
    return std::nullopt;
}

TokenKind classify_word(std::string_view word) noexcept {
    for (const auto& entry : kKeywords) {
        if (entry.spelling == word) return entry.kind;
    }
    return TokenKind::Word;
}

// ── Lexer ───────────────────────────────────────────────────────────────────

Lexer::Lexer(std::string_view source) : src_(source) {}

Token Lexer::read_word() {
    while (idx_ < src_.size() && is_space(src_[idx_])) ++idx_;
    if (idx_ >= src_.size()) {
        return Token{TokenKind::Eof, "", count_, depth_};
    }

    std::size_t start = idx_;
    while (idx_ < src_.size() && !is_space(src_[idx_])) ++idx_;

    std::string_view word = src_.substr(start, idx_ - start);
    depth_ += paren_balance(word);
    return Token{classify_word(word), std::string(word), count_++, depth_};
}

Token Lexer::next() {
    if (has_peeked_) {
        has_peeked_ = false;
        return std::move(peeked_);
    }
    return read_word();
}

const Token& Lexer::peek() {
    if (!has_peeked_) {
        peeked_ = read_word();
        has_peeked_ = true;
    }
    return peeked_;
}

// ── tokenise ────────────────────────────────────────────────────────────────

std::vector<Token> tokenise(std::string_view source) {
    Lexer lex(source);
    std::vector<Token> tokens;
    for (Token t = lex.next(); t.kind != TokenKind::Eof; t = lex.next()) {
        tokens.push_back(std::move(t));
    }
    return tokens;
}

std::string join_tokens(const std::vector<Token>& tokens, std::size_t begin,
                        std::size_t end) {
    std::string out;
    for (std::size_t i = begin; i < end && i < tokens.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += tokens[i].text;
    }
    return out;
}

// ── Parentheses ─────────────────────────────────────────────────────────────

int paren_balance(std::string_view text) noexcept {
    int balance = 0;
    for (char c : text) {
        if (c == '(') ++balance;
        else if (c == ')') --balance;
    }
    return balance;
}

std::string deparenthesize(std::string_view text) {
    while (!text.empty() && text.front() == '(' && text.back() == ')') {
        int nestedness = 0;
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '(') ++nestedness;
            else if (text[i] == ')') --nestedness;
            // The outer pair is connected only if depth first returns to
            // zero on the final character.
            if (nestedness <= 0 && i + 1 < text.size()) {
                return std::string(text);
            }
        }
        text = text.substr(1, text.size() - 2);
    }
    return std::string(text);
}

// ── Placeholders ────────────────────────────────────────────────────────────

std::vector<std::string> scan_placeholders(std::string_view text,
                                           PlaceholderKind kind) {
    std::vector<std::string> found;
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '<') {
            ++i;
            continue;
        }
        std::size_t j = i + 1;
        while (j < text.size() && is_lower(text[j])) ++j;
        const std::size_t len = j - i - 1;
        if (j < text.size() && text[j] == '>' && len > 0) {
            const bool wanted = (kind == PlaceholderKind::Variable)
                                    ? len == 1
                                    : len >= 2;
            if (wanted) found.emplace_back(text.substr(i + 1, len));
            i = j + 1;
        } else {
            ++i;
        }
    }
    return found;
}

std::string replace_placeholder(std::string_view text, std::string_view from,
                                std::string_view to) {
    const std::string needle = "<" + std::string(from) + ">";
    const std::string replacement = "<" + std::string(to) + ">";

    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t hit = text.find(needle, pos);
        if (hit == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, hit - pos));
        out += replacement;
        pos = hit + needle.size();
    }
    return out;
}

bool is_bound_variable_token(std::string_view word) noexcept {
    return word.size() == 3 && word[0] == '<' && is_lower(word[1]) &&
           word[2] == '>';
}

bool is_name_text(std::string_view text) noexcept {
    if (text.size() < 2) return false;
    for (char c : text) {
        if (!is_lower(c)) return false;
    }
    return true;
}

}  // namespace seqprover
