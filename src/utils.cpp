// ============================================================================
// utils.cpp — File I/O and string utilities
// ============================================================================

#include "seqprover/utils.hpp"

#include <fstream>
#include <stdexcept>

namespace seqprover {

// ── read_lines ──────────────────────────────────────────────────────────────

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

// ── trim ────────────────────────────────────────────────────────────────────
// Same whitespace set as std::isspace, which the word scanner splits on.
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\v\f");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\v\f");
    return s.substr(start, end - start + 1);
}

// ── strip_comment ───────────────────────────────────────────────────────────

std::string strip_comment(const std::string& line) {
    auto pos = line.find('#');
    if (pos == std::string::npos) {
        return trim(line);
    }
    return trim(line.substr(0, pos));
}

bool is_blank_or_comment(const std::string& line) {
    return strip_comment(line).empty();
}

// ── split / count / join ────────────────────────────────────────────────────

std::vector<std::string> split(std::string_view text,
                               std::string_view separator) {
    std::vector<std::string> pieces;
    if (separator.empty()) {
        pieces.emplace_back(text);
        return pieces;
    }
    std::size_t pos = 0;
    for (;;) {
        std::size_t hit = text.find(separator, pos);
        if (hit == std::string_view::npos) {
            pieces.emplace_back(text.substr(pos));
            return pieces;
        }
        pieces.emplace_back(text.substr(pos, hit - pos));
        pos = hit + separator.size();
    }
}

std::size_t count_occurrences(std::string_view text, std::string_view needle) {
    if (needle.empty()) return 0;
    std::size_t count = 0;
    for (std::size_t pos = text.find(needle); pos != std::string_view::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

std::string join(const std::vector<std::string>& parts,
                 std::string_view separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

}  // namespace seqprover
