// ============================================================================
// seqprover/utils.hpp — Utility functions
// ============================================================================

#ifndef SEQPROVER_UTILS_HPP
#define SEQPROVER_UTILS_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace seqprover {

// ── File I/O ────────────────────────────────────────────────────────────────

/// Read a text file and return its content as a vector of lines.
/// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> read_lines(const std::string& path);

// ── String helpers ──────────────────────────────────────────────────────────

/// Trim leading and trailing whitespace from a string.
std::string trim(const std::string& s);

/// Strip an inline comment (everything from the first '#' onward).
/// Returns the portion before '#', trimmed.
std::string strip_comment(const std::string& line);

/// Return true if the line is empty or consists only of whitespace
/// (after comment stripping).
bool is_blank_or_comment(const std::string& line);

/// Split on every occurrence of `separator`.  Always returns at least one
/// piece; pieces are not trimmed.
std::vector<std::string> split(std::string_view text,
                               std::string_view separator);

/// Number of non-overlapping occurrences of `needle` in `text`.
std::size_t count_occurrences(std::string_view text, std::string_view needle);

/// Join with a separator.
std::string join(const std::vector<std::string>& parts,
                 std::string_view separator);

}  // namespace seqprover

#endif  // SEQPROVER_UTILS_HPP
