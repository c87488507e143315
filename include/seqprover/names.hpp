// ============================================================================
// seqprover/names.hpp — Fresh-name supply for quantifier rules
// ============================================================================
//
// Quantifier rules substitute <name> constants for bound variables.  The
// eigenvariable rules (∃ on the antecedent, ∀ on the consequent) need a
// name that occurs nowhere in the whole search; the reusable rules need one
// when the sequent mentions no name at all.  Both ask a NameSupply.
//
// The supply is the only mutable state shared by a proof search, so it is
// an explicit collaborator handed to the Decomposer.  Alternative policies
// (e.g. Skolem-style naming) plug in by subclassing.
//
// ============================================================================

#ifndef SEQPROVER_NAMES_HPP
#define SEQPROVER_NAMES_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace seqprover {

// ── NameSupply ──────────────────────────────────────────────────────────────

class NameSupply {
public:
    virtual ~NameSupply() = default;

    /// Return a valid <name> (two or more lowercase letters) that was never
    /// returned before, was never reserved, and is not in `avoid`.
    virtual std::string fresh(const std::vector<std::string>& avoid) = 0;

    /// Mark names as taken, e.g. every name of the goal sequent.
    virtual void reserve(const std::vector<std::string>& names) = 0;

    /// Forget every issued and reserved name.
    virtual void reset() = 0;
};

// ── SequentialNameSupply ────────────────────────────────────────────────────
// Enumerates aa, ab, ..., az, ba, ..., zz, aaa, ... skipping taken names.
// Thread-safe: concurrent search tasks may share one instance.

class SequentialNameSupply final : public NameSupply {
public:
    SequentialNameSupply() = default;

    std::string fresh(const std::vector<std::string>& avoid) override;
    void reserve(const std::vector<std::string>& names) override;
    void reset() override;

    /// Number of names handed out by fresh() since the last reset().
    std::uint64_t issued() const;

    /// The n-th candidate of the enumeration (0 → "aa").
    static std::string candidate(std::uint64_t n);

private:
    mutable std::mutex              mutex_;
    std::uint64_t                   next_ = 0;
    std::uint64_t                   issued_ = 0;
    std::unordered_set<std::string> taken_;
};

}  // namespace seqprover

#endif  // SEQPROVER_NAMES_HPP
