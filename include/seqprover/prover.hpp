// ============================================================================
// seqprover/prover.hpp — Depth-first proof search over sequents
// ============================================================================
//
// A sequent is proved by building its AND-OR decomposition tree bottom-up:
//
//   - an atomic sequent is closed iff the closure oracle accepts it;
//   - a Branch (one rule application) is proved iff ANY of its Leaves is;
//   - a Leaf is proved iff ALL of its parent sequents are.
//
// Search is depth-first.  With OpenMP enabled, alternative Leaves and the
// two parents of a branching rule are explored as tasks above a depth
// threshold, exactly like the OR/AND children of a tableau node.
//
// The search is bounded (SearchLimits).  When a bound cuts a branch and the
// root is not proved, the verdict is Exhausted instead of Unproved.  The
// same holds when a ∀-left or ∃-right step failed: it is applied once and
// never sees names introduced below it, so its failure proves nothing.
//
// ============================================================================

#ifndef SEQPROVER_PROVER_HPP
#define SEQPROVER_PROVER_HPP

#include "seqprover/decompose.hpp"
#include "seqprover/names.hpp"
#include "seqprover/sequent.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace seqprover {

// ── Result ──────────────────────────────────────────────────────────────────
// Verdict plus the wall-clock time (in seconds) the search took.

struct Result {
    enum class Value { Proved, Unproved, Exhausted };

    Value  verdict   = Value::Unproved;
    double elapsed_s = 0.0;

    Result() = default;
    Result(Value v, double t = 0.0) : verdict(v), elapsed_s(t) {}

    bool operator==(Value v) const noexcept { return verdict == v; }
    bool operator!=(Value v) const noexcept { return verdict != v; }

    static constexpr Value Proved    = Value::Proved;
    static constexpr Value Unproved  = Value::Unproved;
    static constexpr Value Exhausted = Value::Exhausted;
};

/// "PROVED" / "UNPROVED" / "EXHAUSTED".
const char* result_to_string(const Result& r) noexcept;

// ── Closure ─────────────────────────────────────────────────────────────────

/// True iff some antecedent formula is structurally equal to some
/// consequent formula.
bool is_axiom(const Sequent& s);

enum class ClosureMode : std::uint8_t {
    Syntactic,  // is_axiom on atomic sequents
    Z3          // Z3 decides every quantifier-free sequent outright
};

const char* closure_mode_name(ClosureMode m) noexcept;

// ── SearchLimits ────────────────────────────────────────────────────────────

struct SearchLimits {
    std::uint32_t        max_depth = 64;  // rule applications along a path
    std::uint32_t        max_names = 16;  // witnesses tried per reusable rule
    std::chrono::seconds timeout{0};      // 0 = none
};

// ── SearchStats ─────────────────────────────────────────────────────────────
// Atomic so that concurrent search tasks can update them without locking.

struct SearchStats {
    std::atomic<std::uint32_t> sequents_expanded{0};
    std::atomic<std::uint32_t> axioms{0};
    std::atomic<std::uint32_t> open_leaves{0};
    std::atomic<std::uint32_t> max_depth{0};
    std::atomic<std::uint32_t> cutoffs{0};
    std::atomic<std::uint32_t> z3_calls{0};
    std::atomic<std::uint32_t> reuse_failures{0};   // failed ∀-left / ∃-right

    void reset() noexcept {
        sequents_expanded = 0; axioms = 0; open_leaves = 0;
        max_depth = 0; cutoffs = 0; z3_calls = 0;
        reuse_failures = 0;
    }

    void update_max_depth(std::uint32_t d) noexcept {
        std::uint32_t cur = max_depth.load(std::memory_order_relaxed);
        while (d > cur && !max_depth.compare_exchange_weak(
                              cur, d, std::memory_order_relaxed)) {}
    }

    std::string to_string() const;
};

// ── ProofSearch ─────────────────────────────────────────────────────────────

class ProofSearch {
public:
    explicit ProofSearch(NameSupply& names);

    ProofSearch(const ProofSearch&) = delete;
    ProofSearch& operator=(const ProofSearch&) = delete;

    /// Search for a proof of `goal`.  Resets the name supply and reserves
    /// every name of the goal before starting.
    Result prove(const Sequent& goal);

    void set_limits(const SearchLimits& limits) { limits_ = limits; }
    const SearchLimits& limits() const noexcept { return limits_; }

    void set_closure_mode(ClosureMode mode) { closure_ = mode; }

    /// Maximum number of OpenMP threads (0 = OMP default).
    void set_num_threads(int n) { num_threads_ = n; }

    /// Tasks are spawned only at depth < d.
    void set_par_depth_limit(int d) { par_depth_limit_ = d; }

    /// Record one line per visited sequent.  Meaningful with one thread.
    void set_record_trace(bool enable) { record_trace_ = enable; }

    const SearchStats& stats() const noexcept { return stats_; }

    /// The first open leaf found by the last prove() call, if any.
    const std::optional<Sequent>& counter_sequent() const noexcept {
        return counter_;
    }

    const std::vector<std::string>& trace() const noexcept { return trace_; }

private:
    bool dfs(Sequent s, std::uint32_t depth);
    bool prove_leaf(Leaf& leaf, std::uint32_t depth, bool do_parallel);

    // Settle `s` without decomposing it, if the closure oracle can.
    std::optional<bool> try_close(const Sequent& s);

    void record_open(const Sequent& s);
    void record_trace(std::uint32_t depth, const std::string& line);
    bool deadline_passed();

    NameSupply& names_;
    Decomposer  decomposer_;

    SearchLimits limits_;
    ClosureMode  closure_ = ClosureMode::Syntactic;

    SearchStats stats_;

    std::optional<Sequent> counter_;
    std::mutex             counter_mutex_;

    bool                     record_trace_ = false;
    std::vector<std::string> trace_;
    std::mutex               trace_mutex_;

    std::chrono::steady_clock::time_point deadline_;
    std::atomic<bool> timed_out_{false};

    int num_threads_ = 0;
    int par_depth_limit_ = 8;
};

}  // namespace seqprover

#endif  // SEQPROVER_PROVER_HPP
