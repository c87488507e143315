// ============================================================================
// prover.cpp — Depth-first proof search implementation
// ============================================================================
//
// KEY DESIGN DECISIONS:
// ─────────────────────
// 1. Sequents are passed by value down the search.  Decomposition consumes
//    them, so no sequent is ever shared between two tasks.
//
// 2. Early exit: an OR node stops at the first proved Leaf, an AND node at
//    the first unproved parent.  In parallel mode the remaining tasks check
//    a shared atomic flag before starting.
//
// 3. Bounds never produce a wrong PROVED: a cut branch counts as unproved,
//    and the cut is remembered so the root verdict becomes EXHAUSTED.
//    A failed reusable quantifier step is remembered the same way.
//
// ============================================================================

#include "seqprover/prover.hpp"
#include "seqprover/z3_solver.hpp"

#include <sstream>

#ifdef SEQPROVER_USE_OPENMP
#include <omp.h>
#endif

// #define SEQPROVER_DEBUG 1  // Uncomment for debug output
#ifdef SEQPROVER_DEBUG
#include <iostream>
#endif

namespace seqprover {

// ============================================================================
// Result / mode string conversion
// ============================================================================

const char* result_to_string(const Result& r) noexcept {
    switch (r.verdict) {
        case Result::Value::Proved:    return "PROVED";
        case Result::Value::Unproved:  return "UNPROVED";
        case Result::Value::Exhausted: return "EXHAUSTED";
    }
    return "?";
}

const char* closure_mode_name(ClosureMode m) noexcept {
    switch (m) {
        case ClosureMode::Syntactic: return "syntactic";
        case ClosureMode::Z3:        return "z3";
    }
    return "?";
}

std::string SearchStats::to_string() const {
    std::ostringstream oss;
    oss << "expanded=" << sequents_expanded.load()
        << " axioms=" << axioms.load()
        << " open=" << open_leaves.load()
        << " max_depth=" << max_depth.load()
        << " cutoffs=" << cutoffs.load()
        << " z3_calls=" << z3_calls.load()
        << " reuse_failures=" << reuse_failures.load();
    return oss.str();
}

// ============================================================================
// is_axiom() — Identity closure
// ============================================================================

bool is_axiom(const Sequent& s) {
    for (const auto& lhs : s.antecedent()) {
        for (const auto& rhs : s.consequent()) {
            if (lhs == rhs) return true;
        }
    }
    return false;
}

// ============================================================================
// ProofSearch
// ============================================================================

ProofSearch::ProofSearch(NameSupply& names)
    : names_(names), decomposer_(names) {}

// ── prove() ─────────────────────────────────────────────────────────────────
//   1. Reset state from previous runs and reserve the goal's names.
//   2. Run DFS from the goal.
//   3. Map the outcome and the cut-off count to a verdict.

Result ProofSearch::prove(const Sequent& goal) {
    stats_.reset();
    counter_.reset();
    trace_.clear();
    timed_out_.store(false, std::memory_order_relaxed);

    names_.reset();
    names_.reserve(goal.names());

    const auto t_start = std::chrono::steady_clock::now();
    if (limits_.timeout.count() > 0) {
        deadline_ = t_start + limits_.timeout;
    }

#ifdef SEQPROVER_USE_OPENMP
    if (num_threads_ > 0) omp_set_num_threads(num_threads_);
#endif

    Sequent root = goal;
    bool proved = false;

#ifdef SEQPROVER_USE_OPENMP
    // One thread enters dfs(); the others pick up the tasks it spawns.
    #pragma omp parallel shared(proved, root) if(num_threads_ != 1)
    {
        #pragma omp single nowait
        {
            proved = dfs(std::move(root), 0);
        }
    }
#else
    proved = dfs(std::move(root), 0);
#endif

    const double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - t_start).count();

    if (proved) {
        counter_.reset();
        return Result(Result::Value::Proved, elapsed);
    }
    // A failed reusable rule may have missed a name introduced later, so
    // its failure does not refute the goal.
    if (stats_.cutoffs.load() > 0 || stats_.reuse_failures.load() > 0 ||
        timed_out_.load(std::memory_order_relaxed)) {
        return Result(Result::Value::Exhausted, elapsed);
    }
    return Result(Result::Value::Unproved, elapsed);
}

// ── try_close() ─────────────────────────────────────────────────────────────

std::optional<bool> ProofSearch::try_close(const Sequent& s) {
    if (closure_ == ClosureMode::Z3) {
        Z3Checker checker;
        if (checker.add_sequent_negation(s)) {
            stats_.z3_calls.fetch_add(1, std::memory_order_relaxed);
            switch (checker.check()) {
                case Z3Result::UNSAT:   return true;
                case Z3Result::SAT:     return false;
                case Z3Result::UNKNOWN: break;
            }
        }
    }

    if (s.is_atomic()) return is_axiom(s);
    return std::nullopt;
}

void ProofSearch::record_open(const Sequent& s) {
    std::lock_guard<std::mutex> lk(counter_mutex_);
    if (!counter_) counter_ = s;
}

void ProofSearch::record_trace(std::uint32_t depth, const std::string& line) {
    std::lock_guard<std::mutex> lk(trace_mutex_);
    trace_.push_back(std::string(2 * depth, ' ') + line);
}

bool ProofSearch::deadline_passed() {
    if (limits_.timeout.count() == 0) return false;
    if (timed_out_.load(std::memory_order_relaxed)) return true;
    if (std::chrono::steady_clock::now() >= deadline_) {
        timed_out_.store(true, std::memory_order_relaxed);
        return true;
    }
    return false;
}

// ============================================================================
// dfs() — Depth-first search over the AND-OR tree
// ============================================================================
//
// Returns true iff `s` is provable within the limits.

bool ProofSearch::dfs(Sequent s, std::uint32_t depth) {
#ifdef SEQPROVER_DEBUG
    std::cerr << "DFS depth=" << depth << " complexity=" << s.complexity()
              << "  " << s.to_string() << "\n";
#endif
    stats_.sequents_expanded.fetch_add(1, std::memory_order_relaxed);
    stats_.update_max_depth(depth);

    // ── Timeout check ────────────────────────────────────────────────────
    if (deadline_passed()) {
        stats_.cutoffs.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    // ── Closure ─────────────────────────────────────────────────────────
    if (auto closed = try_close(s)) {
        if (*closed) {
            stats_.axioms.fetch_add(1, std::memory_order_relaxed);
            if (record_trace_) record_trace(depth, s.to_string() + "   [axiom]");
            return true;
        }
        stats_.open_leaves.fetch_add(1, std::memory_order_relaxed);
        if (record_trace_) record_trace(depth, s.to_string() + "   [open]");
        record_open(s);
        return false;
    }

    // ── Depth limit ─────────────────────────────────────────────────────
    if (depth >= limits_.max_depth) {
        stats_.cutoffs.fetch_add(1, std::memory_order_relaxed);
        if (record_trace_) record_trace(depth, s.to_string() + "   [cut: depth]");
        return false;
    }

    // ── Decompose ───────────────────────────────────────────────────────
    std::string text;
    if (record_trace_) text = s.to_string();

    auto branch = decomposer_.decompose(std::move(s));
    if (!branch) {
        // Atomic sequents are settled by try_close().
        return false;
    }

    if (record_trace_) {
        record_trace(depth, text + "   [" + rule_kind_name(branch->rule) +
                                " " + branch->principal + "]");
    }

    std::size_t n_leaves = branch->leaves.size();
    if (limits_.max_names > 0 && n_leaves > limits_.max_names) {
        n_leaves = limits_.max_names;
        stats_.cutoffs.fetch_add(1, std::memory_order_relaxed);
    }

#ifdef SEQPROVER_USE_OPENMP
    const bool do_parallel = (static_cast<int>(depth) < par_depth_limit_)
                           && (omp_get_num_threads() > 1)
                           && (num_threads_ != 1);
#else
    const bool do_parallel = false;
#endif

    // ── OR over leaves ──────────────────────────────────────────────────
    bool result = false;
    if (do_parallel && n_leaves >= 2) {
#ifdef SEQPROVER_USE_OPENMP
        std::atomic<bool> any_proved{false};
        for (std::size_t li = 0; li < n_leaves; ++li) {
            Leaf* leaf = &branch->leaves[li];
            #pragma omp task firstprivate(leaf) shared(any_proved)
            {
                if (!any_proved.load(std::memory_order_relaxed)) {
                    if (prove_leaf(*leaf, depth + 1, true)) {
                        any_proved.store(true, std::memory_order_relaxed);
                    }
                }
            }
        }
        #pragma omp taskwait
        result = any_proved.load(std::memory_order_relaxed);
#endif
    } else {
        for (std::size_t li = 0; li < n_leaves; ++li) {
            if (prove_leaf(branch->leaves[li], depth + 1, do_parallel)) {
                result = true;
                break;
            }
        }
    }

    if (!result && is_reusable_rule(branch->rule)) {
        stats_.reuse_failures.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

// ── prove_leaf() — AND over parents ─────────────────────────────────────────

bool ProofSearch::prove_leaf(Leaf& leaf, std::uint32_t depth, bool do_parallel) {
    if (record_trace_ && !leaf.witness.empty()) {
        record_trace(depth, "with <" + leaf.witness + ">");
    }

    const std::size_t n_parents = leaf.parents.size();
    if (do_parallel && n_parents >= 2) {
#ifdef SEQPROVER_USE_OPENMP
        std::atomic<bool> all_proved{true};
        for (std::size_t pi = 0; pi < n_parents; ++pi) {
            Sequent* parent = &leaf.parents[pi];
            #pragma omp task firstprivate(parent, depth) shared(all_proved)
            {
                if (all_proved.load(std::memory_order_relaxed)) {
                    if (!dfs(std::move(*parent), depth)) {
                        all_proved.store(false, std::memory_order_relaxed);
                    }
                }
            }
        }
        #pragma omp taskwait
        return all_proved.load(std::memory_order_relaxed);
#endif
    }

    for (auto& parent : leaf.parents) {
        if (!dfs(std::move(parent), depth)) return false;
    }
    return true;
}

}  // namespace seqprover
