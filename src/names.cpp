// ============================================================================
// names.cpp — Sequential fresh-name supply
// ============================================================================

#include "seqprover/names.hpp"

#include <algorithm>

namespace seqprover {

std::string SequentialNameSupply::candidate(std::uint64_t n) {
    // Skip whole length classes first: 26^2 names of length 2, 26^3 of
    // length 3, ...
    std::size_t length = 2;
    std::uint64_t block = 26 * 26;
    while (n >= block) {
        n -= block;
        ++length;
        block *= 26;
    }

    std::string name(length, 'a');
    for (std::size_t i = length; i-- > 0;) {
        name[i] = static_cast<char>('a' + n % 26);
        n /= 26;
    }
    return name;
}

std::string SequentialNameSupply::fresh(const std::vector<std::string>& avoid) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (;;) {
        std::string name = candidate(next_++);
        if (taken_.count(name) > 0) continue;
        if (std::find(avoid.begin(), avoid.end(), name) != avoid.end()) continue;
        taken_.insert(name);
        ++issued_;
        return name;
    }
}

void SequentialNameSupply::reserve(const std::vector<std::string>& names) {
    std::lock_guard<std::mutex> lk(mutex_);
    taken_.insert(names.begin(), names.end());
}

void SequentialNameSupply::reset() {
    std::lock_guard<std::mutex> lk(mutex_);
    next_ = 0;
    issued_ = 0;
    taken_.clear();
}

std::uint64_t SequentialNameSupply::issued() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return issued_;
}

}  // namespace seqprover
