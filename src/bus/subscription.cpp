#include "esflow/bus/subscription.hpp"

namespace esflow {

bool topic_matches(std::string_view pattern, std::string_view topic) noexcept {
    if (pattern == "*") {
        return true;
    }

    // Iterative glob match with single-star backtracking
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star = std::string_view::npos;
    std::size_t resume = 0;

    while (t < topic.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (p < pattern.size() && pattern[p] == topic[t]) {
            p++;
            t++;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        p++;
    }
    return p == pattern.size();
}

} // namespace esflow
