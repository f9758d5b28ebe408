#include "internal/text/similarity.hpp"

#include <cstddef>

#include <algorithm>
#include <string>
#include <vector>

#include "internal/text/text_utils.hpp"

namespace kazu {
namespace text {

size_t levenshteinDistance(const std::string& a, const std::string& b) {
    auto chars_a = splitUtf8(a);
    auto chars_b = splitUtf8(b);

    if (chars_a.empty()) return chars_b.size();
    if (chars_b.empty()) return chars_a.size();

    // Two-row DP over code points
    std::vector<size_t> prev(chars_b.size() + 1);
    std::vector<size_t> curr(chars_b.size() + 1);
    for (size_t j = 0; j <= chars_b.size(); ++j) {
        prev[j] = j;
    }

    for (size_t i = 1; i <= chars_a.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= chars_b.size(); ++j) {
            size_t cost = (chars_a[i - 1] == chars_b[j - 1]) ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }

    return prev[chars_b.size()];
}

float similarity(const std::string& a, const std::string& b) {
    size_t max_length = std::max(splitUtf8(a).size(), splitUtf8(b).size());
    if (max_length == 0) return 1.0f;

    size_t distance = levenshteinDistance(a, b);
    return 1.0f - static_cast<float>(distance) / static_cast<float>(max_length);
}

}  // namespace text
}  // namespace kazu
