#include "netconn/comp_metrics.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace netconn {

std::vector<uint32_t> component_sizes(const std::vector<int>& labels) {
    return component_sizes(static_cast<uint32_t>(labels.size()), [&](uint32_t v) {
        if (labels[v] < 0) {
            throw std::invalid_argument("vertex " + std::to_string(v) + " has no component label");
        }
        return static_cast<uint32_t>(labels[v]);
    });
}

CompSummary summarize_components(const std::vector<uint32_t>& sizes) {
    CompSummary s;
    s.K = static_cast<uint32_t>(sizes.size());
    s.N = std::accumulate(sizes.begin(), sizes.end(), uint32_t{0});
    if (s.K == 0 || s.N == 0) return s;

    const auto [lo, hi] = std::minmax_element(sizes.begin(), sizes.end());
    s.smallest = *lo;
    s.largest = *hi;
    s.singletons = static_cast<uint32_t>(std::count(sizes.begin(), sizes.end(), 1u));

    const double total = static_cast<double>(s.N);
    double sum_p2 = 0.0;
    for (uint32_t x : sizes) {
        const double p = static_cast<double>(x) / total;
        sum_p2 += p * p;
    }
    s.pmax = static_cast<double>(s.largest) / total;
    s.keff = sum_p2 > 0.0 ? 1.0 / sum_p2 : 0.0;
    return s;
}

} // namespace netconn
