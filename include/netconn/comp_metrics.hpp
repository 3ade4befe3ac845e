#pragma once
// Component-size statistics for a partition given as per-vertex roots or labels.
//
//  - component_sizes: counts vertices per component id into a compact vector.
//  - summarize_components: a handful of figures describing how the vertices are
//    spread over the components, printed in the executables' summary lines.

#include <cstddef>
#include <cstdint>
#include <vector>

namespace netconn {

/**
 * Summary of a component size distribution.
 *
 *  - K: number of non-empty components.
 *  - N: total number of vertices (sum of sizes).
 *  - largest / smallest: extreme component sizes (0 when K == 0).
 *  - singletons: components holding exactly one vertex.
 *  - pmax: share of the largest component, largest / N.
 *  - keff: effective number of components, 1 / sum p_i^2 with p_i = size_i / N.
 */
struct CompSummary {
    uint32_t K = 0;
    uint32_t N = 0;
    uint32_t largest = 0;
    uint32_t smallest = 0;
    uint32_t singletons = 0;
    double pmax = 0.0;
    double keff = 0.0;
};

/**
 * Count component sizes.
 *
 * @tparam GetComponent callable uint32_t(uint32_t v) returning a non-negative id
 * @param N number of vertices; ids are queried for v in [0, N)
 * @return one entry per non-empty id, in increasing id order
 *
 * Ids may be sparse (forest roots) or dense (labeler output).
 */
template <class GetComponent>
std::vector<uint32_t> component_sizes(uint32_t N, GetComponent&& get_component) {
    std::vector<uint32_t> counts;
    counts.reserve(N);
    for (uint32_t v = 0; v < N; ++v) {
        const uint32_t c = get_component(v);
        if (c >= counts.size()) counts.resize(static_cast<std::size_t>(c) + 1u, 0u);
        ++counts[c];
    }
    std::vector<uint32_t> sizes;
    for (uint32_t x : counts) {
        if (x != 0u) sizes.push_back(x);
    }
    return sizes;
}

// Sizes from a label array (negative labels are not allowed).
std::vector<uint32_t> component_sizes(const std::vector<int>& labels);

CompSummary summarize_components(const std::vector<uint32_t>& sizes);

} // namespace netconn
