#include "knn_bruteforce.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <queue>

float cosine_similarity(const float* a, float norm_a, const float* b, float norm_b, uint32_t dim) {
    if (norm_a == 0.0f || norm_b == 0.0f) {
        return kDegenerateSimilarity;
    }

    double dot_product = 0.0;
    for (uint32_t j = 0; j < dim; j++) {
        dot_product += static_cast<double>(a[j]) * b[j];
    }

    double similarity = dot_product / (static_cast<double>(norm_a) * norm_b);
    if (!std::isfinite(similarity)) {
        return kDegenerateSimilarity;
    }
    return static_cast<float>(similarity);
}

std::vector<Neighbor> BruteforceRanker::rank(const std::vector<float>& target,
                                             const std::vector<std::string>& exclude,
                                             size_t k) const {
    std::vector<Neighbor> results;

    const VectorTable& table = *table_;
    uint32_t dim = table.dim;
    uint32_t count = table.count;

    if (target.size() != dim) {
        LOG_ERROR("Centroid dimension mismatch: expected " + std::to_string(dim) +
                  ", got " + std::to_string(target.size()));
        return results;
    }

    if (k == 0) {
        return results;
    }

    std::unordered_set<std::string> excluded;
    for (const auto& word : exclude) {
        excluded.insert(to_lower(word));
    }

    float target_norm = compute_norm(target.data(), dim);

    // Higher score first, then lexicographic word
    auto better = [&table](const std::pair<float, uint32_t>& a, const std::pair<float, uint32_t>& b) {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return table.words[a.second] < table.words[b.second];
    };

    // Heap top is the worst of the current top-k
    std::priority_queue<std::pair<float, uint32_t>,
                        std::vector<std::pair<float, uint32_t>>,
                        decltype(better)> heap(better);

    for (uint32_t i = 0; i < count; i++) {
        if (excluded.count(table.words[i]) != 0) {
            continue;
        }

        float similarity = cosine_similarity(target.data(), target_norm, table.row(i), table.norms[i], dim);
        std::pair<float, uint32_t> candidate(similarity, i);

        if (heap.size() < k) {
            heap.push(candidate);
        } else if (better(candidate, heap.top())) {
            heap.pop();
            heap.push(candidate);
        }
    }

    std::vector<std::pair<float, uint32_t>> temp_results;
    temp_results.reserve(heap.size());
    while (!heap.empty()) {
        temp_results.push_back(heap.top());
        heap.pop();
    }

    std::sort(temp_results.begin(), temp_results.end(), better);

    results.reserve(temp_results.size());
    for (const auto& result : temp_results) {
        results.emplace_back(table.words[result.second], result.first);
    }

    return results;
}
