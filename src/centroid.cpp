#include "centroid.hpp"

std::optional<std::vector<float>> compute_centroid(const VectorTable& table,
                                                   const std::vector<std::string>& words) {
    std::vector<double> sum(table.dim, 0.0);
    size_t matched = 0;

    for (const auto& word : words) {
        const float* vector = table.find(to_lower(word));
        if (vector == nullptr) {
            continue;
        }
        for (uint32_t i = 0; i < table.dim; i++) {
            sum[i] += vector[i];
        }
        matched++;
    }

    if (matched == 0) {
        return std::nullopt;
    }

    std::vector<float> centroid(table.dim);
    for (uint32_t i = 0; i < table.dim; i++) {
        centroid[i] = static_cast<float>(sum[i] / static_cast<double>(matched));
    }
    return centroid;
}

std::vector<std::string> find_missing_words(const VectorTable& table,
                                            const std::vector<std::string>& words) {
    std::vector<std::string> missing;
    for (const auto& word : words) {
        if (!table.contains(to_lower(word))) {
            missing.push_back(word);
        }
    }
    return missing;
}
