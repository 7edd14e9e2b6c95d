#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>
#include "vector_table.hpp"

struct Neighbor {
    std::string word;
    float score;

    Neighbor(const std::string& word, float score) : word(word), score(score) {}
};

// Score given to pairs whose cosine similarity is undefined (zero norm, NaN):
// cosine distance 1, same as an orthogonal pair
const float kDegenerateSimilarity = 0.0f;

// Exact cosine similarity scan over every row of a shared, read-only table.
// Safe to call concurrently from any number of threads.
class BruteforceRanker {
public:
    explicit BruteforceRanker(std::shared_ptr<const VectorTable> table)
        : table_(std::move(table)) {}

    // Top-k rows by cosine similarity to target, highest first. Words in
    // exclude are skipped (compared lowercase). Equal scores are ordered by
    // word. Returns an empty vector when nothing is left to rank.
    std::vector<Neighbor> rank(const std::vector<float>& target,
                               const std::vector<std::string>& exclude,
                               size_t k) const;

    size_t get_count() const { return table_->count; }
    int get_dim() const { return static_cast<int>(table_->dim); }

private:
    std::shared_ptr<const VectorTable> table_;
};

// dot(a, b) / (|a| * |b|) using the precomputed norms, or kDegenerateSimilarity
// when that is not a finite number
float cosine_similarity(const float* a, float norm_a, const float* b, float norm_b, uint32_t dim);
