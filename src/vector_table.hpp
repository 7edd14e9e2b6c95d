#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

struct VectorTable {
    std::vector<std::string> words;   // Row -> lowercase word
    std::vector<float> data;          // Contiguous float array: [v0[0..dim-1], v1[0..dim-1], ...]
    std::vector<float> norms;         // Precomputed L2 norms for each row
    std::unordered_map<std::string, uint32_t> index;  // Word -> row
    uint32_t dim = 0;
    uint32_t count = 0;

    // Returns a pointer to the word's vector, or nullptr if the word is unknown.
    // The word must already be lowercase.
    const float* find(const std::string& word) const;

    bool contains(const std::string& word) const { return index.count(word) != 0; }

    const float* row(uint32_t i) const { return &data[static_cast<size_t>(i) * dim]; }
};

// Outcome of loading a vocabulary. A failed result is a fatal startup
// condition: the caller must not start serving.
struct LoadResult {
    std::shared_ptr<const VectorTable> table;
    std::string error;
    size_t skipped_lines = 0;

    bool ok() const { return table != nullptr; }
};

// Load a "word c1 c2 ... cD" text file
LoadResult load_vector_table(const std::string& path);

// Same, reading from an already open stream. source_name is only used in log lines.
LoadResult load_vector_table(std::istream& in, const std::string& source_name);

// Helper to compute L2 norm of a vector
float compute_norm(const float* vector, uint32_t dim);

// Lowercase copy of a UTF-8 string, full Unicode case mapping
std::string to_lower(const std::string& s);
