#pragma once

#include "vector_table.hpp"
#include <optional>
#include <string>
#include <vector>

// Component-wise mean of the vectors of every word found in the table.
// Words are lowercased before lookup and repeated words are counted each
// time. Returns std::nullopt when no word matched.
std::optional<std::vector<float>> compute_centroid(const VectorTable& table,
                                                   const std::vector<std::string>& words);

// Input words (as given, in order) that are not in the table
std::vector<std::string> find_missing_words(const VectorTable& table,
                                            const std::vector<std::string>& words);
