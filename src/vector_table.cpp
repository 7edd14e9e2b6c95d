#include "vector_table.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace {

const size_t kProgressEvery = 500000;

// Whole token must be a float, "1.0abc" is rejected
bool parse_component(const std::string& token, float& out) {
    const char* begin = token.c_str();
    char* end = nullptr;
    float value = std::strtof(begin, &end);
    if (end == begin || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

} // namespace

const float* VectorTable::find(const std::string& word) const {
    auto it = index.find(word);
    if (it == index.end()) {
        return nullptr;
    }
    return row(it->second);
}

LoadResult load_vector_table(const std::string& path) {
    LoadResult result;

    if (!std::filesystem::exists(path)) {
        result.error = "Vectors file does not exist: " + path;
        return result;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        result.error = "Failed to open vectors file: " + path;
        return result;
    }

    return load_vector_table(file, path);
}

LoadResult load_vector_table(std::istream& in, const std::string& source_name) {
    LoadResult result;
    auto table = std::make_shared<VectorTable>();

    LOG_INFO("Loading word vectors from " + source_name);

    std::string line;
    std::string word;
    std::string token;
    std::vector<float> values;

    while (std::getline(in, line)) {
        std::istringstream ss(line);
        if (!(ss >> word)) {
            continue;  // blank line
        }

        values.clear();
        bool parsed = true;
        while (ss >> token) {
            float value = 0.0f;
            if (!parse_component(token, value)) {
                parsed = false;
                break;
            }
            values.push_back(value);
        }

        if (!parsed || values.empty()) {
            result.skipped_lines++;
            continue;
        }

        // First good line fixes the dimension
        if (table->count == 0) {
            table->dim = static_cast<uint32_t>(values.size());
        } else if (values.size() != table->dim) {
            result.skipped_lines++;
            continue;
        }

        std::string key = to_lower(word);
        float norm = compute_norm(values.data(), table->dim);

        auto it = table->index.find(key);
        if (it != table->index.end()) {
            // Last occurrence wins
            std::copy(values.begin(), values.end(),
                      table->data.begin() + static_cast<size_t>(it->second) * table->dim);
            table->norms[it->second] = norm;
            continue;
        }

        table->index.emplace(key, table->count);
        table->words.push_back(std::move(key));
        table->data.insert(table->data.end(), values.begin(), values.end());
        table->norms.push_back(norm);
        table->count++;

        if (table->count % kProgressEvery == 0) {
            LOG_INFO("Loaded " + std::to_string(table->count) + " vectors...");
        }
    }

    if (in.bad()) {
        result.error = "Error reading vectors from " + source_name;
        return result;
    }

    if (table->count == 0) {
        result.error = "No word vectors were loaded from " + source_name;
        return result;
    }

    LOG_INFO("Finished loading " + std::to_string(table->count) + " word vectors with dimension " +
             std::to_string(table->dim) + " (" + std::to_string(result.skipped_lines) +
             " lines skipped)");

    result.table = std::move(table);
    return result;
}

float compute_norm(const float* vector, uint32_t dim) {
    double sum_squares = 0.0;
    for (uint32_t i = 0; i < dim; i++) {
        sum_squares += static_cast<double>(vector[i]) * vector[i];
    }
    return static_cast<float>(std::sqrt(sum_squares));
}

std::string to_lower(const std::string& s) {
    bool ascii = std::all_of(s.begin(), s.end(), [](unsigned char c) { return c < 0x80; });
    if (ascii) {
        std::string out = s;
        for (auto& c : out) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        return out;
    }

    // Root locale: no Turkish dotless-i or other tailoring
    std::string out;
    icu::UnicodeString::fromUTF8(s).toLower(icu::Locale::getRoot()).toUTF8String(out);
    return out;
}
