#include "service.hpp"
#include "centroid.hpp"
#include "util.hpp"
#include <algorithm>
#include <cstdint>

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

bool is_word_list(const nlohmann::json& words) {
    if (!words.is_array() || words.empty()) {
        return false;
    }
    for (const auto& w : words) {
        if (!w.is_string() || w.get_ref<const std::string&>().empty()) {
            return false;
        }
    }
    return true;
}

// Accepts only JSON integers > 0; floats and booleans are rejected
bool read_top_n(const nlohmann::json& value, size_t& out) {
    if (!value.is_number_integer()) {
        return false;
    }
    if (value.is_number_unsigned()) {
        uint64_t n = value.get<uint64_t>();
        if (n == 0) return false;
        out = static_cast<size_t>(n);
        return true;
    }
    int64_t n = value.get<int64_t>();
    if (n <= 0) return false;
    out = static_cast<size_t>(n);
    return true;
}

std::string missing_words_message(const std::vector<std::string>& missing) {
    std::string msg = "None of the provided words were found in the vocabulary.";
    if (missing.empty()) {
        return msg;
    }
    std::vector<std::string> shown(missing.begin(),
                                   missing.begin() + std::min(missing.size(), kMaxMissingShown));
    if (missing.size() > kMaxMissingShown) {
        shown.push_back("...");
    }
    msg += " Missing words (" + std::to_string(missing.size()) + " total): " + join(shown, ", ");
    return msg;
}

} // namespace

QueryResponse make_error(int status, const std::string& code, const std::string& message) {
    nlohmann::json error_response;
    error_response["error"]["code"] = code;
    error_response["error"]["message"] = message;
    return QueryResponse{status, error_response};
}

QueryService::QueryService(std::shared_ptr<const VectorTable> table)
    : table_(table), ranker_(table) {}

QueryResponse QueryService::find_common_word(const std::string& body) const {
    nlohmann::json json_req;
    try {
        json_req = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error(400, "INVALID_JSON", "Failed to parse JSON: " + std::string(e.what()));
    }
    return find_common_word(json_req);
}

QueryResponse QueryService::find_common_word(const nlohmann::json& request) const {
    if (!request.is_object() || !request.contains("words")) {
        return make_error(400, "MISSING_FIELD", "Input must contain a list of words");
    }

    const nlohmann::json& words_json = request["words"];
    if (!is_word_list(words_json)) {
        return make_error(400, "INVALID_WORDS",
                          "Words must be provided as a non-empty list of non-empty strings");
    }

    size_t top_n = kDefaultTopN;
    if (request.contains("top_n") && !read_top_n(request["top_n"], top_n)) {
        return make_error(400, "INVALID_TOP_N", "top_n must be a positive integer");
    }

    std::vector<std::string> words = words_json.get<std::vector<std::string>>();

    Timer timer;

    auto centroid = compute_centroid(*table_, words);
    if (!centroid) {
        return make_error(400, "WORDS_NOT_FOUND",
                          missing_words_message(find_missing_words(*table_, words)));
    }

    // Exclude every input word, not only the matched ones
    std::vector<Neighbor> neighbors = ranker_.rank(*centroid, words, top_n);
    if (neighbors.empty()) {
        return make_error(400, "NO_RELATED_WORDS",
                          "Could not find any related words in the vocabulary "
                          "(excluding input words).");
    }

    nlohmann::json common_words = nlohmann::json::array();
    for (const auto& neighbor : neighbors) {
        nlohmann::json item;
        item["word"] = neighbor.word;
        item["similarity_score"] = static_cast<double>(neighbor.score);
        common_words.push_back(item);
    }

    nlohmann::json response;
    response["input_words"] = words_json;
    response["top_n_requested"] = top_n;
    response["common_words"] = common_words;

    log_query(timer.elapsed_ms(), top_n, words.size(), neighbors.size(), table_->count);

    return QueryResponse{200, response};
}
