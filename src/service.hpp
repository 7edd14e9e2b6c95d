#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "knn_bruteforce.hpp"
#include "vector_table.hpp"

const int kDefaultTopN = 5;
const size_t kMaxMissingShown = 10;

struct QueryResponse {
    int status;
    nlohmann::json body;
};

// {"error": {"code": ..., "message": ...}}
QueryResponse make_error(int status, const std::string& code, const std::string& message);

// Transport-independent find_common_word logic: request validation, centroid,
// ranking and mapping of every outcome onto a status and JSON body.
class QueryService {
public:
    explicit QueryService(std::shared_ptr<const VectorTable> table);

    // Parses a raw request body first
    QueryResponse find_common_word(const std::string& body) const;
    QueryResponse find_common_word(const nlohmann::json& request) const;

    const VectorTable& table() const { return *table_; }

private:
    std::shared_ptr<const VectorTable> table_;
    BruteforceRanker ranker_;
};
