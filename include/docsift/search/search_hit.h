#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace docsift::search {

/**
 * @brief One candidate from either retrieval path, with the stored chunk fields.
 */
struct SearchHit {
    std::string id; // "<doc_id>:<source>:<locator>:<sig>"
    double score = 0.0;

    std::string text;
    std::string title;
    std::optional<int> page;
    std::optional<int> slide;
    std::optional<std::string> uri;
    std::optional<std::string> source;
    std::optional<std::string> caption;
    nlohmann::json extra; // null when absent

    std::optional<std::string> highlight; // lexical path only
};

struct FusedResult {
    SearchHit hit;
    double fusedScore = 0.0;
    std::optional<std::string> snippet;
};

// Prefix of a composite hit id before the first ':'; the whole id when there is none
std::string_view documentIdOf(std::string_view hitId);

} // namespace docsift::search
