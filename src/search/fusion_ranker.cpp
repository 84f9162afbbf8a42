#include <docsift/search/fusion_ranker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace docsift::search {

std::vector<FusedResult> FusionRanker::fuse(const std::vector<SearchHit>& vectorHits,
                                            const std::vector<SearchHit>& lexicalHits, size_t k,
                                            double minScore) const {
    std::vector<FusedResult> candidates;
    std::unordered_map<std::string, size_t> position; // id -> index in candidates

    auto accumulate = [&](const std::vector<SearchHit>& hits, bool lexical) {
        std::unordered_set<std::string> seenInList;
        size_t rank = 0;
        for (const auto& hit : hits) {
            ++rank;
            if (!seenInList.insert(hit.id).second) {
                continue; // only the best rank of a repeated id counts
            }
            const double partial = 1.0 / (config_.rrfK + static_cast<double>(rank));
            auto [it, inserted] = position.try_emplace(hit.id, candidates.size());
            if (inserted) {
                candidates.push_back(FusedResult{hit, 0.0, std::nullopt});
            }
            auto& entry = candidates[it->second];
            if (lexical && !inserted) {
                entry.hit = hit; // stored fields of a hit in both lists come from the lexical copy
            }
            entry.fusedScore += partial;
            if (lexical && hit.highlight && !entry.snippet) {
                entry.snippet = hit.highlight;
            }
        }
    };
    accumulate(vectorHits, false);
    accumulate(lexicalHits, true);

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const FusedResult& a, const FusedResult& b) {
                         return a.fusedScore > b.fusedScore;
                     });

    std::vector<FusedResult> results;
    std::unordered_map<std::string, size_t> perDocument;
    for (auto& c : candidates) {
        if (results.size() >= k) {
            break;
        }
        if (c.fusedScore <= minScore) {
            continue;
        }
        auto docId = std::string(documentIdOf(c.hit.id));
        if (!docId.empty()) {
            auto& count = perDocument[docId];
            if (count >= config_.perDocumentCap) {
                continue;
            }
            ++count;
        }
        results.push_back(std::move(c));
    }

    spdlog::debug("Fused {} vector and {} lexical hits into {} results (k={}, min_score={})",
                  vectorHits.size(), lexicalHits.size(), results.size(), k, minScore);
    return results;
}

} // namespace docsift::search
