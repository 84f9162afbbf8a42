#pragma once

#include <docsift/search/search_hit.h>

#include <cstddef>
#include <vector>

namespace docsift::search {

struct FusionConfig {
    double rrfK = 60.0;          // Standard RRF constant
    size_t perDocumentCap = 2;   // Max hits sharing one document id
};

/**
 * @brief Reciprocal Rank Fusion of a vector and a lexical ranking.
 *
 * A hit at 1-based rank r in a list scores 1 / (K + r) from that list; the
 * fused score is the sum over both lists. Ties keep first-seen order (the
 * vector list, then the lexical list). Hits scoring <= minScore are dropped;
 * the rest are walked in order, skipping hits whose document already has
 * perDocumentCap results, until k are taken. The snippet is the lexical
 * highlight when the hit has one.
 */
class FusionRanker {
public:
    explicit FusionRanker(FusionConfig config = {}) : config_(config) {}

    std::vector<FusedResult> fuse(const std::vector<SearchHit>& vectorHits,
                                  const std::vector<SearchHit>& lexicalHits, size_t k,
                                  double minScore) const;

    const FusionConfig& config() const { return config_; }

private:
    FusionConfig config_;
};

} // namespace docsift::search
