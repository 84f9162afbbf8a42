#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace docsift::ingest {

// Lines judged to recur across a document's pages/slides (headers, footers, watermarks)
using BoilerplateSet = std::unordered_set<std::string>;

// Hex SHA-1 of a canonical form
using DedupSignature = std::string;
using SignatureSet = std::unordered_set<DedupSignature>;

/**
 * @brief Find lines present on at least `minFraction` of the pages.
 *
 * Lines are trimmed; empty lines and lines longer than `maxLineLength` code points are
 * ignored. A line repeated on one page counts once for that page.
 */
BoilerplateSet findBoilerplate(const std::vector<std::string>& pages, double minFraction = 0.6,
                               size_t maxLineLength = 120);

/**
 * @brief Remove lines whose trimmed form is in `boilerplate`; keeps the order of the rest.
 *
 * Blank lines are dropped too when the set is non-empty.
 */
std::string dropBoilerplate(std::string_view text, const BoilerplateSet& boilerplate);

/**
 * @brief Canonical form used for duplicate detection.
 *
 * Drops empty and page-number-only lines ("12", "Page 12"), removes one trailing
 * period per line, joins lines with ". ", collapses spaces/tabs and lower-cases.
 */
std::string canonicalizeForHash(std::string_view text);

DedupSignature signature(std::string_view canonical);

/**
 * @brief True if `sig` was already seen; otherwise records it and returns false.
 */
bool isDuplicate(const DedupSignature& sig, SignatureSet& seen);

} // namespace docsift::ingest
