#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docsift::ingest {

/**
 * @brief Canonicalize extracted text before chunking.
 *
 * - CRLF and CR become LF
 * - a hyphen directly before a line break joins the two lines (no space)
 * - runs of spaces/tabs collapse to one space
 * - leading bullet glyphs (•, ▪, -) are stripped from each line
 * - three or more consecutive line breaks collapse to one blank line
 * - the result is trimmed
 *
 * Pure and idempotent: normalizeText(normalizeText(x)) == normalizeText(x).
 */
std::string normalizeText(std::string_view text);

// Whitespace-delimited words, as used for the word-count thresholds.
std::vector<std::string> splitWords(std::string_view text);
size_t countWords(std::string_view text);

} // namespace docsift::ingest
