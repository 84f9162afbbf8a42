#include <docsift/extraction/document_extractors.h>

#include <algorithm>
#include <cctype>

namespace docsift::extraction {

namespace {

std::string trimCell(const std::string& cell) {
    auto b = std::find_if_not(cell.begin(), cell.end(),
                              [](unsigned char c) { return std::isspace(c); });
    auto e = std::find_if_not(cell.rbegin(), cell.rend(),
                              [](unsigned char c) { return std::isspace(c); })
                 .base();
    return b < e ? std::string(b, e) : std::string{};
}

void appendRow(std::string& out, const std::vector<std::string>& cells) {
    out += "| ";
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) {
            out += " | ";
        }
        out += cells[i];
    }
    out += " |";
}

} // namespace

std::optional<std::string> rowsToMarkdown(const std::vector<std::vector<std::string>>& rows) {
    if (rows.empty()) {
        return std::nullopt;
    }
    size_t columns = 0;
    for (const auto& row : rows) {
        columns = std::max(columns, row.size());
    }
    if (columns == 0) {
        return std::nullopt;
    }

    std::vector<std::vector<std::string>> normalized;
    normalized.reserve(rows.size());
    bool anyText = false;
    for (const auto& row : rows) {
        std::vector<std::string> cleaned;
        cleaned.reserve(columns);
        for (const auto& cell : row) {
            cleaned.push_back(trimCell(cell));
            anyText = anyText || !cleaned.back().empty();
        }
        cleaned.resize(columns);
        normalized.push_back(std::move(cleaned));
    }
    if (!anyText) {
        return std::nullopt;
    }

    std::string out;
    appendRow(out, normalized.front());
    if (normalized.size() == 1) {
        return out;
    }
    out.push_back('\n');
    appendRow(out, std::vector<std::string>(columns, "---"));
    for (size_t r = 1; r < normalized.size(); ++r) {
        out.push_back('\n');
        appendRow(out, normalized[r]);
    }
    return out;
}

} // namespace docsift::extraction
