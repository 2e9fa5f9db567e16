#include "srcfmt/formatters/import_sorter.hpp"
#include "srcfmt/core/string_utils.hpp"
#include <algorithm>
#include <regex>

namespace srcfmt {

namespace {

const std::regex import_pattern{R"(^import\s+(static\s+)?([\w$]+(?:\s*\.\s*(?:[\w$]+|\*))*)\s*;\s*(//.*)?$)"};

struct ImportBlock {
    size_t begin = 0;
    size_t end = 0;  // One past the last import line
};

// Follows /* ... */ across lines
class CommentTracker {
public:
    auto is_comment(const std::string& trimmed) -> bool {
        if (in_block_) {
            in_block_ = trimmed.find("*/") == std::string::npos;
            return true;
        }
        if (trimmed.starts_with("/*")) {
            in_block_ = trimmed.find("*/", 2) == std::string::npos;
            return true;
        }
        return trimmed.starts_with("//");
    }

private:
    bool in_block_ = false;
};

// Leading import block: the run of import, comment and blank lines that follows the
// package clause and its annotations
auto find_import_block(const std::vector<std::string>& lines) -> std::optional<ImportBlock> {
    CommentTracker comments;

    for (size_t i = 0; i < lines.size(); ++i) {
        auto trimmed = StringUtils::trim(lines[i]);
        if (comments.is_comment(trimmed) || trimmed.empty() || trimmed.starts_with("@")
            || trimmed.starts_with("package ")) {
            continue;
        }
        if (!parse_import_line(trimmed)) {
            return std::nullopt; // First statement is not an import
        }

        ImportBlock block{.begin = i, .end = i + 1};
        for (size_t j = i + 1; j < lines.size(); ++j) {
            auto next = StringUtils::trim(lines[j]);
            if (comments.is_comment(next) || next.empty()) {
                continue;
            }
            if (!parse_import_line(next)) {
                break;
            }
            block.end = j + 1;
        }
        return block;
    }
    return std::nullopt;
}

auto strip_spaces(std::string text) -> std::string {
    text.erase(std::remove_if(text.begin(), text.end(),
                              [](char c) { return c == ' ' || c == '\t'; }),
               text.end());
    return text;
}

auto emit_slots(std::vector<std::vector<ImportStatement>>& slots, std::vector<std::string>& out)
    -> void {
    for (auto& slot : slots) {
        if (slot.empty()) {
            continue;
        }
        std::stable_sort(slot.begin(), slot.end(),
                         [](const auto& a, const auto& b) { return a.name < b.name; });
        if (!out.empty()) {
            out.emplace_back();
        }
        for (const auto& import : slot) {
            out.insert(out.end(), import.comments.begin(), import.comments.end());
            out.push_back(import.text);
        }
    }
}

} // namespace

auto parse_import_line(std::string_view line) -> std::optional<ImportStatement> {
    std::string text(line);
    std::smatch match;
    if (!std::regex_match(text, match, import_pattern)) {
        return std::nullopt;
    }
    return ImportStatement{.name = strip_spaces(match[2].str()),
                           .is_static = match[1].matched,
                           .text = text};
}

auto matches_import_prefix(std::string_view name, std::string_view prefix) -> bool {
    if (prefix.empty() || !name.starts_with(prefix)) {
        return false;
    }
    return name.size() == prefix.size() || name[prefix.size()] == '.' || prefix.back() == '.';
}

auto import_slot(std::string_view name, const ImportOrder& order) -> size_t {
    std::optional<size_t> catch_all;
    for (size_t i = 0; i < order.groups.size(); ++i) {
        if (order.groups[i].empty()) {
            if (!catch_all) {
                catch_all = i;
            }
            continue;
        }
        if (matches_import_prefix(name, order.groups[i])) {
            return i + 1;
        }
    }

    if (catch_all) {
        return *catch_all + 1;
    }
    return order.unmatched == UnmatchedImports::FIRST ? 0 : order.groups.size() + 1;
}

auto sort_imports(const std::vector<std::string>& lines, const ImportOrder& order)
    -> std::vector<std::string> {
    auto block = find_import_block(lines);
    if (!block) {
        return lines;
    }

    const size_t slot_count = order.groups.size() + 2;
    std::vector<std::vector<ImportStatement>> static_slots(slot_count);
    std::vector<std::vector<ImportStatement>> regular_slots(slot_count);

    CommentTracker comments;
    std::vector<std::string> pending_comments;

    for (size_t i = block->begin; i < block->end; ++i) {
        auto trimmed = StringUtils::trim(lines[i]);
        if (comments.is_comment(trimmed)) {
            pending_comments.push_back(lines[i]);
            continue;
        }
        auto import = parse_import_line(trimmed);
        if (!import) {
            continue; // Blank separator
        }
        // Comments move with the import below them
        import->comments = std::move(pending_comments);
        pending_comments.clear();
        auto& slots = import->is_static ? static_slots : regular_slots;
        slots[import_slot(import->name, order)].push_back(std::move(*import));
    }

    std::vector<std::string> sorted_block;
    emit_slots(static_slots, sorted_block);
    emit_slots(regular_slots, sorted_block);

    std::vector<std::string> result(lines.begin(), lines.begin() + static_cast<long>(block->begin));
    result.insert(result.end(), sorted_block.begin(), sorted_block.end());
    result.insert(result.end(), lines.begin() + static_cast<long>(block->end), lines.end());
    return result;
}

} // namespace srcfmt
