#include <scry/core/format.h>
#include <scry/extract/source_file.h>
#include <scry/extract/syntax_tree.h>

#include <limits>

namespace scry::extract {

Result<SyntaxTree> SyntaxTree::parse(const TSLanguage* language, std::string_view content,
                                     std::string_view filePath) {
    if (!language) {
        return Error{ErrorCode::NotInitialized,
                     scry::format("No tree-sitter language loaded for {}", filePath)};
    }
    if (looksBinary(content)) {
        return Error{ErrorCode::ParseError, scry::format("{} looks binary", filePath)};
    }
    if (content.size() > std::numeric_limits<uint32_t>::max()) {
        return Error{ErrorCode::InvalidData, scry::format("{} is too large to parse", filePath)};
    }

    std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser(ts_parser_new(),
                                                                   ts_parser_delete);
    if (!parser || !ts_parser_set_language(parser.get(), language)) {
        return Error{ErrorCode::NotInitialized,
                     scry::format("Parser rejected the language for {}", filePath)};
    }

    TSTree* tree = ts_parser_parse_string(parser.get(), nullptr, content.data(),
                                          static_cast<uint32_t>(content.size()));
    if (!tree) {
        return Error{ErrorCode::ParseError, scry::format("Failed to parse {}", filePath)};
    }

    SyntaxTree parsed(tree);
    if (ts_node_has_error(parsed.root())) {
        return Error{ErrorCode::ParseError,
                     scry::format("{} has syntax errors near line {}", filePath,
                                  firstErrorLine(parsed.root()))};
    }
    return parsed;
}

uint32_t firstErrorLine(TSNode node) {
    if (ts_node_is_error(node) || ts_node_is_missing(node)) {
        return startLine(node);
    }
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(node, i);
        if (ts_node_has_error(child)) {
            return firstErrorLine(child);
        }
    }
    return startLine(node);
}

std::string nodeText(TSNode node, std::string_view content) {
    if (ts_node_is_null(node))
        return "";

    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start >= end || end > content.size())
        return "";
    return std::string(content.substr(start, end - start));
}

TSNode childByField(TSNode node, std::string_view field) {
    return ts_node_child_by_field_name(node, field.data(), static_cast<uint32_t>(field.size()));
}

} // namespace scry::extract
