#include <zk/handlers/save.hpp>
#include <zk/formatting.hpp>
#include <zk/parser.hpp>

namespace zk::handlers {

std::vector<TextEdit> on_will_save(std::string_view text) {
    std::vector<TextEdit> edits;
    if (auto edit = compute_tag_edit(text)) {
        edits.push_back(std::move(*edit));
    }
    return edits;
}

WorkspaceEdit on_save(const fs::path& path, std::string_view text,
                      NoteIndex& index, Logger& logger) {
    auto updated = index.update_file(path);
    if (!updated.ok()) {
        logger.warning("re-index of " + path.string() + " failed: " + updated.error().to_string());
    }

    auto header = parser::parse_header(text);
    if (!header) {
        return {};
    }

    auto tag = parser::compute_status_tag(parser::count_todos(text), header->archived);
    if (!tag || *tag == StatusTag::Todo) {
        return {};
    }

    logger.debug("note " + header->id + " saved as " + parser::status_tag_name(*tag));
    return propagate_tag_change(header->id, *tag, index);
}

}  // namespace zk::handlers
