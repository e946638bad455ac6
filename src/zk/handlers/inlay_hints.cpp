#include <zk/handlers/inlay_hints.hpp>
#include <zk/parser.hpp>

namespace zk::handlers {

std::vector<InlayHint> get_inlay_hints(std::string_view content,
                                       uint32_t first_line,
                                       uint32_t last_line,
                                       const NoteIndex& index) {
    std::vector<InlayHint> hints;

    auto lines = parser::split_lines(content);
    for (size_t n = first_line; n < lines.size() && n <= last_line; ++n) {
        std::string_view line = lines[n];
        for (const auto& ref : parser::find_refs_in_line(line, static_cast<uint32_t>(n))) {
            auto info = index.get(ref.id);
            if (!info) continue;

            InlayHint hint;
            hint.position = {ref.line, parser::byte_to_utf16(line, ref.end_char)};
            hint.label = info->title;
            hints.push_back(std::move(hint));
        }
    }

    return hints;
}

}  // namespace zk::handlers
