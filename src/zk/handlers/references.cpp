#include <zk/handlers/references.hpp>
#include <zk/parser.hpp>

namespace zk::handlers {

namespace {

std::optional<NoteId> extract_angle_id(std::string_view line) {
    size_t start = line.rfind('<');
    if (start == std::string_view::npos) return std::nullopt;
    size_t end = line.find('>', start);
    if (end == std::string_view::npos) return std::nullopt;

    std::string_view candidate = line.substr(start + 1, end - start - 1);
    if (!parser::is_note_id(candidate)) return std::nullopt;
    return NoteId(candidate);
}

std::optional<NoteId> extract_at_id(std::string_view line) {
    size_t at = line.find('@');
    if (at == std::string_view::npos) return std::nullopt;

    std::string_view rest = line.substr(at + 1);
    size_t end = 0;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end != NOTE_ID_LENGTH) return std::nullopt;
    return NoteId(rest.substr(0, end));
}

}  // namespace

std::optional<NoteId> extract_id_from_line(std::string_view line) {
    if (auto id = extract_angle_id(line)) {
        return id;
    }
    return extract_at_id(line);
}

std::vector<BacklinkLocation> find_references(const NoteIndex& index, std::string_view line_text) {
    auto id = extract_id_from_line(line_text);
    if (!id) {
        return {};
    }
    return index.get_backlinks(*id);
}

}  // namespace zk::handlers
