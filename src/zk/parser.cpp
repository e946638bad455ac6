#include <zk/parser.hpp>

namespace zk::parser {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

size_t skip_spaces(std::string_view s, size_t pos) {
    while (pos < s.size() && is_space(s[pos])) ++pos;
    return pos;
}

// `<` + 10 digits + `>` at pos; returns the offset one past `>`
std::optional<size_t> match_label(std::string_view s, size_t pos) {
    if (pos >= s.size() || s[pos] != '<') return std::nullopt;
    size_t end = pos + 1 + NOTE_ID_LENGTH;
    if (end >= s.size() || s[end] != '>') return std::nullopt;
    for (size_t i = pos + 1; i < end; ++i) {
        if (!is_digit(s[i])) return std::nullopt;
    }
    return end + 1;
}

// Length of the UTF-8 sequence introduced by a lead byte
size_t utf8_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;  // Stray continuation byte
}

// First `<name>\s*(\s*<ID>\s*)` on the line
std::optional<NoteId> capture_link(std::string_view line, std::string_view name) {
    size_t from = 0;
    while (true) {
        size_t at = line.find(name, from);
        if (at == std::string_view::npos) {
            return std::nullopt;
        }
        from = at + 1;

        size_t pos = skip_spaces(line, at + name.size());
        if (pos >= line.size() || line[pos] != '(') continue;
        pos = skip_spaces(line, pos + 1);
        size_t label = pos;
        auto after = match_label(line, label);
        if (!after) continue;
        pos = skip_spaces(line, *after);
        if (pos >= line.size() || line[pos] != ')') continue;
        return std::string(line.substr(label + 1, NOTE_ID_LENGTH));
    }
}

std::vector<std::string> split_list(std::string_view value) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string_view::npos) comma = value.size();
        std::string_view item = trim(value.substr(start, comma - start));
        if (!item.empty()) {
            items.emplace_back(item);
        }
        start = comma + 1;
    }
    return items;
}

}  // namespace

// ============================================================================
// Line helpers
// ============================================================================

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        size_t end = (nl == std::string_view::npos) ? text.size() : nl;
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (nl == std::string_view::npos) break;
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines, bool trailing_newline) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    if (trailing_newline) {
        out += '\n';
    }
    return out;
}

std::string_view trim_start(std::string_view s) {
    size_t i = 0;
    while (i < s.size() && is_space(s[i])) ++i;
    return s.substr(i);
}

std::string_view trim(std::string_view s) {
    s = trim_start(s);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

// ============================================================================
// Header
// ============================================================================

std::optional<NoteHeader> parse_header(std::string_view content) {
    auto lines = split_lines(content);

    size_t import_idx = lines.size();
    for (size_t i = 0; i < lines.size(); ++i) {
        if (trim(lines[i]) == IMPORT_LINE) {
            import_idx = i;
            break;
        }
    }
    if (import_idx == lines.size()) {
        return std::nullopt;
    }

    NoteHeader header;
    header.title_line_idx = import_idx + TITLE_LINE_OFFSET;
    header.tag_line_idx = import_idx + TAG_LINE_OFFSET;

    if (header.title_line_idx >= lines.size()) {
        return std::nullopt;
    }

    // `=`, whitespace, then anything up to the last `<ID>` label on the line
    std::string_view title_line = lines[header.title_line_idx];
    if (title_line.size() < 2 || title_line[0] != '=' || !is_space(title_line[1])) {
        return std::nullopt;
    }
    size_t label = std::string_view::npos;
    for (size_t lt = title_line.rfind('<'); lt != std::string_view::npos && lt >= 2;
         lt = title_line.rfind('<', lt - 1)) {
        if (match_label(title_line, lt)) {
            label = lt;
            break;
        }
    }
    if (label == std::string_view::npos) {
        return std::nullopt;
    }
    header.id = std::string(title_line.substr(label + 1, NOTE_ID_LENGTH));

    // "=  Title <ID>" -> "Title"
    std::string_view heading = title_line.substr(0, label);
    size_t eq = heading.find_first_not_of('=');
    header.title = std::string(trim(eq == std::string_view::npos ? std::string_view{}
                                                                 : heading.substr(eq)));

    std::string_view tag_line =
        header.tag_line_idx < lines.size() ? lines[header.tag_line_idx] : std::string_view{};
    header.archived = tag_line.find("#tag.archived") != std::string_view::npos;
    header.legacy = tag_line.find("#tag.legacy") != std::string_view::npos;

    size_t link_idx = import_idx + LINK_LINE_OFFSET;
    std::string_view link_line = link_idx < lines.size() ? lines[link_idx] : std::string_view{};
    header.evo_id = capture_link(link_line, "#evolution_link");
    header.alt_id = capture_link(link_line, "#alternative_link");

    // Metadata block before the import line
    bool in_metadata = false;
    for (size_t i = 0; i < import_idx; ++i) {
        std::string_view line = lines[i];
        std::string_view t = trim(line);
        if (t == "/* Metadata:") {
            in_metadata = true;
            continue;
        }
        if (t == "*/") {
            break;
        }
        if (!in_metadata) {
            continue;
        }

        if (starts_with(line, "Aliases:")) {
            header.aliases = split_list(line.substr(8));
        } else if (starts_with(line, "Abstract:")) {
            std::string_view value = trim(line.substr(9));
            if (!value.empty()) {
                header.abstract_text = std::string(value);
            }
        } else if (starts_with(line, "Keyword:")) {
            header.keywords = split_list(line.substr(8));
        }
        // Other metadata keys are ignored
    }

    return header;
}

// ============================================================================
// Checklists
// ============================================================================

std::optional<ChecklistMarker> checklist_marker(std::string_view line) {
    size_t indent = 0;
    while (indent < line.size() && (line[indent] == ' ' || line[indent] == '\t')) {
        ++indent;
    }

    std::string_view rest = line.substr(indent);
    if (!starts_with(rest, "- [") || rest.size() < 5) {
        return std::nullopt;
    }

    ChecklistMarker marker;
    marker.indent = indent;
    marker.state_offset = indent + 3;

    auto lead = static_cast<unsigned char>(line[marker.state_offset]);
    marker.state_length = utf8_length(lead);
    size_t close = marker.state_offset + marker.state_length;
    if (close >= line.size() || line[close] != ']') {
        return std::nullopt;
    }
    marker.state = lead < 0x80 ? static_cast<char>(lead) : '\0';
    return marker;
}

TodoStatus count_todos(std::string_view content) {
    TodoStatus status;
    bool in_code_block = false;

    for (std::string_view line : split_lines(content)) {
        if (starts_with(trim_start(line), "```")) {
            in_code_block = !in_code_block;
            continue;
        }
        if (in_code_block) {
            continue;
        }

        auto marker = checklist_marker(line);
        if (!marker) continue;
        if (marker->checked()) {
            ++status.completed;
        } else if (marker->unchecked()) {
            ++status.incomplete;
        }
    }
    return status;
}

std::optional<StatusTag> compute_status_tag(const TodoStatus& todos, bool archived) {
    if (todos.completed == 0 && todos.incomplete == 0) {
        return std::nullopt;
    }
    if (archived) {
        return StatusTag::Done;
    }
    if (todos.incomplete == 0) {
        return StatusTag::Done;
    }
    if (todos.completed > 0) {
        return StatusTag::Wip;
    }
    return StatusTag::Todo;
}

const char* status_tag_token(StatusTag tag) {
    switch (tag) {
        case StatusTag::Done: return "#tag.done";
        case StatusTag::Wip: return "#tag.wip";
        case StatusTag::Todo: return "#tag.todo";
    }
    return "#tag.todo";
}

const char* status_tag_name(StatusTag tag) {
    switch (tag) {
        case StatusTag::Done: return "done";
        case StatusTag::Wip: return "wip";
        case StatusTag::Todo: return "todo";
    }
    return "todo";
}

// ============================================================================
// References
// ============================================================================

std::vector<RefOccurrence> find_refs_in_line(std::string_view line, uint32_t line_num) {
    std::vector<RefOccurrence> refs;
    size_t i = 0;
    while (i < line.size()) {
        if (line[i] != '@') {
            ++i;
            continue;
        }
        size_t j = i + 1;
        while (j < line.size() && is_digit(line[j])) ++j;

        if (j - i - 1 == NOTE_ID_LENGTH) {
            RefOccurrence ref;
            ref.id = std::string(line.substr(i + 1, NOTE_ID_LENGTH));
            ref.line = line_num;
            ref.start_char = static_cast<uint32_t>(i);
            ref.end_char = static_cast<uint32_t>(j);
            refs.push_back(std::move(ref));
        }
        i = j;
    }
    return refs;
}

std::vector<RefOccurrence> find_all_refs(std::string_view content) {
    std::vector<RefOccurrence> refs;
    auto lines = split_lines(content);
    for (size_t n = 0; n < lines.size(); ++n) {
        auto line_refs = find_refs_in_line(lines[n], static_cast<uint32_t>(n));
        refs.insert(refs.end(),
                    std::make_move_iterator(line_refs.begin()),
                    std::make_move_iterator(line_refs.end()));
    }
    return refs;
}

uint32_t byte_to_utf16(std::string_view line, size_t byte_offset) {
    if (byte_offset > line.size()) {
        byte_offset = line.size();
    }

    uint32_t units = 0;
    for (size_t i = 0; i < byte_offset; ++i) {
        auto c = static_cast<unsigned char>(line[i]);
        if ((c & 0xC0) == 0x80) {
            continue;  // Continuation byte
        }
        // Four-byte sequences are surrogate pairs in UTF-16
        units += (c >= 0xF0) ? 2 : 1;
    }
    return units;
}

// ============================================================================
// Identifiers
// ============================================================================

bool is_note_id(std::string_view s) {
    if (s.size() != NOTE_ID_LENGTH) return false;
    for (char c : s) {
        if (!is_digit(c)) return false;
    }
    return true;
}

bool is_note_filename(const fs::path& path) {
    if (path.extension() != NOTE_EXTENSION) {
        return false;
    }
    return is_note_id(path.stem().string());
}

}  // namespace zk::parser
