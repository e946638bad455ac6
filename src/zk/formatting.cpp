#include <zk/formatting.hpp>
#include <zk/parser.hpp>
#include <zk/util/file_io.hpp>

#include <set>
#include <unordered_map>

namespace zk {

namespace {

constexpr const char* STATUS_TOKENS[] = {"#tag.done", "#tag.wip", "#tag.todo"};

std::vector<std::string> to_owned(const std::vector<std::string_view>& lines) {
    return std::vector<std::string>(lines.begin(), lines.end());
}

bool ends_with_newline(std::string_view s) {
    return !s.empty() && s.back() == '\n';
}

std::string replace_all(std::string s, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::string with_state(std::string_view line, const parser::ChecklistMarker& marker, bool checked) {
    std::string out(line.substr(0, marker.state_offset));
    out += checked ? 'x' : ' ';
    out += line.substr(marker.state_offset + marker.state_length);
    return out;
}

// Whether the marker already shows the wanted state
bool has_state(const parser::ChecklistMarker& marker, bool checked) {
    return checked ? marker.checked() : marker.unchecked();
}

TextEdit whole_line_edit(uint32_t line_num, std::string_view old_line, std::string new_text) {
    TextEdit edit;
    edit.range.start = {line_num, 0};
    edit.range.end = {line_num, parser::byte_to_utf16(old_line, old_line.size())};
    edit.new_text = std::move(new_text);
    return edit;
}

}  // namespace

std::optional<TextEdit> compute_tag_edit(std::string_view content) {
    auto header = parser::parse_header(content);
    if (!header) {
        return std::nullopt;
    }

    auto tag = parser::compute_status_tag(parser::count_todos(content), header->archived);
    if (!tag) {
        return std::nullopt;
    }
    std::string_view new_token = parser::status_tag_token(*tag);

    auto lines = parser::split_lines(content);
    if (header->tag_line_idx >= lines.size()) {
        return std::nullopt;
    }
    std::string_view tag_line = lines[header->tag_line_idx];

    std::optional<std::string_view> current;
    for (const char* token : STATUS_TOKENS) {
        if (tag_line.find(token) != std::string_view::npos) {
            current = token;
            break;
        }
    }

    if (current == new_token) {
        return std::nullopt;
    }

    std::string new_line;
    if (current) {
        new_line = replace_all(std::string(tag_line), *current, new_token);
    } else {
        new_line = std::string(tag_line) + " " + std::string(new_token);
    }

    return whole_line_edit(static_cast<uint32_t>(header->tag_line_idx), tag_line, std::move(new_line));
}

std::string apply_tag_edit(const std::string& content) {
    auto edit = compute_tag_edit(content);
    if (!edit) {
        return content;
    }
    return apply_line_edits(content, {*edit});
}

std::string apply_line_edits(const std::string& content, const std::vector<TextEdit>& edits) {
    auto lines = to_owned(parser::split_lines(content));
    for (const auto& edit : edits) {
        if (edit.range.start.line < lines.size()) {
            lines[edit.range.start.line] = edit.new_text;
        }
    }
    return parser::join_lines(lines, ends_with_newline(content));
}

bool is_effectively_done(const fs::path& path) {
    auto content = read_file(path);
    if (!content.ok()) {
        return false;
    }
    const std::string& text = content.value();

    auto header = parser::parse_header(text);
    if (!header) {
        return false;
    }

    // Judge by the tag the note would carry after reconciliation
    std::string effective;
    if (auto edit = compute_tag_edit(text)) {
        effective = edit->new_text;
    } else {
        auto lines = parser::split_lines(text);
        if (header->tag_line_idx < lines.size()) {
            effective = std::string(lines[header->tag_line_idx]);
        }
    }
    return effective.find("#tag.done") != std::string::npos;
}

std::string update_ref_checkboxes(const std::string& content, const fs::path& note_dir) {
    auto views = parser::split_lines(content);
    std::vector<std::string> lines;
    bool changed = false;

    // A note referenced on several lines is read once per pass
    std::unordered_map<NoteId, bool> done_cache;
    auto ref_done = [&](const NoteId& id) {
        auto it = done_cache.find(id);
        if (it != done_cache.end()) {
            return it->second;
        }
        bool done = is_effectively_done(note_dir / (id + NOTE_EXTENSION));
        done_cache.emplace(id, done);
        return done;
    };

    for (size_t i = 0; i < views.size(); ++i) {
        std::string_view line = views[i];
        auto marker = parser::checklist_marker(line);
        if (!marker) continue;

        auto refs = parser::find_refs_in_line(line);
        if (refs.empty()) continue;

        bool all_done = true;
        for (const auto& ref : refs) {
            if (!ref_done(ref.id)) {
                all_done = false;
                break;
            }
        }

        if (has_state(*marker, all_done)) continue;

        if (!changed) {
            lines = to_owned(views);
            changed = true;
        }
        lines[i] = with_state(line, *marker, all_done);
    }

    if (!changed) {
        return content;
    }
    return parser::join_lines(lines, ends_with_newline(content));
}

std::string update_nested_checkboxes(const std::string& content) {
    auto lines = to_owned(parser::split_lines(content));

    struct Item {
        size_t line_idx;
        size_t indent;
    };
    std::vector<Item> items;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (auto marker = parser::checklist_marker(lines[i])) {
            items.push_back({i, marker->indent});
        }
    }

    // Bottom-up, so a parent sees its children's updated state
    for (size_t i = items.size(); i-- > 0;) {
        const Item& item = items[i];

        bool has_descendants = false;
        bool all_done = true;
        for (size_t j = i + 1; j < items.size() && items[j].indent > item.indent; ++j) {
            has_descendants = true;
            auto child = parser::checklist_marker(lines[items[j].line_idx]);
            if (!child || !child->checked()) {
                all_done = false;
            }
        }

        if (!has_descendants) continue;

        auto marker = parser::checklist_marker(lines[item.line_idx]);
        if (marker && !has_state(*marker, all_done)) {
            lines[item.line_idx] = with_state(lines[item.line_idx], *marker, all_done);
        }
    }

    return parser::join_lines(lines, ends_with_newline(content));
}

std::string format_content(const std::string& content, const fs::path& note_dir) {
    std::string after_refs = update_ref_checkboxes(content, note_dir);
    std::string after_nested = update_nested_checkboxes(after_refs);
    return apply_tag_edit(after_nested);
}

WorkspaceEdit propagate_tag_change(const NoteId& note_id, StatusTag tag, const NoteIndex& index) {
    const bool checked = (tag == StatusTag::Done);

    std::set<fs::path> files;
    for (const auto& loc : index.get_backlinks(note_id)) {
        files.insert(loc.file);
    }

    WorkspaceEdit changes;
    for (const auto& file : files) {
        auto content = read_file(file);
        if (!content.ok()) {
            continue;
        }

        std::vector<TextEdit> edits;
        auto lines = parser::split_lines(content.value());
        for (size_t n = 0; n < lines.size(); ++n) {
            std::string_view line = lines[n];
            auto marker = parser::checklist_marker(line);
            if (!marker || has_state(*marker, checked)) continue;

            auto refs = parser::find_refs_in_line(line);
            bool references_note = false;
            for (const auto& ref : refs) {
                if (ref.id == note_id) {
                    references_note = true;
                    break;
                }
            }
            if (!references_note) continue;

            edits.push_back(whole_line_edit(static_cast<uint32_t>(n), line,
                                            with_state(line, *marker, checked)));
        }

        if (!edits.empty()) {
            changes.emplace(file, std::move(edits));
        }
    }

    return changes;
}

size_t apply_workspace_edit(const WorkspaceEdit& edit, NoteIndex& index, Logger& logger) {
    size_t written = 0;
    for (const auto& [file, edits] : edit) {
        auto content = read_file(file);
        if (!content.ok()) {
            logger.warning("cannot apply edits: " + content.error().to_string());
            continue;
        }

        auto write = write_file_atomic(file, apply_line_edits(content.value(), edits));
        if (!write.ok()) {
            logger.warning("cannot apply edits: " + write.error().to_string());
            continue;
        }
        ++written;

        auto update = index.update_file(file);
        if (!update.ok()) {
            logger.warning("re-index after edit failed: " + update.error().to_string());
        }
    }
    return written;
}

}  // namespace zk
