#pragma once

#include <zk/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zk::parser {

/**
 * Stateless parsing of note text.
 *
 * Every function takes text in and returns data out; nothing here touches
 * the filesystem or the index.
 */

// The line that anchors the fixed header layout
constexpr std::string_view IMPORT_LINE = "#import \"../include.typ\": *";

// Header line offsets relative to the import line
constexpr size_t TITLE_LINE_OFFSET = 3;
constexpr size_t TAG_LINE_OFFSET = 4;
constexpr size_t LINK_LINE_OFFSET = 5;

// ============================================================================
// Line helpers
// ============================================================================

/**
 * Split text into lines on '\n', dropping one trailing '\r' per line.
 * A final newline does not produce an empty trailing line.
 */
std::vector<std::string_view> split_lines(std::string_view text);

/**
 * Join lines with '\n', appending a final newline if requested.
 */
std::string join_lines(const std::vector<std::string>& lines, bool trailing_newline);

std::string_view trim(std::string_view s);
std::string_view trim_start(std::string_view s);

// ============================================================================
// Header
// ============================================================================

/**
 * Parse the header of a note.
 *
 * Locates the import line; the title line sits three lines below it and
 * must end with a `<ID>` label. Returns nullopt when the text is not a
 * note (no import line, or the title line does not match).
 *
 * @param content Full note text
 * @return Parsed header, or nullopt
 */
std::optional<NoteHeader> parse_header(std::string_view content);

// ============================================================================
// Checklists
// ============================================================================

/**
 * Location of the state character in a checklist line
 * (`<indent>- [<state>]`).
 */
struct ChecklistMarker {
    size_t indent = 0;        // Leading whitespace bytes
    size_t state_offset = 0;  // Byte offset of the state character
    size_t state_length = 1;  // UTF-8 length of the state character
    char state = ' ';         // The state byte, or '\0' for non-ASCII states

    bool checked() const { return state == 'x' || state == 'X'; }
    bool unchecked() const { return state == ' '; }
};

/**
 * Recognize a checklist line.
 *
 * @param line One line of text
 * @return Marker position, or nullopt if the line is not a checklist item
 */
std::optional<ChecklistMarker> checklist_marker(std::string_view line);

/**
 * Count complete and incomplete checklist items outside ``` fences.
 */
TodoStatus count_todos(std::string_view content);

/**
 * Derive the status tag from checklist counts.
 * No tag without checklist items; archived notes are always done.
 */
std::optional<StatusTag> compute_status_tag(const TodoStatus& todos, bool archived);

// "#tag.done", "#tag.wip", "#tag.todo"
const char* status_tag_token(StatusTag tag);

// "done", "wip", "todo"
const char* status_tag_name(StatusTag tag);

// ============================================================================
// References
// ============================================================================

/**
 * Find `@ID` tokens in a single line.
 * Offsets in the result are bytes within the line.
 */
std::vector<RefOccurrence> find_refs_in_line(std::string_view line, uint32_t line_num = 0);

/**
 * Find all `@ID` tokens, line by line, left to right.
 * An `@` must be followed by exactly ten digits; longer or shorter digit
 * runs are not references.
 */
std::vector<RefOccurrence> find_all_refs(std::string_view content);

/**
 * Convert a byte offset within a line to UTF-16 code units.
 * Offsets past the end of the line are clamped.
 */
uint32_t byte_to_utf16(std::string_view line, size_t byte_offset);

// ============================================================================
// Identifiers
// ============================================================================

// Exactly ten ASCII digits
bool is_note_id(std::string_view s);

// `<10 digits>.typ`
bool is_note_filename(const fs::path& path);

}  // namespace zk::parser
