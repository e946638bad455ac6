#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zk {

namespace fs = std::filesystem;

// Note identifier: 10 ASCII digits (YYMMDDHHMM of the creation time)
using NoteId = std::string;

constexpr size_t NOTE_ID_LENGTH = 10;
constexpr const char* NOTE_EXTENSION = ".typ";

/**
 * Facts parsed from the preamble of one note.
 * Produced fresh by every parse and replaced wholesale.
 */
struct NoteHeader {
    NoteId id;
    std::string title;
    bool archived = false;
    bool legacy = false;
    std::optional<NoteId> alt_id;     // Successor when archived
    std::optional<NoteId> evo_id;     // Newer insight when legacy
    std::vector<std::string> aliases;
    std::vector<std::string> keywords;
    std::optional<std::string> abstract_text;
    size_t title_line_idx = 0;        // 0-based
    size_t tag_line_idx = 0;          // 0-based
};

/**
 * Index entry: header facts plus the file they came from.
 */
struct NoteInfo {
    NoteId id;
    std::string title;
    bool archived = false;
    bool legacy = false;
    std::optional<NoteId> alt_id;
    std::optional<NoteId> evo_id;
    std::vector<std::string> aliases;
    std::vector<std::string> keywords;
    std::optional<std::string> abstract_text;
    fs::path path;
};

// One `@<id>` occurrence. Offsets are bytes within the line.
struct RefOccurrence {
    NoteId id;
    uint32_t line = 0;
    uint32_t start_char = 0;
    uint32_t end_char = 0;
};

// A reference location as reported outside the index (UTF-16 offsets)
struct BacklinkLocation {
    fs::path file;
    uint32_t line = 0;
    uint32_t start_char = 0;
    uint32_t end_char = 0;

    bool operator==(const BacklinkLocation& other) const {
        return file == other.file && line == other.line &&
               start_char == other.start_char && end_char == other.end_char;
    }
};

// Checklist marker counts, fenced code blocks excluded
struct TodoStatus {
    size_t completed = 0;
    size_t incomplete = 0;
};

enum class StatusTag {
    Todo,
    Wip,
    Done
};

// ============================================================================
// Edit model (0-based lines, UTF-16 characters)
// ============================================================================

struct Position {
    uint32_t line = 0;
    uint32_t character = 0;

    bool operator==(const Position& other) const {
        return line == other.line && character == other.character;
    }
};

struct Range {
    Position start;
    Position end;

    bool operator==(const Range& other) const {
        return start == other.start && end == other.end;
    }
};

struct TextEdit {
    Range range;
    std::string new_text;
};

// Edits grouped by file
using WorkspaceEdit = std::map<fs::path, std::vector<TextEdit>>;

}  // namespace zk
