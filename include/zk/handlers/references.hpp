#pragma once

#include <zk/note_index.hpp>
#include <zk/types.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace zk::handlers {

/**
 * The note ID a line points at: the last `<ID>` label (title lines),
 * otherwise the first `@` when exactly ten digits follow it.
 */
std::optional<NoteId> extract_id_from_line(std::string_view line);

/**
 * Backlinks of the note named on `line_text`; empty when the line names
 * no note.
 */
std::vector<BacklinkLocation> find_references(const NoteIndex& index, std::string_view line_text);

}  // namespace zk::handlers
