#pragma once

#include <zk/note_index.hpp>
#include <zk/result.hpp>
#include <zk/types.hpp>
#include <zk/util/logger.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zk {

/**
 * Status derivation and checklist propagation.
 *
 * A note's status tag (#tag.todo / #tag.wip / #tag.done) is derived from
 * its own checklist. Checklist items that reference other notes follow the
 * referenced notes' status, and nested items follow their descendants.
 */

/**
 * Compute the edit that brings the tag line in line with the checklist.
 *
 * Replaces the status token on the tag line, or appends one when the line
 * has none. This is the single place where a note's expected tag is
 * decided.
 *
 * @param content Full note text
 * @return Whole-line edit of the tag line, or nullopt when the tag is
 *         already right, the note has no header or no checklist items
 */
std::optional<TextEdit> compute_tag_edit(std::string_view content);

/**
 * Apply compute_tag_edit to the text.
 */
std::string apply_tag_edit(const std::string& content);

/**
 * Replace whole lines according to `edits`, keeping the trailing newline
 * convention of the input. Edits beyond the last line are ignored.
 */
std::string apply_line_edits(const std::string& content, const std::vector<TextEdit>& edits);

/**
 * Whether the note at `path` is Done once its tag is reconciled.
 * Unreadable files and non-notes count as not done.
 */
bool is_effectively_done(const fs::path& path);

/**
 * Check each checklist item that references notes iff every referenced
 * note is effectively done; uncheck it otherwise.
 *
 * @param content Note text
 * @param note_dir Directory holding the referenced `<ID>.typ` files
 */
std::string update_ref_checkboxes(const std::string& content, const fs::path& note_dir);

/**
 * Derive parent checklist items from their nested items, deepest first.
 * An item with nested items is checked iff all of them are checked; leaf
 * items are left alone.
 */
std::string update_nested_checkboxes(const std::string& content);

/**
 * Normalize a note: reference checkboxes, then nested checkboxes, then
 * the tag line.
 */
std::string format_content(const std::string& content, const fs::path& note_dir);

/**
 * Edits that bring checklist items referencing `note_id` in line with its
 * new status (checked iff `tag` is Done).
 *
 * Candidate files come from the index's backlinks for `note_id`. Files that
 * cannot be read, or that have nothing to change, are left out.
 */
WorkspaceEdit propagate_tag_change(const NoteId& note_id, StatusTag tag, const NoteIndex& index);

/**
 * Write edited files back to disk and re-index them.
 *
 * @return Number of files written; failures are logged and skipped
 */
size_t apply_workspace_edit(const WorkspaceEdit& edit, NoteIndex& index, Logger& logger);

}  // namespace zk
