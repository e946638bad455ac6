#pragma once

#include <zk/note_index.hpp>
#include <zk/types.hpp>
#include <zk/util/logger.hpp>

#include <string_view>
#include <vector>

namespace zk::handlers {

/**
 * Edits to apply to a document that is about to be saved: the tag line
 * fix, if any.
 */
std::vector<TextEdit> on_will_save(std::string_view text);

/**
 * Handle a saved note.
 *
 * Re-indexes `path`, then, when the saved text's status is Done or Wip,
 * returns the edits that update checklist items referencing the note in
 * other files. The edits are not applied.
 *
 * @param path Saved file
 * @param text Saved content
 * @param index Index to refresh
 * @param logger Receives re-index failures
 */
WorkspaceEdit on_save(const fs::path& path, std::string_view text,
                      NoteIndex& index, Logger& logger);

}  // namespace zk::handlers
