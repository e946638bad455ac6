#pragma once

#include <zk/note_index.hpp>
#include <zk/types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace zk::handlers {

struct InlayHint {
    Position position;
    std::string label;
    bool padding_left = true;
};

/**
 * Title hints after each reference to a known note.
 *
 * @param content Document text
 * @param first_line First line to scan (inclusive)
 * @param last_line Last line to scan (inclusive)
 * @param index Note index for title lookup
 */
std::vector<InlayHint> get_inlay_hints(std::string_view content,
                                       uint32_t first_line,
                                       uint32_t last_line,
                                       const NoteIndex& index);

}  // namespace zk::handlers
