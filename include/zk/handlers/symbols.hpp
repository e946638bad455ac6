#pragma once

#include <zk/note_index.hpp>
#include <zk/types.hpp>

#include <string>
#include <vector>

namespace zk::handlers {

struct SymbolInfo {
    std::string name;   // "[ID] Title"
    NoteId id;
    fs::path path;
};

/**
 * Workspace symbols for notes matching `query` (see NoteIndex::search),
 * sorted by ID.
 */
std::vector<SymbolInfo> workspace_symbols(const NoteIndex& index, const std::string& query);

}  // namespace zk::handlers
