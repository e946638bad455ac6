#include <zk/handlers/symbols.hpp>

#include <algorithm>

namespace zk::handlers {

std::vector<SymbolInfo> workspace_symbols(const NoteIndex& index, const std::string& query) {
    std::vector<SymbolInfo> symbols;
    for (auto& note : index.search(query)) {
        SymbolInfo symbol;
        symbol.name = "[" + note.id + "] " + note.title;
        symbol.id = std::move(note.id);
        symbol.path = std::move(note.path);
        symbols.push_back(std::move(symbol));
    }

    std::sort(symbols.begin(), symbols.end(),
              [](const SymbolInfo& a, const SymbolInfo& b) { return a.id < b.id; });
    return symbols;
}

}  // namespace zk::handlers
