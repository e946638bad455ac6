#pragma once

#include <zk/handlers/diagnostics.hpp>
#include <zk/types.hpp>

#include <string>
#include <vector>

namespace zk::handlers {

struct CodeAction {
    std::string title;
    std::string kind = "quickfix";
    std::vector<Diagnostic> diagnostics;
    WorkspaceEdit edit;
};

/**
 * Quick fixes for our own diagnostics on `file`.
 *
 * Each diagnostic with a replacement note yields "Replace @old with @new";
 * legacy diagnostics also yield "Append new insight (@old @new)".
 */
std::vector<CodeAction> get_code_actions(const fs::path& file,
                                         const std::vector<Diagnostic>& diagnostics);

}  // namespace zk::handlers
