#include <zk/handlers/code_actions.hpp>

namespace zk::handlers {

namespace {

CodeAction make_replace_action(const fs::path& file, const Diagnostic& diag,
                               std::string title, std::string new_text) {
    CodeAction action;
    action.title = std::move(title);
    action.diagnostics.push_back(diag);
    action.edit[file].push_back(TextEdit{diag.range, std::move(new_text)});
    return action;
}

}  // namespace

std::vector<CodeAction> get_code_actions(const fs::path& file,
                                         const std::vector<Diagnostic>& diagnostics) {
    std::vector<CodeAction> actions;

    for (const auto& diag : diagnostics) {
        if (diag.source != DIAGNOSTIC_SOURCE || !diag.data || !diag.data->new_id) {
            continue;
        }
        const DiagnosticData& data = *diag.data;

        std::string old_text = "@" + data.old_id;
        std::string new_text = "@" + *data.new_id;

        actions.push_back(make_replace_action(
            file, diag, "Fix: Replace " + old_text + " with " + new_text, new_text));

        if (data.kind == "legacy") {
            std::string appended = old_text + " " + new_text;
            actions.push_back(make_replace_action(
                file, diag, "Fix: Append new insight (" + appended + ")", appended));
        }
    }

    return actions;
}

}  // namespace zk::handlers
