#include <zk/handlers/diagnostics.hpp>
#include <zk/parser.hpp>

namespace zk::handlers {

namespace {

// The `@ID` token immediately following `rest` (after whitespace), if any
std::string_view next_ref_id(std::string_view rest) {
    rest = parser::trim_start(rest);
    if (rest.empty() || rest.front() != '@') {
        return {};
    }
    rest.remove_prefix(1);
    size_t end = 0;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    return rest.substr(0, end);
}

}  // namespace

std::vector<Diagnostic> get_diagnostics(std::string_view content, const NoteIndex& index) {
    std::vector<Diagnostic> diagnostics;

    auto lines = parser::split_lines(content);
    for (size_t n = 0; n < lines.size(); ++n) {
        std::string_view line = lines[n];
        auto line_num = static_cast<uint32_t>(n);

        for (const auto& ref : parser::find_refs_in_line(line, line_num)) {
            auto info = index.get(ref.id);
            if (!info) continue;

            Range range;
            range.start = {line_num, parser::byte_to_utf16(line, ref.start_char)};
            range.end = {line_num, parser::byte_to_utf16(line, ref.end_char)};

            if (info->archived) {
                Diagnostic diag;
                diag.range = range;
                diag.severity = DiagnosticSeverity::Warning;
                diag.message = "Note @" + ref.id + " is archived.";
                if (info->alt_id) {
                    diag.message += " New version: @" + *info->alt_id;
                }
                diag.data = DiagnosticData{"archived", ref.id, info->alt_id};
                diagnostics.push_back(std::move(diag));
            } else if (info->legacy) {
                if (info->evo_id && next_ref_id(line.substr(ref.end_char)) == *info->evo_id) {
                    continue;  // Already paired with the newer note
                }

                Diagnostic diag;
                diag.range = range;
                diag.severity = DiagnosticSeverity::Information;
                diag.message = "Note @" + ref.id + " is legacy.";
                if (info->evo_id) {
                    diag.message += " Newer insights: @" + *info->evo_id;
                }
                diag.data = DiagnosticData{"legacy", ref.id, info->evo_id};
                diagnostics.push_back(std::move(diag));
            }
        }
    }

    return diagnostics;
}

}  // namespace zk::handlers
