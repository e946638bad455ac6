#pragma once

#include <zk/note_index.hpp>
#include <zk/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zk::handlers {

constexpr const char* DIAGNOSTIC_SOURCE = "zk";

enum class DiagnosticSeverity {
    Error = 1,
    Warning = 2,
    Information = 3,
    Hint = 4
};

/**
 * Payload attached to a diagnostic so a quick fix can be built later.
 */
struct DiagnosticData {
    std::string kind;               // "archived" | "legacy"
    NoteId old_id;
    std::optional<NoteId> new_id;   // Alternative or evolution note
};

struct Diagnostic {
    Range range;
    DiagnosticSeverity severity = DiagnosticSeverity::Warning;
    std::string source = DIAGNOSTIC_SOURCE;
    std::string message;
    std::optional<DiagnosticData> data;
};

/**
 * Diagnose references to archived and legacy notes.
 *
 * - Archived target: warning, pointing at the alternative note if any.
 * - Legacy target: information, pointing at the evolution note if any.
 *   Not reported when the reference is already followed by `@<evolution>`.
 *
 * References to unknown notes are not reported.
 */
std::vector<Diagnostic> get_diagnostics(std::string_view content, const NoteIndex& index);

}  // namespace zk::handlers
