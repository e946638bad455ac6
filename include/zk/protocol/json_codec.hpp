#pragma once

#include <zk/handlers/code_actions.hpp>
#include <zk/handlers/diagnostics.hpp>
#include <zk/handlers/inlay_hints.hpp>
#include <zk/handlers/symbols.hpp>
#include <zk/result.hpp>
#include <zk/types.hpp>

#include <nlohmann/json.hpp>

#include <optional>

// JSON encoding of the values exchanged over the request transport.
// Field names follow the editor protocol (camelCase, 0-based positions).

namespace zk {

using json = nlohmann::json;

void to_json(json& j, const Position& p);
void from_json(const json& j, Position& p);

void to_json(json& j, const Range& r);
void from_json(const json& j, Range& r);

void to_json(json& j, const TextEdit& e);
void from_json(const json& j, TextEdit& e);

void to_json(json& j, const NoteInfo& n);
void to_json(json& j, const BacklinkLocation& loc);

// "done" | "wip" | "todo"
std::optional<StatusTag> status_tag_from_name(const std::string& name);

}  // namespace zk

namespace zk::handlers {

void to_json(json& j, const Diagnostic& d);
void from_json(const json& j, Diagnostic& d);

void to_json(json& j, const CodeAction& a);
void to_json(json& j, const InlayHint& h);
void to_json(json& j, const SymbolInfo& s);

}  // namespace zk::handlers

namespace zk::protocol {

/**
 * {"changes": {"<path>": [TextEdit, ...]}}
 */
json encode_workspace_edit(const WorkspaceEdit& edit);

/**
 * Inverse of encode_workspace_edit.
 * @return PARSE_ERROR if the value does not have that shape
 */
Result<WorkspaceEdit> decode_workspace_edit(const json& j);

}  // namespace zk::protocol
