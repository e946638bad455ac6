#include <zk/protocol/json_codec.hpp>

namespace zk {

void to_json(json& j, const Position& p) {
    j = json{{"line", p.line}, {"character", p.character}};
}

void from_json(const json& j, Position& p) {
    j.at("line").get_to(p.line);
    j.at("character").get_to(p.character);
}

void to_json(json& j, const Range& r) {
    j = json{{"start", r.start}, {"end", r.end}};
}

void from_json(const json& j, Range& r) {
    j.at("start").get_to(r.start);
    j.at("end").get_to(r.end);
}

void to_json(json& j, const TextEdit& e) {
    j = json{{"range", e.range}, {"newText", e.new_text}};
}

void from_json(const json& j, TextEdit& e) {
    j.at("range").get_to(e.range);
    j.at("newText").get_to(e.new_text);
}

void to_json(json& j, const NoteInfo& n) {
    j = json{
        {"id", n.id},
        {"title", n.title},
        {"archived", n.archived},
        {"legacy", n.legacy},
        {"aliases", n.aliases},
        {"keywords", n.keywords},
        {"path", n.path.string()}
    };
    j["altId"] = n.alt_id ? json(*n.alt_id) : json(nullptr);
    j["evoId"] = n.evo_id ? json(*n.evo_id) : json(nullptr);
    j["abstract"] = n.abstract_text ? json(*n.abstract_text) : json(nullptr);
}

void to_json(json& j, const BacklinkLocation& loc) {
    Range range;
    range.start = {loc.line, loc.start_char};
    range.end = {loc.line, loc.end_char};
    j = json{{"path", loc.file.string()}, {"range", range}};
}

std::optional<StatusTag> status_tag_from_name(const std::string& name) {
    if (name == "done") return StatusTag::Done;
    if (name == "wip") return StatusTag::Wip;
    if (name == "todo") return StatusTag::Todo;
    return std::nullopt;
}

}  // namespace zk

namespace zk::handlers {

void to_json(json& j, const Diagnostic& d) {
    j = json{
        {"range", d.range},
        {"severity", static_cast<int>(d.severity)},
        {"source", d.source},
        {"message", d.message}
    };
    if (d.data) {
        json data{{"kind", d.data->kind}, {"oldId", d.data->old_id}};
        data["newId"] = d.data->new_id ? json(*d.data->new_id) : json(nullptr);
        j["data"] = std::move(data);
    }
}

void from_json(const json& j, Diagnostic& d) {
    j.at("range").get_to(d.range);
    d.severity = static_cast<DiagnosticSeverity>(j.value("severity", 1));
    d.source = j.value("source", std::string());
    d.message = j.value("message", std::string());
    d.data.reset();

    auto data = j.find("data");
    if (data != j.end() && data->is_object()) {
        DiagnosticData parsed;
        data->at("kind").get_to(parsed.kind);
        data->at("oldId").get_to(parsed.old_id);
        auto new_id = data->find("newId");
        if (new_id != data->end() && new_id->is_string()) {
            parsed.new_id = new_id->get<std::string>();
        }
        d.data = std::move(parsed);
    }
}

void to_json(json& j, const CodeAction& a) {
    j = json{
        {"title", a.title},
        {"kind", a.kind},
        {"diagnostics", a.diagnostics},
        {"edit", protocol::encode_workspace_edit(a.edit)}
    };
}

void to_json(json& j, const InlayHint& h) {
    j = json{{"position", h.position}, {"label", h.label}, {"paddingLeft", h.padding_left}};
}

void to_json(json& j, const SymbolInfo& s) {
    j = json{{"name", s.name}, {"id", s.id}, {"path", s.path.string()}};
}

}  // namespace zk::handlers

namespace zk::protocol {

json encode_workspace_edit(const WorkspaceEdit& edit) {
    json changes = json::object();
    for (const auto& [path, edits] : edit) {
        changes[path.string()] = edits;
    }
    return json{{"changes", std::move(changes)}};
}

Result<WorkspaceEdit> decode_workspace_edit(const json& j) {
    auto changes = j.find("changes");
    if (!j.is_object() || changes == j.end() || !changes->is_object()) {
        return Error(ErrorCode::PARSE_ERROR, "workspace edit needs a \"changes\" object");
    }

    WorkspaceEdit edit;
    try {
        for (auto it = changes->begin(); it != changes->end(); ++it) {
            edit[fs::path(it.key())] = it.value().get<std::vector<TextEdit>>();
        }
    } catch (const json::exception& e) {
        return Error(ErrorCode::PARSE_ERROR, std::string("malformed text edit: ") + e.what());
    }
    return edit;
}

}  // namespace zk::protocol
