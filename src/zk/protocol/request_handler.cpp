#include <zk/protocol/request_handler.hpp>

#include <zk/formatting.hpp>
#include <zk/handlers/code_actions.hpp>
#include <zk/handlers/diagnostics.hpp>
#include <zk/handlers/inlay_hints.hpp>
#include <zk/handlers/references.hpp>
#include <zk/handlers/save.hpp>
#include <zk/handlers/symbols.hpp>
#include <zk/note_ops.hpp>
#include <zk/parser.hpp>
#include <zk/util/file_io.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>

namespace zk::protocol {

namespace {

json make_response(const json& id, json result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json make_error(const json& id, int code, const std::string& message) {
    return json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

int rpc_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::PARSE_ERROR:
            return RPC_INVALID_PARAMS;
        default:
            return RPC_INTERNAL_ERROR;
    }
}

Result<std::string> string_param(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        return Error(ErrorCode::INVALID_ARGUMENT, std::string("missing string param \"") + key + "\"");
    }
    return it->get<std::string>();
}

Result<NoteId> id_param(const json& params) {
    auto id = string_param(params, "id");
    if (!id.ok()) {
        return id.error();
    }
    if (!parser::is_note_id(id.value())) {
        return Error(ErrorCode::INVALID_ARGUMENT, "not a note id: " + id.value());
    }
    return std::move(id).value();
}

uint32_t line_param(const json& params, const char* key, uint32_t fallback) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_number_integer() || it->get<int64_t>() < 0) {
        return fallback;
    }
    return static_cast<uint32_t>(std::min<int64_t>(it->get<int64_t>(), std::numeric_limits<uint32_t>::max()));
}

}  // namespace

RequestHandler::RequestHandler(Config config,
                               std::shared_ptr<NoteIndex> index,
                               std::shared_ptr<LinkRegistry> registry,
                               std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , index_(std::move(index))
    , registry_(std::move(registry))
    , logger_(or_null_logger(std::move(logger)))
{
    methods_ = {
        {"get", &RequestHandler::get},
        {"search", &RequestHandler::search},
        {"symbols", &RequestHandler::symbols},
        {"backlinks", &RequestHandler::backlinks},
        {"references", &RequestHandler::references},
        {"update", &RequestHandler::update},
        {"remove", &RequestHandler::remove},
        {"rebuild", &RequestHandler::rebuild},
        {"format", &RequestHandler::format},
        {"tagEdit", &RequestHandler::tag_edit},
        {"willSave", &RequestHandler::will_save},
        {"didSave", &RequestHandler::did_save},
        {"propagate", &RequestHandler::propagate},
        {"applyEdit", &RequestHandler::apply_edit},
        {"diagnostics", &RequestHandler::diagnostics},
        {"inlayHints", &RequestHandler::inlay_hints},
        {"codeActions", &RequestHandler::code_actions},
        {"newNote", &RequestHandler::new_note},
        {"removeNote", &RequestHandler::remove_note},
        {"generateLinks", &RequestHandler::generate_links},
        {"shutdown", &RequestHandler::shutdown},
    };
}

std::optional<std::string> RequestHandler::handle_line(const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        logger_->warning(std::string("unparseable request: ") + e.what());
        return make_error(nullptr, RPC_PARSE_ERROR, "Parse error").dump();
    }

    auto response = handle(request);
    if (!response) {
        return std::nullopt;
    }
    return response->dump();
}

std::optional<json> RequestHandler::handle(const json& request) {
    if (!request.is_object()) {
        return make_error(nullptr, RPC_INVALID_REQUEST, "Request must be an object");
    }

    bool is_notification = !request.contains("id");
    json id = is_notification ? json(nullptr) : request["id"];

    auto method_it = request.find("method");
    if (method_it == request.end() || !method_it->is_string()) {
        return make_error(id, RPC_INVALID_REQUEST, "Missing method");
    }
    std::string method = method_it->get<std::string>();

    auto handler = methods_.find(method);
    if (handler == methods_.end()) {
        logger_->debug("unknown method: " + method);
        if (is_notification) return std::nullopt;
        return make_error(id, RPC_METHOD_NOT_FOUND, "Method not found: " + method);
    }

    json params = request.value("params", json::object());
    if (!params.is_object()) {
        if (is_notification) return std::nullopt;
        return make_error(id, RPC_INVALID_PARAMS, "params must be an object");
    }

    logger_->debug("request: " + method);

    Result<json> result = Error(ErrorCode::INTERNAL_ERROR);
    try {
        result = (this->*(handler->second))(params);
    } catch (const json::exception& e) {
        result = Error(ErrorCode::INVALID_ARGUMENT, e.what());
    }

    if (!result.ok()) {
        logger_->warning(method + " failed: " + result.error().to_string());
        if (is_notification) return std::nullopt;
        return make_error(id, rpc_code_for(result.error().code()), result.error().to_string());
    }

    if (is_notification) return std::nullopt;
    return make_response(id, std::move(result).value());
}

// ============================================================================
// Index queries
// ============================================================================

Result<json> RequestHandler::get(const json& params) {
    auto id = id_param(params);
    if (!id.ok()) return id.error();

    auto info = index_->get(id.value());
    if (!info) return json(nullptr);
    return json(*info);
}

Result<json> RequestHandler::search(const json& params) {
    auto query = string_param(params, "query");
    if (!query.ok()) return query.error();
    return json(index_->search(query.value()));
}

Result<json> RequestHandler::symbols(const json& params) {
    auto query = string_param(params, "query");
    if (!query.ok()) return query.error();
    return json(handlers::workspace_symbols(*index_, query.value()));
}

Result<json> RequestHandler::backlinks(const json& params) {
    auto id = id_param(params);
    if (!id.ok()) return id.error();
    return json(index_->get_backlinks(id.value()));
}

Result<json> RequestHandler::references(const json& params) {
    auto line = string_param(params, "line");
    if (!line.ok()) return line.error();
    return json(handlers::find_references(*index_, line.value()));
}

// ============================================================================
// Index maintenance
// ============================================================================

Result<json> RequestHandler::update(const json& params) {
    auto path = string_param(params, "path");
    if (!path.ok()) return path.error();

    auto result = index_->update_file(path.value());
    if (!result.ok()) return result.error();
    return json(nullptr);
}

Result<json> RequestHandler::remove(const json& params) {
    auto path = string_param(params, "path");
    if (!path.ok()) return path.error();

    index_->remove_by_path(path.value());
    return json(nullptr);
}

Result<json> RequestHandler::rebuild(const json&) {
    auto count = index_->rebuild_full();
    if (!count.ok()) return count.error();
    return json{{"count", count.value()}};
}

// ============================================================================
// Formatting and status
// ============================================================================

Result<json> RequestHandler::format(const json& params) {
    auto text = document_text(params);
    if (!text.ok()) return text.error();
    return json{{"text", format_content(text.value(), config_.note_dir)}};
}

Result<json> RequestHandler::tag_edit(const json& params) {
    auto text = document_text(params);
    if (!text.ok()) return text.error();

    auto edit = compute_tag_edit(text.value());
    if (!edit) return json(nullptr);
    return json(*edit);
}

Result<json> RequestHandler::will_save(const json& params) {
    auto text = document_text(params);
    if (!text.ok()) return text.error();
    return json(handlers::on_will_save(text.value()));
}

Result<json> RequestHandler::did_save(const json& params) {
    auto path = string_param(params, "path");
    if (!path.ok()) return path.error();
    auto text = document_text(params);
    if (!text.ok()) return text.error();

    WorkspaceEdit edit = handlers::on_save(path.value(), text.value(), *index_, *logger_);

    size_t applied = 0;
    if (params.value("apply", false)) {
        applied = apply_workspace_edit(edit, *index_, *logger_);
    }
    return json{{"edit", encode_workspace_edit(edit)}, {"applied", applied}};
}

Result<json> RequestHandler::propagate(const json& params) {
    auto id = id_param(params);
    if (!id.ok()) return id.error();
    auto tag_name = string_param(params, "tag");
    if (!tag_name.ok()) return tag_name.error();

    auto tag = status_tag_from_name(tag_name.value());
    if (!tag) {
        return Error(ErrorCode::INVALID_ARGUMENT, "unknown tag: " + tag_name.value());
    }
    return encode_workspace_edit(propagate_tag_change(id.value(), *tag, *index_));
}

Result<json> RequestHandler::apply_edit(const json& params) {
    auto edit_it = params.find("edit");
    if (edit_it == params.end()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "missing param \"edit\"");
    }
    auto edit = decode_workspace_edit(*edit_it);
    if (!edit.ok()) return edit.error();

    size_t applied = apply_workspace_edit(edit.value(), *index_, *logger_);
    return json{{"applied", applied}};
}

// ============================================================================
// Editor features
// ============================================================================

Result<json> RequestHandler::diagnostics(const json& params) {
    auto text = document_text(params);
    if (!text.ok()) return text.error();
    return json(handlers::get_diagnostics(text.value(), *index_));
}

Result<json> RequestHandler::inlay_hints(const json& params) {
    auto text = document_text(params);
    if (!text.ok()) return text.error();

    uint32_t first = line_param(params, "firstLine", 0);
    uint32_t last = line_param(params, "lastLine", std::numeric_limits<uint32_t>::max());
    return json(handlers::get_inlay_hints(text.value(), first, last, *index_));
}

Result<json> RequestHandler::code_actions(const json& params) {
    auto path = string_param(params, "path");
    if (!path.ok()) return path.error();

    auto diags = params.value("diagnostics", json::array())
                       .get<std::vector<handlers::Diagnostic>>();
    return json(handlers::get_code_actions(path.value(), diags));
}

// ============================================================================
// Note operations
// ============================================================================

Result<json> RequestHandler::new_note(const json& params) {
    auto path = create_note(config_, *registry_, params.value("metadata", false));
    if (!path.ok()) return path.error();

    auto indexed = index_->update_file(path.value());
    if (!indexed.ok()) {
        logger_->warning("new note not indexed: " + indexed.error().to_string());
    }
    return json{{"path", path.value().string()}, {"id", path.value().stem().string()}};
}

Result<json> RequestHandler::remove_note(const json& params) {
    auto id = string_param(params, "id");
    if (!id.ok()) return id.error();

    auto result = delete_note(id.value(), config_, *registry_);
    if (!result.ok()) return result.error();

    index_->remove_by_path(config_.note_dir / (id.value() + NOTE_EXTENSION));
    return json(nullptr);
}

Result<json> RequestHandler::generate_links(const json&) {
    auto count = registry_->generate();
    if (!count.ok()) return count.error();
    return json{{"count", count.value()}};
}

Result<json> RequestHandler::shutdown(const json&) {
    shutdown_requested_ = true;
    logger_->info("shutdown requested");
    return json(nullptr);
}

// ============================================================================
// Private helpers
// ============================================================================

Result<std::string> RequestHandler::document_text(const json& params) const {
    auto text = params.find("text");
    if (text != params.end() && text->is_string()) {
        return text->get<std::string>();
    }

    auto path = string_param(params, "path");
    if (!path.ok()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "need \"text\" or \"path\"");
    }
    return read_file(path.value());
}

}  // namespace zk::protocol
