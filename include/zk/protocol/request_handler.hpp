#pragma once

#include <zk/config.hpp>
#include <zk/link_registry.hpp>
#include <zk/note_index.hpp>
#include <zk/protocol/json_codec.hpp>
#include <zk/result.hpp>
#include <zk/util/logger.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace zk::protocol {

// JSON-RPC error codes
constexpr int RPC_PARSE_ERROR = -32700;
constexpr int RPC_INVALID_REQUEST = -32600;
constexpr int RPC_METHOD_NOT_FOUND = -32601;
constexpr int RPC_INVALID_PARAMS = -32602;
constexpr int RPC_INTERNAL_ERROR = -32603;

/**
 * RequestHandler - Dispatches JSON-RPC requests onto the index, the link
 * registry and the request handlers.
 *
 * Messages are single JSON objects:
 *   {"jsonrpc": "2.0", "id": 1, "method": "search", "params": {"query": "x"}}
 * Requests without an "id" are notifications and get no response.
 *
 * handle() may be called from one thread at a time; the index it wraps may
 * be updated concurrently by the watcher.
 */
class RequestHandler {
public:
    RequestHandler(Config config,
                   std::shared_ptr<NoteIndex> index,
                   std::shared_ptr<LinkRegistry> registry,
                   std::shared_ptr<Logger> logger = nullptr);

    /**
     * Handle one request object.
     * @return Response object, or nullopt for notifications
     */
    std::optional<json> handle(const json& request);

    /**
     * Parse and handle one line of input.
     * @return Serialized response, or nullopt for notifications
     */
    std::optional<std::string> handle_line(const std::string& line);

    /**
     * True once a "shutdown" request has been handled.
     */
    bool shutdown_requested() const { return shutdown_requested_.load(); }

private:
    using Method = Result<json> (RequestHandler::*)(const json& params);

    Result<json> get(const json& params);
    Result<json> search(const json& params);
    Result<json> symbols(const json& params);
    Result<json> backlinks(const json& params);
    Result<json> references(const json& params);
    Result<json> update(const json& params);
    Result<json> remove(const json& params);
    Result<json> rebuild(const json& params);
    Result<json> format(const json& params);
    Result<json> tag_edit(const json& params);
    Result<json> will_save(const json& params);
    Result<json> did_save(const json& params);
    Result<json> propagate(const json& params);
    Result<json> apply_edit(const json& params);
    Result<json> diagnostics(const json& params);
    Result<json> inlay_hints(const json& params);
    Result<json> code_actions(const json& params);
    Result<json> new_note(const json& params);
    Result<json> remove_note(const json& params);
    Result<json> generate_links(const json& params);
    Result<json> shutdown(const json& params);

    // Text from params["text"], or the content of params["path"]
    Result<std::string> document_text(const json& params) const;

    Config config_;
    std::shared_ptr<NoteIndex> index_;
    std::shared_ptr<LinkRegistry> registry_;
    std::shared_ptr<Logger> logger_;
    std::map<std::string, Method> methods_;
    std::atomic<bool> shutdown_requested_{false};
};

}  // namespace zk::protocol
