#include <gtest/gtest.h>
#include <zk/protocol/request_handler.hpp>

#include "test_helpers.hpp"

using namespace zk;
using namespace zk::protocol;
using zk::test_support::make_note;
using zk::test_support::read_text;
using zk::test_support::write_text;

class RequestHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "zk_protocol_test";
        fs::remove_all(test_dir_);
        config_ = Config::from_root(test_dir_);
        fs::create_directories(config_.note_dir);

        parent_ = write_note("2401011200", make_note("2401011200", "Parent", "#tag.todo",
                                                     "- [ ] @2402021300\n"));
        child_ = write_note("2402021300", make_note("2402021300", "Child", "#tag.archived", "",
                                                    "#alternative_link(<2403031400>)"));

        index_ = std::make_shared<NoteIndex>(config_);
        registry_ = std::make_shared<LinkRegistry>(config_.link_file, config_.note_dir);
        ASSERT_TRUE(index_->rebuild_full().ok());
        handler_ = std::make_unique<RequestHandler>(config_, index_, registry_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path write_note(const std::string& id, const std::string& content) {
        fs::path path = NoteIndex::normalize_path(config_.note_dir / (id + ".typ"));
        write_text(path, content);
        return path;
    }

    json call(const std::string& method, json params = json::object()) {
        json request{{"jsonrpc", "2.0"}, {"id", ++next_id_}, {"method", method}, {"params", params}};
        auto response = handler_->handle(request);
        EXPECT_TRUE(response.has_value());
        if (!response) return json();
        EXPECT_EQ((*response)["id"], next_id_);
        return *response;
    }

    // Result of a call expected to succeed
    json result(const std::string& method, json params = json::object()) {
        json response = call(method, std::move(params));
        EXPECT_TRUE(response.contains("result")) << response.dump();
        return response.value("result", json());
    }

    int error_code(const json& response) {
        return response.at("error").at("code").get<int>();
    }

    fs::path test_dir_;
    Config config_;
    fs::path parent_;
    fs::path child_;
    std::shared_ptr<NoteIndex> index_;
    std::shared_ptr<LinkRegistry> registry_;
    std::unique_ptr<RequestHandler> handler_;
    int next_id_ = 0;
};

// ============================================================================
// Envelope
// ============================================================================

TEST_F(RequestHandlerTest, ParseErrorLine) {
    auto response = handler_->handle_line("{not json");
    ASSERT_TRUE(response.has_value());
    json parsed = json::parse(*response);
    EXPECT_EQ(error_code(parsed), RPC_PARSE_ERROR);
    EXPECT_TRUE(parsed["id"].is_null());
}

TEST_F(RequestHandlerTest, UnknownMethod) {
    EXPECT_EQ(error_code(call("frobnicate")), RPC_METHOD_NOT_FOUND);
}

TEST_F(RequestHandlerTest, InvalidParams) {
    EXPECT_EQ(error_code(call("get", {{"id", 42}})), RPC_INVALID_PARAMS);
    EXPECT_EQ(error_code(call("get", {{"id", "abc"}})), RPC_INVALID_PARAMS);
    EXPECT_EQ(error_code(call("propagate", {{"id", "2402021300"}, {"tag", "maybe"}})),
              RPC_INVALID_PARAMS);
    EXPECT_EQ(error_code(call("codeActions", {{"path", "x"}, {"diagnostics", {{{"bad", 1}}}}})),
              RPC_INVALID_PARAMS);
}

TEST_F(RequestHandlerTest, NotificationGetsNoResponse) {
    json request{{"jsonrpc", "2.0"}, {"method", "rebuild"}};
    EXPECT_FALSE(handler_->handle(request).has_value());

    EXPECT_FALSE(handler_->handle_line(R"({"method":"nope"})").has_value());
}

TEST_F(RequestHandlerTest, ShutdownSetsFlag) {
    EXPECT_FALSE(handler_->shutdown_requested());
    EXPECT_TRUE(result("shutdown").is_null());
    EXPECT_TRUE(handler_->shutdown_requested());
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(RequestHandlerTest, GetNote) {
    json note = result("get", {{"id", "2402021300"}});
    EXPECT_EQ(note["title"], "Child");
    EXPECT_EQ(note["archived"], true);
    EXPECT_EQ(note["altId"], "2403031400");
    EXPECT_TRUE(note["evoId"].is_null());
    EXPECT_EQ(note["path"], child_.string());

    EXPECT_TRUE(result("get", {{"id", "2409999999"}}).is_null());
}

TEST_F(RequestHandlerTest, SearchAndSymbols) {
    json notes = result("search", {{"query", "child"}});
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(notes[0]["id"], "2402021300");

    json symbols = result("symbols", {{"query", ""}});
    ASSERT_EQ(symbols.size(), 2u);
    EXPECT_EQ(symbols[0]["name"], "[2401011200] Parent");
}

TEST_F(RequestHandlerTest, BacklinksAndReferences) {
    json links = result("backlinks", {{"id", "2402021300"}});
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0]["path"], parent_.string());
    EXPECT_EQ(links[0]["range"]["start"]["line"], 6);
    EXPECT_EQ(links[0]["range"]["start"]["character"], 6);
    EXPECT_EQ(links[0]["range"]["end"]["character"], 17);

    json refs = result("references", {{"line", "= Child <2402021300>"}});
    EXPECT_EQ(refs, links);
}

// ============================================================================
// Index maintenance
// ============================================================================

TEST_F(RequestHandlerTest, UpdateRemoveRebuild) {
    auto extra = write_note("2405051600", make_note("2405051600", "Extra", ""));
    EXPECT_TRUE(result("update", {{"path", extra.string()}}).is_null());
    EXPECT_FALSE(result("get", {{"id", "2405051600"}}).is_null());

    EXPECT_TRUE(result("remove", {{"path", extra.string()}}).is_null());
    EXPECT_TRUE(result("get", {{"id", "2405051600"}}).is_null());

    EXPECT_EQ(result("rebuild")["count"], 3);

    json failed = call("update", {{"path", (config_.note_dir / "2409999999.typ").string()}});
    EXPECT_EQ(error_code(failed), RPC_INTERNAL_ERROR);
}

// ============================================================================
// Formatting and propagation
// ============================================================================

TEST_F(RequestHandlerTest, FormatAndTagEdit) {
    std::string text = make_note("2409999999", "Scratch", "", "- [x] done\n");

    json formatted = result("format", {{"text", text}});
    EXPECT_EQ(formatted["text"], make_note("2409999999", "Scratch", " #tag.done", "- [x] done\n"));

    json edit = result("tagEdit", {{"text", text}});
    EXPECT_EQ(edit["newText"], " #tag.done");
    EXPECT_EQ(edit["range"]["start"]["line"], 4);

    EXPECT_TRUE(result("tagEdit", {{"path", parent_.string()}}).is_null());
    EXPECT_EQ(result("willSave", {{"text", text}}).size(), 1u);
}

TEST_F(RequestHandlerTest, PropagateThenApply) {
    json edit = result("propagate", {{"id", "2402021300"}, {"tag", "done"}});
    ASSERT_TRUE(edit["changes"].contains(parent_.string()));
    EXPECT_EQ(edit["changes"][parent_.string()][0]["newText"], "- [x] @2402021300");

    json applied = result("applyEdit", {{"edit", edit}});
    EXPECT_EQ(applied["applied"], 1);
    EXPECT_NE(read_text(parent_).find("- [x] @2402021300"), std::string::npos);

    EXPECT_EQ(error_code(call("applyEdit", {{"edit", {{"changes", 3}}}})), RPC_INVALID_PARAMS);
}

TEST_F(RequestHandlerTest, DidSaveAppliesWhenAsked) {
    std::string saved = make_note("2402021300", "Child", "#tag.archived", "- [ ] a\n",
                                  "#alternative_link(<2403031400>)");
    write_text(child_, saved);

    json response = result("didSave", {{"path", child_.string()}, {"text", saved}, {"apply", true}});
    EXPECT_EQ(response["applied"], 1);
    EXPECT_TRUE(response["edit"]["changes"].contains(parent_.string()));
    EXPECT_NE(read_text(parent_).find("- [x] @2402021300"), std::string::npos);
}

// ============================================================================
// Editor features
// ============================================================================

TEST_F(RequestHandlerTest, DiagnosticsRoundTripIntoCodeActions) {
    json diags = result("diagnostics", {{"path", parent_.string()}});
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0]["severity"], 2);
    EXPECT_EQ(diags[0]["data"]["newId"], "2403031400");

    json actions = result("codeActions", {{"path", parent_.string()}, {"diagnostics", diags}});
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0]["kind"], "quickfix");
    EXPECT_EQ(actions[0]["edit"]["changes"][parent_.string()][0]["newText"], "@2403031400");
}

TEST_F(RequestHandlerTest, InlayHints) {
    json hints = result("inlayHints", {{"text", "@2401011200\n@2402021300\n"}, {"firstLine", 1}});
    ASSERT_EQ(hints.size(), 1u);
    EXPECT_EQ(hints[0]["label"], "Child");
    EXPECT_EQ(hints[0]["position"]["line"], 1);
}

// ============================================================================
// Note operations
// ============================================================================

TEST_F(RequestHandlerTest, NewRemoveAndGenerate) {
    json created = result("newNote", {{"metadata", true}});
    std::string id = created["id"].get<std::string>();
    EXPECT_TRUE(fs::exists(created["path"].get<std::string>()));
    EXPECT_FALSE(result("get", {{"id", id}}).is_null());

    json generated = result("generateLinks");
    EXPECT_EQ(generated["count"], 3);

    EXPECT_TRUE(result("removeNote", {{"id", id}}).is_null());
    EXPECT_TRUE(result("get", {{"id", id}}).is_null());
    EXPECT_EQ(read_text(config_.link_file).find(id), std::string::npos);

    EXPECT_EQ(error_code(call("removeNote", {{"id", "../x"}})), RPC_INVALID_PARAMS);
}
