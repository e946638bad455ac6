#include "search_command.hpp"

#include <zk/protocol/json_codec.hpp>

#include <algorithm>
#include <iomanip>

namespace zk::cli {

void SearchCommand::setup(CLI::App& app) {
    app.add_option("query", query_, "Search query")
        ->required()
        ->type_name("<query>");

    app.add_flag("--json", json_, "Print results as JSON");

    app.add_option("-n,--max", max_results_, "Maximum results (default: 20)")
        ->type_name("<num>");
}

int SearchCommand::execute(CommandContext& ctx) {
    auto index = load_index(ctx);
    if (!index) {
        return ZK_EXIT_IO_ERROR;
    }

    auto results = index->search(query_);
    std::sort(results.begin(), results.end(),
              [](const NoteInfo& a, const NoteInfo& b) { return a.id < b.id; });
    if (results.size() > max_results_) {
        results.resize(max_results_);
    }

    if (json_) {
        std::cout << json(results).dump(2) << "\n";
        return ZK_EXIT_SUCCESS;
    }

    if (results.empty()) {
        std::cout << "No matches found for: " << query_ << "\n";
        return ZK_EXIT_SUCCESS;
    }

    print_results(results);
    return ZK_EXIT_SUCCESS;
}

void SearchCommand::print_results(const std::vector<NoteInfo>& notes) {
    std::cout << "Search results for: " << query_ << "\n";
    std::cout << std::string(70, '-') << "\n";
    std::cout << std::left
              << std::setw(12) << "ID"
              << std::setw(48) << "TITLE"
              << "STATE\n";
    std::cout << std::string(70, '-') << "\n";

    for (const auto& n : notes) {
        const char* state = n.archived ? "archived" : (n.legacy ? "legacy" : "");
        std::cout << std::left
                  << std::setw(12) << n.id
                  << std::setw(48) << truncate(n.title, 47)
                  << state << "\n";
    }

    std::cout << "\n" << notes.size() << " result(s)\n";
}

}  // namespace zk::cli
