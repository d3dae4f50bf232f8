// bloomdb_search: send one search to a server and print the candidate files.
//
//   bloomdb_search --source=DIR --files=GLOB --query=JSON [--host=H] [--port=N] [--timeout_ms=N]
//   bloomdb_search --ping [--host=H] [--port=N]
// --query takes a rule tree, e.g. {"column":"status","value":"active"}.

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "bloomdb/client/search_client.hpp"

using namespace bloomdb;

static std::optional<std::string> eat_arg(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

int main(int argc, char** argv) {
    client::ClientConfig config{};
    std::string source, pattern, query_text;
    bool ping = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);
            if (a == "--ping") ping = true;
            else if (auto v = eat_arg(a, "--host=")) config.host = *v;
            else if (auto v = eat_arg(a, "--port=")) config.port = static_cast<std::uint16_t>(std::stoul(*v));
            else if (auto v = eat_arg(a, "--timeout_ms=")) config.timeout_ms = static_cast<std::uint32_t>(std::stoul(*v));
            else if (auto v = eat_arg(a, "--source=")) source = *v;
            else if (auto v = eat_arg(a, "--files=")) pattern = *v;
            else if (auto v = eat_arg(a, "--query=")) query_text = *v;
            else {
                std::cerr << "unknown argument: " << a << "\nUsage: " << argv[0]
                          << " --source=DIR --files=GLOB --query=JSON [--host=H] [--port=N] [--timeout_ms=N] | --ping"
                          << std::endl;
                return 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "invalid argument: " << e.what() << std::endl;
        return 2;
    }

    const client::SearchClient client(config);
    if (ping) {
        if (auto ok = client.ping(); !ok) { std::cerr << core::describe(ok.error()) << std::endl; return 1; }
        std::cout << "pong" << std::endl;
        return 0;
    }
    if (pattern.empty() || query_text.empty()) {
        std::cerr << "--files and --query are required" << std::endl;
        return 2;
    }

    auto j = nlohmann::json::parse(query_text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) { std::cerr << "--query is not valid JSON" << std::endl; return 2; }
    auto rule = protocol::rule_from_json(j);
    if (!rule) { std::cerr << core::describe(rule.error()) << std::endl; return 2; }

    auto files = client.send(protocol::search_request{source, pattern, std::move(*rule)});
    if (!files) { std::cerr << core::describe(files.error()) << std::endl; return 1; }
    for (const auto& f : *files) std::cout << f << "\n";
    return 0;
}
