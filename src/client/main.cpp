#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <format>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start                         Start recording");
    std::println(stderr, "  stop [--wait]                 Stop recording (--wait: until analysed)");
    std::println(stderr, "  toggle [--wait]               Toggle recording");
    std::println(stderr, "  status                        Show workflow state and pending expenses");
    std::println(stderr, "  confirm [--index N] [edits]   Save a pending expense");
    std::println(stderr, "  confirm-all [--indices 0,2]   Save several pending expenses");
    std::println(stderr, "  cancel                        Discard pending expenses");
    std::println(stderr, "  reset                         Return to idle");
    std::println(stderr, "  history [--limit N]           Show saved expenses");
    std::println(stderr, "  search <text>                 Find expenses by text");
    std::println(stderr, "  range --from DATE --to DATE [--category C]");
    std::println(stderr, "  update <id> [edits]           Edit a saved expense");
    std::println(stderr, "  delete <id>                   Delete a saved expense");
    std::println(stderr, "Edits: --amount X --category C --title T --description D --tags a,b");
    std::println(stderr, "Dates: YYYY-MM-DD (local time)");
    std::println(stderr, "Global: --json prints raw responses");
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, sep)) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

// Local midnight of YYYY-MM-DD as Unix seconds; end_of_day moves to 23:59:59.
static std::optional<int64_t> parse_date(const std::string& s, bool end_of_day) {
    std::tm tm{};
    if (std::sscanf(s.c_str(), "%d-%d-%d", &tm.tm_year, &tm.tm_mon, &tm.tm_mday) != 3) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    tm.tm_isdst = -1;
    if (end_of_day) {
        tm.tm_hour = 23;
        tm.tm_min = 59;
        tm.tm_sec = 59;
    }
    std::time_t t = std::mktime(&tm);
    if (t == -1) return std::nullopt;
    return static_cast<int64_t>(t);
}

static std::string format_date(int64_t unix_seconds) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

static void print_expense(const json& e) {
    std::string prefix = e.contains("id") ? std::format("#{}", e["id"].get<int64_t>())
                                          : std::format("[{}]", e.value("index", 0));
    std::println("{} {}  {:>10}  {}  {}", prefix, format_date(e.value("date", int64_t{0})),
                 e.value("amount", ""), e.value("category_label", ""), e.value("title", ""));
    auto description = e.value("description", "");
    if (!description.empty()) std::println("    {}", description);
    if (e.contains("tags") && !e["tags"].empty()) {
        std::string tags;
        for (const auto& t : e["tags"]) {
            if (!tags.empty()) tags += ", ";
            tags += t.get<std::string>();
        }
        std::println("    tags: {}", tags);
    }
    if (e.contains("confidence_level")) {
        std::println("    confidence: {} ({:.2f})", e["confidence_level"].get<std::string>(),
                     e.value("confidence", 0.0));
    }
}

static void print_status(const json& r) {
    std::println("State: {}", r.value("step", "unknown"));
    if (r.contains("progress")) std::println("Progress: {}", r["progress"].get<std::string>());
    if (r.contains("audio_level")) std::println("Level: {:.2f}", r["audio_level"].get<double>());
    if (r.contains("error")) std::println("Error: {}", r["error"].get<std::string>());

    auto transcript = r.value("transcript", "");
    if (!transcript.empty()) std::println("Heard: {}", transcript);

    if (r.contains("candidates") && !r["candidates"].empty()) {
        std::println("Pending:");
        for (const auto& c : r["candidates"]) print_expense(c);
    }
    if (r.contains("capture")) {
        const auto& cap = r["capture"];
        std::println("Capture: {} ({}: {})", cap.value("state", ""), cap.value("health", ""),
                     cap.value("health_message", ""));
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    json edits = json::object();
    json cmd;
    bool wait = false;
    bool raw = false;
    int limit = 10;
    std::optional<int> index;
    std::string indices, from, to, category;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                std::println(stderr, "Missing value for {}", arg);
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--wait") {
            wait = true;
        } else if (arg == "--json") {
            raw = true;
        } else if (arg == "--limit") {
            limit = std::atoi(next().c_str());
        } else if (arg == "--index") {
            index = std::atoi(next().c_str());
        } else if (arg == "--indices") {
            indices = next();
        } else if (arg == "--from") {
            from = next();
        } else if (arg == "--to") {
            to = next();
        } else if (arg == "--amount") {
            edits["amount"] = next();
        } else if (arg == "--category") {
            category = next();
            edits["category"] = category;
        } else if (arg == "--title") {
            edits["title"] = next();
        } else if (arg == "--description") {
            edits["description"] = next();
        } else if (arg == "--tags") {
            edits["tags"] = split(next(), ',');
        } else {
            positional.push_back(arg);
        }
    }

    auto need_id = [&]() -> int64_t {
        if (positional.empty()) {
            std::println(stderr, "{} needs an expense id", command);
            std::exit(1);
        }
        return std::atoll(positional[0].c_str());
    };

    // Build command JSON
    if (command == "start" || command == "cancel" || command == "reset" || command == "status") {
        cmd = {{"cmd", command}};
    } else if (command == "stop" || command == "toggle") {
        cmd = {{"cmd", command}, {"wait", wait}};
    } else if (command == "confirm") {
        cmd = {{"cmd", "confirm"}, {"index", index.value_or(0)}};
        if (!edits.empty()) cmd["edits"] = edits;
    } else if (command == "confirm-all") {
        cmd = {{"cmd", "confirm_multiple"}};
        if (!indices.empty()) {
            json list = json::array();
            for (const auto& s : split(indices, ',')) list.push_back(std::atoi(s.c_str()));
            cmd["indices"] = list;
        }
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "search") {
        if (positional.empty()) {
            std::println(stderr, "search needs a query");
            return 1;
        }
        cmd = {{"cmd", "search"}, {"query", positional[0]}};
    } else if (command == "range") {
        auto f = parse_date(from, false);
        auto t = parse_date(to, true);
        if (!f || !t) {
            std::println(stderr, "range needs --from and --to as YYYY-MM-DD");
            return 1;
        }
        cmd = {{"cmd", "range"}, {"from", *f}, {"to", *t}};
        if (!category.empty()) cmd["category"] = category;
    } else if (command == "update") {
        cmd = {{"cmd", "update"}, {"id", need_id()}, {"fields", edits}};
    } else if (command == "delete") {
        cmd = {{"cmd", "delete"}, {"id", need_id()}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is voice-ledgerd running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    // Analysis may retry with backoff; allow for it when waiting.
    json response;
    if (!client.recv(response, wait ? 180000 : 30000)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    // Display response
    if (raw) {
        std::println("{}", response.dump(2));
        return response.value("status", "") == "error" ? 1 : 0;
    }

    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (response.contains("entries")) {
        if (response["entries"].empty()) std::println("No expenses");
        for (const auto& e : response["entries"]) print_expense(e);
    } else if (response.contains("step") && response.contains("candidates")) {
        print_status(response);
    } else if (response.contains("id")) {
        std::println("Saved expense #{}", response["id"].get<int64_t>());
    } else if (response.contains("ids")) {
        for (const auto& id : response["ids"]) std::println("Saved expense #{}", id.get<int64_t>());
    } else if (response.contains("expense")) {
        print_expense(response["expense"]);
    } else if (response.contains("step")) {
        std::println("State: {}", response["step"].get<std::string>());
    } else {
        std::println("OK");
    }

    return 0;
}
