#include "core/config.hpp"
#include "core/logger.hpp"
#include "server/http_server.hpp"
#include "server/json_convert.hpp"
#include "server/request_router.hpp"
#include "storage/error.hpp"
#include "storage/store_config.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace tabula;

namespace {

std::atomic<server::HttpServer*> g_server{nullptr};

void on_signal(int) {
    if (auto* srv = g_server.load()) {
        srv->stop();
    }
}

struct Args {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::set<std::string> flags;

    std::string get(const std::string& name, const std::string& fallback = "") const {
        auto it = options.find(name);
        return it == options.end() ? fallback : it->second;
    }
    bool has(const std::string& name) const { return options.count(name) > 0; }
};

const std::set<std::string> kFlagOptions = {"encrypted", "verbose"};

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            args.positional.push_back(arg);
            continue;
        }

        std::string name = arg.substr(2);
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            args.options[name.substr(0, eq)] = name.substr(eq + 1);
        } else if (kFlagOptions.count(name) > 0) {
            args.flags.insert(name);
        } else if (i + 1 < argc) {
            args.options[name] = argv[++i];
        } else {
            throw std::invalid_argument("missing value for --" + name);
        }
    }
    return args;
}

void print_usage() {
    std::cout <<
        "Usage: tabula <command> [options]\n"
        "\n"
        "Commands:\n"
        "  serve [--host H] [--port N] [--data-dir D] [--encrypted]\n"
        "  demo [--data-dir D]\n"
        "  keygen\n"
        "  db insert --table T --data JSON\n"
        "  db find   --table T [--id ID] [--query JSON]\n"
        "  db update --table T --id ID --data JSON\n"
        "  db delete --table T --id ID\n"
        "  db tables\n"
        "\n"
        "Environment: TABULA_DATA_DIR, TABULA_ENCRYPTION_KEY (64 hex chars),\n"
        "             TABULA_MAX_FILE_SIZE, TABULA_LOG_LEVEL\n";
}

storage::StoreConfig store_config_from(const Args& args) {
    storage::StoreConfig config = storage::load_store_config();
    if (args.has("data-dir")) {
        config.data_dir = args.get("data-dir");
    }
    return config;
}

int run_serve(const Args& args) {
    storage::StoreConfig config = store_config_from(args);
    if (args.flags.count("encrypted") > 0 && !config.encryption_key) {
        auto key = storage::Crypto::generate_key();
        std::cout << "Generated encryption key (keep it safe): "
                  << storage::Crypto::key_to_hex(key) << "\n";
        config.encryption_key = key;
    }

    server::HttpServerConfig http;
    http.host = args.get("host", http.host);
    if (args.has("port")) {
        auto port = core::config::parse_u64(args.get("port"));
        if (!port || *port > 65535) {
            std::cerr << "Invalid port: " << args.get("port") << "\n";
            return 2;
        }
        http.port = static_cast<uint16_t>(*port);
    }

    storage::Store store(config);
    server::RequestRouter router(store);
    server::HttpServer srv(router, http);
    if (!srv.start()) {
        return 1;
    }

    g_server = &srv;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    srv.run();

    g_server = nullptr;
    store.close();
    return 0;
}

int run_demo(const Args& args) {
    storage::StoreConfig config = store_config_from(args);
    if (!args.has("data-dir")) {
        config.data_dir = "./demo_data";
    }
    if (!config.encryption_key) {
        // Reused on later runs so the demo directory stays readable
        auto key_file = config.data_dir / "demo.key";
        config.encryption_key = storage::load_or_create_key_file(key_file);
        std::cout << "Demo encryption key (" << key_file.string() << "): "
                  << storage::Crypto::key_to_hex(*config.encryption_key) << "\n";
    }

    storage::with_store(config, [](storage::Store& store) {
        store.insert("users", storage::Fields{{"name", "Alice"}, {"age", 25},
                                           {"email", "alice@example.com"}, {"active", true}});
        store.insert("users", storage::Fields{{"name", "Bob"}, {"age", 30},
                                           {"email", "bob@example.com"}, {"active", false}});
        store.insert("users", storage::Fields{{"name", "Carol"}, {"age", 28},
                                           {"email", "carol@example.com"}, {"active", true}});

        store.insert("products", storage::Fields{{"name", "Laptop"}, {"price", 5999.99},
                                              {"category", "electronics"}, {"in_stock", true}});
        store.insert("products", storage::Fields{{"name", "Phone"}, {"price", 2999.50},
                                              {"category", "electronics"}, {"in_stock", true}});
        store.insert("products", storage::Fields{{"name", "Coffee maker"}, {"price", 899.0},
                                              {"category", "appliances"}, {"in_stock", false}});

        store.insert("orders", storage::Fields{{"user_name", "Alice"}, {"product_name", "Laptop"},
                                            {"quantity", 1}, {"total", 5999.99},
                                            {"status", "paid"},
                                            {"tags", storage::Value::Array{"priority", "gift"}}});

        std::cout << "Demo store created with tables:\n";
        for (const auto& name : store.list_tables()) {
            std::cout << "  - " << name << ": " << store.count(name) << " records\n";
            auto records = store.find_all(name);
            for (size_t i = 0; i < records.size() && i < 3; ++i) {
                std::cout << "      " << server::record_to_json(records[i]).dump() << "\n";
            }
        }
    });
    return 0;
}

int run_db(const Args& args) {
    if (args.positional.size() < 2) {
        print_usage();
        return 2;
    }

    json request;
    request["op"] = args.positional[1];
    if (args.has("table")) request["table"] = args.get("table");
    if (args.has("id")) request["id"] = args.get("id");
    if (args.has("data")) request["data"] = json::parse(args.get("data"));
    if (args.has("query")) request["query"] = json::parse(args.get("query"));

    json response = storage::with_store(store_config_from(args), [&request](storage::Store& store) {
        server::RequestRouter router(store, false);
        return router.handle(request);
    });

    std::cout << response.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    return response.value("success", false) ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    core::init_logger();
    core::config::load_dotenv();

    std::string level = core::config::get_env("TABULA_LOG_LEVEL");
    if (!level.empty()) {
        if (auto parsed = core::log_level_from_string(level)) {
            core::set_log_level(*parsed);
        } else {
            spdlog::warn("Ignoring unknown TABULA_LOG_LEVEL '{}'", level);
        }
    }

    try {
        Args args = parse_args(argc, argv);
        if (args.flags.count("verbose") > 0) {
            core::set_log_level(spdlog::level::debug);
        }
        if (args.positional.empty()) {
            print_usage();
            return 2;
        }

        const std::string& command = args.positional[0];
        if (command == "serve") return run_serve(args);
        if (command == "demo") return run_demo(args);
        if (command == "db") return run_db(args);
        if (command == "keygen") {
            std::cout << storage::Crypto::key_to_hex(storage::Crypto::generate_key()) << "\n";
            return 0;
        }

        print_usage();
        return 2;
    } catch (const storage::StoreError& e) {
        spdlog::error("{} error: {}", storage::error_code_to_string(e.code()), e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
