#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mirrorsync/crypto.hpp"
#include "mirrorsync/server/catalog.hpp"
#include "mirrorsync/server/config.hpp"
#include "mirrorsync/server/connection_logger.hpp"
#include "mirrorsync/server/session.hpp"
#include "mirrorsync/server/session_manager.hpp"
#include "mirrorsync/server/timeout_supervisor.hpp"

using namespace mirrorsync;
using namespace mirrorsync::server;
using namespace std::chrono_literals;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    ServerConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "mirrorsync_server");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool parse_fails(std::vector<std::string> args)
    {
        try
        {
            (void)parse(std::move(args));
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    template <typename Predicate>
    bool wait_until(Predicate predicate, std::chrono::milliseconds limit = 2s)
    {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return predicate();
    }

    void test_catalog_basic()
    {
        FileCatalog catalog;
        assert(catalog.empty());
        assert(catalog.insert("mods/b.jar", "hash-b"));
        assert(catalog.insert("mods/a.jar", "hash-a"));
        assert(!catalog.insert("mods/b.jar", "other"));
        assert(catalog.size() == 2);

        assert(catalog.find("mods/b.jar") == "hash-b");
        assert(!catalog.find("mods/c.jar").has_value());
        assert(catalog.contains("mods/a.jar"));
        assert(!catalog.contains("mods"));

        // Insertion order, not key order.
        auto it = catalog.begin();
        assert(it->path == "mods/b.jar");
        ++it;
        assert(it->path == "mods/a.jar");
        ++it;
        assert(it == catalog.end());
    }

    void test_build_catalog()
    {
        const auto root = std::filesystem::temp_directory_path() / "mirrorsync_catalog_test";
        cleanup_path(root);
        write_file(root / "mods" / "z.jar", "zzz");
        write_file(root / "mods" / "sub" / "b.txt", "bbb");
        write_file(root / "config" / "c.cfg", "ccc");
        write_file(root / "unmanaged" / "x.bin", "xxx");

        const auto catalog = build_catalog(root, {"mods", "config", "missing", "mods/sub"});
        assert(catalog.size() == 3);

        std::vector<std::string> paths;
        for (const auto &entry : catalog)
        {
            paths.push_back(entry.path);
        }
        const std::vector<std::string> expected = {"mods/sub/b.txt", "mods/z.jar", "config/c.cfg"};
        assert(paths == expected);

        assert(catalog.find("mods/z.jar") == crypto::hash_file(root / "mods" / "z.jar"));
        assert(catalog.find("config/c.cfg") == crypto::hash_file(root / "config" / "c.cfg"));
        assert(!catalog.contains("unmanaged/x.bin"));

        assert(build_catalog(root, {}).empty());
        cleanup_path(root);
    }

    void test_timeout_supervisor()
    {
        asio::io_context scheduler;
        auto guard = asio::make_work_guard(scheduler);
        std::thread runner([&scheduler]
                           { scheduler.run(); });

        {
            std::atomic<int> fired{0};
            TimeoutSupervisor timeout(scheduler, [&fired]
                                      { ++fired; });
            assert(!timeout.expired());
            timeout.set(20ms);
            assert(wait_until([&fired]
                              { return fired.load() == 1; }));
            assert(timeout.expired());
            std::this_thread::sleep_for(50ms);
            assert(fired.load() == 1);
        }

        {
            std::atomic<int> fired{0};
            TimeoutSupervisor timeout(scheduler, [&fired]
                                      { ++fired; });
            timeout.set(40ms);
            timeout.clear();
            std::this_thread::sleep_for(150ms);
            assert(fired.load() == 0);
            assert(!timeout.expired());
        }

        {
            std::atomic<int> fired{0};
            TimeoutSupervisor timeout(scheduler, [&fired]
                                      { ++fired; });
            timeout.set(30ms);
            timeout.set(400ms);
            std::this_thread::sleep_for(150ms);
            assert(fired.load() == 0);
            assert(wait_until([&fired]
                              { return fired.load() == 1; }));
            assert(timeout.expired());
        }

        guard.reset();
        runner.join();
    }

    void test_connection_identity()
    {
        assert(connection_identity("127.0.0.1") == "server-connection-from-127-0-0-1");
        assert(connection_identity("::1") == "server-connection-from---1");
        assert(connection_identity("") == "server-connection-from-");

        const auto log_dir = std::filesystem::temp_directory_path() / "mirrorsync_connection_logs";
        cleanup_path(log_dir);
        const auto identity = connection_identity("10.0.0.7");
        auto logger = make_connection_logger(identity, log_dir);
        assert(logger->name() == identity);
        logger->info("hello");
        logger->flush();
        assert(std::filesystem::exists(log_dir / (identity + ".log")));
        logger.reset();
        cleanup_path(log_dir);
    }

    void test_parse_arguments()
    {
        const auto config = parse({"--port", "4000", "--root", "/srv/pack", "--directory", "mods",
                                   "--directory", "config", "--timeout", "500", "--verbose"});
        assert(config.port == 4000);
        assert(config.root == std::filesystem::path("/srv/pack"));
        assert((config.managed_directories == std::vector<std::string>{"mods", "config"}));
        assert(config.idle_timeout == 500ms);
        assert(config.transfer_timeout == protocol::kTransferIdleTimeout);
        assert(config.address == "0.0.0.0");
        assert(config.verbose);
        assert(!config.show_help);

        assert(parse({"--help"}).show_help);

        assert(parse_fails({}));
        assert(parse_fails({"--port", "70000"}));
        assert(parse_fails({"--port", "-1"}));
        assert(parse_fails({"--port", "4000", "--timeout", "0"}));
        assert(parse_fails({"--port", "4000", "--bogus"}));
        assert(parse_fails({"--port"}));
    }

    void test_config_file()
    {
        const auto dir = std::filesystem::temp_directory_path() / "mirrorsync_config_test";
        cleanup_path(dir);
        const auto path = dir / "server.json";
        write_file(path, R"({"port": 5000, "root": "/data", "directories": ["mods"], "timeout_ms": 1000,
                             "transfer_timeout_ms": 9000, "threads": 3, "connection_log_dir": "logs"})");

        ServerConfig loaded;
        load_config_file(path, loaded);
        assert(loaded.port == 5000);
        assert(loaded.root == std::filesystem::path("/data"));
        assert(loaded.idle_timeout == 1000ms);
        assert(loaded.transfer_timeout == 9000ms);
        assert(loaded.worker_threads == 3);
        assert(loaded.connection_log_dir == std::filesystem::path("logs"));
        assert(!loaded.log_file.has_value());

        // Flags override the file, and --directory replaces its list.
        const auto overridden = parse({"--config", path.string(), "--port", "6000", "--directory", "config"});
        assert(overridden.port == 6000);
        assert((overridden.managed_directories == std::vector<std::string>{"config"}));
        assert(overridden.idle_timeout == 1000ms);

        const auto kept = parse({"--port", "6001", "--config", path.string()});
        assert(kept.port == 6001);
        assert((kept.managed_directories == std::vector<std::string>{"mods"}));

        const auto bad_path = dir / "bad.json";
        bool caught = false;
        write_file(bad_path, "[1, 2]");
        try
        {
            ServerConfig config;
            load_config_file(bad_path, config);
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);

        caught = false;
        write_file(bad_path, R"({"port": "not a number"})");
        try
        {
            ServerConfig config;
            load_config_file(bad_path, config);
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);

        caught = false;
        try
        {
            ServerConfig config;
            load_config_file(dir / "absent.json", config);
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);

        cleanup_path(dir);
    }

    void test_session_manager()
    {
        asio::io_context io;
        const FileCatalog catalog;
        const std::vector<std::string> directories;

        SessionManager manager;
        auto session = std::make_shared<Session>(asio::ip::tcp::socket(io),
                                                 SessionContext{
                                                     .catalog = catalog,
                                                     .managed_directories = directories,
                                                     .root = ".",
                                                     .scheduler = io,
                                                 });
        assert(session->identity() == connection_identity("unknown"));

        manager.register_session(session);
        assert(manager.active_count() == 1);
        manager.stop_all();

        const auto identity = session->identity();
        session.reset();
        manager.release(identity);
        assert(manager.active_count() == 0);
        manager.wait_for_idle();
    }

} // namespace

void run_server_component_tests()
{
    test_catalog_basic();
    test_build_catalog();
    test_timeout_supervisor();
    test_connection_identity();
    test_parse_arguments();
    test_config_file();
    test_session_manager();
}
