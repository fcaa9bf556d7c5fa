#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "clouddrive/client/config.hpp"
#include "clouddrive/error_codes.hpp"

using namespace clouddrive;
using namespace clouddrive::client;
using namespace std::chrono_literals;

namespace
{

    CommandLine parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "clouddrive");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool parse_throws(std::vector<std::string> args)
    {
        try
        {
            parse(std::move(args));
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    void test_parse_arguments()
    {
        const auto empty = parse({});
        assert(empty.command == "help");
        assert(empty.args.empty());

        const auto upload = parse({"upload", "--debug", "big.iso", "/backups", "--chunk-size", "3276800",
                                   "--log", "client.log"});
        assert(upload.command == "upload");
        assert((upload.args == std::vector<std::string>{"big.iso", "/backups"}));
        assert(upload.debug);
        assert(upload.chunk_size && *upload.chunk_size == 3276800);
        assert(upload.log_path && *upload.log_path == "client.log");
        assert(!upload.wait);

        const auto copy = parse({"--config", "/tmp/alt.json", "copy", "/a.txt", "/dest", "--wait"});
        assert(copy.command == "copy");
        assert(copy.wait);
        assert(copy.config_path && *copy.config_path == "/tmp/alt.json");
        assert(copy.args.size() == 2);

        assert(parse_throws({"upload", "--chunk-size"}));
        assert(parse_throws({"upload", "--chunk-size", "12abc"}));
        assert(parse_throws({"upload", "--log"}));
        assert(parse_throws({"upload", "--frobnicate"}));
    }

    void test_settings_defaults_and_partial_documents()
    {
        const auto dir = std::filesystem::temp_directory_path() / "clouddrive_config_test";
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);

        const auto defaults = load_settings(dir / "missing.json");
        assert(defaults.token.empty());
        assert(defaults.http.timeout == 30s);
        assert(defaults.http.retry_attempts == 3);
        assert(defaults.http.retry_delay == 1000ms);
        assert(defaults.http.max_retry_delay == 10000ms);
        assert(defaults.polling.initial_interval == 2000ms);
        assert(defaults.polling.max_interval == 30000ms);
        assert(defaults.polling.multiplier == 1.5);
        assert(defaults.upload.chunk_size == 1638400);

        std::filesystem::create_directories(dir);
        const auto partial = dir / "partial.json";
        {
            std::ofstream out(partial);
            out << R"({"debug": true, "polling": {"multiplier": 2.0},
                       "token": {"access_token": "at", "refresh_token": "rt", "expiry": "2030-05-01T00:00:00Z"}})";
        }
        const auto loaded = load_settings(partial);
        assert(loaded.debug);
        assert(loaded.polling.multiplier == 2.0);
        assert(loaded.polling.initial_interval == 2000ms);
        assert(loaded.http.retry_attempts == 3);
        assert(loaded.token.access_token == "at");
        assert(loaded.token.token_type == "Bearer");
        assert(loaded.token.expiry == parse_timestamp("2030-05-01T00:00:00Z"));

        const auto broken = dir / "broken.json";
        {
            std::ofstream out(broken);
            out << "{ not json";
        }
        bool threw = false;
        try
        {
            load_settings(broken);
        }
        catch (const Error &ex)
        {
            threw = ex.code() == ErrorCode::DecodingFailed;
        }
        assert(threw);

        std::filesystem::remove_all(dir);
    }

    void test_save_settings()
    {
        const auto dir = std::filesystem::temp_directory_path() / "clouddrive_config_save";
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        const auto path = dir / "nested" / "config.json";

        Settings settings;
        settings.token.access_token = "access";
        settings.token.refresh_token = "refresh";
        settings.token.expiry = parse_timestamp("2031-01-01T12:00:00Z");
        settings.http.retry_attempts = 5;
        settings.upload.chunk_size = 3276800;
        save_settings(path, settings);

        const auto perms = std::filesystem::status(path).permissions();
        assert((perms & std::filesystem::perms::others_read) == std::filesystem::perms::none);

        const auto reloaded = load_settings(path);
        assert(reloaded.token.access_token == "access");
        assert(reloaded.token.refresh_token == "refresh");
        assert(reloaded.token.expiry == settings.token.expiry);
        assert(reloaded.http.retry_attempts == 5);
        assert(reloaded.upload.chunk_size == 3276800);

        settings.token = remote::Credential{};
        save_settings(path, settings);
        assert(load_settings(path).token.empty());

        std::filesystem::remove_all(dir);
    }

    void test_default_config_path()
    {
        ::setenv("CLOUDDRIVE_CONFIG_PATH", "/tmp/explicit/config.json", 1);
        assert(default_config_path() == std::filesystem::path("/tmp/explicit/config.json"));
        ::unsetenv("CLOUDDRIVE_CONFIG_PATH");

        ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
        assert(default_config_path() == std::filesystem::path("/tmp/xdg/clouddrive/config.json"));
        ::unsetenv("XDG_CONFIG_HOME");

        ::setenv("HOME", "/home/tester", 1);
        assert(default_config_path() == std::filesystem::path("/home/tester/.config/clouddrive/config.json"));
    }

} // namespace

void run_config_tests()
{
    test_parse_arguments();
    test_settings_defaults_and_partial_documents();
    test_save_settings();
    test_default_config_path();
}
