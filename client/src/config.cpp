#include "clouddrive/client/config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "clouddrive/atomic_file.hpp"
#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    namespace
    {

        constexpr const char *kUsage = "Usage: clouddrive <command> [args] [--log <file>] [--debug] "
                                       "[--config <file>] [--chunk-size <bytes>] [--wait]";

        template <typename Duration>
        Duration duration_field(const nlohmann::json &json, const char *key, Duration fallback)
        {
            auto it = json.find(key);
            if (it == json.end() || !it->is_number())
            {
                return fallback;
            }
            return Duration{it->template get<typename Duration::rep>()};
        }

    } // namespace

    CommandLine parse_arguments(int argc, char *argv[])
    {
        CommandLine line;
        bool have_command = false;
        int index = 1;

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                line.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--config")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--config requires a file path");
                }
                line.config_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--chunk-size")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--chunk-size requires a value (bytes)");
                }
                const std::string value = argv[index++];
                if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front())))
                {
                    throw std::runtime_error("--chunk-size expects a positive integer, got: " + value);
                }
                std::size_t consumed = 0;
                try
                {
                    line.chunk_size = std::stoull(value, &consumed);
                }
                catch (const std::logic_error &)
                {
                    consumed = 0;
                }
                if (consumed != value.size())
                {
                    throw std::runtime_error("--chunk-size expects a positive integer, got: " + value);
                }
            }
            else if (arg == "--debug")
            {
                line.debug = true;
            }
            else if (arg == "--wait")
            {
                line.wait = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                line.command = "help";
                have_command = true;
            }
            else if (arg.size() > 1 && arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg + "\n" + kUsage);
            }
            else if (!have_command)
            {
                line.command = arg;
                have_command = true;
            }
            else
            {
                line.args.push_back(arg);
            }
        }

        return line;
    }

    void to_json(nlohmann::json &json, const Settings &settings)
    {
        json = nlohmann::json::object();
        if (!settings.token.empty())
        {
            json["token"] = settings.token;
        }
        json["debug"] = settings.debug;
        json["http"] = {
            {"timeout_seconds", settings.http.timeout.count()},
            {"retry_attempts", settings.http.retry_attempts},
            {"retry_delay_ms", settings.http.retry_delay.count()},
            {"max_retry_delay_ms", settings.http.max_retry_delay.count()},
        };
        json["polling"] = {
            {"initial_interval_ms", settings.polling.initial_interval.count()},
            {"max_interval_ms", settings.polling.max_interval.count()},
            {"multiplier", settings.polling.multiplier},
        };
        json["upload"] = {
            {"chunk_size", settings.upload.chunk_size},
        };
    }

    void from_json(const nlohmann::json &json, Settings &settings)
    {
        settings = Settings{};
        if (auto it = json.find("token"); it != json.end() && it->is_object())
        {
            settings.token = it->get<remote::Credential>();
        }
        settings.debug = json.value("debug", false);

        if (auto it = json.find("http"); it != json.end() && it->is_object())
        {
            const auto &http = *it;
            settings.http.timeout = duration_field(http, "timeout_seconds", settings.http.timeout);
            settings.http.retry_attempts = http.value("retry_attempts", settings.http.retry_attempts);
            settings.http.retry_delay = duration_field(http, "retry_delay_ms", settings.http.retry_delay);
            settings.http.max_retry_delay = duration_field(http, "max_retry_delay_ms", settings.http.max_retry_delay);
        }
        if (auto it = json.find("polling"); it != json.end() && it->is_object())
        {
            const auto &polling = *it;
            settings.polling.initial_interval =
                duration_field(polling, "initial_interval_ms", settings.polling.initial_interval);
            settings.polling.max_interval = duration_field(polling, "max_interval_ms", settings.polling.max_interval);
            settings.polling.multiplier = polling.value("multiplier", settings.polling.multiplier);
        }
        if (auto it = json.find("upload"); it != json.end() && it->is_object())
        {
            settings.upload.chunk_size = it->value("chunk_size", settings.upload.chunk_size);
        }
    }

    std::filesystem::path default_config_path()
    {
        if (const char *explicit_path = std::getenv("CLOUDDRIVE_CONFIG_PATH"); explicit_path && *explicit_path)
        {
            return std::filesystem::path(explicit_path);
        }
        if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        {
            return std::filesystem::path(xdg) / "clouddrive" / "config.json";
        }
        if (const char *home = std::getenv("HOME"); home && *home)
        {
            return std::filesystem::path(home) / ".config" / "clouddrive" / "config.json";
        }
        return std::filesystem::path(".clouddrive") / "config.json";
    }

    Settings load_settings(const std::filesystem::path &path)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            return Settings{};
        }
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw Error(ErrorCode::StateStoreFailure, "cannot read config file " + path.string());
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        const auto content = buffer.str();
        if (content.find_first_not_of(" \t\r\n") == std::string::npos)
        {
            return Settings{};
        }
        try
        {
            return nlohmann::json::parse(content).get<Settings>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::DecodingFailed, "malformed config file " + path.string() + ": " + ex.what());
        }
    }

    void save_settings(const std::filesystem::path &path, const Settings &settings)
    {
        const nlohmann::json json = settings;
        write_file_atomically(path, json.dump(2));
    }

} // namespace clouddrive::client
