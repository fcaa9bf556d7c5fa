#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clouddrive/remote_types.hpp"

namespace clouddrive::client
{

    struct CommandLine
    {
        std::string command{"help"};
        std::vector<std::string> args;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> config_path;
        std::optional<std::uint64_t> chunk_size;
        bool debug{};
        bool wait{};
    };

    CommandLine parse_arguments(int argc, char *argv[]);

    struct HttpSettings
    {
        std::chrono::seconds timeout{30};
        int retry_attempts{3};
        std::chrono::milliseconds retry_delay{1000};
        std::chrono::milliseconds max_retry_delay{10000};
    };

    struct PollingSettings
    {
        std::chrono::milliseconds initial_interval{2000};
        std::chrono::milliseconds max_interval{30000};
        double multiplier{1.5};
    };

    struct UploadSettings
    {
        std::uint64_t chunk_size{5 * 320 * 1024};
    };

    struct Settings
    {
        remote::Credential token;
        bool debug{};
        HttpSettings http;
        PollingSettings polling;
        UploadSettings upload;
    };

    void to_json(nlohmann::json &json, const Settings &settings);
    void from_json(const nlohmann::json &json, Settings &settings);

    // $CLOUDDRIVE_CONFIG_PATH, then $XDG_CONFIG_HOME/clouddrive/config.json, then ~/.config/clouddrive/config.json.
    std::filesystem::path default_config_path();

    // Missing file yields defaults; a malformed document throws clouddrive::Error(DecodingFailed).
    Settings load_settings(const std::filesystem::path &path);

    void save_settings(const std::filesystem::path &path, const Settings &settings);

} // namespace clouddrive::client
