#include "clouddrive/client/state_store.hpp"

#include <algorithm>
#include <fstream>

#include "clouddrive/atomic_file.hpp"
#include "clouddrive/crypto.hpp"
#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    namespace
    {

        constexpr const char *kAuthFileName = "auth_session.json";

        bool is_fingerprint(const std::string &value)
        {
            return !value.empty() && std::all_of(value.begin(), value.end(), [](char ch)
                                                 { return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f'); });
        }

    } // namespace

    std::string TransferCheckpoint::fingerprint() const
    {
        return crypto::transfer_fingerprint(local_resource_id, remote_resource_id);
    }

    bool TransferCheckpoint::expired(TimePoint now) const noexcept
    {
        return session_expiry && *session_expiry <= now;
    }

    void to_json(nlohmann::json &json, const TransferCheckpoint &checkpoint)
    {
        json = {
            {"local_resource_id", checkpoint.local_resource_id},
            {"remote_resource_id", checkpoint.remote_resource_id},
            {"upload_session_handle", checkpoint.upload_session_handle},
            {"bytes_completed", checkpoint.bytes_completed},
            {"total_size", checkpoint.total_size},
        };
        if (checkpoint.session_expiry)
        {
            json["session_expiry"] = format_timestamp(*checkpoint.session_expiry);
        }
    }

    void from_json(const nlohmann::json &json, TransferCheckpoint &checkpoint)
    {
        json.at("local_resource_id").get_to(checkpoint.local_resource_id);
        json.at("remote_resource_id").get_to(checkpoint.remote_resource_id);
        json.at("upload_session_handle").get_to(checkpoint.upload_session_handle);
        json.at("bytes_completed").get_to(checkpoint.bytes_completed);
        checkpoint.total_size = json.value("total_size", 0ULL);
        checkpoint.session_expiry.reset();
        if (auto it = json.find("session_expiry"); it != json.end() && !it->is_null())
        {
            checkpoint.session_expiry = parse_timestamp(it->get<std::string>());
            if (!checkpoint.session_expiry)
            {
                throw Error(ErrorCode::DecodingFailed, "invalid session_expiry");
            }
        }
    }

    void to_json(nlohmann::json &json, const PendingAuthState &state)
    {
        json = {
            {"device_code", state.device_code},
            {"user_code", state.user_code},
            {"verification_uri", state.verification_uri},
            {"interval", state.interval},
        };
    }

    void from_json(const nlohmann::json &json, PendingAuthState &state)
    {
        json.at("device_code").get_to(state.device_code);
        state.user_code = json.value("user_code", std::string{});
        state.verification_uri = json.value("verification_uri", std::string{});
        state.interval = json.value("interval", 5);
    }

    StateStore::StateStore(std::filesystem::path directory, Logger logger)
        : directory_(std::move(directory)),
          logger_(std::move(logger)) {}

    std::optional<TransferCheckpoint> StateStore::load(const std::string &fingerprint) const
    {
        if (!is_fingerprint(fingerprint))
        {
            return std::nullopt;
        }
        const auto path = checkpoint_path(fingerprint);
        auto document = read_document(path);
        if (!document)
        {
            return std::nullopt;
        }
        try
        {
            auto checkpoint = document->get<TransferCheckpoint>();
            if (checkpoint.fingerprint() != fingerprint)
            {
                logger_.warn("state", "checkpoint ", path.string(), " does not match its key, ignoring");
                return std::nullopt;
            }
            return checkpoint;
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.warn("state", "corrupt checkpoint ", path.string(), ": ", ex.what());
        }
        catch (const Error &ex)
        {
            logger_.warn("state", "corrupt checkpoint ", path.string(), ": ", ex.what());
        }
        return std::nullopt;
    }

    void StateStore::save(const TransferCheckpoint &checkpoint)
    {
        const nlohmann::json json = checkpoint;
        write_file_atomically(checkpoint_path(checkpoint.fingerprint()), json.dump(2));
    }

    void StateStore::remove(const std::string &fingerprint)
    {
        if (!is_fingerprint(fingerprint))
        {
            throw Error(ErrorCode::InvalidArgument, "invalid checkpoint key: " + fingerprint);
        }
        remove_file(checkpoint_path(fingerprint));
    }

    std::vector<TransferCheckpoint> StateStore::pending() const
    {
        std::vector<TransferCheckpoint> result;
        std::error_code ec;
        if (!std::filesystem::is_directory(directory_, ec))
        {
            return result;
        }
        std::vector<std::string> keys;
        for (const auto &entry : std::filesystem::directory_iterator(directory_, ec))
        {
            const auto &path = entry.path();
            if (path.extension() == ".json" && is_fingerprint(path.stem().string()))
            {
                keys.push_back(path.stem().string());
            }
        }
        std::sort(keys.begin(), keys.end());
        for (const auto &key : keys)
        {
            if (auto checkpoint = load(key))
            {
                result.push_back(std::move(*checkpoint));
            }
        }
        return result;
    }

    std::optional<PendingAuthState> StateStore::load_auth() const
    {
        const auto path = directory_ / kAuthFileName;
        auto document = read_document(path);
        if (!document)
        {
            return std::nullopt;
        }
        try
        {
            return document->get<PendingAuthState>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.warn("state", "corrupt auth session ", path.string(), ": ", ex.what());
        }
        return std::nullopt;
    }

    void StateStore::save_auth(const PendingAuthState &state)
    {
        const nlohmann::json json = state;
        write_file_atomically(directory_ / kAuthFileName, json.dump(2));
    }

    void StateStore::remove_auth()
    {
        remove_file(directory_ / kAuthFileName);
    }

    std::filesystem::path StateStore::checkpoint_path(const std::string &fingerprint) const
    {
        return directory_ / (fingerprint + ".json");
    }

    std::optional<nlohmann::json> StateStore::read_document(const std::filesystem::path &path) const
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            return std::nullopt;
        }
        std::ifstream in(path);
        if (!in.is_open())
        {
            logger_.warn("state", "cannot open ", path.string());
            return std::nullopt;
        }
        auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            logger_.warn("state", "corrupt record ", path.string(), ", ignoring");
            return std::nullopt;
        }
        return json;
    }

    void StateStore::remove_file(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory)
        {
            throw Error(ErrorCode::StateStoreFailure, "cannot remove " + path.string() + ": " + ec.message());
        }
    }

} // namespace clouddrive::client
