#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clouddrive/client/logger.hpp"
#include "clouddrive/timestamp.hpp"

namespace clouddrive::client
{

    // Resumable state of one chunked upload.
    struct TransferCheckpoint
    {
        std::string local_resource_id;
        std::string remote_resource_id;
        std::string upload_session_handle;
        std::optional<TimePoint> session_expiry;
        std::uint64_t bytes_completed{};
        std::uint64_t total_size{};

        std::string fingerprint() const;
        bool expired(TimePoint now) const noexcept;
    };

    void to_json(nlohmann::json &json, const TransferCheckpoint &checkpoint);
    void from_json(const nlohmann::json &json, TransferCheckpoint &checkpoint);

    // Device-code login started by `auth login` and not yet exchanged for a token.
    struct PendingAuthState
    {
        std::string device_code;
        std::string user_code;
        std::string verification_uri;
        int interval{};
    };

    void to_json(nlohmann::json &json, const PendingAuthState &state);
    void from_json(const nlohmann::json &json, PendingAuthState &state);

    // Durable checkpoint storage keyed by transfer fingerprint.
    class CheckpointStore
    {
    public:
        virtual ~CheckpointStore() = default;

        // Absent, unreadable and corrupt records all yield std::nullopt.
        virtual std::optional<TransferCheckpoint> load(const std::string &fingerprint) const = 0;
        // Atomic overwrite. Throws clouddrive::Error(StateStoreFailure).
        virtual void save(const TransferCheckpoint &checkpoint) = 0;
        // Succeeds when the record is already absent.
        virtual void remove(const std::string &fingerprint) = 0;
    };

    // One JSON document per record under a sessions directory:
    //   <dir>/<fingerprint>.json   transfer checkpoints
    //   <dir>/auth_session.json    pending device-code login
    class StateStore : public CheckpointStore
    {
    public:
        StateStore(std::filesystem::path directory, Logger logger);

        std::optional<TransferCheckpoint> load(const std::string &fingerprint) const override;
        void save(const TransferCheckpoint &checkpoint) override;
        void remove(const std::string &fingerprint) override;

        // Every readable checkpoint, ordered by fingerprint.
        std::vector<TransferCheckpoint> pending() const;

        std::optional<PendingAuthState> load_auth() const;
        void save_auth(const PendingAuthState &state);
        void remove_auth();

        const std::filesystem::path &directory() const noexcept { return directory_; }

    private:
        std::filesystem::path checkpoint_path(const std::string &fingerprint) const;
        std::optional<nlohmann::json> read_document(const std::filesystem::path &path) const;
        void remove_file(const std::filesystem::path &path);

        std::filesystem::path directory_;
        mutable Logger logger_;
    };

} // namespace clouddrive::client
