#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "clouddrive/client/state_store.hpp"
#include "clouddrive/crypto.hpp"
#include "clouddrive/error_codes.hpp"

using namespace clouddrive;
using namespace clouddrive::client;

namespace
{

    std::filesystem::path fresh_dir(const std::string &name)
    {
        const auto dir = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        return dir;
    }

    TransferCheckpoint sample(const std::string &local, std::uint64_t bytes)
    {
        return TransferCheckpoint{
            .local_resource_id = local,
            .remote_resource_id = "/remote/file.bin",
            .upload_session_handle = "https://upload.example/abc",
            .session_expiry = parse_timestamp("2030-01-02T03:04:05Z"),
            .bytes_completed = bytes,
            .total_size = 1000,
        };
    }

    std::size_t file_count(const std::filesystem::path &dir)
    {
        std::size_t count = 0;
        for ([[maybe_unused]] const auto &entry : std::filesystem::directory_iterator(dir))
        {
            ++count;
        }
        return count;
    }

    void test_save_load_overwrite()
    {
        const auto dir = fresh_dir("clouddrive_state_basic");
        StateStore store(dir, Logger{});
        const auto checkpoint = sample("/local/file.bin", 0);
        const auto key = checkpoint.fingerprint();
        assert(key == crypto::transfer_fingerprint("/local/file.bin", "/remote/file.bin"));
        assert(!store.load(key));

        store.save(checkpoint);
        store.save(sample("/local/file.bin", 320));
        store.save(sample("/local/file.bin", 640));

        const auto loaded = store.load(key);
        assert(loaded);
        assert(loaded->bytes_completed == 640);
        assert(loaded->upload_session_handle == "https://upload.example/abc");
        assert(loaded->session_expiry == parse_timestamp("2030-01-02T03:04:05Z"));
        assert(file_count(dir) == 1);
        assert(std::filesystem::exists(dir / (key + ".json")));
        assert(!std::filesystem::exists(dir / (key + ".json.tmp")));

        const auto perms = std::filesystem::status(dir / (key + ".json")).permissions();
        assert((perms & std::filesystem::perms::group_read) == std::filesystem::perms::none);
        assert((perms & std::filesystem::perms::others_read) == std::filesystem::perms::none);

        std::filesystem::remove_all(dir);
    }

    void test_remove_is_idempotent()
    {
        const auto dir = fresh_dir("clouddrive_state_remove");
        StateStore store(dir, Logger{});
        const auto checkpoint = sample("/local/a", 10);
        store.save(checkpoint);
        store.remove(checkpoint.fingerprint());
        assert(!store.load(checkpoint.fingerprint()));
        store.remove(checkpoint.fingerprint());

        StateStore missing_dir(dir / "never-created", Logger{});
        missing_dir.remove(checkpoint.fingerprint());

        std::filesystem::remove_all(dir);
    }

    void test_corrupt_records_read_as_absent()
    {
        const auto dir = fresh_dir("clouddrive_state_corrupt");
        StateStore store(dir, Logger{});
        const auto checkpoint = sample("/local/corrupt", 10);
        const auto key = checkpoint.fingerprint();
        store.save(checkpoint);

        {
            std::ofstream out(dir / (key + ".json"), std::ios::trunc);
            out << "{\"local_resource_id\": ";
        }
        assert(!store.load(key));

        {
            std::ofstream out(dir / (key + ".json"), std::ios::trunc);
            out << R"({"local_resource_id": "/local/corrupt", "remote_resource_id": "/remote/file.bin",
                       "upload_session_handle": "u", "bytes_completed": "many"})";
        }
        assert(!store.load(key));

        // A record filed under another pair's key is ignored.
        const auto other = sample("/local/other", 5);
        {
            const nlohmann::json json = other;
            std::ofstream out(dir / (key + ".json"), std::ios::trunc);
            out << json.dump();
        }
        assert(!store.load(key));

        assert(!store.load("../../etc/passwd"));

        store.save(checkpoint);
        assert(store.load(key)->bytes_completed == 10);

        std::filesystem::remove_all(dir);
    }

    void test_pending_listing_and_auth_state()
    {
        const auto dir = fresh_dir("clouddrive_state_pending");
        StateStore store(dir, Logger{});
        assert(store.pending().empty());
        assert(!store.load_auth());

        store.save(sample("/local/one", 1));
        store.save(sample("/local/two", 2));
        store.save_auth(PendingAuthState{
            .device_code = "device-123",
            .user_code = "ABCD-EFGH",
            .verification_uri = "https://microsoft.com/devicelogin",
            .interval = 5,
        });
        {
            std::ofstream out(dir / "notes.txt");
            out << "ignored";
        }

        const auto pending = store.pending();
        assert(pending.size() == 2);
        assert(pending[0].fingerprint() < pending[1].fingerprint());

        const auto auth = store.load_auth();
        assert(auth);
        assert(auth->device_code == "device-123");
        assert(auth->user_code == "ABCD-EFGH");
        assert(auth->interval == 5);

        store.remove_auth();
        assert(!store.load_auth());
        store.remove_auth();
        assert(store.pending().size() == 2);

        std::filesystem::remove_all(dir);
    }

    void test_save_failure_is_reported()
    {
        const auto dir = fresh_dir("clouddrive_state_blocked");
        std::filesystem::create_directories(dir);
        const auto blocker = dir / "sessions";
        {
            std::ofstream out(blocker);
            out << "not a directory";
        }
        StateStore store(blocker, Logger{});
        bool threw = false;
        try
        {
            store.save(sample("/local/blocked", 1));
        }
        catch (const Error &ex)
        {
            threw = ex.code() == ErrorCode::StateStoreFailure;
        }
        assert(threw);
        assert(!store.load(sample("/local/blocked", 1).fingerprint()));

        std::filesystem::remove_all(dir);
    }

} // namespace

void run_state_store_tests()
{
    test_save_load_overwrite();
    test_remove_is_idempotent();
    test_corrupt_records_read_as_absent();
    test_pending_listing_and_auth_state();
    test_save_failure_is_reported();
}
