#include "clouddrive/client/chunked_upload_engine.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <span>
#include <vector>

#include "clouddrive/crypto.hpp"

namespace clouddrive::client
{

    namespace
    {

        std::string remote_basename(const std::string &remote_path)
        {
            const auto trimmed_end = remote_path.find_last_not_of('/');
            if (trimmed_end == std::string::npos)
            {
                return {};
            }
            const auto slash = remote_path.find_last_of('/', trimmed_end);
            const auto begin = slash == std::string::npos ? 0 : slash + 1;
            return remote_path.substr(begin, trimmed_end - begin + 1);
        }

        // Used when the service accepted every byte without returning the final item.
        remote::DriveItem synthesized_item(const std::string &remote_path, std::uint64_t total_size)
        {
            return remote::DriveItem{
                .name = remote_basename(remote_path),
                .size = total_size,
            };
        }

        UploadOutcome failed(UploadOutcome outcome, ErrorCode code, const std::string &message)
        {
            outcome.status = UploadStatus::Failed;
            outcome.error = code;
            outcome.message = message + " (" + std::to_string(outcome.bytes_completed) + " of " +
                              std::to_string(outcome.total_size) + " bytes durably completed)";
            return outcome;
        }

        UploadOutcome succeeded(UploadOutcome outcome, remote::DriveItem item)
        {
            outcome.status = UploadStatus::Succeeded;
            outcome.error = ErrorCode::Ok;
            outcome.item = std::move(item);
            outcome.bytes_completed = outcome.total_size;
            return outcome;
        }

    } // namespace

    ChunkedUploadEngine::ChunkedUploadEngine(RemoteService &remote, CheckpointStore &store, Logger logger)
        : remote_(remote),
          store_(store),
          logger_(std::move(logger)) {}

    UploadOutcome ChunkedUploadEngine::upload(const std::filesystem::path &local_path, const std::string &remote_path,
                                              const UploadOptions &options)
    {
        const auto local_id = std::filesystem::absolute(local_path).lexically_normal();
        UploadOutcome outcome;

        std::error_code ec;
        if (!std::filesystem::is_regular_file(local_id, ec))
        {
            return failed(outcome, ErrorCode::SourceUnreadable, local_id.string() + " is not a readable regular file");
        }
        const auto total_size = std::filesystem::file_size(local_id, ec);
        if (ec)
        {
            return failed(outcome, ErrorCode::SourceUnreadable, "cannot stat " + local_id.string() + ": " + ec.message());
        }
        std::ifstream source(local_id, std::ios::binary);
        if (!source.is_open())
        {
            return failed(outcome, ErrorCode::SourceUnreadable, "cannot open " + local_id.string());
        }
        return upload(local_id.string(), remote_path, source, total_size, options);
    }

    UploadOutcome ChunkedUploadEngine::upload(const std::string &local_resource_id,
                                              const std::string &remote_resource_id, std::istream &source,
                                              std::uint64_t total_size, const UploadOptions &options)
    {
        UploadOutcome outcome;
        outcome.total_size = total_size;

        if (options.chunk_size == 0 || (options.alignment != 0 && options.chunk_size % options.alignment != 0))
        {
            return failed(outcome, ErrorCode::InvalidArgument,
                          "chunk size " + std::to_string(options.chunk_size) + " must be a positive multiple of " +
                              std::to_string(options.alignment));
        }

        const auto fingerprint = crypto::transfer_fingerprint(local_resource_id, remote_resource_id);
        int restarts_left = 1;

        while (true)
        {
            auto resumed = resume_checkpoint(fingerprint, remote_resource_id, total_size);
            if (resumed.finished)
            {
                return *resumed.finished;
            }

            TransferCheckpoint checkpoint;
            if (resumed.checkpoint)
            {
                checkpoint = std::move(*resumed.checkpoint);
                outcome.resumed = true;
            }
            else
            {
                remote::UploadSessionInfo session;
                try
                {
                    session = remote_.open_upload_session(remote_resource_id);
                }
                catch (const Error &ex)
                {
                    return failed(outcome, ex.code(), std::string("cannot open upload session: ") + ex.what());
                }
                checkpoint = TransferCheckpoint{
                    .local_resource_id = local_resource_id,
                    .remote_resource_id = remote_resource_id,
                    .upload_session_handle = session.upload_url,
                    .session_expiry = session.expiration,
                    .bytes_completed = 0,
                    .total_size = total_size,
                };
                try
                {
                    store_.save(checkpoint);
                }
                catch (const Error &ex)
                {
                    cancel_quietly(checkpoint.upload_session_handle);
                    return failed(outcome, ErrorCode::StateStoreFailure,
                                  std::string("cannot record upload checkpoint: ") + ex.what());
                }
                logger_.log("upload", "opened session for ", local_resource_id, " -> ", remote_resource_id);
                outcome.resumed = false;
            }

            outcome.bytes_completed = checkpoint.bytes_completed;
            auto result = transfer(checkpoint, source, options, outcome);
            if (result)
            {
                return *result;
            }

            discard(fingerprint);
            if (restarts_left-- == 0)
            {
                outcome.bytes_completed = 0;
                return failed(outcome, ErrorCode::SessionExpired, "upload session expired again after a restart");
            }
            logger_.warn("upload", "upload session for ", remote_resource_id, " expired, starting a new one");
        }
    }

    ChunkedUploadEngine::ResumeResult ChunkedUploadEngine::resume_checkpoint(const std::string &fingerprint,
                                                                             const std::string &remote_resource_id,
                                                                             std::uint64_t total_size)
    {
        auto stored = store_.load(fingerprint);
        if (!stored)
        {
            return {};
        }

        if (stored->expired(std::chrono::system_clock::now()))
        {
            logger_.log("upload", "checkpoint for ", remote_resource_id, " has an expired session, purging");
            discard(fingerprint);
            return {};
        }
        if (stored->total_size != total_size)
        {
            logger_.log("upload", "source size changed since checkpoint (", stored->total_size, " -> ", total_size,
                        "), starting over");
            cancel_quietly(stored->upload_session_handle);
            discard(fingerprint);
            return {};
        }

        UploadOutcome outcome;
        outcome.total_size = total_size;
        outcome.bytes_completed = stored->bytes_completed;
        outcome.resumed = true;

        UploadSessionStatus status;
        try
        {
            status = remote_.query_upload_session(stored->upload_session_handle);
        }
        catch (const Error &ex)
        {
            if (ex.code() == ErrorCode::SessionExpired || ex.code() == ErrorCode::NotFound)
            {
                logger_.log("upload", "stored upload session is gone, starting over");
                discard(fingerprint);
                return {};
            }
            return ResumeResult{
                .finished = failed(outcome, ex.code(), std::string("cannot query upload session: ") + ex.what()),
            };
        }

        if (status.complete)
        {
            logger_.log("upload", "remote already holds every byte of ", remote_resource_id);
            discard(fingerprint);
            return ResumeResult{.finished = succeeded(outcome, synthesized_item(remote_resource_id, total_size))};
        }
        if (status.watermark > total_size)
        {
            logger_.warn("upload", "remote watermark ", status.watermark, " exceeds size ", total_size,
                         ", starting over");
            cancel_quietly(stored->upload_session_handle);
            discard(fingerprint);
            return {};
        }
        if (status.watermark != stored->bytes_completed)
        {
            logger_.log("upload", "checkpoint says ", stored->bytes_completed, " bytes, remote says ",
                        status.watermark, "; using remote");
            stored->bytes_completed = status.watermark;
        }
        logger_.log("upload", "resuming ", remote_resource_id, " at byte ", stored->bytes_completed);
        return ResumeResult{.checkpoint = std::move(stored)};
    }

    std::optional<UploadOutcome> ChunkedUploadEngine::transfer(TransferCheckpoint &checkpoint, std::istream &source,
                                                               const UploadOptions &options, UploadOutcome outcome)
    {
        const auto total = checkpoint.total_size;
        std::optional<remote::DriveItem> final_item;
        std::vector<std::byte> buffer;

        if (total == 0)
        {
            try
            {
                final_item = remote_.finalize_empty_upload(checkpoint.upload_session_handle,
                                                           checkpoint.remote_resource_id);
            }
            catch (const Error &ex)
            {
                return failed(outcome, ex.code(), std::string("cannot create empty resource: ") + ex.what());
            }
        }

        while (checkpoint.bytes_completed < total)
        {
            outcome.bytes_completed = checkpoint.bytes_completed;
            if (options.cancellation && options.cancellation->is_cancelled())
            {
                persist(checkpoint);
                logger_.log("upload", "interrupted at byte ", checkpoint.bytes_completed);
                outcome.status = UploadStatus::Interrupted;
                outcome.error = ErrorCode::Ok;
                outcome.message = "interrupted; " + std::to_string(checkpoint.bytes_completed) + " of " +
                                  std::to_string(total) + " bytes completed";
                return outcome;
            }

            const auto start = checkpoint.bytes_completed;
            const auto end = std::min(start + options.chunk_size - 1, total - 1);
            const auto length = static_cast<std::size_t>(end - start + 1);

            buffer.resize(length);
            source.clear();
            source.seekg(static_cast<std::streamoff>(start));
            source.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(length));
            if (!source || static_cast<std::size_t>(source.gcount()) != length)
            {
                persist(checkpoint);
                return failed(outcome, ErrorCode::SourceUnreadable,
                              "short read at byte " + std::to_string(start) + " of " + checkpoint.local_resource_id);
            }

            ChunkResult result;
            try
            {
                result = remote_.send_chunk(checkpoint.upload_session_handle, start, end, total,
                                            std::span<const std::byte>(buffer.data(), buffer.size()));
            }
            catch (const Error &ex)
            {
                if (ex.code() == ErrorCode::SessionExpired)
                {
                    return std::nullopt;
                }
                logger_.warn("upload", "chunk ", start, "-", end, " failed: ", ex.what());
                persist(checkpoint);
                return failed(outcome, ex.code(), ex.what());
            }

            checkpoint.bytes_completed = end + 1;
            outcome.bytes_completed = checkpoint.bytes_completed;

            if (result.item)
            {
                if (checkpoint.bytes_completed < total)
                {
                    persist(checkpoint);
                    return failed(outcome, ErrorCode::OperationFailed,
                                  "service reported completion after byte " + std::to_string(end));
                }
                final_item = std::move(result.item);
            }
            else if (result.session)
            {
                if (!result.session->upload_url.empty())
                {
                    checkpoint.upload_session_handle = result.session->upload_url;
                }
                if (result.session->expiration)
                {
                    checkpoint.session_expiry = result.session->expiration;
                }
            }

            if (options.on_progress)
            {
                options.on_progress(checkpoint.bytes_completed, total);
            }
            if (checkpoint.bytes_completed < total)
            {
                persist(checkpoint);
            }
        }

        discard(checkpoint.fingerprint());
        logger_.log("upload", "completed ", checkpoint.remote_resource_id, " (", total, " bytes)");
        return succeeded(outcome, final_item ? std::move(*final_item)
                                             : synthesized_item(checkpoint.remote_resource_id, total));
    }

    void ChunkedUploadEngine::persist(const TransferCheckpoint &checkpoint)
    {
        try
        {
            store_.save(checkpoint);
        }
        catch (const Error &ex)
        {
            logger_.warn("upload", "failed to save checkpoint at byte ", checkpoint.bytes_completed, ": ", ex.what());
        }
    }

    void ChunkedUploadEngine::discard(const std::string &fingerprint)
    {
        try
        {
            store_.remove(fingerprint);
        }
        catch (const Error &ex)
        {
            logger_.warn("upload", "failed to delete checkpoint: ", ex.what());
        }
    }

    void ChunkedUploadEngine::cancel_quietly(const std::string &upload_handle)
    {
        try
        {
            remote_.cancel_upload_session(upload_handle);
        }
        catch (const Error &ex)
        {
            logger_.warn("upload", "failed to cancel stale upload session: ", ex.what());
        }
    }

} // namespace clouddrive::client
