#pragma once

#include "blindxfer/byte_source.hpp"
#include "blindxfer/cancellation.hpp"
#include "blindxfer/chunk_cipher.hpp"
#include "blindxfer/config.hpp"
#include "blindxfer/multipart_client.hpp"
#include "blindxfer/upload_scheduler.hpp"
#include "blindxfer/upload_session.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace blindxfer::upload {

struct UploadOutcome {
    UploadStatus status = UploadStatus::kFailed;
    std::string id;
    std::string share_link;
    std::string key;
    std::uint64_t plain_chunk_size = 0;
    std::uint64_t total_parts = 0;
    std::string expires_at;
    // Last error message when status is kFailed.
    std::string error;
};

// Drives one transfer end to end: key generation, begin, scheduled part
// uploads, finalize. Failures abort the remote session and reset local state.
class Uploader {
public:
    Uploader(remote::MultipartTransferClient& client, config::TransferConfig config);

    UploadOutcome Upload(io::ByteSource& source,
                         std::uint64_t size,
                         const chunkcipher::FileMetadata& meta,
                         const CancellationToken& cancel,
                         const ProgressCallback& on_progress = {});

    UploadOutcome UploadFile(const std::filesystem::path& path,
                             const std::string& content_type,
                             const CancellationToken& cancel,
                             const ProgressCallback& on_progress = {});

    // Partial uploads cannot be resumed; always throws UnsupportedError.
    [[noreturn]] void Resume(const std::string& session_id);

    // Session of the transfer in progress, if any.
    const UploadSession* CurrentSession() const noexcept { return session_.get(); }

    static std::string ShareLink(const std::string& share_base, const std::string& id, const Secret& key);

private:
    UploadOutcome Fail(UploadOutcome outcome, const std::string& error);
    void AbortRemote();

    remote::MultipartTransferClient& client_;
    config::TransferConfig config_;
    std::optional<remote::UploadTicket> ticket_;
    std::unique_ptr<UploadSession> session_;
};

}  // namespace blindxfer::upload
