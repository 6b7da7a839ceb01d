#include "blindxfer/uploader.hpp"

#include "blindxfer/chunk_reader.hpp"
#include "blindxfer/constants.hpp"
#include "blindxfer/errors.hpp"
#include "blindxfer/log.hpp"
#include "blindxfer/transfer_plan.hpp"

#include <system_error>

namespace blindxfer::upload {

namespace {

constexpr const char* kComponent = "upload";

}  // namespace

Uploader::Uploader(remote::MultipartTransferClient& client, config::TransferConfig config)
    : client_(client), config_(std::move(config)) {
    config::Normalize(config_);
}

std::string Uploader::ShareLink(const std::string& share_base, const std::string& id, const Secret& key) {
    return share_base + "/download/" + id + "#" + key.ToBase64Url();
}

void Uploader::AbortRemote() {
    if (ticket_) {
        log::Info(kComponent, "aborting remote session " + ticket_->session_id);
        try {
            client_.Abort(*ticket_);
        } catch (const std::exception& ex) {
            log::Warn(kComponent, std::string("abort of remote session failed: ") + ex.what());
        }
    }
}

UploadOutcome Uploader::Fail(UploadOutcome outcome, const std::string& error) {
    AbortRemote();
    ticket_.reset();
    session_.reset();
    outcome.status = UploadStatus::kFailed;
    outcome.error = error;
    outcome.share_link.clear();
    outcome.key.clear();
    log::Error(kComponent, error);
    return outcome;
}

UploadOutcome Uploader::Upload(io::ByteSource& source,
                               std::uint64_t size,
                               const chunkcipher::FileMetadata& meta,
                               const CancellationToken& cancel,
                               const ProgressCallback& on_progress) {
    UploadOutcome outcome;
    ticket_.reset();
    session_.reset();
    if (size == 0) {
        return Fail(std::move(outcome), "Cannot upload an empty file");
    }

    Secret key = Secret::Generate();
    try {
        remote::BeginRequest request;
        request.total_size = size;
        request.content_type = std::string(constants::kDefaultContentType);
        request.encrypted_metadata = chunkcipher::EncryptMetadata(key, meta);

        ticket_ = client_.Begin(request);
        outcome.id = ticket_->session_id;
        outcome.plain_chunk_size = ticket_->plain_chunk_size;
        outcome.total_parts = ticket_->total_parts;
        outcome.expires_at = ticket_->expires_at;
        plan::ValidateTicket(*ticket_, size);
        log::Info(kComponent, "session " + ticket_->session_id + ": " + std::to_string(ticket_->total_parts)
                                  + " parts of " + std::to_string(ticket_->plain_chunk_size) + " bytes");

        session_ = std::make_unique<UploadSession>(*ticket_, size);
        io::ChunkReader reader(source, ticket_->plain_chunk_size, size);
        SchedulerOptions options;
        options.max_in_flight = config_.max_in_flight;
        options.max_attempts = config_.max_attempts;
        options.retry_base_delay = config_.retry_base_delay;
        options.throughput_window = config_.throughput_window;
        UploadScheduler scheduler(client_, key, options);
        ScheduleResult scheduled = scheduler.Run(*session_, reader, cancel, on_progress);

        if (scheduled.status == UploadStatus::kCancelled) {
            AbortRemote();
            ticket_.reset();
            session_.reset();
            outcome.status = UploadStatus::kCancelled;
            log::Info(kComponent, "upload cancelled");
            return outcome;
        }
        if (scheduled.status == UploadStatus::kFailed) {
            return Fail(std::move(outcome), scheduled.error);
        }

        std::string handle = client_.Finalize(*ticket_, scheduled.parts);
        if (!handle.empty()) {
            outcome.id = handle;
        }
    } catch (const std::exception& ex) {
        return Fail(std::move(outcome), ex.what());
    }

    outcome.status = UploadStatus::kCompleted;
    outcome.key = key.ToBase64Url();
    outcome.share_link = ShareLink(config_.share_base, outcome.id, key);
    ticket_.reset();
    session_.reset();
    return outcome;
}

UploadOutcome Uploader::UploadFile(const std::filesystem::path& path,
                                   const std::string& content_type,
                                   const CancellationToken& cancel,
                                   const ProgressCallback& on_progress) {
    std::error_code ec;
    std::uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Failed to stat " + path.string() + ": " + ec.message());
    }
    io::FileSource source(path);
    chunkcipher::FileMetadata meta;
    meta.name = path.filename().string();
    meta.type = content_type.empty() ? std::string(constants::kDefaultContentType) : content_type;
    return Upload(source, size, meta, cancel, on_progress);
}

void Uploader::Resume(const std::string& session_id) {
    throw UnsupportedError("Resuming upload " + session_id
                           + " is not supported; start a new upload instead");
}

}  // namespace blindxfer::upload
