#pragma once

#include "blindxfer/cancellation.hpp"
#include "blindxfer/chunk_reader.hpp"
#include "blindxfer/multipart_client.hpp"
#include "blindxfer/part_pool.hpp"
#include "blindxfer/progress.hpp"
#include "blindxfer/secret.hpp"
#include "blindxfer/upload_session.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace blindxfer::upload {

enum class UploadStatus {
    kCompleted,
    kFailed,
    kCancelled,
};

const char* UploadStatusName(UploadStatus status);

struct SchedulerOptions {
    std::size_t max_in_flight = 3;
    std::size_t max_attempts = 3;
    std::chrono::milliseconds retry_base_delay{1000};
    std::chrono::milliseconds throughput_window{5000};
};

struct ScheduleResult {
    UploadStatus status = UploadStatus::kFailed;
    // Sorted by part number; filled only when status is kCompleted.
    std::vector<remote::CompletedPart> parts;
    std::string error;
    std::size_t peak_in_flight = 0;
};

using ProgressCallback = progress::Callback;

// Reads, encrypts and uploads parts with at most max_in_flight uploads
// outstanding. Reading and encryption of the next part overlap the uploads
// already in flight. Settlements are applied one at a time on the calling
// thread.
class UploadScheduler {
public:
    UploadScheduler(remote::MultipartTransferClient& client, const Secret& key, SchedulerOptions options);

    ScheduleResult Run(UploadSession& session,
                       io::ChunkReader& reader,
                       const CancellationToken& cancel,
                       const ProgressCallback& on_progress = {});

private:
    Settlement UploadWithRetry(const remote::UploadTicket& ticket,
                               std::uint32_t part_number,
                               std::shared_ptr<const Bytes> frame,
                               const CancellationToken& cancel);

    remote::MultipartTransferClient& client_;
    Secret key_;
    SchedulerOptions options_;
};

}  // namespace blindxfer::upload
