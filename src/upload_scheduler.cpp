#include "blindxfer/upload_scheduler.hpp"

#include "blindxfer/chunk_cipher.hpp"
#include "blindxfer/errors.hpp"
#include "blindxfer/log.hpp"
#include "blindxfer/part_pool.hpp"

#include <algorithm>

namespace blindxfer::upload {

namespace {

constexpr const char* kComponent = "scheduler";

}  // namespace

const char* UploadStatusName(UploadStatus status) {
    switch (status) {
        case UploadStatus::kCompleted:
            return "completed";
        case UploadStatus::kFailed:
            return "failed";
        case UploadStatus::kCancelled:
            return "cancelled";
    }
    return "unknown";
}

UploadScheduler::UploadScheduler(remote::MultipartTransferClient& client,
                                 const Secret& key,
                                 SchedulerOptions options)
    : client_(client), key_(key), options_(options) {
    options_.max_in_flight = std::max<std::size_t>(options_.max_in_flight, 1);
    options_.max_attempts = std::max<std::size_t>(options_.max_attempts, 1);
}

Settlement UploadScheduler::UploadWithRetry(const remote::UploadTicket& ticket,
                                            std::uint32_t part_number,
                                            std::shared_ptr<const Bytes> frame,
                                            const CancellationToken& cancel) {
    Settlement result;
    result.part_number = part_number;
    for (std::size_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        if (attempt > 1) {
            auto delay = options_.retry_base_delay * static_cast<long>(attempt - 1);
            if (cancel.WaitFor(delay)) {
                result.outcome = Outcome::kCancelled;
                return result;
            }
        }
        if (cancel.IsCancelled()) {
            result.outcome = Outcome::kCancelled;
            return result;
        }
        result.attempts = attempt;
        try {
            result.etag = client_.UploadPart(ticket, part_number, *frame);
            result.outcome = Outcome::kCompleted;
            return result;
        } catch (const TransportError& ex) {
            result.error = ex.what();
            log::Warn(kComponent, "part " + std::to_string(part_number) + " attempt " + std::to_string(attempt)
                                      + "/" + std::to_string(options_.max_attempts) + " failed: " + ex.what());
        }
    }
    result.outcome = Outcome::kFailed;
    result.error = "Failed to upload part " + std::to_string(part_number) + " after "
                   + std::to_string(options_.max_attempts) + " attempts: " + result.error;
    return result;
}

ScheduleResult UploadScheduler::Run(UploadSession& session,
                                    io::ChunkReader& reader,
                                    const CancellationToken& cancel,
                                    const ProgressCallback& on_progress) {
    ScheduleResult result;
    PartPool pool(options_.max_in_flight);
    progress::ThroughputMeter meter(options_.throughput_window);
    bool failed = false;
    bool cancelled = false;
    const remote::UploadTicket& ticket = session.Ticket();

    auto settle = [&](Settlement settlement) {
        switch (settlement.outcome) {
            case Outcome::kCompleted:
                if (failed || cancelled) {
                    log::Debug(kComponent, "discarding late result for part " + std::to_string(settlement.part_number));
                    return;
                }
                session.RecordCompletion(settlement.part_number, settlement.etag, settlement.attempts);
                meter.Record(session.Task(settlement.part_number).plain_size);
                if (on_progress) {
                    progress::Snapshot snapshot;
                    snapshot.completed_parts = session.CompletedParts();
                    snapshot.total_parts = ticket.total_parts;
                    snapshot.completed_bytes = session.CompletedBytes();
                    snapshot.total_bytes = session.TotalBytes();
                    snapshot.bytes_per_second = meter.BytesPerSecond();
                    if (snapshot.bytes_per_second > 0.0) {
                        snapshot.seconds_remaining =
                            static_cast<double>(snapshot.total_bytes - snapshot.completed_bytes)
                            / snapshot.bytes_per_second;
                    }
                    on_progress(snapshot);
                }
                return;
            case Outcome::kFailed:
                session.RecordFailure(settlement.part_number, settlement.error, settlement.attempts);
                if (!failed) {
                    failed = true;
                    result.error = settlement.error;
                }
                return;
            case Outcome::kCancelled:
                session.RecordFailure(settlement.part_number, "cancelled", settlement.attempts);
                cancelled = true;
                return;
        }
    };

    try {
        while (!failed && !cancelled) {
            if (cancel.IsCancelled()) {
                cancelled = true;
                break;
            }
            if (pool.Full()) {
                settle(pool.AwaitOne());
                continue;
            }
            auto chunk = reader.Next();
            if (!chunk) {
                break;
            }
            Bytes frame = chunkcipher::Encode(key_, chunk->data);
            PartTask& task = session.Admit(chunk->part_number, std::move(frame), chunk->data.size());
            session.MarkInFlight(task.part_number);
            log::Debug(kComponent, "dispatch part " + std::to_string(task.part_number) + " ("
                                       + std::to_string(task.frame->size()) + " bytes)");
            pool.Admit(task.part_number,
                       [this, &ticket, &cancel, part = task.part_number, frame_ref = task.frame]() {
                           return UploadWithRetry(ticket, part, frame_ref, cancel);
                       });
        }
    } catch (const std::exception& ex) {
        failed = true;
        result.error = ex.what();
    }

    while (pool.InFlight() > 0) {
        settle(pool.AwaitOne());
    }
    result.peak_in_flight = pool.PeakInFlight();

    if (failed) {
        result.status = UploadStatus::kFailed;
        return result;
    }
    if (cancelled || cancel.IsCancelled()) {
        result.status = UploadStatus::kCancelled;
        return result;
    }
    try {
        result.parts = session.OrderedParts();
        result.status = UploadStatus::kCompleted;
    } catch (const ProtocolError& ex) {
        result.status = UploadStatus::kFailed;
        result.error = ex.what();
    }
    return result;
}

}  // namespace blindxfer::upload
