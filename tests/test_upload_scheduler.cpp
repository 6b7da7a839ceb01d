#include "blindxfer/byte_source.hpp"
#include "blindxfer/cancellation.hpp"
#include "blindxfer/chunk_cipher.hpp"
#include "blindxfer/chunk_reader.hpp"
#include "blindxfer/errors.hpp"
#include "blindxfer/frame_coalescer.hpp"
#include "blindxfer/upload_scheduler.hpp"
#include "blindxfer/upload_session.hpp"
#include "blindxfer/uploader.hpp"
#include "test_support.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using blindxfer::testing::Bytes;
using blindxfer::testing::Check;
using blindxfer::testing::CheckEq;
using blindxfer::testing::CheckThrows;
using blindxfer::testing::FakeClient;
using blindxfer::testing::PatternBytes;
using blindxfer::upload::UploadStatus;

namespace {

constexpr std::uint64_t kChunk = 100;

blindxfer::config::TransferConfig TestConfig(std::size_t max_in_flight = 3) {
    blindxfer::config::TransferConfig config;
    config.share_base = "https://share.example";
    config.max_in_flight = max_in_flight;
    config.max_attempts = 3;
    config.retry_base_delay = std::chrono::milliseconds(5);
    return config;
}

blindxfer::upload::UploadOutcome UploadBytes(FakeClient& client,
                                             const Bytes& data,
                                             const blindxfer::config::TransferConfig& config,
                                             const blindxfer::upload::CancellationToken& cancel = {},
                                             const blindxfer::upload::ProgressCallback& on_progress = {}) {
    blindxfer::io::MemorySource source(data);
    blindxfer::upload::Uploader uploader(client, config);
    blindxfer::chunkcipher::FileMetadata meta{"data.bin", "application/octet-stream"};
    return uploader.Upload(source, data.size(), meta, cancel, on_progress);
}

// Counts the abort like FakeClient, then reports the abort endpoint as unreachable.
class UnreachableAbortClient : public FakeClient {
public:
    using FakeClient::FakeClient;

    void Abort(const blindxfer::remote::UploadTicket& ticket) override {
        FakeClient::Abort(ticket);
        throw blindxfer::TransportError("abort endpoint unreachable", 503);
    }
};

// Runs the scheduler alone over a fresh session of `data`.
blindxfer::upload::ScheduleResult Schedule(FakeClient& client,
                                           const Bytes& data,
                                           const blindxfer::upload::SchedulerOptions& options,
                                           const blindxfer::upload::CancellationToken& cancel) {
    blindxfer::remote::BeginRequest request;
    request.total_size = data.size();
    blindxfer::remote::UploadTicket ticket = client.Begin(request);
    blindxfer::upload::UploadSession session(ticket, data.size());
    blindxfer::io::MemorySource source(data);
    blindxfer::io::ChunkReader reader(source, ticket.plain_chunk_size, data.size());
    blindxfer::upload::UploadScheduler scheduler(client, blindxfer::Secret::Generate(), options);
    return scheduler.Run(session, reader, cancel);
}

}  // namespace

int main() {
    blindxfer::testing::Suite suite("upload_scheduler");
    const Bytes data = PatternBytes(1000, 21);

    suite.Run("in_flight_never_exceeds_bound", [&] {
        FakeClient client(kChunk);
        client.SetDelay(std::chrono::milliseconds(20));
        blindxfer::upload::SchedulerOptions options;
        options.max_in_flight = 3;
        options.retry_base_delay = std::chrono::milliseconds(1);
        blindxfer::upload::CancellationToken cancel;
        auto result = Schedule(client, data, options, cancel);
        CheckEq(result.status, UploadStatus::kCompleted, "completed");
        CheckEq(result.parts.size(), std::size_t{10}, "ten parts");
        CheckEq(result.peak_in_flight, std::size_t{3}, "pool filled to its bound");
        Check(client.PeakInFlight() <= 3, "service never saw more than three uploads");
    });

    suite.Run("bound_of_one_is_sequential", [&] {
        FakeClient client(kChunk);
        client.SetDelay(std::chrono::milliseconds(2));
        blindxfer::upload::SchedulerOptions options;
        options.max_in_flight = 1;
        blindxfer::upload::CancellationToken cancel;
        auto result = Schedule(client, data, options, cancel);
        CheckEq(result.status, UploadStatus::kCompleted, "completed");
        CheckEq(client.PeakInFlight(), std::size_t{1}, "one at a time");
        CheckEq(client.CompletionOrder(), std::vector<std::uint32_t>({1, 2, 3, 4, 5, 6, 7, 8, 9, 10}),
                "in order");
    });

    suite.Run("finalize_sorts_out_of_order_completions", [&] {
        FakeClient client(kChunk);
        client.DelayPart(1, std::chrono::milliseconds(150));
        client.DelayPart(2, std::chrono::milliseconds(75));
        auto outcome = UploadBytes(client, PatternBytes(300, 3), TestConfig());
        CheckEq(outcome.status, UploadStatus::kCompleted, "completed");
        CheckEq(client.CompletionOrder().front(), std::uint32_t{3}, "part 3 finished first");
        auto parts = client.FinalizedParts();
        CheckEq(parts.size(), std::size_t{3}, "three parts");
        for (std::size_t i = 0; i < parts.size(); ++i) {
            CheckEq(parts[i].part_number, static_cast<std::uint32_t>(i + 1), "ascending part numbers");
            CheckEq(parts[i].etag, "etag-" + std::to_string(i + 1), "etag kept with its part");
        }
    });

    suite.Run("transient_failures_are_retried_with_linear_backoff", [&] {
        FakeClient client(kChunk);
        client.FailTransiently(2, 2);
        auto config = TestConfig();
        config.retry_base_delay = std::chrono::milliseconds(30);
        auto started = std::chrono::steady_clock::now();
        auto outcome = UploadBytes(client, data, config);
        auto elapsed = std::chrono::steady_clock::now() - started;
        CheckEq(outcome.status, UploadStatus::kCompleted, "completed");
        CheckEq(client.AttemptsFor(2), 3, "two failures then success");
        CheckEq(client.AttemptsFor(1), 1, "other parts untouched");
        Check(elapsed >= std::chrono::milliseconds(90), "waited 30 ms then 60 ms");
        CheckEq(client.AbortCount(), 0, "no abort");
    });

    suite.Run("exhausted_retries_fail_and_abort", [&] {
        FakeClient client(kChunk);
        client.FailTransiently(2, 10);
        auto outcome = UploadBytes(client, data, TestConfig());
        CheckEq(outcome.status, UploadStatus::kFailed, "failed");
        CheckEq(client.AttemptsFor(2), 3, "attempt budget");
        CheckEq(client.FinalizeCount(), 0, "never finalized");
        CheckEq(client.AbortCount(), 1, "aborted once");
        Check(outcome.error.find("part 2") != std::string::npos, "error names the part");
        Check(outcome.share_link.empty() && outcome.key.empty(), "no link for a failed upload");
    });

    suite.Run("non_transport_errors_are_not_retried", [&] {
        FakeClient client(kChunk);
        client.FailPermanently(3);
        auto outcome = UploadBytes(client, data, TestConfig());
        CheckEq(outcome.status, UploadStatus::kFailed, "failed");
        CheckEq(client.AttemptsFor(3), 1, "single attempt");
        Check(outcome.error.find("injected rejection") != std::string::npos, "error propagated");
        CheckEq(client.AbortCount(), 1, "aborted");
    });

    suite.Run("cancel_stops_admission_and_aborts", [&] {
        FakeClient client(kChunk);
        client.SetDelay(std::chrono::milliseconds(10));
        blindxfer::upload::CancellationToken cancel;
        client.OnUpload([&cancel](std::uint32_t part) {
            if (part == 2) {
                cancel.Cancel();
            }
        });
        auto outcome = UploadBytes(client, data, TestConfig(), cancel);
        CheckEq(outcome.status, UploadStatus::kCancelled, "cancelled");
        Check(outcome.error.empty(), "cancellation is not an error");
        Check(client.TotalAttempts() < 10, "remaining parts were never dispatched");
        CheckEq(client.FinalizeCount(), 0, "not finalized");
        CheckEq(client.AbortCount(), 1, "aborted");
    });

    suite.Run("failing_abort_still_reports_failure", [&] {
        UnreachableAbortClient client(kChunk);
        client.FailTransiently(2, 10);
        blindxfer::upload::UploadOutcome outcome;
        try {
            outcome = UploadBytes(client, data, TestConfig());
        } catch (const std::exception& ex) {
            Check(false, std::string("upload threw: ") + ex.what());
        }
        CheckEq(outcome.status, UploadStatus::kFailed, "failed");
        Check(!outcome.error.empty(), "error recorded");
        CheckEq(client.AbortCount(), 1, "abort attempted once");
        CheckEq(client.FinalizeCount(), 0, "not finalized");
    });

    suite.Run("failing_abort_still_reports_cancel", [&] {
        UnreachableAbortClient client(kChunk);
        client.SetDelay(std::chrono::milliseconds(10));
        blindxfer::upload::CancellationToken cancel;
        client.OnUpload([&cancel](std::uint32_t part) {
            if (part == 2) {
                cancel.Cancel();
            }
        });
        blindxfer::upload::UploadOutcome outcome;
        try {
            outcome = UploadBytes(client, data, TestConfig(), cancel);
        } catch (const std::exception& ex) {
            Check(false, std::string("upload threw: ") + ex.what());
        }
        CheckEq(outcome.status, UploadStatus::kCancelled, "cancelled");
        CheckEq(client.AbortCount(), 1, "abort attempted once");
    });

    suite.Run("cancel_interrupts_retry_wait", [&] {
        FakeClient client(kChunk);
        client.FailTransiently(1, 10);
        auto config = TestConfig(1);
        config.retry_base_delay = std::chrono::seconds(5);
        blindxfer::upload::CancellationToken cancel;
        std::thread canceller([&cancel] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            cancel.Cancel();
        });
        auto started = std::chrono::steady_clock::now();
        auto outcome = UploadBytes(client, data, config, cancel);
        auto elapsed = std::chrono::steady_clock::now() - started;
        canceller.join();
        CheckEq(outcome.status, UploadStatus::kCancelled, "cancelled");
        CheckEq(client.AttemptsFor(1), 1, "no retry after cancel");
        Check(elapsed < std::chrono::seconds(4), "did not sit out the backoff");
    });

    suite.Run("progress_is_monotonic", [&] {
        FakeClient client(kChunk);
        std::vector<blindxfer::progress::Snapshot> snapshots;
        auto outcome = UploadBytes(client, data, TestConfig(), {},
                                   [&snapshots](const blindxfer::progress::Snapshot& s) { snapshots.push_back(s); });
        CheckEq(outcome.status, UploadStatus::kCompleted, "completed");
        CheckEq(snapshots.size(), std::size_t{10}, "one snapshot per settlement");
        for (std::size_t i = 1; i < snapshots.size(); ++i) {
            Check(snapshots[i].completed_bytes > snapshots[i - 1].completed_bytes, "bytes increase");
        }
        CheckEq(snapshots.back().completed_bytes, std::uint64_t{1000}, "all bytes");
        CheckEq(snapshots.back().completed_parts, std::uint64_t{10}, "all parts");
        CheckEq(snapshots.back().total_parts, std::uint64_t{10}, "total parts");
    });

    suite.Run("uploaded_frames_decrypt_with_link_key", [&] {
        FakeClient client(kChunk);
        auto outcome = UploadBytes(client, data, TestConfig());
        CheckEq(outcome.status, UploadStatus::kCompleted, "completed");
        CheckEq(outcome.share_link, "https://share.example/download/" + outcome.id + "#" + outcome.key, "link");
        auto frames = client.Frames();
        CheckEq(frames.size(), std::size_t{10}, "ten frames stored");
        for (const auto& entry : frames) {
            CheckEq(entry.second.size(), static_cast<std::size_t>(kChunk + 28), "frame size");
        }
        blindxfer::Secret key = blindxfer::Secret::FromBase64Url(outcome.key);
        blindxfer::io::MemorySource object(client.Object());
        blindxfer::stream::DecryptingReader reader(object, key, kChunk);
        Bytes plain;
        while (auto chunk = reader.Next()) {
            plain.insert(plain.end(), chunk->begin(), chunk->end());
        }
        CheckEq(plain, data, "plaintext");

        auto meta = blindxfer::chunkcipher::DecryptMetadata(key, client.LastBeginRequest().encrypted_metadata);
        CheckEq(meta.name, std::string("data.bin"), "metadata travels encrypted");
    });

    suite.Run("empty_input_is_rejected", [&] {
        FakeClient client(kChunk);
        auto outcome = UploadBytes(client, Bytes{}, TestConfig());
        CheckEq(outcome.status, UploadStatus::kFailed, "failed");
        CheckEq(client.BeginCount(), 0, "no session created");
    });

    suite.Run("inconsistent_ticket_fails_before_upload", [&] {
        FakeClient client(kChunk);
        client.SkewPartCount(1);
        auto outcome = UploadBytes(client, data, TestConfig());
        CheckEq(outcome.status, UploadStatus::kFailed, "failed");
        CheckEq(client.TotalAttempts(), 0, "no part uploaded");
        CheckEq(client.AbortCount(), 1, "session aborted");
    });

    suite.Run("resume_is_unsupported", [&] {
        FakeClient client(kChunk);
        blindxfer::upload::Uploader uploader(client, TestConfig());
        CheckThrows<blindxfer::UnsupportedError>([&] { uploader.Resume("fake-1"); }, "resume");
    });

    suite.Run("session_rejects_duplicates_and_gaps", [&] {
        blindxfer::remote::UploadTicket ticket;
        ticket.session_id = "s";
        ticket.plain_chunk_size = 10;
        ticket.total_parts = 2;
        blindxfer::upload::UploadSession session(ticket, 20);
        session.Admit(1, Bytes(38), 10);
        session.Admit(2, Bytes(38), 10);
        session.RecordCompletion(2, "b", 1);
        CheckThrows<blindxfer::ProtocolError>([&] { session.OrderedParts(); }, "gap at part 1");
        session.RecordCompletion(1, "a", 1);
        auto parts = session.OrderedParts();
        CheckEq(parts.front().part_number, std::uint32_t{1}, "sorted");
        Check(session.CompletedBytes() == 20, "bytes counted");
        CheckThrows<std::exception>([&] { session.RecordCompletion(1, "a", 1); }, "duplicate completion");
    });

    return suite.Finish();
}
