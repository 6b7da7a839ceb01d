#include "blindxfer/byte_source.hpp"
#include "blindxfer/chunk_reader.hpp"
#include "blindxfer/constants.hpp"
#include "blindxfer/errors.hpp"
#include "blindxfer/transfer_plan.hpp"
#include "test_support.hpp"

#include <stdexcept>
#include <vector>

using blindxfer::constants::kFrameOverhead;
using blindxfer::constants::kGiB;
using blindxfer::constants::kMiB;
using blindxfer::testing::Bytes;
using blindxfer::testing::Check;
using blindxfer::testing::CheckEq;
using blindxfer::testing::CheckThrows;
using blindxfer::testing::PatternBytes;

namespace plan = blindxfer::plan;

int main() {
    blindxfer::testing::Suite suite("transfer_plan");

    suite.Run("part_count_rounds_up", [] {
        auto p = plan::MakePlan(25 * kMiB, 10 * kMiB);
        CheckEq(p.total_parts, std::uint64_t{3}, "25 MiB in 10 MiB parts");
        CheckEq(plan::MakePlan(20 * kMiB, 10 * kMiB).total_parts, std::uint64_t{2}, "exact multiple");
        CheckEq(plan::MakePlan(1, 10 * kMiB).total_parts, std::uint64_t{1}, "one byte");
        CheckEq(plan::MakePlan(0, 10 * kMiB).total_parts, std::uint64_t{0}, "empty");
        CheckThrows<blindxfer::ProtocolError>([] { plan::MakePlan(10, 0); }, "zero chunk");
    });

    suite.Run("frame_geometry", [] {
        auto p = plan::MakePlan(25 * kMiB, 10 * kMiB);
        CheckEq(plan::PlainSizeOfPart(p, 0), 10 * kMiB, "first part");
        CheckEq(plan::PlainSizeOfPart(p, 2), 5 * kMiB, "short last part");
        CheckEq(plan::FrameSizeOfPart(p, 1), 10 * kMiB + kFrameOverhead, "full frame");
        CheckEq(plan::FrameSizeOfPart(p, 2), 5 * kMiB + kFrameOverhead, "last frame");
        CheckEq(plan::CiphertextOffsetOfPart(p, 2), 2 * (10 * kMiB + kFrameOverhead), "third frame offset");
        CheckEq(plan::EncryptedSize(p), 25 * kMiB + 3 * kFrameOverhead, "object size");
        CheckThrows<blindxfer::ProtocolError>([&] { plan::PlainSizeOfPart(p, 3); }, "index past the end");

        auto even = plan::MakePlan(20 * kMiB, 10 * kMiB);
        CheckEq(plan::PlainSizeOfPart(even, 1), 10 * kMiB, "last part of an exact multiple is full");
    });

    suite.Run("service_chunk_policy", [] {
        CheckEq(plan::ChooseChunkSize(1), 10 * kMiB, "small file");
        CheckEq(plan::ChooseChunkSize(10000 * 10 * kMiB), 10 * kMiB, "exactly the part limit");
        std::uint64_t big = 200 * kGiB;
        std::uint64_t chunk = plan::ChooseChunkSize(big);
        CheckEq(chunk, (big + 9999) / 10000, "grown to fit 10000 parts");
        Check(plan::MakePlan(big, chunk).total_parts <= 10000, "part limit respected");
        CheckThrows<blindxfer::ProtocolError>([] { plan::ChooseChunkSize(500 * kGiB + 1); }, "over 500 GiB");
    });

    suite.Run("ticket_validation", [] {
        blindxfer::remote::UploadTicket ticket;
        ticket.session_id = "abc";
        ticket.plain_chunk_size = 10 * kMiB;
        ticket.total_parts = 3;
        plan::ValidateTicket(ticket, 25 * kMiB);

        auto wrong_count = ticket;
        wrong_count.total_parts = 4;
        CheckThrows<blindxfer::ProtocolError>([&] { plan::ValidateTicket(wrong_count, 25 * kMiB); },
                                              "part count mismatch");
        auto no_chunk = ticket;
        no_chunk.plain_chunk_size = 0;
        CheckThrows<blindxfer::ProtocolError>([&] { plan::ValidateTicket(no_chunk, 25 * kMiB); }, "missing size");
        auto no_id = ticket;
        no_id.session_id.clear();
        CheckThrows<blindxfer::ProtocolError>([&] { plan::ValidateTicket(no_id, 25 * kMiB); }, "missing id");
    });

    suite.Run("chunk_reader_slices_irregular_input", [] {
        Bytes data = PatternBytes(2500, 5);
        // The source hands out odd-sized pieces; chunks must still be exact.
        blindxfer::io::MemorySource source(data, {7, 1, 333, 64});
        blindxfer::io::ChunkReader reader(source, 1000, data.size());
        Bytes joined;
        std::vector<std::size_t> sizes;
        std::vector<std::uint32_t> numbers;
        bool saw_last = false;
        while (auto chunk = reader.Next()) {
            sizes.push_back(chunk->data.size());
            numbers.push_back(chunk->part_number);
            Check(!saw_last, "nothing after the last chunk");
            saw_last = chunk->is_last;
            joined.insert(joined.end(), chunk->data.begin(), chunk->data.end());
        }
        CheckEq(sizes, std::vector<std::size_t>({1000, 1000, 500}), "chunk sizes");
        CheckEq(numbers, std::vector<std::uint32_t>({1, 2, 3}), "dense part numbers");
        Check(saw_last, "last chunk flagged");
        CheckEq(joined, data, "content preserved");
        CheckEq(reader.Offset(), std::uint64_t{2500}, "offset at end");
        Check(!reader.Next().has_value(), "stays exhausted");
    });

    suite.Run("chunk_reader_detects_short_input", [] {
        blindxfer::io::MemorySource source(PatternBytes(1500));
        blindxfer::io::ChunkReader reader(source, 1000, 2000);
        Check(reader.Next().has_value(), "first chunk");
        CheckThrows<std::runtime_error>([&] { reader.Next(); }, "input shorter than declared");
    });

    return suite.Finish();
}
