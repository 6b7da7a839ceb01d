#pragma once

#include "blindxfer/multipart_client.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace blindxfer::upload {

using Bytes = std::vector<std::uint8_t>;

enum class PartState {
    kPending,
    kInFlight,
    kCompleted,
    kFailed,
};

const char* PartStateName(PartState state);

struct PartTask {
    std::uint32_t part_number = 0;
    std::shared_ptr<const Bytes> frame;
    std::uint64_t plain_size = 0;
    std::string remote_etag;
    PartState state = PartState::kPending;
    std::size_t attempts = 0;
    std::string last_error;
};

// Per-transfer bookkeeping. Mutated only from the orchestrating thread.
class UploadSession {
public:
    UploadSession(remote::UploadTicket ticket, std::uint64_t total_bytes);

    const remote::UploadTicket& Ticket() const noexcept { return ticket_; }

    // Part numbers must be admitted densely in increasing order.
    PartTask& Admit(std::uint32_t part_number, Bytes frame, std::uint64_t plain_size);
    void MarkInFlight(std::uint32_t part_number);
    void RecordCompletion(std::uint32_t part_number, const std::string& etag, std::size_t attempts);
    void RecordFailure(std::uint32_t part_number, const std::string& error, std::size_t attempts);

    const PartTask& Task(std::uint32_t part_number) const;

    // Completed parts sorted by part number. Throws ProtocolError unless they
    // form the dense sequence 1..total_parts.
    std::vector<remote::CompletedPart> OrderedParts() const;

    std::uint32_t Cursor() const noexcept { return next_part_; }
    std::uint64_t CompletedParts() const noexcept { return completed_.size(); }
    std::uint64_t CompletedBytes() const noexcept { return completed_bytes_; }
    std::uint64_t TotalBytes() const noexcept { return total_bytes_; }

private:
    PartTask& MutableTask(std::uint32_t part_number);

    remote::UploadTicket ticket_;
    std::uint64_t total_bytes_ = 0;
    std::map<std::uint32_t, PartTask> tasks_;
    // Completion order, not part order.
    std::vector<remote::CompletedPart> completed_;
    std::uint64_t completed_bytes_ = 0;
    std::uint32_t next_part_ = 1;
};

}  // namespace blindxfer::upload
