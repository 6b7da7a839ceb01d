#include "blindxfer/upload_session.hpp"

#include "blindxfer/errors.hpp"

#include <algorithm>

namespace blindxfer::upload {

const char* PartStateName(PartState state) {
    switch (state) {
        case PartState::kPending:
            return "pending";
        case PartState::kInFlight:
            return "in-flight";
        case PartState::kCompleted:
            return "completed";
        case PartState::kFailed:
            return "failed";
    }
    return "unknown";
}

UploadSession::UploadSession(remote::UploadTicket ticket, std::uint64_t total_bytes)
    : ticket_(std::move(ticket)), total_bytes_(total_bytes) {}

PartTask& UploadSession::Admit(std::uint32_t part_number, Bytes frame, std::uint64_t plain_size) {
    if (part_number != next_part_) {
        throw ProtocolError("Part " + std::to_string(part_number) + " admitted out of order, expected "
                            + std::to_string(next_part_));
    }
    if (ticket_.total_parts != 0 && part_number > ticket_.total_parts) {
        throw ProtocolError("Part " + std::to_string(part_number) + " exceeds total parts "
                            + std::to_string(ticket_.total_parts));
    }
    PartTask task;
    task.part_number = part_number;
    task.frame = std::make_shared<const Bytes>(std::move(frame));
    task.plain_size = plain_size;
    ++next_part_;
    return tasks_.emplace(part_number, std::move(task)).first->second;
}

PartTask& UploadSession::MutableTask(std::uint32_t part_number) {
    auto it = tasks_.find(part_number);
    if (it == tasks_.end()) {
        throw ProtocolError("Unknown part " + std::to_string(part_number));
    }
    return it->second;
}

const PartTask& UploadSession::Task(std::uint32_t part_number) const {
    auto it = tasks_.find(part_number);
    if (it == tasks_.end()) {
        throw ProtocolError("Unknown part " + std::to_string(part_number));
    }
    return it->second;
}

void UploadSession::MarkInFlight(std::uint32_t part_number) {
    PartTask& task = MutableTask(part_number);
    if (task.state != PartState::kPending) {
        throw ProtocolError("Part " + std::to_string(part_number) + " is " + PartStateName(task.state));
    }
    task.state = PartState::kInFlight;
}

void UploadSession::RecordCompletion(std::uint32_t part_number, const std::string& etag, std::size_t attempts) {
    PartTask& task = MutableTask(part_number);
    if (task.state == PartState::kCompleted) {
        throw ProtocolError("Part " + std::to_string(part_number) + " completed twice");
    }
    task.state = PartState::kCompleted;
    task.remote_etag = etag;
    task.attempts = attempts;
    task.frame.reset();
    completed_.push_back(remote::CompletedPart{part_number, etag});
    completed_bytes_ += task.plain_size;
}

void UploadSession::RecordFailure(std::uint32_t part_number, const std::string& error, std::size_t attempts) {
    PartTask& task = MutableTask(part_number);
    task.state = PartState::kFailed;
    task.last_error = error;
    task.attempts = attempts;
    task.frame.reset();
}

std::vector<remote::CompletedPart> UploadSession::OrderedParts() const {
    std::vector<remote::CompletedPart> parts = completed_;
    std::sort(parts.begin(), parts.end(),
              [](const remote::CompletedPart& a, const remote::CompletedPart& b) {
                  return a.part_number < b.part_number;
              });
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].part_number != i + 1) {
            throw ProtocolError("Completed parts are not a gap-free sequence at part "
                                + std::to_string(parts[i].part_number));
        }
    }
    if (parts.size() != ticket_.total_parts) {
        throw ProtocolError("Completed " + std::to_string(parts.size()) + " of "
                            + std::to_string(ticket_.total_parts) + " parts");
    }
    return parts;
}

}  // namespace blindxfer::upload
