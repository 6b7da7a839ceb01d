#include "blindxfer/transfer_plan.hpp"

#include "blindxfer/constants.hpp"
#include "blindxfer/errors.hpp"

#include <algorithm>

namespace blindxfer::plan {

namespace {

void CheckIndex(const TransferPlan& plan, std::uint64_t index) {
    if (index >= plan.total_parts) {
        throw ProtocolError("Part index " + std::to_string(index) + " out of range (total parts "
                            + std::to_string(plan.total_parts) + ")");
    }
}

}  // namespace

TransferPlan MakePlan(std::uint64_t total_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw ProtocolError("Plain chunk size must be positive");
    }
    TransferPlan plan;
    plan.total_plaintext_size = total_size;
    plan.plain_chunk_size = chunk_size;
    plan.total_parts = total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
    return plan;
}

std::uint64_t PlainSizeOfPart(const TransferPlan& plan, std::uint64_t index) {
    CheckIndex(plan, index);
    if (index + 1 < plan.total_parts) {
        return plan.plain_chunk_size;
    }
    std::uint64_t tail = plan.total_plaintext_size % plan.plain_chunk_size;
    return tail == 0 ? plan.plain_chunk_size : tail;
}

std::uint64_t FrameSizeOfPart(const TransferPlan& plan, std::uint64_t index) {
    return PlainSizeOfPart(plan, index) + constants::kFrameOverhead;
}

std::uint64_t CiphertextOffsetOfPart(const TransferPlan& plan, std::uint64_t index) {
    CheckIndex(plan, index);
    return index * (plan.plain_chunk_size + constants::kFrameOverhead);
}

std::uint64_t EncryptedSize(const TransferPlan& plan) {
    return plan.total_plaintext_size + plan.total_parts * constants::kFrameOverhead;
}

std::uint64_t ChooseChunkSize(std::uint64_t total_size) {
    if (total_size > constants::kMaxFileSize) {
        throw ProtocolError("File size exceeds 500GB limit");
    }
    std::uint64_t size = constants::kTargetPartSize;
    std::uint64_t min_required = total_size / constants::kMaxParts
                                 + (total_size % constants::kMaxParts != 0 ? 1 : 0);
    if (min_required > size) {
        size = std::min(min_required, constants::kMaxPartSize);
    }
    return size;
}

void ValidateTicket(const remote::UploadTicket& ticket, std::uint64_t total_size) {
    if (ticket.session_id.empty()) {
        throw ProtocolError("Upload session has no id");
    }
    if (ticket.plain_chunk_size == 0) {
        throw ProtocolError("Upload session is missing its part size");
    }
    TransferPlan plan = MakePlan(total_size, ticket.plain_chunk_size);
    if (plan.total_parts != ticket.total_parts) {
        throw ProtocolError("Part count mismatch: service reported " + std::to_string(ticket.total_parts)
                            + ", expected " + std::to_string(plan.total_parts));
    }
}

}  // namespace blindxfer::plan
