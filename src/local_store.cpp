#include "blindxfer/local_store.hpp"

#include "blindxfer/constants.hpp"
#include "blindxfer/crypto.hpp"
#include "blindxfer/errors.hpp"
#include "blindxfer/json.hpp"
#include "blindxfer/log.hpp"
#include "blindxfer/transfer_plan.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iterator>
#include <system_error>

namespace blindxfer::remote {

namespace {

constexpr const char* kComponent = "store";

std::int64_t NowEpoch() {
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count());
}

std::string UtcTimestamp(std::int64_t epoch) {
    std::time_t tt = static_cast<std::time_t>(epoch);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
        return {};
    }
    return std::string(buffer);
}

std::string RandomHex(std::size_t bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::vector<std::uint8_t> raw = crypto::RandomBytes(bytes);
    std::string out;
    out.reserve(bytes * 2);
    for (std::uint8_t b : raw) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0F]);
    }
    return out;
}

std::string NewUuid() {
    std::string hex = RandomHex(16);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-"
           + hex.substr(20, 12);
}

void CheckId(const std::string& id) {
    if (id.empty() || id.size() > 64) {
        throw ProtocolError("Invalid object id");
    }
    for (char c : id) {
        bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-';
        if (!ok) {
            throw ProtocolError("Invalid object id: " + id);
        }
    }
}

std::string ReadText(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::vector<std::uint8_t> ReadBytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Write to a sibling temp file and rename over the target.
void WriteAtomically(const std::filesystem::path& path, const std::uint8_t* data, std::size_t len) {
    std::filesystem::path tmp = path;
    tmp += ".tmp-" + RandomHex(4);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Failed to open file for writing: " + tmp.string());
        }
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        out.flush();
        if (!out) {
            throw std::runtime_error("Failed to write file: " + tmp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("Failed to rename into place: " + path.string());
    }
}

void WriteTextAtomically(const std::filesystem::path& path, const std::string& text) {
    WriteAtomically(path, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

}  // namespace

LocalStore::LocalStore(std::filesystem::path root, std::uint64_t part_size)
    : root_(std::move(root)), part_size_(part_size) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec || !std::filesystem::is_directory(root_)) {
        throw std::runtime_error("Failed to create store directory: " + root_.string());
    }
}

std::filesystem::path LocalStore::PartsDir(const std::string& id) const {
    return root_ / (id + ".parts");
}

std::filesystem::path LocalStore::PartPath(const std::string& id, std::uint32_t part_number) const {
    char name[32];
    std::snprintf(name, sizeof(name), "part-%05u", static_cast<unsigned>(part_number));
    return PartsDir(id) / name;
}

std::filesystem::path LocalStore::MetaPath(const std::string& id) const {
    return root_ / (id + ".meta");
}

std::filesystem::path LocalStore::ObjectPath(const std::string& id) const {
    CheckId(id);
    return root_ / (id + ".bin");
}

UploadTicket LocalStore::Begin(const BeginRequest& request) {
    if (request.total_size == 0) {
        throw ProtocolError("fileName and fileSize are required");
    }
    Manifest manifest;
    manifest.id = NewUuid();
    manifest.upload_id = "local-" + RandomHex(8);
    manifest.file_size = request.total_size;
    manifest.content_type = request.content_type.empty() ? std::string(constants::kDefaultContentType)
                                                         : request.content_type;
    manifest.part_size = part_size_ != 0 ? part_size_ : plan::ChooseChunkSize(request.total_size);
    manifest.total_parts = plan::MakePlan(request.total_size, manifest.part_size).total_parts;
    manifest.encrypted_metadata = request.encrypted_metadata;
    std::int64_t now = NowEpoch();
    manifest.created_at = UtcTimestamp(now);

    std::string text = json::ObjectWriter()
                           .Add("id", manifest.id)
                           .Add("uploadId", manifest.upload_id)
                           .AddNumber("fileSize", manifest.file_size)
                           .Add("contentType", manifest.content_type)
                           .AddNumber("partSize", manifest.part_size)
                           .AddNumber("totalParts", manifest.total_parts)
                           .Add("encryptedMetadata", manifest.encrypted_metadata)
                           .Add("createdAt", manifest.created_at)
                           .Finish();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::filesystem::path dir = PartsDir(manifest.id);
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create session directory: " + dir.string());
        }
        WriteTextAtomically(dir / "manifest", text);
    }

    UploadTicket ticket;
    ticket.session_id = manifest.id;
    ticket.remote_upload_id = manifest.upload_id;
    ticket.object_key = "uploads/" + manifest.id + "/" + std::string(constants::kNeutralObjectName);
    ticket.plain_chunk_size = manifest.part_size;
    ticket.total_parts = manifest.total_parts;
    ticket.expires_at = UtcTimestamp(now + constants::kExpiryHours * 3600);
    log::Debug(kComponent, "began session " + manifest.id + " (" + std::to_string(manifest.total_parts) + " parts)");
    return ticket;
}

LocalStore::Manifest LocalStore::LoadManifest(const UploadTicket& ticket) const {
    CheckId(ticket.session_id);
    std::filesystem::path path = PartsDir(ticket.session_id) / "manifest";
    std::string text;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!std::filesystem::exists(path)) {
            throw ProtocolError("Upload not found or not in uploading state");
        }
        text = ReadText(path);
    }
    auto fields = json::ParseFlatObject(text);
    Manifest manifest;
    manifest.id = json::GetString(fields, "id").value_or("");
    manifest.upload_id = json::GetString(fields, "uploadId").value_or("");
    manifest.file_size = json::GetUnsigned(fields, "fileSize").value_or(0);
    manifest.content_type = json::GetString(fields, "contentType").value_or("");
    manifest.part_size = json::GetUnsigned(fields, "partSize").value_or(0);
    manifest.total_parts = json::GetUnsigned(fields, "totalParts").value_or(0);
    manifest.encrypted_metadata = json::GetString(fields, "encryptedMetadata").value_or("");
    manifest.created_at = json::GetString(fields, "createdAt").value_or("");
    if (manifest.upload_id != ticket.remote_upload_id) {
        throw ProtocolError("Upload id mismatch for session " + ticket.session_id);
    }
    return manifest;
}

std::string LocalStore::UploadPart(const UploadTicket& ticket, std::uint32_t part_number, const Bytes& frame) {
    Manifest manifest = LoadManifest(ticket);
    if (part_number == 0 || part_number > manifest.total_parts) {
        throw ProtocolError("Part number " + std::to_string(part_number) + " out of range");
    }
    if (frame.size() > manifest.part_size + constants::kFrameOverhead) {
        throw ProtocolError("Part " + std::to_string(part_number) + " larger than the part size");
    }
    WriteAtomically(PartPath(manifest.id, part_number), frame.data(), frame.size());
    return crypto::Sha256Hex(frame.data(), frame.size());
}

std::string LocalStore::Finalize(const UploadTicket& ticket, const std::vector<CompletedPart>& parts) {
    Manifest manifest = LoadManifest(ticket);
    if (parts.size() != manifest.total_parts) {
        throw ProtocolError("Expected " + std::to_string(manifest.total_parts) + " parts, got "
                            + std::to_string(parts.size()));
    }
    plan::TransferPlan layout = plan::MakePlan(manifest.file_size, manifest.part_size);
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].part_number != i + 1) {
            throw ProtocolError("Part list must be strictly increasing from 1 without gaps (position "
                                + std::to_string(i) + " has part " + std::to_string(parts[i].part_number) + ")");
        }
    }

    std::filesystem::path object = ObjectPath(manifest.id);
    std::filesystem::path tmp = object;
    tmp += ".tmp";
    try {
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("Failed to open file for writing: " + tmp.string());
            }
            for (std::size_t i = 0; i < parts.size(); ++i) {
                std::filesystem::path part_path = PartPath(manifest.id, parts[i].part_number);
                if (!std::filesystem::exists(part_path)) {
                    throw ProtocolError("Part " + std::to_string(parts[i].part_number) + " was never uploaded");
                }
                std::vector<std::uint8_t> frame = ReadBytes(part_path);
                if (frame.size() != plan::FrameSizeOfPart(layout, i)) {
                    throw ProtocolError("Part " + std::to_string(parts[i].part_number) + " has unexpected size "
                                        + std::to_string(frame.size()));
                }
                if (crypto::Sha256Hex(frame.data(), frame.size()) != parts[i].etag) {
                    throw ProtocolError("ETag mismatch for part " + std::to_string(parts[i].part_number));
                }
                out.write(reinterpret_cast<const char*>(frame.data()), static_cast<std::streamsize>(frame.size()));
            }
            out.flush();
            if (!out) {
                throw std::runtime_error("Failed to write file: " + tmp.string());
            }
        }
    } catch (const std::exception&) {
        std::error_code cleanup;
        std::filesystem::remove(tmp, cleanup);
        throw;
    }
    std::error_code ec;
    std::filesystem::rename(tmp, object, ec);
    if (ec) {
        throw std::runtime_error("Failed to rename into place: " + object.string());
    }

    std::int64_t now = NowEpoch();
    std::int64_t expires = now + constants::kExpiryHours * 3600;
    std::string meta = json::ObjectWriter()
                           .Add("id", manifest.id)
                           .Add("fileName", constants::kNeutralObjectName)
                           .AddNumber("fileSize", manifest.file_size)
                           .Add("contentType", manifest.content_type)
                           .AddNumber("partSize", manifest.part_size)
                           .AddNumber("totalParts", manifest.total_parts)
                           .Add("expiresAt", UtcTimestamp(expires))
                           .AddNumber("expiresAtEpoch", static_cast<std::uint64_t>(expires))
                           .Add("createdAt", manifest.created_at)
                           .Add("encryptedMetadata", manifest.encrypted_metadata)
                           .Finish();
    WriteTextAtomically(MetaPath(manifest.id), meta);

    std::lock_guard<std::mutex> lock(mutex_);
    std::filesystem::remove_all(PartsDir(manifest.id), ec);
    if (ec) {
        log::Warn(kComponent, "failed to remove parts of " + manifest.id + ": " + ec.message());
    }
    log::Debug(kComponent, "finalized " + manifest.id);
    return manifest.id;
}

void LocalStore::Abort(const UploadTicket& ticket) {
    if (ticket.session_id.empty()) {
        return;
    }
    try {
        CheckId(ticket.session_id);
    } catch (const ProtocolError& ex) {
        log::Warn(kComponent, std::string("abort ignored: ") + ex.what());
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::uintmax_t removed = std::filesystem::remove_all(PartsDir(ticket.session_id), ec);
    if (ec) {
        log::Warn(kComponent, "abort of " + ticket.session_id + " failed: " + ec.message());
        return;
    }
    log::Debug(kComponent, "aborted " + ticket.session_id + " (" + std::to_string(removed) + " entries removed)");
}

DownloadInfo LocalStore::GetDownloadInfo(const std::string& id) const {
    CheckId(id);
    std::filesystem::path path = MetaPath(id);
    if (!std::filesystem::exists(path)) {
        throw ProtocolError("File not found or expired");
    }
    auto fields = json::ParseFlatObject(ReadText(path));
    auto expires = json::GetUnsigned(fields, "expiresAtEpoch");
    if (expires && static_cast<std::int64_t>(*expires) <= NowEpoch()) {
        throw ProtocolError("File not found or expired");
    }
    DownloadInfo info;
    info.id = json::GetString(fields, "id").value_or(id);
    info.file_name = json::GetString(fields, "fileName").value_or("");
    info.file_size = json::GetUnsigned(fields, "fileSize").value_or(0);
    info.content_type = json::GetString(fields, "contentType").value_or("");
    info.plain_chunk_size = json::GetUnsigned(fields, "partSize").value_or(0);
    info.total_parts = json::GetUnsigned(fields, "totalParts").value_or(0);
    info.expires_at = json::GetString(fields, "expiresAt").value_or("");
    info.created_at = json::GetString(fields, "createdAt").value_or("");
    info.encrypted_metadata = json::GetString(fields, "encryptedMetadata").value_or("");
    return info;
}

std::unique_ptr<io::ByteSource> LocalStore::OpenObject(const std::string& id,
                                                       std::uint64_t offset,
                                                       std::uint64_t length) const {
    std::filesystem::path path = ObjectPath(id);
    if (!std::filesystem::exists(path)) {
        throw ProtocolError("File not found or expired");
    }
    return std::make_unique<io::FileSource>(path, offset, length);
}

io::RangeOpener LocalStore::ObjectOpener(const std::string& id) const {
    std::filesystem::path path = ObjectPath(id);
    return [path](std::uint64_t offset, std::uint64_t length) -> std::unique_ptr<io::ByteSource> {
        return std::make_unique<io::FileSource>(path, offset, length);
    };
}

}  // namespace blindxfer::remote
