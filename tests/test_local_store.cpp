#include "blindxfer/byte_source.hpp"
#include "blindxfer/chunk_cipher.hpp"
#include "blindxfer/constants.hpp"
#include "blindxfer/errors.hpp"
#include "blindxfer/local_store.hpp"
#include "blindxfer/transfer_plan.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <vector>

using blindxfer::testing::Bytes;
using blindxfer::testing::Check;
using blindxfer::testing::CheckEq;
using blindxfer::testing::CheckThrows;
using blindxfer::testing::PatternBytes;
using blindxfer::testing::TempDir;

namespace remote = blindxfer::remote;

namespace {

constexpr std::uint64_t kChunk = 100;

struct Uploaded {
    remote::UploadTicket ticket;
    std::vector<remote::CompletedPart> parts;
    std::vector<Bytes> frames;
};

// Begins a session and uploads every frame, last part first.
Uploaded UploadAll(remote::LocalStore& store, const blindxfer::Secret& key, const Bytes& data) {
    remote::BeginRequest request;
    request.total_size = data.size();
    request.encrypted_metadata = blindxfer::chunkcipher::EncryptMetadata(key, {"notes.txt", "text/plain"});
    Uploaded out;
    out.ticket = store.Begin(request);
    auto layout = blindxfer::plan::MakePlan(data.size(), out.ticket.plain_chunk_size);
    for (std::uint64_t i = 0; i < layout.total_parts; ++i) {
        std::size_t offset = static_cast<std::size_t>(i * layout.plain_chunk_size);
        std::size_t len = static_cast<std::size_t>(blindxfer::plan::PlainSizeOfPart(layout, i));
        out.frames.push_back(blindxfer::chunkcipher::Encode(key, data.data() + offset, len));
    }
    out.parts.resize(out.frames.size());
    for (std::size_t i = out.frames.size(); i-- > 0;) {
        auto part_number = static_cast<std::uint32_t>(i + 1);
        out.parts[i] = {part_number, store.UploadPart(out.ticket, part_number, out.frames[i])};
    }
    return out;
}

Bytes ReadAll(blindxfer::io::ByteSource& source) {
    Bytes out;
    std::uint8_t buffer[97];
    std::size_t n = 0;
    while ((n = source.Read(buffer, sizeof(buffer))) > 0) {
        out.insert(out.end(), buffer, buffer + n);
    }
    return out;
}

}  // namespace

int main() {
    blindxfer::testing::Suite suite("local_store");
    const blindxfer::Secret key = blindxfer::Secret::Generate();
    const Bytes data = PatternBytes(250, 8);

    suite.Run("begin_uses_service_policy_by_default", [&] {
        TempDir dir;
        remote::LocalStore store(dir.path());
        remote::BeginRequest request;
        request.total_size = 25 * blindxfer::constants::kMiB;
        auto ticket = store.Begin(request);
        CheckEq(ticket.plain_chunk_size, 10 * blindxfer::constants::kMiB, "10 MiB parts");
        CheckEq(ticket.total_parts, std::uint64_t{3}, "three parts");
        Check(!ticket.session_id.empty() && !ticket.remote_upload_id.empty(), "ids assigned");
        Check(ticket.object_key.find(std::string(blindxfer::constants::kNeutralObjectName)) != std::string::npos,
              "neutral object name");
        store.Abort(ticket);
    });

    suite.Run("finalize_concatenates_in_part_order", [&] {
        TempDir dir;
        remote::LocalStore store(dir.path(), kChunk);
        Uploaded up = UploadAll(store, key, data);
        CheckEq(up.ticket.total_parts, std::uint64_t{3}, "three parts");
        std::string id = store.Finalize(up.ticket, up.parts);
        CheckEq(id, up.ticket.session_id, "handle");
        Check(!std::filesystem::exists(dir.path() / (id + ".parts")), "parts removed");

        auto object = store.OpenObject(id);
        Bytes expected;
        for (const auto& frame : up.frames) {
            expected.insert(expected.end(), frame.begin(), frame.end());
        }
        CheckEq(ReadAll(*object), expected, "object is frames in order");

        auto info = store.GetDownloadInfo(id);
        CheckEq(info.file_size, std::uint64_t{250}, "size");
        CheckEq(info.plain_chunk_size, kChunk, "chunk size persisted");
        CheckEq(info.total_parts, std::uint64_t{3}, "parts");
        CheckEq(info.file_name, std::string(blindxfer::constants::kNeutralObjectName), "neutral name");
        CheckEq(blindxfer::chunkcipher::DecryptMetadata(key, info.encrypted_metadata).name, std::string("notes.txt"),
                "metadata stored opaquely");
    });

    suite.Run("ranged_open_returns_one_frame", [&] {
        TempDir dir;
        remote::LocalStore store(dir.path(), kChunk);
        Uploaded up = UploadAll(store, key, data);
        std::string id = store.Finalize(up.ticket, up.parts);
        auto layout = blindxfer::plan::MakePlan(250, kChunk);
        auto opener = store.ObjectOpener(id);
        auto source = opener(blindxfer::plan::CiphertextOffsetOfPart(layout, 2),
                             blindxfer::plan::FrameSizeOfPart(layout, 2));
        Bytes frame = ReadAll(*source);
        CheckEq(frame, up.frames[2], "third frame");
        CheckEq(blindxfer::chunkcipher::Decode(key, frame), Bytes(data.begin() + 200, data.end()), "plaintext");
    });

    suite.Run("finalize_rejects_bad_part_lists", [&] {
        TempDir dir;
        remote::LocalStore store(dir.path(), kChunk);
        Uploaded up = UploadAll(store, key, data);

        auto unsorted = up.parts;
        std::swap(unsorted[0], unsorted[1]);
        CheckThrows<blindxfer::ProtocolError>([&] { store.Finalize(up.ticket, unsorted); }, "not increasing");

        auto missing = up.parts;
        missing.pop_back();
        CheckThrows<blindxfer::ProtocolError>([&] { store.Finalize(up.ticket, missing); }, "missing part");

        auto bad_etag = up.parts;
        bad_etag[1].etag = "0000";
        CheckThrows<blindxfer::ProtocolError>([&] { store.Finalize(up.ticket, bad_etag); }, "etag mismatch");
        Check(!std::filesystem::exists(store.ObjectPath(up.ticket.session_id)), "no object after failures");

        store.Finalize(up.ticket, up.parts);
        Check(std::filesystem::exists(store.ObjectPath(up.ticket.session_id)), "valid list still finalizes");
    });

    suite.Run("reupload_replaces_part", [&] {
        TempDir dir;
        remote::LocalStore store(dir.path(), kChunk);
        Uploaded up = UploadAll(store, key, data);
        Bytes again = blindxfer::chunkcipher::Encode(key, data.data(), 100);
        std::string etag = store.UploadPart(up.ticket, 1, again);
        Check(etag != up.parts[0].etag, "fresh IV gives a new etag");
        up.parts[0].etag = etag;
        std::string id = store.Finalize(up.ticket, up.parts);
        auto object = store.OpenObject(id, 0, again.size());
        CheckEq(ReadAll(*object), again, "latest upload wins");
    });

    suite.Run("upload_part_validation", [&] {
        TempDir dir;
        remote::LocalStore store(dir.path(), kChunk);
        remote::BeginRequest request;
        request.total_size = 250;
        auto ticket = store.Begin(request);
        CheckThrows<blindxfer::ProtocolError>([&] { store.UploadPart(ticket, 4, Bytes(50)); }, "part out of range");
        CheckThrows<blindxfer::ProtocolError>([&] { store.UploadPart(ticket, 1, Bytes(kChunk + 29)); },
                                              "oversized frame");
        auto forged = ticket;
        forged.remote_upload_id = "local-other";
        CheckThrows<blindxfer::ProtocolError>([&] { store.UploadPart(forged, 1, Bytes(50)); }, "wrong upload id");
        CheckThrows<blindxfer::ProtocolError>(
            [&] {
                remote::BeginRequest empty;
                store.Begin(empty);
            },
            "empty file");
    });

    suite.Run("abort_is_safe", [&] {
        TempDir dir;
        remote::LocalStore store(dir.path(), kChunk);
        Uploaded up = UploadAll(store, key, data);
        store.Abort(up.ticket);
        Check(!std::filesystem::exists(dir.path() / (up.ticket.session_id + ".parts")), "session removed");
        CheckThrows<blindxfer::ProtocolError>([&] { store.Finalize(up.ticket, up.parts); }, "aborted session");
        store.Abort(up.ticket);

        remote::UploadTicket unknown;
        unknown.session_id = "../../etc";
        store.Abort(unknown);

        Uploaded done = UploadAll(store, key, data);
        std::string id = store.Finalize(done.ticket, done.parts);
        store.Abort(done.ticket);
        Check(std::filesystem::exists(store.ObjectPath(id)), "finalized object survives abort");
    });

    suite.Run("download_info_errors", [&] {
        TempDir dir;
        remote::LocalStore store(dir.path(), kChunk);
        CheckThrows<blindxfer::ProtocolError>([&] { store.GetDownloadInfo("0123-unknown"); }, "unknown id");
        CheckThrows<blindxfer::ProtocolError>([&] { store.GetDownloadInfo("../secret"); }, "path traversal");

        std::ofstream(dir.path() / "old.meta")
            << "{\"id\":\"old\",\"fileSize\":10,\"partSize\":10,\"totalParts\":1,\"expiresAtEpoch\":1000}";
        CheckThrows<blindxfer::ProtocolError>([&] { store.GetDownloadInfo("old"); }, "expired");
    });

    return suite.Finish();
}
