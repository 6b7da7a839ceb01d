#include "blindxfer/http_client.hpp"

#include "blindxfer/constants.hpp"
#include "blindxfer/errors.hpp"
#include "blindxfer/json.hpp"
#include "blindxfer/log.hpp"
#include "blindxfer/transfer_plan.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>

namespace blindxfer::remote {

namespace {

constexpr const char* kComponent = "http";
constexpr std::size_t kMaxErrorBody = 4096;

struct EasyDeleter {
    void operator()(CURL* handle) const noexcept {
        if (handle) curl_easy_cleanup(handle);
    }
};

using UniqueEasy = std::unique_ptr<CURL, EasyDeleter>;

// curl_slist over strings that outlive the list.
struct HeaderList {
    std::vector<std::string> store;
    curl_slist* list = nullptr;
    ~HeaderList() { if (list) curl_slist_free_all(list); }

    void Add(const std::string& header) {
        store.push_back(header);
        list = curl_slist_append(list, store.back().c_str());
    }
};

std::size_t WriteToString(char* data, std::size_t size, std::size_t nmemb, void* user) {
    auto* out = static_cast<std::string*>(user);
    out->append(data, size * nmemb);
    return size * nmemb;
}

bool IsSuccess(long status) {
    return status >= 200 && status < 300;
}

json::FlatObject ParseBody(const HttpResponse& response, const std::string& what) {
    try {
        return json::ParseFlatObject(response.body);
    } catch (const ProtocolError& ex) {
        throw ProtocolError(what + ": unexpected response body (" + ex.what() + ")");
    }
}

std::string RequireString(const json::FlatObject& object, std::string_view key, const std::string& what) {
    auto value = json::GetString(object, key);
    if (!value || value->empty()) {
        throw ProtocolError(what + ": response is missing '" + std::string(key) + "'");
    }
    return *value;
}

}  // namespace

void EnsureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string UrlEncode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(c);
        } else {
            char buffer[4];
            std::snprintf(buffer, sizeof(buffer), "%%%02X", static_cast<unsigned>(uc));
            out += buffer;
        }
    }
    return out;
}

HttpResponse PerformRequest(const std::string& method,
                            const std::string& url,
                            const std::vector<std::string>& headers,
                            std::string_view body,
                            std::chrono::seconds timeout) {
    EnsureCurlGlobalInit();
    UniqueEasy easy(curl_easy_init());
    if (!easy) {
        throw TransportError("curl_easy_init failed");
    }
    HeaderList header_list;
    for (const auto& header : headers) {
        header_list.Add(header);
    }
    HttpResponse response;
    CURL* h = easy.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    if (method == "GET") {
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.empty() ? "" : body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    }
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.list);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(h);
    if (res != CURLE_OK) {
        throw TransportError(method + " " + url + " failed: " + curl_easy_strerror(res));
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    log::Debug(kComponent, method + " " + url + " -> " + std::to_string(response.status));
    return response;
}

void ThrowForStatus(const HttpResponse& response, const std::string& what) {
    if (IsSuccess(response.status)) {
        return;
    }
    std::string message = "HTTP " + std::to_string(response.status);
    if (!response.body.empty()) {
        try {
            auto fields = json::ParseFlatObject(response.body);
            if (auto error = json::GetString(fields, "error")) {
                message = *error + " (" + message + ")";
            }
        } catch (const ProtocolError&) {
            log::Debug(kComponent, what + ": error body is not JSON");
        }
    }
    long status = response.status;
    if (status >= 500 || status == 408 || status == 429) {
        throw TransportError(what + ": " + message, status);
    }
    throw ProtocolError(what + ": " + message);
}

HttpMultipartClient::HttpMultipartClient(config::TransferConfig config) : config_(std::move(config)) {
    config::Normalize(config_);
    EnsureCurlGlobalInit();
}

std::vector<std::string> HttpMultipartClient::Headers(std::string_view content_type) const {
    std::vector<std::string> headers;
    if (!content_type.empty()) {
        headers.push_back("Content-Type: " + std::string(content_type));
    }
    if (!config_.api_token.empty()) {
        headers.push_back("Authorization: Bearer " + config_.api_token);
    }
    // Large PUT bodies must not wait for 100-continue.
    headers.emplace_back("Expect:");
    return headers;
}

HttpResponse HttpMultipartClient::Send(const std::string& method,
                                       const std::string& path,
                                       std::string_view body,
                                       std::string_view content_type) const {
    return PerformRequest(method, config_.api_base + path, Headers(content_type), body, config_.http_timeout);
}

UploadTicket HttpMultipartClient::Begin(const BeginRequest& request) {
    const std::string what = "upload/init";
    std::string body = json::ObjectWriter()
                           .Add("fileName", constants::kNeutralObjectName)
                           .AddNumber("fileSize", request.total_size)
                           .Add("contentType", request.content_type.empty()
                                                   ? std::string(constants::kDefaultContentType)
                                                   : request.content_type)
                           .Add("encryptedMetadata", request.encrypted_metadata)
                           .Finish();
    HttpResponse response = Send("POST", "/upload/init", body, "application/json");
    ThrowForStatus(response, what);
    auto fields = ParseBody(response, what);

    UploadTicket ticket;
    ticket.session_id = RequireString(fields, "id", what);
    ticket.remote_upload_id = RequireString(fields, "uploadId", what);
    ticket.object_key = json::GetString(fields, "key").value_or("");
    ticket.plain_chunk_size = json::GetUnsigned(fields, "partSize").value_or(0);
    ticket.total_parts = json::GetUnsigned(fields, "totalParts").value_or(0);
    ticket.expires_at = json::GetString(fields, "expiresAt").value_or("");
    return ticket;
}

std::string HttpMultipartClient::UploadPart(const UploadTicket& ticket,
                                            std::uint32_t part_number,
                                            const Bytes& frame) {
    const std::string what = "upload/part " + std::to_string(part_number);
    std::string path = "/upload/part?id=" + UrlEncode(ticket.session_id)
                       + "&uploadId=" + UrlEncode(ticket.session_id)
                       + "&r2UploadId=" + UrlEncode(ticket.remote_upload_id)
                       + "&partNumber=" + std::to_string(part_number);
    std::string_view body(reinterpret_cast<const char*>(frame.data()), frame.size());
    HttpResponse response = Send("PUT", path, body, "application/octet-stream");
    ThrowForStatus(response, what);
    auto fields = ParseBody(response, what);
    auto size = json::GetUnsigned(fields, "size");
    if (size && *size != frame.size()) {
        throw TransportError(what + ": service stored " + std::to_string(*size) + " of "
                             + std::to_string(frame.size()) + " bytes");
    }
    return RequireString(fields, "etag", what);
}

std::string HttpMultipartClient::Finalize(const UploadTicket& ticket, const std::vector<CompletedPart>& parts) {
    const std::string what = "upload/complete";
    std::string list = "[";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            list.push_back(',');
        }
        list += json::ObjectWriter()
                    .AddNumber("partNumber", parts[i].part_number)
                    .Add("etag", parts[i].etag)
                    .Finish();
    }
    list.push_back(']');
    std::string body = json::ObjectWriter().Add("uploadId", ticket.session_id).AddRaw("parts", list).Finish();
    HttpResponse response = Send("POST", "/upload/complete", body, "application/json");
    ThrowForStatus(response, what);
    auto fields = ParseBody(response, what);
    if (!json::GetBool(fields, "success", true)) {
        throw ProtocolError(what + ": service reported failure");
    }
    return json::GetString(fields, "id").value_or(ticket.session_id);
}

void HttpMultipartClient::Abort(const UploadTicket& ticket) {
    if (ticket.session_id.empty()) {
        return;
    }
    try {
        std::string body = json::ObjectWriter().Add("uploadId", ticket.session_id).Finish();
        HttpResponse response = Send("POST", "/upload/abort", body, "application/json");
        if (response.status == 404) {
            log::Debug(kComponent, "abort: session " + ticket.session_id + " already gone");
            return;
        }
        ThrowForStatus(response, "upload/abort");
    } catch (const std::exception& ex) {
        log::Warn(kComponent, std::string("abort failed: ") + ex.what());
    }
}

DownloadInfo HttpMultipartClient::GetDownloadInfo(const std::string& id) {
    const std::string what = "download/" + id;
    HttpResponse response = Send("GET", "/download/" + UrlEncode(id), {}, {});
    ThrowForStatus(response, what);
    auto fields = ParseBody(response, what);

    DownloadInfo info;
    info.id = json::GetString(fields, "id").value_or(id);
    info.file_name = json::GetString(fields, "fileName").value_or("");
    info.file_size = json::GetUnsigned(fields, "fileSize").value_or(0);
    info.content_type = json::GetString(fields, "contentType").value_or("");
    info.plain_chunk_size = json::GetUnsigned(fields, "partSize").value_or(0);
    info.expires_at = json::GetString(fields, "expiresAt").value_or("");
    info.created_at = json::GetString(fields, "createdAt").value_or("");
    info.encrypted_metadata = json::GetString(fields, "encryptedMetadata").value_or("");
    if (auto total = json::GetUnsigned(fields, "totalParts")) {
        info.total_parts = *total;
    } else if (info.plain_chunk_size > 0) {
        info.total_parts = plan::MakePlan(info.file_size, info.plain_chunk_size).total_parts;
    }
    return info;
}

std::string HttpMultipartClient::ObjectUrl(const std::string& id) const {
    return config_.api_base + "/download/" + UrlEncode(id) + "/file";
}

io::RangeOpener HttpMultipartClient::ObjectOpener(const std::string& id) const {
    std::string url = ObjectUrl(id);
    std::vector<std::string> headers = Headers({});
    std::chrono::seconds timeout = config_.http_timeout;
    return [url, headers, timeout](std::uint64_t offset, std::uint64_t length) -> std::unique_ptr<io::ByteSource> {
        return std::make_unique<HttpSource>(url, offset, length, headers, timeout);
    };
}

HttpSource::HttpSource(std::string url,
                       std::uint64_t offset,
                       std::uint64_t length,
                       std::vector<std::string> headers,
                       std::chrono::seconds timeout)
    : url_(std::move(url)), ranged_(offset > 0 || length > 0), offset_(offset), header_store_(std::move(headers)) {
    EnsureCurlGlobalInit();
    easy_ = curl_easy_init();
    multi_ = curl_multi_init();
    if (!easy_ || !multi_) {
        if (easy_) curl_easy_cleanup(easy_);
        if (multi_) curl_multi_cleanup(multi_);
        throw TransportError("curl handle allocation failed");
    }
    for (const auto& header : header_store_) {
        header_list_ = curl_slist_append(header_list_, header.c_str());
    }
    curl_easy_setopt(easy_, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(easy_, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, header_list_);
    curl_easy_setopt(easy_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
    // A long download may legitimately outlast the request timeout; abort only on a stall.
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeout.count()));
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &HttpSource::WriteCallback);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
    std::string range;
    if (ranged_) {
        range = std::to_string(offset) + "-";
        if (length > 0) {
            range += std::to_string(offset + length - 1);
        }
        curl_easy_setopt(easy_, CURLOPT_RANGE, range.c_str());
    }
    curl_multi_add_handle(multi_, easy_);
}

HttpSource::~HttpSource() {
    if (multi_ && easy_) {
        curl_multi_remove_handle(multi_, easy_);
    }
    if (easy_) curl_easy_cleanup(easy_);
    if (multi_) curl_multi_cleanup(multi_);
    if (header_list_) curl_slist_free_all(header_list_);
}

std::size_t HttpSource::WriteCallback(char* data, std::size_t size, std::size_t nmemb, void* user) {
    return static_cast<HttpSource*>(user)->OnData(data, size * nmemb);
}

std::size_t HttpSource::OnData(const char* data, std::size_t len) {
    if (status_ == 0) {
        curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status_);
    }
    if (!IsSuccess(status_)) {
        if (error_body_.size() < kMaxErrorBody) {
            error_body_.append(data, std::min(len, kMaxErrorBody - error_body_.size()));
        }
        return len;
    }
    if (ranged_ && offset_ > 0 && status_ == 200) {
        // Server ignored the Range header; delivering from offset 0 would misalign every frame.
        return 0;
    }
    if (buffer_.size() - buffer_offset_ >= constants::kHttpSourceHighWater) {
        paused_ = true;
        return CURL_WRITEFUNC_PAUSE;
    }
    buffer_.insert(buffer_.end(), reinterpret_cast<const std::uint8_t*>(data),
                   reinterpret_cast<const std::uint8_t*>(data) + len);
    return len;
}

void HttpSource::Complete(int curl_code) {
    done_ = true;
    if (status_ == 0) {
        curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status_);
    }
    if (ranged_ && offset_ > 0 && status_ == 200) {
        throw ProtocolError("GET " + url_ + ": server does not support byte ranges");
    }
    if (curl_code != CURLE_OK) {
        throw TransportError("GET " + url_ + " failed: " + curl_easy_strerror(static_cast<CURLcode>(curl_code)),
                             status_);
    }
    ThrowForStatus(HttpResponse{status_, error_body_}, "GET " + url_);
}

void HttpSource::Pump() {
    if (paused_) {
        paused_ = false;
        curl_easy_pause(easy_, CURLPAUSE_CONT);
    }
    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_, &running);
    if (mc != CURLM_OK) {
        done_ = true;
        throw TransportError("GET " + url_ + " failed: " + curl_multi_strerror(mc));
    }
    if (running == 0) {
        int code = CURLE_OK;
        int pending = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &pending)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                code = msg->data.result;
            }
        }
        Complete(code);
        return;
    }
    if (buffer_.size() == buffer_offset_ && !paused_) {
        int numfds = 0;
        mc = curl_multi_wait(multi_, nullptr, 0, 1000, &numfds);
        if (mc != CURLM_OK) {
            done_ = true;
            throw TransportError("GET " + url_ + " failed: " + curl_multi_strerror(mc));
        }
    }
}

std::size_t HttpSource::Read(std::uint8_t* out, std::size_t max) {
    while (buffer_.size() == buffer_offset_ && !done_) {
        buffer_.clear();
        buffer_offset_ = 0;
        Pump();
    }
    std::size_t take = std::min(max, buffer_.size() - buffer_offset_);
    if (take == 0) {
        return 0;
    }
    std::memcpy(out, buffer_.data() + buffer_offset_, take);
    buffer_offset_ += take;
    return take;
}

}  // namespace blindxfer::remote
