#include "blindxfer/proxy_bridge.hpp"

#include "blindxfer/constants.hpp"
#include "blindxfer/crypto.hpp"
#include "blindxfer/download_session.hpp"
#include "blindxfer/errors.hpp"
#include "blindxfer/frame_coalescer.hpp"
#include "blindxfer/http_client.hpp"
#include "blindxfer/json.hpp"
#include "blindxfer/log.hpp"
#include "blindxfer/secret.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <vector>

namespace blindxfer::proxy {

using Bytes = std::vector<std::uint8_t>;

namespace {

constexpr const char* kComponent = "proxy";
constexpr std::size_t kMaxHeaderBytes = 16 * 1024;
constexpr std::size_t kMaxRegisterBody = 64 * 1024;
constexpr std::uint32_t kRecvTimeoutMs = 30000;
constexpr int kAcceptPollMs = 250;

struct Request {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
};

bool SetRecvTimeout(int fd, std::uint32_t timeout_ms) {
    timeval tv{};
    tv.tv_sec = static_cast<long>(timeout_ms / 1000u);
    tv.tv_usec = static_cast<long>((timeout_ms % 1000u) * 1000u);
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, static_cast<socklen_t>(sizeof(tv))) == 0;
}

bool SendAll(int fd, const char* data, std::size_t len) {
    std::size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

bool SendAll(int fd, const std::string& text) {
    return SendAll(fd, text.data(), text.size());
}

std::string Lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string Trim(const std::string& value) {
    std::size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return {};
    }
    std::size_t end = value.find_last_not_of(" \t\r");
    return value.substr(start, end - start + 1);
}

// Reads the request head; bytes after it stay in `request.body`.
bool ReadRequestHead(int fd, Request& request) {
    std::string data;
    char buffer[4096];
    std::size_t head_end = std::string::npos;
    while (head_end == std::string::npos) {
        if (data.size() > kMaxHeaderBytes) {
            return false;
        }
        ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        data.append(buffer, static_cast<std::size_t>(n));
        head_end = data.find("\r\n\r\n");
    }
    std::string head = data.substr(0, head_end);
    request.body = data.substr(head_end + 4);

    std::size_t line_end = head.find("\r\n");
    std::string request_line = head.substr(0, line_end);
    std::size_t sp1 = request_line.find(' ');
    std::size_t sp2 = request_line.find(' ', sp1 == std::string::npos ? sp1 : sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos) {
        return false;
    }
    request.method = request_line.substr(0, sp1);
    request.path = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    std::size_t query = request.path.find('?');
    if (query != std::string::npos) {
        request.path.resize(query);
    }
    std::size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        std::size_t next = head.find("\r\n", pos);
        if (next == std::string::npos) {
            next = head.size();
        }
        std::string line = head.substr(pos, next - pos);
        std::size_t colon = line.find(':');
        if (colon != std::string::npos) {
            request.headers[Lower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
        }
        pos = next + 2;
    }
    return true;
}

const char* ReasonPhrase(int code) {
    switch (code) {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 413:
            return "Payload Too Large";
        case 502:
            return "Bad Gateway";
        case 503:
            return "Service Unavailable";
        default:
            return "Error";
    }
}

// Consumer hang-ups while replying are only logged.
void SendSimple(int fd, int code, const std::string& content_type, const std::string& body) {
    std::string response = "HTTP/1.1 " + std::to_string(code) + " " + ReasonPhrase(code) + "\r\n"
                           + "Content-Type: " + content_type + "\r\n"
                           + "Content-Length: " + std::to_string(body.size()) + "\r\n"
                           + "Cache-Control: no-store\r\n"
                           + "Connection: close\r\n\r\n" + body;
    if (!SendAll(fd, response)) {
        log::Debug(kComponent, "client went away before the " + std::to_string(code) + " reply");
    }
}

void SendError(int fd, int code, const std::string& message) {
    SendSimple(fd, code, "application/json", json::ObjectWriter().Add("error", message).Finish());
}

std::string ContentDisposition(const std::string& name) {
    std::string ascii;
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        ascii.push_back(uc < 0x80 ? c : '_');
    }
    return "attachment; filename=\"" + ascii + "\"; filename*=UTF-8''" + remote::UrlEncode(name);
}

std::string NormalizeAddress(const std::string& address) {
    std::string out = address;
    std::size_t scheme = out.find("://");
    if (scheme != std::string::npos) {
        std::size_t slash = out.find('/', scheme + 3);
        out = slash == std::string::npos ? std::string("/") : out.substr(slash);
    }
    std::size_t query = out.find_first_of("?#");
    if (query != std::string::npos) {
        out.resize(query);
    }
    return out;
}

}  // namespace

std::string EncodeRegistration(const Registration& registration) {
    return json::ObjectWriter()
        .Add("type", constants::kRegisterType)
        .Add("address", registration.address)
        .Add("displayName", registration.display_name)
        .AddNumber("size", registration.size)
        .Add("remoteSource", registration.remote_source)
        .Add("key", registration.key)
        .AddNumber("plainChunkSize", registration.plain_chunk_size)
        .Finish();
}

Registration ParseRegistration(std::string_view json_text) {
    auto fields = json::ParseFlatObject(json_text);
    if (json::GetString(fields, "type").value_or("") != constants::kRegisterType) {
        throw ProtocolError("Registration message must have type \"register\"");
    }
    Registration registration;
    registration.address = json::GetString(fields, "address").value_or("");
    registration.display_name = json::GetString(fields, "displayName").value_or("");
    registration.size = json::GetUnsigned(fields, "size").value_or(0);
    registration.remote_source = json::GetString(fields, "remoteSource").value_or("");
    registration.key = json::GetString(fields, "key").value_or("");
    registration.plain_chunk_size = json::GetUnsigned(fields, "plainChunkSize").value_or(0);
    if (registration.address.empty() || registration.remote_source.empty() || registration.key.empty()) {
        throw ProtocolError("Registration requires address, remoteSource and key");
    }
    if (registration.plain_chunk_size == 0) {
        throw ProtocolError("Registration requires a positive plainChunkSize");
    }
    return registration;
}

std::string NewVirtualAddress() {
    static constexpr char kHex[] = "0123456789abcdef";
    std::vector<std::uint8_t> raw = crypto::RandomBytes(16);
    std::string out(constants::kVirtualPrefix);
    for (std::uint8_t b : raw) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0F]);
    }
    return out;
}

std::unique_ptr<io::ByteSource> OpenRemoteSource(const std::string& remote_source, std::chrono::seconds timeout) {
    if (remote_source.rfind("file://", 0) == 0) {
        return std::make_unique<io::FileSource>(remote_source.substr(7));
    }
    if (remote_source.rfind("http://", 0) == 0 || remote_source.rfind("https://", 0) == 0) {
        return std::make_unique<remote::HttpSource>(remote_source, 0, 0, std::vector<std::string>{}, timeout);
    }
    throw ProtocolError("Unsupported upstream source: " + remote_source);
}

ProxyBridge::ProxyBridge(config::TransferConfig config, SourceFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)) {
    config::Normalize(config_);
}

ProxyBridge::~ProxyBridge() {
    Stop();
}

std::string ProxyBridge::BaseUrl() const {
    std::uint16_t port = Port() != 0 ? Port() : config_.proxy_port;
    return "http://127.0.0.1:" + std::to_string(port);
}

void ProxyBridge::Start() {
    if (running_.load()) {
        return;
    }
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("socket() failed: ") + std::strerror(errno));
    }
    int yes = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.proxy_port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        int err = errno;
        ::close(fd);
        throw std::runtime_error("bind() failed on port " + std::to_string(config_.proxy_port) + ": "
                                 + std::strerror(err));
    }
    if (::listen(fd, 16) != 0) {
        int err = errno;
        ::close(fd);
        throw std::runtime_error(std::string("listen() failed: ") + std::strerror(err));
    }
    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
        int err = errno;
        ::close(fd);
        throw std::runtime_error(std::string("getsockname() failed: ") + std::strerror(err));
    }
    listen_fd_ = fd;
    port_.store(ntohs(bound.sin_port));
    stopping_.store(false);
    running_.store(true);
    mailbox_thread_ = std::thread([this] { MailboxLoop(); });
    accept_thread_ = std::thread([this] { AcceptLoop(); });
    log::Info(kComponent, "listening on " + BaseUrl());
}

void ProxyBridge::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mailbox_mutex_);
        stopping_.store(true);
    }
    mailbox_cv_.notify_all();
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (int fd : active_fds_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }
    ReapWorkers(true);
    if (mailbox_thread_.joinable()) {
        mailbox_thread_.join();
    }
    log::Debug(kComponent, "stopped");
}

std::future<std::string> ProxyBridge::Register(Registration registration) {
    registration.address = NormalizeAddress(registration.address);
    if (registration.address.size() < 2 || registration.address.front() != '/') {
        throw ProtocolError("Virtual address must be an absolute path");
    }
    if (registration.address == "/register") {
        throw ProtocolError("Virtual address is reserved: /register");
    }
    if (registration.remote_source.empty() || registration.plain_chunk_size == 0) {
        throw ProtocolError("Registration requires a remote source and a plain chunk size");
    }
    Command command;
    command.registration = std::move(registration);
    std::future<std::string> reply = command.reply.get_future();
    {
        std::lock_guard<std::mutex> lock(mailbox_mutex_);
        mailbox_.push_back(std::move(command));
    }
    mailbox_cv_.notify_one();
    return reply;
}

bool ProxyBridge::Unregister(const std::string& address) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return registry_.erase(NormalizeAddress(address)) > 0;
}

bool ProxyBridge::IsRegistered(const std::string& address) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return registry_.count(NormalizeAddress(address)) > 0;
}

std::size_t ProxyBridge::RegisteredCount() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return registry_.size();
}

std::string ProxyBridge::Navigate(Registration registration) {
    if (registration.address.empty()) {
        registration.address = NewVirtualAddress();
    }
    std::string address = NormalizeAddress(registration.address);
    std::future<std::string> reply = Register(std::move(registration));
    if (reply.wait_for(config_.handshake_timeout) == std::future_status::ready) {
        std::string value = reply.get();
        if (value != constants::kReadyReply) {
            throw ProtocolError("Unexpected proxy reply: " + value);
        }
    } else if (config_.optimistic_handshake) {
        log::Warn(kComponent, "no acknowledgement within " + std::to_string(config_.handshake_timeout.count())
                                  + " ms, proceeding optimistically");
    } else {
        throw ProtocolError("Proxy did not acknowledge registration within "
                            + std::to_string(config_.handshake_timeout.count()) + " ms");
    }
    return BaseUrl() + address;
}

void ProxyBridge::MailboxLoop() {
    while (true) {
        std::unique_lock<std::mutex> lock(mailbox_mutex_);
        mailbox_cv_.wait(lock, [this] { return stopping_.load() || !mailbox_.empty(); });
        if (stopping_.load()) {
            return;
        }
        Command command = std::move(mailbox_.front());
        mailbox_.pop_front();
        lock.unlock();

        const std::string address = command.registration.address;
        {
            std::lock_guard<std::mutex> registry_lock(registry_mutex_);
            registry_[address] = std::move(command.registration);
        }
        log::Debug(kComponent, "registered " + address);
        command.reply.set_value(std::string(constants::kReadyReply));
    }
}

void ProxyBridge::ReapWorkers(bool all) {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (all || it->done->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), workers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (Worker& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void ProxyBridge::AcceptLoop() {
    while (!stopping_.load()) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, kAcceptPollMs);
        ReapWorkers(false);
        if (rc <= 0 || stopping_.load()) {
            continue;
        }
        int client = ::accept(listen_fd_, nullptr, nullptr);
        if (client < 0) {
            continue;
        }
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(workers_mutex_);
        active_fds_.insert(client);
        Worker worker;
        worker.done = done;
        worker.thread = std::thread([this, client, done] {
            HandleConnection(client);
            done->store(true);
        });
        workers_.push_back(std::move(worker));
    }
}

std::unique_ptr<io::ByteSource> ProxyBridge::OpenSource(const Registration& registration) const {
    if (factory_) {
        return factory_(registration.remote_source);
    }
    return OpenRemoteSource(registration.remote_source, config_.http_timeout);
}

void ProxyBridge::HandleConnection(int fd) {
    try {
        if (!SetRecvTimeout(fd, kRecvTimeoutMs)) {
            log::Warn(kComponent, std::string("SO_RCVTIMEO failed: ") + std::strerror(errno));
        }
        Request request;
        if (!ReadRequestHead(fd, request)) {
            SendError(fd, 400, "Malformed request");
        } else if (request.method == "POST" && request.path == "/register") {
            std::size_t length = 0;
            auto it = request.headers.find("content-length");
            if (it != request.headers.end()) {
                length = static_cast<std::size_t>(std::strtoull(it->second.c_str(), nullptr, 10));
            }
            if (length > kMaxRegisterBody) {
                SendError(fd, 413, "Registration too large");
            } else {
                char buffer[4096];
                while (request.body.size() < length) {
                    ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
                    if (n < 0 && errno == EINTR) {
                        continue;
                    }
                    if (n <= 0) {
                        break;
                    }
                    request.body.append(buffer, static_cast<std::size_t>(n));
                }
                if (request.body.size() < length) {
                    SendError(fd, 400, "Truncated registration body");
                } else {
                    request.body.resize(length);
                    ServeRegister(fd, request.body);
                }
            }
        } else if (request.method == "GET" || request.method == "HEAD") {
            ServeStream(fd, request.path, request.method == "HEAD");
        } else {
            SendError(fd, 405, "Method not allowed");
        }
    } catch (const std::exception& ex) {
        log::Error(kComponent, std::string("connection failed: ") + ex.what());
    }
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        active_fds_.erase(fd);
    }
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
}

void ProxyBridge::ServeRegister(int fd, const std::string& body) {
    std::future<std::string> reply;
    try {
        reply = Register(ParseRegistration(body));
    } catch (const ProtocolError& ex) {
        SendError(fd, 400, ex.what());
        return;
    }
    if (reply.wait_for(config_.handshake_timeout) != std::future_status::ready) {
        SendError(fd, 503, "Registration not acknowledged");
        return;
    }
    SendSimple(fd, 200, "text/plain", reply.get());
}

void ProxyBridge::ServeStream(int fd, const std::string& address, bool head_only) {
    std::optional<Registration> found;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = registry_.find(address);
        if (it != registry_.end()) {
            found = it->second;
        }
    }
    if (!found) {
        SendError(fd, 404, "Unknown address");
        return;
    }
    const Registration& registration = *found;
    std::string name = download::SanitizeFileName(registration.display_name);
    std::string headers = std::string("HTTP/1.1 200 OK\r\n")
                          + "Content-Type: application/octet-stream\r\n"
                          + "Content-Disposition: " + ContentDisposition(name) + "\r\n"
                          + "Cache-Control: no-store\r\n"
                          + "Transfer-Encoding: chunked\r\n"
                          + "Connection: close\r\n\r\n";
    if (head_only) {
        if (!SendAll(fd, headers)) {
            log::Debug(kComponent, "client went away before HEAD reply for " + address);
        }
        return;
    }

    // Upstream is opened and the first frame decoded before any header goes
    // out so that a bad key or an unreachable source still gets a status.
    std::unique_ptr<stream::DecryptingReader> reader;
    std::optional<Bytes> chunk;
    try {
        Secret key = Secret::FromBase64Url(registration.key);
        reader = std::make_unique<stream::DecryptingReader>(OpenSource(registration), key,
                                                            registration.plain_chunk_size);
        chunk = reader->Next();
    } catch (const std::exception& ex) {
        log::Error(kComponent, "cannot open " + address + ": " + ex.what());
        Unregister(address);
        SendError(fd, 502, ex.what());
        return;
    }
    if (!SendAll(fd, headers)) {
        Unregister(address);
        return;
    }

    bool complete = true;
    std::uint64_t sent = 0;
    try {
        while (chunk) {
            char size_line[32];
            std::snprintf(size_line, sizeof(size_line), "%zx\r\n", chunk->size());
            if (!chunk->empty()
                && (!SendAll(fd, size_line) || !SendAll(fd, reinterpret_cast<const char*>(chunk->data()), chunk->size())
                    || !SendAll(fd, "\r\n"))) {
                log::Warn(kComponent, "consumer disconnected from " + address);
                complete = false;
                break;
            }
            sent += chunk->size();
            crypto::SecureWipe(chunk->data(), chunk->size());
            chunk = reader->Next();
        }
    } catch (const std::exception& ex) {
        log::Error(kComponent, "stream " + address + " aborted: " + ex.what());
        complete = false;
    }
    if (complete && registration.size != 0 && sent != registration.size) {
        log::Error(kComponent, "stream " + address + " produced " + std::to_string(sent) + " bytes, expected "
                                   + std::to_string(registration.size));
        complete = false;
    }
    // Without the terminating chunk the consumer sees a truncated body.
    if (complete) {
        if (!SendAll(fd, "0\r\n\r\n")) {
            log::Warn(kComponent, "consumer disconnected before the end of " + address);
        }
        log::Debug(kComponent, "served " + std::to_string(sent) + " bytes from " + address);
    }
    Unregister(address);
}

}  // namespace blindxfer::proxy
