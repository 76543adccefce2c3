#include "platform/linux/websocket_connection.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <format>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr uint8_t kOpContinuation = 0x0;
constexpr uint8_t kOpText = 0x1;
constexpr uint8_t kOpBinary = 0x2;
constexpr uint8_t kOpClose = 0x8;
constexpr uint8_t kOpPing = 0x9;
constexpr uint8_t kOpPong = 0xA;

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

} // namespace

namespace websocket {

std::string accept_key(const std::string& client_key) {
    static constexpr char kGuid[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    std::string input = client_key + kGuid;

    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);

    unsigned char encoded[4 * ((SHA_DIGEST_LENGTH + 2) / 3) + 1];
    int n = EVP_EncodeBlock(encoded, digest, SHA_DIGEST_LENGTH);
    return std::string(reinterpret_cast<const char*>(encoded), static_cast<size_t>(n));
}

std::vector<uint8_t> build_frame(uint8_t opcode, std::string_view payload) {
    std::vector<uint8_t> frame;
    const size_t len = payload.size();
    frame.reserve(len + 10);
    frame.push_back(static_cast<uint8_t>(0x80 | opcode));  // FIN
    if (len <= 125) {
        frame.push_back(static_cast<uint8_t>(len));
    } else if (len <= 0xFFFF) {
        frame.push_back(126);
        frame.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
        frame.push_back(static_cast<uint8_t>(len & 0xFF));
    } else {
        frame.push_back(127);
        for (int i = 7; i >= 0; --i) {
            frame.push_back(static_cast<uint8_t>((static_cast<uint64_t>(len) >> (i * 8)) & 0xFF));
        }
    }
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

} // namespace websocket

WebSocketConnection::WebSocketConnection(int fd) : fd_(fd) {}

WebSocketConnection::~WebSocketConnection() {
    if (fd_ >= 0) ::close(fd_);
}

bool WebSocketConnection::handshake(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    size_t end;
    while ((end = buf_.find("\r\n\r\n")) == std::string::npos) {
        if (buf_.size() > kMaxRequestBytes) {
            reject(400, "request too large");
            return false;
        }
        auto left = remaining(deadline);
        if (left.count() == 0) return false;
        if (fill(left) != FillStatus::Data) return false;
    }

    std::string head = buf_.substr(0, end);
    buf_.erase(0, end + 4);

    auto line_end = head.find("\r\n");
    std::string request_line = head.substr(0, line_end);

    auto sp1 = request_line.find(' ');
    auto sp2 = sp1 == std::string::npos ? std::string::npos : request_line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos) {
        reject(400, "malformed request line");
        return false;
    }
    std::string method = request_line.substr(0, sp1);
    std::string target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    std::string path = target.substr(0, target.find('?'));

    if (method != "GET") {
        reject(400, "upgrade requires GET");
        return false;
    }
    if (path != websocket::kPath) {
        reject(404, "not found");
        return false;
    }

    std::string upgrade;
    std::string key;
    size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        auto next = head.find("\r\n", pos);
        if (next == std::string::npos) next = head.size();
        std::string header = head.substr(pos, next - pos);
        pos = next + 2;

        auto colon = header.find(':');
        if (colon == std::string::npos) continue;
        auto name = lower(trim(header.substr(0, colon)));
        auto value = trim(header.substr(colon + 1));
        if (name == "upgrade") upgrade = lower(value);
        else if (name == "sec-websocket-key") key = value;
    }

    if (upgrade.find("websocket") == std::string::npos || key.empty()) {
        reject(400, "missing websocket upgrade headers");
        return false;
    }

    std::string response = std::format(
        "HTTP/1.1 101 Switching Protocols\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Accept: {}\r\n"
        "\r\n", websocket::accept_key(key));

    std::lock_guard lock(write_mu_);
    return send_all(response);
}

void WebSocketConnection::reject(int status, const std::string& reason) {
    std::string body = std::format(R"({{"error":"{}"}})", reason);
    std::string text = status == 404 ? "Not Found" : "Bad Request";
    std::string response = std::format(
        "HTTP/1.1 {} {}\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: {}\r\n"
        "Connection: close\r\n"
        "\r\n{}", status, text, body.size(), body);

    std::lock_guard lock(write_mu_);
    send_all(response);
}

Connection::ReadStatus WebSocketConnection::read_line(std::string& line,
                                                      std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (auto status = take_message(line)) return *status;

        switch (fill(remaining(deadline))) {
            case FillStatus::Data: break;
            case FillStatus::Timeout: return ReadStatus::Timeout;
            case FillStatus::Closed: return ReadStatus::Closed;
            case FillStatus::Error: return ReadStatus::Error;
        }
    }
}

std::optional<Connection::ReadStatus> WebSocketConnection::take_message(std::string& line) {
    for (;;) {
        if (buf_.size() < 2) return std::nullopt;

        auto byte = [this](size_t i) { return static_cast<uint8_t>(buf_[i]); };
        bool fin = byte(0) & 0x80;
        uint8_t opcode = byte(0) & 0x0F;
        bool masked = byte(1) & 0x80;
        uint64_t len = byte(1) & 0x7F;
        size_t pos = 2;

        if (len == 126) {
            if (buf_.size() < 4) return std::nullopt;
            len = (static_cast<uint64_t>(byte(2)) << 8) | byte(3);
            pos = 4;
        } else if (len == 127) {
            if (buf_.size() < 10) return std::nullopt;
            len = 0;
            for (size_t i = 0; i < 8; ++i) len = (len << 8) | byte(2 + i);
            pos = 10;
        }

        // RFC 6455 §5.1: every client frame is masked
        if (!masked) return ReadStatus::Error;
        if (len > kMaxMessageBytes || fragment_.size() + len > kMaxMessageBytes) {
            return ReadStatus::Error;
        }
        if (buf_.size() < pos + 4 + len) return std::nullopt;

        uint8_t mask[4] = {byte(pos), byte(pos + 1), byte(pos + 2), byte(pos + 3)};
        pos += 4;
        std::string payload = buf_.substr(pos, static_cast<size_t>(len));
        for (size_t i = 0; i < payload.size(); ++i) {
            payload[i] = static_cast<char>(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]);
        }
        buf_.erase(0, pos + static_cast<size_t>(len));

        switch (opcode) {
            case kOpContinuation:
            case kOpText:
            case kOpBinary:
                fragment_ += payload;
                if (fin) {
                    line = std::move(fragment_);
                    fragment_.clear();
                    return ReadStatus::Line;
                }
                break;
            case kOpClose:
                send_frame(kOpClose, std::string_view(payload).substr(0, std::min<size_t>(2, payload.size())));
                return ReadStatus::Closed;
            case kOpPing:
                if (!send_frame(kOpPong, payload)) return ReadStatus::Error;
                break;
            case kOpPong:
                break;
            default:
                return ReadStatus::Error;
        }
    }
}

WebSocketConnection::FillStatus WebSocketConnection::fill(std::chrono::milliseconds timeout) {
    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
    int rc;
    do {
        rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) return FillStatus::Error;
    if (rc == 0) return FillStatus::Timeout;

    char tmp[4096];
    ssize_t n;
    do {
        n = ::recv(fd_, tmp, sizeof(tmp), 0);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) return FillStatus::Timeout;
        return FillStatus::Error;
    }
    if (n == 0) return FillStatus::Closed;

    buf_.append(tmp, static_cast<size_t>(n));
    return FillStatus::Data;
}

bool WebSocketConnection::write_line(std::string_view line) {
    return send_frame(kOpText, line);
}

bool WebSocketConnection::send_frame(uint8_t opcode, std::string_view payload) {
    auto frame = websocket::build_frame(opcode, payload);
    std::lock_guard lock(write_mu_);
    return send_all(std::string_view(reinterpret_cast<const char*>(frame.data()), frame.size()));
}

bool WebSocketConnection::send_all(std::string_view data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd{.fd = fd_, .events = POLLOUT, .revents = 0};
                if (::poll(&pfd, 1, 1000) <= 0) return false;
                continue;
            }
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

void WebSocketConnection::shutdown() {
    ::shutdown(fd_, SHUT_RDWR);
}
