#include "mcpipe/transport/frame_codec.hpp"
#include "mcpipe/log/logger.hpp"

#include <poll.h>
#include <unistd.h>
#include <signal.h>
#include <fcntl.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>

namespace mcpipe {

namespace {

constexpr std::size_t kMaxHeaderBytes = 1024;

std::once_flag g_sigpipe_once;

// A write to a child that already exited must come back as EPIPE instead of
// killing the host process.
void ignore_sigpipe() {
    std::call_once(g_sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });
}

FrameError frame_error(FrameError::Kind kind, std::string msg) {
    const bool recoverable = kind == FrameError::Kind::Malformed ||
                             kind == FrameError::Kind::Oversized;
    return FrameError{kind, recoverable, std::move(msg)};
}

TransportError make_error(TransportError::Category cat, const std::string& msg, std::optional<int> err = std::nullopt) {
    return TransportError{cat, msg, err};
}

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool iequals_prefix(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<std::unique_ptr<FrameCodec>> FrameCodec::create(int read_fd, int write_fd, FrameCodecConfig config) {
    ignore_sigpipe();

    if (read_fd < 0 || write_fd < 0) {
        return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "FrameCodec needs valid read and write descriptors"
        ));
    }

    int wake[2];
    if (pipe2(wake, O_CLOEXEC | O_NONBLOCK) == -1) {
        const int err = errno;
        return tl::unexpected(make_error(
            TransportError::Category::Io,
            "Failed to create wake pipe: " + std::string(strerror(err)), err
        ));
    }

    // Writers wait in poll() so interrupt() can release them
    const int flags = fcntl(write_fd, F_GETFL);
    if (flags == -1 || fcntl(write_fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        const int err = errno;
        ::close(wake[0]);
        ::close(wake[1]);
        return tl::unexpected(make_error(
            TransportError::Category::Io,
            "Failed to configure write descriptor: " + std::string(strerror(err)), err
        ));
    }

    return std::unique_ptr<FrameCodec>(new FrameCodec(read_fd, write_fd, wake[0], wake[1], config));
}

FrameCodec::FrameCodec(int read_fd, int write_fd, int wake_read, int wake_write, FrameCodecConfig config)
    : read_fd_(read_fd)
    , write_fd_(write_fd)
    , wake_read_(wake_read)
    , wake_write_(wake_write)
    , config_(config)
    , parser_(FastJsonConfig{config.max_depth})
{}

FrameCodec::~FrameCodec() {
    ::close(wake_read_);
    ::close(wake_write_);
}

// ─────────────────────────────────────────────────────────────────────────────
// Interrupt
// ─────────────────────────────────────────────────────────────────────────────

void FrameCodec::interrupt() noexcept {
    if (interrupted_.exchange(true)) {
        return;
    }
    // The byte is never drained, so every later poll() wakes immediately
    const char byte = 1;
    ssize_t n;
    do {
        n = ::write(wake_write_, &byte, 1);
    } while (n == -1 && errno == EINTR);
}

void FrameCodec::shutdown() {
    interrupt();
    std::lock_guard lock(write_mutex_);
}

// ─────────────────────────────────────────────────────────────────────────────
// Writing
// ─────────────────────────────────────────────────────────────────────────────

std::string FrameCodec::encode(const Json& message, Framing framing) {
    std::string body = message.dump();
    if (framing == Framing::ContentLength) {
        return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    }
    body.push_back('\n');
    return body;
}

TransportResult<void> FrameCodec::write_message(const Json& message) {
    std::string data;
    try {
        data = encode(message, config_.framing);
    } catch (const nlohmann::json::exception& e) {
        // dump() throws on invalid UTF-8 in strings
        return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            std::string("Failed to serialize message: ") + e.what()
        ));
    }

    std::lock_guard lock(write_mutex_);
    if (interrupted_) {
        return tl::unexpected(make_error(TransportError::Category::Closed, "Codec is shut down"));
    }

    MCPIPE_LOG_TRACE("-> " + data.substr(0, data.size() - (config_.framing == Framing::NewlineDelimited ? 1 : 0)));
    return write_all(data);
}

TransportResult<void> FrameCodec::write_all(const std::string& data) {
    // Loop over partial writes; pipes only guarantee atomicity up to PIPE_BUF
    const char* ptr = data.data();
    std::size_t remaining = data.size();

    while (remaining > 0) {
        const ssize_t written = ::write(write_fd_, ptr, remaining);
        if (written >= 0) {
            ptr += written;
            remaining -= static_cast<std::size_t>(written);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            const int err = errno;
            return tl::unexpected(make_error(
                TransportError::Category::Io,
                "Failed to write to peer: " + std::string(strerror(err)), err
            ));
        }

        // Pipe full: wait for room or for interrupt()
        struct pollfd fds[2]{};
        fds[0].fd = write_fd_;
        fds[0].events = POLLOUT;
        fds[1].fd = wake_read_;
        fds[1].events = POLLIN;
        const int ready = poll(fds, 2, -1);
        if (ready < 0 && errno != EINTR) {
            const int err = errno;
            return tl::unexpected(make_error(
                TransportError::Category::Io,
                "poll failed while writing: " + std::string(strerror(err)), err
            ));
        }
        if (fds[1].revents & POLLIN) {
            return tl::unexpected(make_error(
                TransportError::Category::Closed,
                "Write interrupted by shutdown"
            ));
        }
        if (fds[0].revents & (POLLERR | POLLHUP)) {
            return tl::unexpected(make_error(
                TransportError::Category::Io,
                "Peer closed its input", EPIPE
            ));
        }
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Buffered Reading
// ─────────────────────────────────────────────────────────────────────────────

FrameResult<std::size_t> FrameCodec::fill_read_buffer() {
    while (true) {
        struct pollfd fds[2]{};
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[1].fd = wake_read_;
        fds[1].events = POLLIN;

        const int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return tl::unexpected(frame_error(
                FrameError::Kind::Io,
                "poll failed while reading: " + std::string(strerror(errno))
            ));
        }
        if (fds[1].revents & POLLIN) {
            return tl::unexpected(frame_error(FrameError::Kind::Interrupted, "Reader interrupted"));
        }
        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
            continue;
        }

        const ssize_t n = ::read(read_fd_, read_buffer_, read_buffer_size);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return tl::unexpected(frame_error(
                FrameError::Kind::Io,
                "Failed to read from peer: " + std::string(strerror(errno))
            ));
        }
        if (n == 0) {
            return tl::unexpected(frame_error(FrameError::Kind::Eof, "Peer closed connection"));
        }
        read_buffer_pos_ = 0;
        read_buffer_len_ = static_cast<std::size_t>(n);
        return read_buffer_len_;
    }
}

FrameResult<void> FrameCodec::read_exact(char* dest, std::size_t n) {
    std::size_t total_read = 0;
    while (total_read < n) {
        if (read_buffer_pos_ < read_buffer_len_) {
            const std::size_t available = read_buffer_len_ - read_buffer_pos_;
            const std::size_t to_copy = std::min(available, n - total_read);
            std::memcpy(dest + total_read, read_buffer_ + read_buffer_pos_, to_copy);
            read_buffer_pos_ += to_copy;
            total_read += to_copy;
        } else {
            auto result = fill_read_buffer();
            if (!result) {
                return tl::unexpected(result.error());
            }
        }
    }
    return {};
}

FrameResult<Json> FrameCodec::read_next() {
    if (interrupted_) {
        return tl::unexpected(frame_error(FrameError::Kind::Interrupted, "Reader interrupted"));
    }
    if (config_.framing == Framing::ContentLength) {
        return read_content_length_frame();
    }
    return read_line_frame();
}

FrameResult<Json> FrameCodec::decode(std::string_view payload) {
    auto parsed = parser_.parse(payload);
    if (!parsed) {
        return tl::unexpected(frame_error(
            FrameError::Kind::Malformed,
            "Invalid JSON frame: " + parsed.error().message
        ));
    }
    MCPIPE_LOG_TRACE("<- " + std::string(payload));
    return std::move(*parsed);
}

// ─────────────────────────────────────────────────────────────────────────────
// Newline-delimited frames
// ─────────────────────────────────────────────────────────────────────────────
// A bad line costs exactly that line: the bytes up to and including its '\n'
// are consumed before the error is returned, so the next call starts clean.

FrameResult<Json> FrameCodec::read_line_frame() {
    std::string line;
    line.reserve(1024);
    bool oversized = false;

    while (true) {
        while (read_buffer_pos_ < read_buffer_len_) {
            const char* start = read_buffer_ + read_buffer_pos_;
            const std::size_t available = read_buffer_len_ - read_buffer_pos_;
            const auto* newline = static_cast<const char*>(std::memchr(start, '\n', available));
            const std::size_t chunk = newline ? static_cast<std::size_t>(newline - start) : available;

            if (!oversized) {
                if (line.size() + chunk > config_.max_frame_size) {
                    oversized = true;
                    line.clear();
                    line.shrink_to_fit();
                } else {
                    line.append(start, chunk);
                }
            }
            read_buffer_pos_ += chunk;

            if (newline == nullptr) {
                continue;
            }
            ++read_buffer_pos_;  // the '\n'

            if (oversized) {
                return tl::unexpected(frame_error(
                    FrameError::Kind::Oversized,
                    "Frame exceeds " + std::to_string(config_.max_frame_size) + " bytes; line discarded"
                ));
            }
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (is_blank(line)) {
                line.clear();
                continue;
            }
            return decode(line);
        }

        auto result = fill_read_buffer();
        if (!result) {
            if (result.error().kind == FrameError::Kind::Eof && (oversized || !is_blank(line))) {
                return tl::unexpected(frame_error(FrameError::Kind::Eof, "Peer closed connection mid-frame"));
            }
            return tl::unexpected(result.error());
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Content-Length frames
// ─────────────────────────────────────────────────────────────────────────────

FrameResult<Json> FrameCodec::read_content_length_frame() {
    std::string header_buffer;
    header_buffer.reserve(128);

    // Headers end at the first empty line
    while (true) {
        if (read_buffer_pos_ >= read_buffer_len_) {
            auto result = fill_read_buffer();
            if (!result) {
                if (result.error().kind == FrameError::Kind::Eof && !header_buffer.empty()) {
                    return tl::unexpected(frame_error(FrameError::Kind::Eof, "Peer closed connection mid-header"));
                }
                return tl::unexpected(result.error());
            }
        }

        header_buffer.push_back(read_buffer_[read_buffer_pos_++]);
        const auto sz = header_buffer.size();
        if (sz >= 4 && header_buffer.compare(sz - 4, 4, "\r\n\r\n") == 0) {
            break;
        }
        if (sz > kMaxHeaderBytes) {
            return tl::unexpected(frame_error(FrameError::Kind::Corrupt, "Header too large"));
        }
    }

    std::optional<std::size_t> content_length;
    std::string_view headers(header_buffer);
    constexpr std::string_view prefix = "content-length:";
    while (!headers.empty()) {
        const auto eol = headers.find("\r\n");
        const std::string_view header_line = headers.substr(0, eol);
        headers.remove_prefix(eol == std::string_view::npos ? headers.size() : eol + 2);

        if (!iequals_prefix(header_line, prefix)) {
            continue;
        }
        const auto value = trim(header_line.substr(prefix.size()));
        std::size_t parsed = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty()) {
            return tl::unexpected(frame_error(
                FrameError::Kind::Corrupt,
                "Invalid Content-Length value '" + std::string(value) + "'"
            ));
        }
        content_length = parsed;
    }

    if (!content_length) {
        return tl::unexpected(frame_error(FrameError::Kind::Corrupt, "Missing Content-Length header"));
    }
    if (*content_length > config_.max_frame_size) {
        return tl::unexpected(frame_error(
            FrameError::Kind::Corrupt,
            "Content-Length " + std::to_string(*content_length) + " exceeds limit"
        ));
    }

    std::string body(*content_length, '\0');
    auto read_result = read_exact(body.data(), *content_length);
    if (!read_result) {
        return tl::unexpected(read_result.error());
    }
    return decode(body);
}

}  // namespace mcpipe
