#pragma once

#include "mcpipe/json/fast_json.hpp"
#include "mcpipe/transport.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace mcpipe {

// ═══════════════════════════════════════════════════════════════════════════
// Frame Codec Configuration
// ═══════════════════════════════════════════════════════════════════════════

enum class Framing {
    NewlineDelimited,  // One JSON document per '\n'-terminated line (MCP stdio)
    ContentLength      // "Content-Length: N\r\n\r\n" followed by N bytes
};

[[nodiscard]] constexpr std::string_view to_string(Framing framing) noexcept {
    switch (framing) {
        case Framing::NewlineDelimited: return "line";
        case Framing::ContentLength:    return "content-length";
    }
    return "unknown";
}

struct FrameCodecConfig {
    Framing framing{Framing::NewlineDelimited};
    std::size_t max_frame_size{4 * 1024 * 1024};  // Applies to a line or a body
    std::size_t max_depth{64};                    // JSON nesting limit on decode
};

// ═══════════════════════════════════════════════════════════════════════════
// Frame Errors
// ═══════════════════════════════════════════════════════════════════════════
// `recoverable` tells the reader whether the stream is still aligned on a
// frame boundary. Recoverable errors lose one frame; the next read_next()
// starts at the following frame. Anything else ends the stream.

struct FrameError {
    enum class Kind {
        Malformed,    // Frame boundary intact, payload is not valid JSON
        Oversized,    // Line longer than max_frame_size (newline framing)
        Corrupt,      // Header unreadable; boundary lost
        Eof,          // Peer closed its end
        Io,           // read() failed
        Interrupted   // interrupt() was called
    };

    Kind kind{Kind::Io};
    bool recoverable{false};
    std::string message;
};

[[nodiscard]] constexpr std::string_view to_string(FrameError::Kind kind) noexcept {
    switch (kind) {
        case FrameError::Kind::Malformed:   return "Malformed";
        case FrameError::Kind::Oversized:   return "Oversized";
        case FrameError::Kind::Corrupt:     return "Corrupt";
        case FrameError::Kind::Eof:         return "Eof";
        case FrameError::Kind::Io:          return "Io";
        case FrameError::Kind::Interrupted: return "Interrupted";
    }
    return "Unknown";
}

template <typename T>
using FrameResult = tl::expected<T, FrameError>;

// ═══════════════════════════════════════════════════════════════════════════
// Frame Codec
// ═══════════════════════════════════════════════════════════════════════════
// Message framing over a pair of file descriptors (normally the child's
// stdout and stdin). The descriptors are borrowed, never closed.
//
// Threading:
//   - write_message() may be called from any number of threads; one frame is
//     written at a time under the writer mutex.
//   - read_next() must only be called from one thread (the listener).
//   - interrupt() / shutdown() may be called from any thread.

class FrameCodec {
public:
    /// Creates the internal wake-up pipe and switches `write_fd` to
    /// non-blocking mode. Fails only when the OS refuses a pipe.
    [[nodiscard]] static TransportResult<std::unique_ptr<FrameCodec>> create(
        int read_fd, int write_fd, FrameCodecConfig config = {});

    ~FrameCodec();

    FrameCodec(const FrameCodec&) = delete;
    FrameCodec& operator=(const FrameCodec&) = delete;
    FrameCodec(FrameCodec&&) = delete;
    FrameCodec& operator=(FrameCodec&&) = delete;

    /// Serialize and write one frame. Returns once every byte is in the pipe.
    [[nodiscard]] TransportResult<void> write_message(const Json& message);

    /// Block until one complete frame is decoded, the stream ends or the codec
    /// is interrupted.
    [[nodiscard]] FrameResult<Json> read_next();

    /// Wake the reader and every blocked writer. Sticky: later reads report
    /// Interrupted and later writes fail with Closed.
    void interrupt() noexcept;

    /// interrupt(), then wait until no writer is inside write_message().
    /// After this returns the write descriptor is no longer touched.
    void shutdown();

    [[nodiscard]] bool is_interrupted() const noexcept { return interrupted_.load(); }

    [[nodiscard]] const FrameCodecConfig& config() const noexcept { return config_; }

    /// Wire bytes for one message under the given framing
    [[nodiscard]] static std::string encode(const Json& message, Framing framing);

private:
    FrameCodec(int read_fd, int write_fd, int wake_read, int wake_write, FrameCodecConfig config);

    [[nodiscard]] FrameResult<Json> read_line_frame();
    [[nodiscard]] FrameResult<Json> read_content_length_frame();
    [[nodiscard]] FrameResult<Json> decode(std::string_view payload);

    /// Refill the read buffer; waits on both the stream and the wake pipe
    [[nodiscard]] FrameResult<std::size_t> fill_read_buffer();

    /// Read exactly n bytes into dest
    [[nodiscard]] FrameResult<void> read_exact(char* dest, std::size_t n);

    [[nodiscard]] TransportResult<void> write_all(const std::string& data);

    int read_fd_{-1};
    int write_fd_{-1};
    int wake_read_{-1};
    int wake_write_{-1};
    FrameCodecConfig config_;

    std::mutex write_mutex_;
    std::atomic<bool> interrupted_{false};

    // Reader-thread state
    FastJsonParser parser_;
    static constexpr std::size_t read_buffer_size = 8192;
    char read_buffer_[read_buffer_size];
    std::size_t read_buffer_pos_{0};
    std::size_t read_buffer_len_{0};
};

}  // namespace mcpipe
