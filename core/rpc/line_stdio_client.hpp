#pragma once

#include <cstddef>
#include <string>

namespace toolproxy {
namespace rpc {

// Lines above this size are discarded by read_line (16 MiB)
constexpr size_t kMaxLineSize = 16u * 1024u * 1024u;

// LineStdioClient speaks newline-delimited messages over a child's stdin/stdout pipes.
// Writes and reads may happen on different threads; each direction is used by one thread at a time.
class LineStdioClient {
public:
    using PipeHandle = int;  // file descriptor

    enum class ReadStatus {
        LINE,           // `out` holds one complete line (without the terminator)
        TIMEOUT,        // no complete line within timeout_ms
        END_OF_STREAM,  // child closed stdout
        IO_ERROR        // read/poll failure (see last_read_error())
    };

    LineStdioClient();
    ~LineStdioClient();

    LineStdioClient(const LineStdioClient &) = delete;
    LineStdioClient &operator=(const LineStdioClient &) = delete;

    // Takes ownership of both descriptors
    void set_handles(PipeHandle stdin_write, PipeHandle stdout_read);

    // Write `line` followed by '\n'. Returns false on error (sets last_write_error()).
    // timeout_ms < 0 blocks until the whole line is written.
    bool write_line(const std::string &line, int timeout_ms = -1);

    // Read the next line. timeout_ms < 0 blocks until a line, EOF, or error.
    ReadStatus read_line(std::string &out, int timeout_ms = -1);

    // Close stdin (signals EOF to the child)
    void close_stdin();
    void close_stdout();

    bool stdin_open() const { return stdin_write_ >= 0; }

    const std::string &last_write_error() const { return write_error_; }
    const std::string &last_read_error() const { return read_error_; }

private:
    PipeHandle stdin_write_;
    PipeHandle stdout_read_;

    // Bytes read past the last returned line
    std::string buffer_;
    size_t scan_from_ = 0;
    bool discarding_ = false;  // inside an oversized line, dropping bytes until the next '\n'
    bool eof_ = false;

    std::string write_error_;
    std::string read_error_;

    bool write_exact(const char *buf, size_t n, int timeout_ms);

    // Extract one complete line from buffer_ if present
    bool take_buffered_line(std::string &out);
};

}  // namespace rpc
}  // namespace toolproxy
