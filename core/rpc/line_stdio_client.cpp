#include "line_stdio_client.hpp"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <thread>

#include "logging/logger.hpp"

namespace toolproxy {
namespace rpc {

namespace {
constexpr LineStdioClient::PipeHandle kInvalidHandle = -1;
constexpr size_t kReadChunkSize = 64 * 1024;

int remaining_ms(std::chrono::steady_clock::time_point start, int timeout_ms) {
    if (timeout_ms < 0) {
        return -1;
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if (elapsed_ms >= timeout_ms) {
        return 0;
    }
    return static_cast<int>(timeout_ms - elapsed_ms);
}
}  // namespace

LineStdioClient::LineStdioClient() : stdin_write_(kInvalidHandle), stdout_read_(kInvalidHandle) {}

LineStdioClient::~LineStdioClient() {
    close_stdin();
    close_stdout();
}

void LineStdioClient::set_handles(PipeHandle stdin_write, PipeHandle stdout_read) {
    close_stdin();
    close_stdout();
    stdin_write_ = stdin_write;
    stdout_read_ = stdout_read;
    buffer_.clear();
    scan_from_ = 0;
    discarding_ = false;
    eof_ = false;
}

bool LineStdioClient::write_line(const std::string &line, int timeout_ms) {
    write_error_.clear();
    if (stdin_write_ < 0) {
        write_error_ = "stdin pipe closed";
        return false;
    }
    if (line.find('\n') != std::string::npos) {
        write_error_ = "Line contains an embedded newline";
        return false;
    }

    std::string framed;
    framed.reserve(line.size() + 1);
    framed.append(line);
    framed.push_back('\n');
    return write_exact(framed.data(), framed.size(), timeout_ms);
}

bool LineStdioClient::write_exact(const char *buf, size_t n, int timeout_ms) {
    size_t total = 0;
    auto start_time = std::chrono::steady_clock::now();

    while (total < n) {
        if (timeout_ms >= 0) {
            int remaining = remaining_ms(start_time, timeout_ms);
            if (remaining == 0) {
                write_error_ = "Timeout writing line";
                return false;
            }

            struct pollfd pfd;
            pfd.fd = stdin_write_;
            pfd.events = POLLOUT;
            int result = poll(&pfd, 1, remaining);
            if (result < 0) {
                if (errno == EINTR) {
                    continue;
                }
                write_error_ = "poll failed: " + std::string(strerror(errno));
                return false;
            }
            if (result == 0) {
                continue;  // re-evaluates the deadline
            }
            if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
                write_error_ = "Broken pipe (server terminated)";
                return false;
            }
        }

        ssize_t w = write(stdin_write_, buf + total, n - total);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            if (errno == EPIPE) {
                write_error_ = "Broken pipe (server terminated)";
            } else {
                write_error_ = "Write failed: " + std::string(strerror(errno));
            }
            return false;
        }
        if (w == 0) {
            write_error_ = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

bool LineStdioClient::take_buffered_line(std::string &out) {
    while (true) {
        size_t pos = buffer_.find('\n', scan_from_);
        if (pos == std::string::npos) {
            scan_from_ = buffer_.size();
            if (buffer_.size() > kMaxLineSize) {
                if (!discarding_) {
                    LOG_WARN("[LineStdioClient] Discarding line over " << kMaxLineSize << " bytes");
                }
                buffer_.clear();
                scan_from_ = 0;
                discarding_ = true;
            }
            return false;
        }

        if (discarding_ || pos > kMaxLineSize) {
            if (!discarding_) {
                LOG_WARN("[LineStdioClient] Discarding line of " << pos << " bytes (limit " << kMaxLineSize << ")");
            }
            buffer_.erase(0, pos + 1);
            scan_from_ = 0;
            discarding_ = false;
            continue;
        }

        out.assign(buffer_, 0, pos);
        buffer_.erase(0, pos + 1);
        scan_from_ = 0;
        if (!out.empty() && out.back() == '\r') {
            out.pop_back();
        }
        return true;
    }
}

LineStdioClient::ReadStatus LineStdioClient::read_line(std::string &out, int timeout_ms) {
    read_error_.clear();
    auto start_time = std::chrono::steady_clock::now();

    while (true) {
        if (take_buffered_line(out)) {
            return ReadStatus::LINE;
        }

        if (eof_) {
            // Hand out a final unterminated line once before reporting EOF
            if (!buffer_.empty() && !discarding_) {
                out.swap(buffer_);
                buffer_.clear();
                scan_from_ = 0;
                return ReadStatus::LINE;
            }
            return ReadStatus::END_OF_STREAM;
        }

        if (stdout_read_ < 0) {
            read_error_ = "Invalid stdout pipe";
            return ReadStatus::IO_ERROR;
        }

        int remaining = remaining_ms(start_time, timeout_ms);
        if (remaining == 0) {
            return ReadStatus::TIMEOUT;
        }

        struct pollfd pfd;
        pfd.fd = stdout_read_;
        pfd.events = POLLIN;
        int result = poll(&pfd, 1, remaining);
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            read_error_ = "poll failed: " + std::string(strerror(errno));
            return ReadStatus::IO_ERROR;
        }
        if (result == 0) {
            return ReadStatus::TIMEOUT;
        }
        if ((pfd.revents & POLLNVAL) != 0) {
            read_error_ = "stdout pipe is not open";
            return ReadStatus::IO_ERROR;
        }

        // POLLIN or POLLHUP: read() distinguishes data from EOF
        char chunk[kReadChunkSize];
        ssize_t r = read(stdout_read_, chunk, sizeof(chunk));
        if (r < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            read_error_ = "Read failed: " + std::string(strerror(errno));
            return ReadStatus::IO_ERROR;
        }
        if (r == 0) {
            eof_ = true;
            continue;
        }
        buffer_.append(chunk, static_cast<size_t>(r));
    }
}

void LineStdioClient::close_stdin() {
    if (stdin_write_ >= 0) {
        close(stdin_write_);
        stdin_write_ = kInvalidHandle;
    }
}

void LineStdioClient::close_stdout() {
    if (stdout_read_ >= 0) {
        close(stdout_read_);
        stdout_read_ = kInvalidHandle;
    }
}

}  // namespace rpc
}  // namespace toolproxy
