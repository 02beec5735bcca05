#include "rpc_channel.hpp"

#include <utility>

#include "json_rpc.hpp"
#include "logging/logger.hpp"

namespace toolproxy {
namespace rpc {

namespace {
// How often the reader wakes up to check for a stop request
constexpr int kReaderPollMs = 100;
// Upper bound on waiting for the reader after the process is gone
constexpr int kReaderJoinTimeoutMs = 2000;
constexpr size_t kMaxLoggedLine = 200;
// Bound on a stalled stdin pipe. Independent of the caller's deadline, which only
// governs the wait for the response.
constexpr int kWriteTimeoutMs = 5000;

std::string truncate_for_log(const std::string &line) {
    if (line.size() <= kMaxLoggedLine) {
        return line;
    }
    return line.substr(0, kMaxLoggedLine) + "...";
}

}  // namespace

RpcChannel::RpcChannel(uint64_t generation, std::unique_ptr<ServerProcess> process, PendingTable &pending,
                       DeadCallback on_dead)
    : generation_(generation),
      process_(std::move(process)),
      pending_(pending),
      on_dead_(std::move(on_dead)),
      tag_("[" + process_->server_name() + "#" + std::to_string(generation) + "]"),
      reader_exited_(reader_done_.get_future().share()),
      started_at_(std::chrono::steady_clock::now()) {}

RpcChannel::~RpcChannel() { close(); }

void RpcChannel::start() {
    started_at_ = std::chrono::steady_clock::now();
    reader_ = std::thread(&RpcChannel::reader_loop, this);
}

int64_t RpcChannel::last_request_id() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return next_id_ - 1;
}

RpcResult RpcChannel::send(const std::string &method, const nlohmann::json &params, int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    std::future<RpcResult> future;
    int64_t id = 0;
    std::string write_error;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);

        if (!writable_ || pending_.is_retired(generation_)) {
            return RpcResult::failure(ErrorKind::RESTART, "Connection restarted before '" + method + "' was sent");
        }

        id = next_id_++;
        auto waiter = std::make_shared<Waiter>(generation_, id, deadline);
        future = waiter->future();

        // Registered before the write so the response cannot outrun it
        if (!pending_.insert(waiter)) {
            return RpcResult::failure(ErrorKind::RESTART, "Connection restarted before '" + method + "' was sent");
        }

        if (!process_->client().write_line(jsonrpc::encode_request(id, method, params), kWriteTimeoutMs)) {
            write_error = process_->client().last_write_error();
            pending_.take(generation_, id);
        } else {
            LOG_DEBUG(tag_ << " Sent request " << id << ": " << method);
        }
    }

    if (!write_error.empty()) {
        LOG_ERROR(tag_ << " Failed to write request " << id << " (" << method << "): " << write_error);
        if (on_dead_) {
            on_dead_(generation_, "write failed: " + write_error);
        }
        return RpcResult::failure(ErrorKind::IO, "Failed to write request: " + write_error);
    }

    if (future.wait_until(deadline) == std::future_status::ready) {
        return future.get();
    }

    if (pending_.take(generation_, id)) {
        LOG_ERROR(tag_ << " Request " << id << " (" << method << ") timed out after " << timeout_ms << "ms");
        return RpcResult::failure(ErrorKind::TIMEOUT, "Timeout waiting for response to '" + method + "' (" +
                                                          std::to_string(timeout_ms) + "ms)");
    }

    // Resolved between the deadline and the take
    return future.get();
}

bool RpcChannel::notify(const std::string &method, const nlohmann::json &params, std::string &error) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!writable_) {
        error = "Connection closed";
        return false;
    }
    if (!process_->client().write_line(jsonrpc::encode_notification(method, params))) {
        error = "Failed to write notification: " + process_->client().last_write_error();
        return false;
    }
    LOG_DEBUG(tag_ << " Sent notification: " << method);
    return true;
}

void RpcChannel::reader_loop() {
    std::string line;
    std::string reason;

    while (!stop_.load(std::memory_order_acquire)) {
        auto status = process_->client().read_line(line, kReaderPollMs);
        if (status == LineStdioClient::ReadStatus::TIMEOUT) {
            continue;
        }
        if (status == LineStdioClient::ReadStatus::END_OF_STREAM) {
            reason = "server closed stdout";
            break;
        }
        if (status == LineStdioClient::ReadStatus::IO_ERROR) {
            reason = process_->client().last_read_error();
            break;
        }
        handle_line(line);
    }

    if (stop_.load(std::memory_order_acquire)) {
        LOG_DEBUG(tag_ << " Reader stopped");
    } else {
        LOG_WARN(tag_ << " Reader exiting: " << reason);
        if (on_dead_) {
            on_dead_(generation_, reason);
        }
    }
    reader_done_.set_value();
}

void RpcChannel::handle_line(const std::string &line) {
    if (line.empty()) {
        return;
    }

    jsonrpc::Message msg;
    std::string error;
    if (!jsonrpc::decode_message(line, msg, error)) {
        malformed_lines_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN(tag_ << " Skipping malformed line: " << error << " | " << truncate_for_log(line));
        return;
    }

    switch (msg.kind) {
        case jsonrpc::MessageKind::NOTIFICATION:
            LOG_DEBUG(tag_ << " Received notification: " << msg.method);
            return;
        case jsonrpc::MessageKind::REQUEST:
            LOG_WARN(tag_ << " Ignoring server request '" << msg.method << "'");
            return;
        case jsonrpc::MessageKind::RESPONSE:
            break;
    }

    WaiterPtr waiter = pending_.take(generation_, msg.id);
    if (!waiter) {
        LOG_DEBUG(tag_ << " Dropping response for unknown or stale id " << msg.id);
        return;
    }

    if (msg.is_error) {
        waiter->resolve(RpcResult::remote(msg.error));
    } else {
        waiter->resolve(RpcResult::ok(msg.result));
    }
}

void RpcChannel::close() {
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;

    stop_.store(true, std::memory_order_release);

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        writable_ = false;
        process_->client().close_stdin();
    }

    process_->shutdown();

    if (reader_.joinable()) {
        if (reader_exited_.wait_for(std::chrono::milliseconds(kReaderJoinTimeoutMs)) != std::future_status::ready) {
            LOG_WARN(tag_ << " Reader did not exit within " << kReaderJoinTimeoutMs << "ms");
        }
        reader_.join();
    }

    size_t failed = pending_.retire_through(
        generation_, RpcResult::failure(ErrorKind::RESTART, "Connection closed while request was in flight"));
    if (failed > 0) {
        LOG_WARN(tag_ << " Failed " << failed << " in-flight request(s) on close");
    }
}

bool RpcChannel::alive() {
    if (reader_exited_.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        return false;
    }
    return process_->is_running();
}

}  // namespace rpc
}  // namespace toolproxy
