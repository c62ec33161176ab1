#include <mcpfs/mcp/response_writer.hpp>

#include <mcpfs/core/log.hpp>
#include <mcpfs/mcp/codec.hpp>

namespace mcpfs {

ResponseWriter::ResponseWriter(std::ostream& out)
    : out_(out), thread_([this] { WriterLoop(); }) {}

ResponseWriter::~ResponseWriter() {
    Close();
}

bool ResponseWriter::Post(const nlohmann::json& message) {
    auto frame = EncodeFrame(message);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            LogDebug("writer", "Dropping frame posted after close");
            return false;
        }
        queue_.push_back(std::move(frame));
    }
    cv_.notify_one();
    return true;
}

void ResponseWriter::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

std::size_t ResponseWriter::FramesWritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

void ResponseWriter::WriterLoop() {
    bool reported = false;
    for (;;) {
        std::string frame;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            if (queue_.empty()) return;
            frame = std::move(queue_.front());
            queue_.pop_front();
        }

        out_.write(frame.data(), static_cast<std::streamsize>(frame.size()));
        out_.flush();
        if (!out_ && !reported) {
            LogError("writer", "Output stream failed; responses are being lost");
            reported = true;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++written_;
    }
}

} // namespace mcpfs
