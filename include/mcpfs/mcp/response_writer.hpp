#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace mcpfs {

// ---------------------------------------------------------------------------
// ResponseWriter: the only thing that writes to the protocol stream.
//
// Post() may be called from any thread; one background thread encodes each
// message as a frame, writes it whole and flushes. Close() writes everything
// already posted, then joins.
// ---------------------------------------------------------------------------
class ResponseWriter {
public:
    explicit ResponseWriter(std::ostream& out);
    ~ResponseWriter();

    ResponseWriter(const ResponseWriter&) = delete;
    ResponseWriter& operator=(const ResponseWriter&) = delete;

    // Returns false after Close().
    bool Post(const nlohmann::json& message);

    void Close();

    [[nodiscard]] std::size_t FramesWritten() const;

private:
    void WriterLoop();

    std::ostream& out_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    std::size_t written_ = 0;
    bool closed_ = false;
    std::thread thread_;
};

} // namespace mcpfs
