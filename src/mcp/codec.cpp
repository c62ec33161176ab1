#include <mcpfs/mcp/codec.hpp>

#include <cerrno>
#include <cstring>

#include <unistd.h>

namespace mcpfs {

namespace {

constexpr const char* kDecodeOp = "FrameDecoder::Next";

std::string Preview(const std::string& line) {
    constexpr std::size_t kMax = 80;
    if (line.size() <= kMax) return line;
    return line.substr(0, kMax) + "...";
}

} // anonymous namespace

std::string EncodeFrame(const nlohmann::json& message) {
    auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    text.push_back('\n');
    return text;
}

// ---------------------------------------------------------------------------
// FrameDecoder
// ---------------------------------------------------------------------------
FrameDecoder::FrameDecoder(std::size_t max_frame_bytes)
    : max_frame_bytes_(max_frame_bytes) {}

void FrameDecoder::Feed(std::string_view bytes) {
    while (!bytes.empty()) {
        auto nl = bytes.find('\n');

        if (discarding_) {
            if (nl == std::string_view::npos) return;
            discarding_ = false;
            bytes.remove_prefix(nl + 1);
            continue;
        }

        if (nl == std::string_view::npos) {
            buffer_.append(bytes.data(), bytes.size());
            if (buffer_.size() > max_frame_bytes_) {
                ready_.push_back(Result<nlohmann::json, Error>::Err(Error::Make(
                    ErrorCategory::MalformedFrame, kDecodeOp, "",
                    "Frame exceeds " + std::to_string(max_frame_bytes_) + " bytes")));
                buffer_.clear();
                discarding_ = true;
            }
            return;
        }

        buffer_.append(bytes.data(), nl);
        bytes.remove_prefix(nl + 1);

        std::string line;
        line.swap(buffer_);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        if (line.size() > max_frame_bytes_) {
            ready_.push_back(Result<nlohmann::json, Error>::Err(Error::Make(
                ErrorCategory::MalformedFrame, kDecodeOp, "",
                "Frame exceeds " + std::to_string(max_frame_bytes_) + " bytes")));
            continue;
        }
        ready_.push_back(Decode(std::move(line)));
    }
}

std::optional<Result<nlohmann::json, Error>> FrameDecoder::Next() {
    if (ready_.empty()) return std::nullopt;
    auto front = std::move(ready_.front());
    ready_.pop_front();
    return front;
}

std::optional<Result<nlohmann::json, Error>> FrameDecoder::Finish() {
    if (discarding_) {
        discarding_ = false;
        buffer_.clear();
        return std::nullopt;
    }
    std::string line;
    line.swap(buffer_);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) return std::nullopt;
    return Decode(std::move(line));
}

Result<nlohmann::json, Error> FrameDecoder::Decode(std::string line) const {
    auto parsed = nlohmann::json::parse(line, nullptr, false);
    if (parsed.is_discarded()) {
        return Result<nlohmann::json, Error>::Err(Error::Make(
            ErrorCategory::MalformedFrame, kDecodeOp, "",
            "Invalid JSON frame: " + Preview(line)));
    }
    return Result<nlohmann::json, Error>::Ok(std::move(parsed));
}

// ---------------------------------------------------------------------------
// Byte sources
// ---------------------------------------------------------------------------
Result<std::size_t, Error> FdByteSource::ReadSome(char* buffer, std::size_t size) {
    for (;;) {
        auto n = ::read(fd_, buffer, size);
        if (n >= 0) {
            return Result<std::size_t, Error>::Ok(static_cast<std::size_t>(n));
        }
        if (errno == EINTR) continue;
        return Result<std::size_t, Error>::Err(Error::Make(
            ErrorCategory::Io, "FdByteSource::ReadSome", "",
            std::string("read failed: ") + std::strerror(errno)));
    }
}

Result<std::size_t, Error> IstreamByteSource::ReadSome(char* buffer, std::size_t size) {
    if (size == 0) return Result<std::size_t, Error>::Ok(0);
    // get() blocks for the first byte; readsome() then takes what is buffered.
    auto c = in_.get();
    if (c == std::char_traits<char>::eof()) {
        if (in_.bad()) {
            return Result<std::size_t, Error>::Err(Error::Make(
                ErrorCategory::Io, "IstreamByteSource::ReadSome", "",
                "input stream failed"));
        }
        return Result<std::size_t, Error>::Ok(0);
    }
    buffer[0] = static_cast<char>(c);
    auto more = in_.readsome(buffer + 1, static_cast<std::streamsize>(size - 1));
    return Result<std::size_t, Error>::Ok(1 + static_cast<std::size_t>(more));
}

// ---------------------------------------------------------------------------
// FrameReader
// ---------------------------------------------------------------------------
FrameReader::FrameReader(IByteSource& source, std::size_t max_frame_bytes)
    : source_(source), decoder_(max_frame_bytes) {}

Result<std::optional<nlohmann::json>, Error> FrameReader::Next() {
    using R = Result<std::optional<nlohmann::json>, Error>;
    char chunk[4096];

    for (;;) {
        if (auto frame = decoder_.Next()) {
            if (frame->IsErr()) return R::Err(std::move(*frame).Error());
            return R::Ok(std::optional<nlohmann::json>(std::move(*frame).Value()));
        }
        if (eof_) {
            if (auto tail = decoder_.Finish()) {
                if (tail->IsErr()) return R::Err(std::move(*tail).Error());
                return R::Ok(std::optional<nlohmann::json>(std::move(*tail).Value()));
            }
            return R::Ok(std::optional<nlohmann::json>());
        }

        auto n = source_.ReadSome(chunk, sizeof(chunk));
        if (n.IsErr()) return R::Err(n.Error());
        if (n.Value() == 0) {
            eof_ = true;
            continue;
        }
        decoder_.Feed(std::string_view(chunk, n.Value()));
    }
}

} // namespace mcpfs
