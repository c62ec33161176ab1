#pragma once

#include <mcpfs/core/result.hpp>

#include <cstddef>
#include <deque>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcpfs {

// Frames are single-line JSON texts terminated by '\n'.
constexpr std::size_t kDefaultMaxFrameBytes = 16 * 1024 * 1024;

/// Serialize one frame. Invalid UTF-8 in strings is replaced, never thrown.
[[nodiscard]] std::string EncodeFrame(const nlohmann::json& message);

// ---------------------------------------------------------------------------
// FrameDecoder: incremental splitter. Feed() arbitrary chunks, pull frames
// with Next(). A bad frame yields one MalformedFrame error and decoding
// continues with the following line.
// ---------------------------------------------------------------------------
class FrameDecoder {
public:
    explicit FrameDecoder(std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

    void Feed(std::string_view bytes);

    /// nullopt: no complete frame buffered yet.
    [[nodiscard]] std::optional<Result<nlohmann::json, Error>> Next();

    /// Flush an unterminated trailing frame at end of input.
    [[nodiscard]] std::optional<Result<nlohmann::json, Error>> Finish();

    [[nodiscard]] std::size_t BufferedBytes() const { return buffer_.size(); }

private:
    Result<nlohmann::json, Error> Decode(std::string line) const;

    std::size_t max_frame_bytes_;
    std::string buffer_;
    bool discarding_ = false;  // inside an oversized frame, skip to next '\n'
    std::deque<Result<nlohmann::json, Error>> ready_;
};

// ---------------------------------------------------------------------------
// Byte sources for FrameReader.
// ---------------------------------------------------------------------------
class IByteSource {
public:
    virtual ~IByteSource() = default;
    /// Returns bytes read; 0 means end of input.
    virtual Result<std::size_t, Error> ReadSome(char* buffer, std::size_t size) = 0;
};

// Reads a POSIX descriptor (not owned).
class FdByteSource : public IByteSource {
public:
    explicit FdByteSource(int fd) : fd_(fd) {}
    Result<std::size_t, Error> ReadSome(char* buffer, std::size_t size) override;
private:
    int fd_;
};

// Reads an std::istream, blocking for at least one byte.
class IstreamByteSource : public IByteSource {
public:
    explicit IstreamByteSource(std::istream& in) : in_(in) {}
    Result<std::size_t, Error> ReadSome(char* buffer, std::size_t size) override;
private:
    std::istream& in_;
};

// ---------------------------------------------------------------------------
// FrameReader: blocking frame pull over a byte source.
// ---------------------------------------------------------------------------
class FrameReader {
public:
    FrameReader(IByteSource& source,
                std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

    /// Ok(nullopt) at end of input. Err for a malformed frame (the reader
    /// stays usable) or a read failure.
    [[nodiscard]] Result<std::optional<nlohmann::json>, Error> Next();

private:
    IByteSource& source_;
    FrameDecoder decoder_;
    bool eof_ = false;
};

} // namespace mcpfs
