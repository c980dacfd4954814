#include "zapwire/transfer/ChunkIO.hpp"

#include "zapwire/Error.hpp"
#include "zapwire/crypto/Sha256.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace zapwire::transfer {

namespace {

constexpr std::size_t kReadBlockSize = 64 * 1024;

[[noreturn]] void io_failure(const std::string& what, const std::filesystem::path& path) {
    throw Error(ErrorCode::IOError, what + " " + path.string() + ": " + std::strerror(errno));
}

Digest digest_stream(std::istream& stream) {
    crypto::Sha256 hasher;
    ByteBuffer block(kReadBlockSize);
    while (stream) {
        stream.read(reinterpret_cast<char*>(block.data()), static_cast<std::streamsize>(block.size()));
        const auto count = stream.gcount();
        if (count > 0) {
            hasher.update(std::span<const std::uint8_t>(block.data(), static_cast<std::size_t>(count)));
        }
    }
    return hasher.finalize();
}

}  // namespace

FileMetadata file_metadata(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw Error(ErrorCode::IOError, "cannot stat " + path.string());
    }

    FileMetadata metadata{};
    auto name_source = path;
    if (!name_source.has_filename()) {
        name_source = name_source.parent_path();
    }
    metadata.name = name_source.filename().string();
    if (metadata.name.empty()) {
        throw Error(ErrorCode::IOError, "path has no file name: " + path.string());
    }

    metadata.is_directory = std::filesystem::is_directory(status);
    if (metadata.is_directory) {
        return metadata;
    }

    metadata.size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw Error(ErrorCode::IOError, "cannot read size of " + path.string() + ": " + ec.message());
    }
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw Error(ErrorCode::IOError, "cannot open " + path.string());
    }
    const auto digest = digest_stream(stream);
    if (stream.bad()) {
        throw Error(ErrorCode::IOError, "read failed for " + path.string());
    }
    metadata.checksum = to_hex(digest);
    return metadata;
}

FileChunkSource::FileChunkSource(const std::filesystem::path& path)
    : path_(path),
      stream_(path, std::ios::binary) {
    if (!stream_) {
        throw Error(ErrorCode::IOError, "cannot open " + path.string());
    }
    std::error_code ec;
    size_ = std::filesystem::file_size(path, ec);
    if (ec) {
        throw Error(ErrorCode::IOError, "cannot read size of " + path.string() + ": " + ec.message());
    }
}

std::optional<ByteBuffer> FileChunkSource::next_chunk(std::size_t max) {
    if (position_ >= size_ || max == 0) {
        return std::nullopt;
    }
    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(max, size_ - position_));
    ByteBuffer chunk(want);
    stream_.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(want));
    const auto count = static_cast<std::size_t>(stream_.gcount());
    if (count == 0) {
        // The file shrank underneath us.
        throw Error(ErrorCode::IOError, "unexpected end of " + path_.string());
    }
    chunk.resize(count);
    position_ += count;
    return chunk;
}

void FileChunkSource::seek(std::uint64_t offset) {
    if (offset > size_) {
        throw Error(ErrorCode::IOError, "seek past end of " + path_.string());
    }
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_) {
        throw Error(ErrorCode::IOError, "seek failed for " + path_.string());
    }
    position_ = offset;
}

FileChunkSink::FileChunkSink(const std::filesystem::path& path, bool append)
    : path_(path) {
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    if (!append) {
        flags |= O_TRUNC;
    }
    fd_ = ::open(path.c_str(), flags, 0644);
    if (fd_ < 0) {
        io_failure("cannot open", path);
    }
    const auto end = ::lseek(fd_, 0, SEEK_END);
    if (end < 0) {
        const int saved = errno;
        ::close(fd_);
        fd_ = -1;
        errno = saved;
        io_failure("cannot seek", path);
    }
    written_ = static_cast<std::uint64_t>(end);
}

FileChunkSink::~FileChunkSink() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::uint64_t FileChunkSink::write_chunk(std::span<const std::uint8_t> data) {
    std::size_t offset = 0;
    while (offset < data.size()) {
        const auto written = ::write(fd_, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            io_failure("write failed for", path_);
        }
        offset += static_cast<std::size_t>(written);
    }
    written_ += data.size();
    return written_;
}

void FileChunkSink::truncate(std::uint64_t offset) {
    if (offset > written_) {
        throw Error(ErrorCode::IOError, "truncate past end of " + path_.string());
    }
    if (::ftruncate(fd_, static_cast<off_t>(offset)) != 0) {
        io_failure("truncate failed for", path_);
    }
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
        io_failure("cannot seek", path_);
    }
    written_ = offset;
}

void FileChunkSink::finalize() {
    if (::fsync(fd_) != 0) {
        io_failure("fsync failed for", path_);
    }
}

Digest FileChunkSink::content_digest() const {
    std::ifstream stream(path_, std::ios::binary);
    if (!stream) {
        throw Error(ErrorCode::IOError, "cannot reopen " + path_.string());
    }
    const auto digest = digest_stream(stream);
    if (stream.bad()) {
        throw Error(ErrorCode::IOError, "read failed for " + path_.string());
    }
    return digest;
}

MemoryChunkSource::MemoryChunkSource(ByteBuffer content)
    : content_(std::move(content)) {}

std::optional<ByteBuffer> MemoryChunkSource::next_chunk(std::size_t max) {
    if (position_ >= content_.size() || max == 0) {
        return std::nullopt;
    }
    const auto count = std::min(max, content_.size() - position_);
    const auto first = content_.begin() + static_cast<std::ptrdiff_t>(position_);
    ByteBuffer chunk(first, first + static_cast<std::ptrdiff_t>(count));
    position_ += count;
    return chunk;
}

void MemoryChunkSource::seek(std::uint64_t offset) {
    if (offset > content_.size()) {
        throw Error(ErrorCode::IOError, "seek past end of buffer");
    }
    position_ = static_cast<std::size_t>(offset);
}

MemoryChunkSink::MemoryChunkSink(ByteBuffer existing)
    : content_(std::move(existing)) {}

std::uint64_t MemoryChunkSink::write_chunk(std::span<const std::uint8_t> data) {
    content_.insert(content_.end(), data.begin(), data.end());
    return content_.size();
}

void MemoryChunkSink::truncate(std::uint64_t offset) {
    if (offset > content_.size()) {
        throw Error(ErrorCode::IOError, "truncate past end of buffer");
    }
    content_.resize(static_cast<std::size_t>(offset));
}

Digest MemoryChunkSink::content_digest() const {
    return crypto::Sha256::digest(content_);
}

}  // namespace zapwire::transfer
