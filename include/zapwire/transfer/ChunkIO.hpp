#pragma once

#include "zapwire/Types.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <string>

namespace zapwire::transfer {

struct FileMetadata {
    std::string name;
    std::uint64_t size{0};
    bool is_directory{false};
    // Lowercase hex SHA-256 of the content; empty for directories.
    std::string checksum;
};

// Throws Error(IOError) when the path cannot be inspected or read.
FileMetadata file_metadata(const std::filesystem::path& path);

class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    // Up to max bytes from the current position; empty at end of content.
    virtual std::optional<ByteBuffer> next_chunk(std::size_t max) = 0;
    virtual void seek(std::uint64_t offset) = 0;
    virtual std::uint64_t size() const = 0;
};

class ChunkSink {
public:
    virtual ~ChunkSink() = default;

    // Appends and returns the total bytes held.
    virtual std::uint64_t write_chunk(std::span<const std::uint8_t> data) = 0;
    virtual std::uint64_t bytes_written() const = 0;
    // Drops everything past offset; later writes continue from there.
    virtual void truncate(std::uint64_t offset) = 0;
    // Flushes the content to stable storage.
    virtual void finalize() = 0;
    virtual Digest content_digest() const = 0;
};

class FileChunkSource : public ChunkSource {
public:
    explicit FileChunkSource(const std::filesystem::path& path);

    std::optional<ByteBuffer> next_chunk(std::size_t max) override;
    void seek(std::uint64_t offset) override;
    std::uint64_t size() const override { return size_; }

private:
    std::filesystem::path path_;
    std::ifstream stream_;
    std::uint64_t size_{0};
    std::uint64_t position_{0};
};

class FileChunkSink : public ChunkSink {
public:
    // Keeps existing content when append is set, otherwise starts empty.
    FileChunkSink(const std::filesystem::path& path, bool append);
    ~FileChunkSink() override;

    FileChunkSink(const FileChunkSink&) = delete;
    FileChunkSink& operator=(const FileChunkSink&) = delete;

    std::uint64_t write_chunk(std::span<const std::uint8_t> data) override;
    std::uint64_t bytes_written() const override { return written_; }
    void truncate(std::uint64_t offset) override;
    void finalize() override;
    Digest content_digest() const override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    int fd_{-1};
    std::uint64_t written_{0};
};

class MemoryChunkSource : public ChunkSource {
public:
    explicit MemoryChunkSource(ByteBuffer content);

    std::optional<ByteBuffer> next_chunk(std::size_t max) override;
    void seek(std::uint64_t offset) override;
    std::uint64_t size() const override { return content_.size(); }

private:
    ByteBuffer content_;
    std::size_t position_{0};
};

class MemoryChunkSink : public ChunkSink {
public:
    MemoryChunkSink() = default;
    explicit MemoryChunkSink(ByteBuffer existing);

    std::uint64_t write_chunk(std::span<const std::uint8_t> data) override;
    std::uint64_t bytes_written() const override { return content_.size(); }
    void truncate(std::uint64_t offset) override;
    void finalize() override { finalized_ = true; }
    Digest content_digest() const override;

    const ByteBuffer& content() const noexcept { return content_; }
    bool finalized() const noexcept { return finalized_; }

private:
    ByteBuffer content_;
    bool finalized_{false};
};

}  // namespace zapwire::transfer
