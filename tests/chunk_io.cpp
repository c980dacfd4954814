#include "zapwire/Error.hpp"
#include "zapwire/crypto/Sha256.hpp"
#include "zapwire/transfer/ChunkIO.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace zapwire;
using namespace zapwire::transfer;

namespace {

template <typename Fn>
bool throws_io_error(Fn&& fn) {
    try {
        fn();
    } catch (const Error& error) {
        return error.code() == ErrorCode::IOError;
    }
    return false;
}

ByteBuffer read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return ByteBuffer((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void write_file(const std::filesystem::path& path, const ByteBuffer& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
}

}  // namespace

int main() {
    const auto root = std::filesystem::temp_directory_path() / "zapwire_chunk_io_test";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);

    const auto content = to_bytes("The quick brown fox jumps over the lazy dog");
    const auto source_path = root / "fox.txt";
    write_file(source_path, content);

    {
        const auto metadata = file_metadata(source_path);
        assert(metadata.name == "fox.txt");
        assert(metadata.size == content.size());
        assert(!metadata.is_directory);
        assert(metadata.checksum == "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
    }

    {
        const auto metadata = file_metadata(root);
        assert(metadata.is_directory);
        assert(metadata.name == "zapwire_chunk_io_test");
        assert(metadata.checksum.empty());
    }

    assert(throws_io_error([&] { (void)file_metadata(root / "missing"); }));
    assert(throws_io_error([&] { FileChunkSource missing(root / "missing"); }));

    {
        FileChunkSource source(source_path);
        assert(source.size() == content.size());
        ByteBuffer collected;
        while (auto chunk = source.next_chunk(10)) {
            assert(chunk->size() <= 10);
            collected.insert(collected.end(), chunk->begin(), chunk->end());
        }
        assert(collected == content);

        source.seek(40);
        const auto tail = source.next_chunk(10);
        assert(tail.has_value());
        assert(*tail == to_bytes("dog"));
        assert(!source.next_chunk(10).has_value());
        assert(throws_io_error([&] { source.seek(content.size() + 1); }));
    }

    const auto sink_path = root / "copy.txt";
    {
        FileChunkSink sink(sink_path, false);
        assert(sink.bytes_written() == 0);
        assert(sink.write_chunk(ByteBuffer(content.begin(), content.begin() + 20)) == 20);
        assert(sink.write_chunk(ByteBuffer(content.begin() + 20, content.end())) == content.size());
        sink.finalize();
        assert(sink.content_digest() == crypto::Sha256::digest(content));
    }
    assert(read_file(sink_path) == content);

    // Append keeps what is there; truncate cuts back and writing resumes at the cut.
    {
        FileChunkSink sink(sink_path, true);
        assert(sink.bytes_written() == content.size());
        sink.truncate(10);
        assert(sink.bytes_written() == 10);
        assert(sink.write_chunk(to_bytes("red")) == 13);
        sink.finalize();
        assert(throws_io_error([&] { sink.truncate(100); }));
    }
    assert(read_file(sink_path) == to_bytes("The quick red"));

    // Without append the file starts over.
    {
        FileChunkSink sink(sink_path, false);
        assert(sink.bytes_written() == 0);
    }
    assert(read_file(sink_path).empty());

    assert(throws_io_error([&] { FileChunkSink unwritable(root / "no" / "such" / "dir.txt", false); }));

    {
        MemoryChunkSource source(content);
        source.seek(4);
        assert(*source.next_chunk(5) == to_bytes("quick"));
        assert(throws_io_error([&] { source.seek(content.size() + 1); }));

        MemoryChunkSink sink(to_bytes("partial"));
        assert(sink.bytes_written() == 7);
        sink.truncate(4);
        assert(sink.write_chunk(to_bytes("y")) == 5);
        assert(sink.content() == to_bytes("party"));
        assert(!sink.finalized());
        sink.finalize();
        assert(sink.finalized());
        assert(sink.content_digest() == crypto::Sha256::digest(to_bytes("party")));
    }

    std::filesystem::remove_all(root);
    return 0;
}
