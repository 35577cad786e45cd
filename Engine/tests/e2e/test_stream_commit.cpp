/**
 * @file test_stream_commit.cpp
 * @brief Draining streams and files through the writer
 */

#include <gtest/gtest.h>
#include <ingestion/stream_commit.hpp>
#include <commitment/errors.hpp>
#include <commitment/piece_hasher.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace Commpute;

namespace {

std::string pattern(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) s[i] = static_cast<char>((i * 31 + 7) % 251);
    return s;
}

WriterConfig small_segments() {
    WriterConfig config;
    config.concurrency = 2;
    config.segment_padded_size = 2048;
    return config;
}

} // namespace

TEST(StreamCommitTest, StreamMatchesDirectCommitment) {
    // Larger than one read chunk so the writer sees several writes.
    std::string data = pattern(STREAM_CHUNK_SIZE + 12345);
    std::istringstream in(data);

    auto sum = commit_stream(in, small_segments());
    auto direct = PieceHasher::compute(reinterpret_cast<const uint8_t*>(data.data()), data.size());

    EXPECT_EQ(sum.payload_size, data.size());
    EXPECT_EQ(sum.piece_size, direct.padded_size);
    EXPECT_EQ(sum.piece_cid, PieceCid::from_commitment(direct.commitment));
}

TEST(StreamCommitTest, EmptyStream) {
    std::istringstream in("");
    EXPECT_THROW(commit_stream(in, small_segments()), EmptyInputError);
}

TEST(StreamCommitTest, File) {
    auto path = std::filesystem::temp_directory_path() / "commpute_stream_commit_test.bin";
    std::string data = pattern(10000);
    {
        std::ofstream out(path, std::ios::binary);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }

    auto sum = commit_file(path.string(), small_segments());
    std::filesystem::remove(path);

    EXPECT_EQ(sum.payload_size, 10000u);
    EXPECT_EQ(sum.piece_size.value, 16384u);
}

TEST(StreamCommitTest, MissingFile) {
    EXPECT_THROW(commit_file("/nonexistent/commpute/input.bin", small_segments()), InputReadError);
}
