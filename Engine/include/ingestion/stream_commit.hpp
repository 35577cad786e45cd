#pragma once

#include <ingestion/data_cid_writer.hpp>
#include <istream>
#include <string>

namespace Commpute {

/// Read size used when draining a stream into a DataCidWriter.
constexpr size_t STREAM_CHUNK_SIZE = size_t(1) << 20;

/**
 * @brief Drain `in` through a fresh DataCidWriter.
 * @throws InputReadError if the stream fails before reaching end-of-file
 */
DataCidSize commit_stream(std::istream& in, const WriterConfig& config = WriterConfig());

/**
 * @throws InputReadError if the file cannot be opened or read
 */
DataCidSize commit_file(const std::string& path, const WriterConfig& config = WriterConfig());

} // namespace Commpute
