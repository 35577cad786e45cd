#include <ingestion/stream_commit.hpp>
#include <commitment/errors.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

namespace Commpute {

DataCidSize commit_stream(std::istream& in, const WriterConfig& config) {
    DataCidWriter writer(config);
    std::vector<char> chunk(STREAM_CHUNK_SIZE);

    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            writer.write(chunk.data(), static_cast<size_t>(got));
        }
    }
    if (in.bad() || !in.eof()) {
        throw InputReadError("error reading input after " + std::to_string(writer.bytes_written()) + " bytes");
    }

    return writer.sum();
}

DataCidSize commit_file(const std::string& path, const WriterConfig& config) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw InputReadError("cannot open " + path + ": " + std::strerror(errno));
    }
    try {
        return commit_stream(file, config);
    } catch (const InputReadError& e) {
        throw InputReadError(path + ": " + e.what());
    }
}

} // namespace Commpute
