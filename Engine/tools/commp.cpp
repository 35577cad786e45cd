#include <ingestion/stream_commit.hpp>
#include <commitment/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <nlohmann/json.hpp>
#include <iostream>

using namespace Commpute;

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <filename>\n";
        std::cout << "\nEnvironment:\n"
                  << "  COMMPUTE_CONCURRENCY   leaf tasks in flight (default: hardware threads)\n"
                  << "  COMMPUTE_SEGMENT_SIZE  padded segment size in bytes (default: 8388608)\n"
                  << "  COMMPUTE_SEAL_PROOF    seal proof bounding the piece (default: 32GiB)\n"
                  << "  COMMPUTE_LOG_LEVEL     debug, info, warn or error\n";
        return 0;
    }
    const std::string path = argv[1];

    try {
        WriterConfig config = WriterConfig::from_env();
        Logger::step("Computing commP of " + path + " (" + std::to_string(config.concurrency)
                     + " tasks, " + to_string(config.seal_proof) + ")");

        Timer timer;
        DataCidSize sum = commit_file(path, config);
        Logger::info("Elapsed commP time: " + timer.elapsed_str());

        std::cout << "commP: " << sum.piece_cid << "\n";
        std::cout << nlohmann::json(sum).dump(2) << std::endl;
        return 0;
    } catch (const InputReadError& e) {
        Logger::error("Error reading file: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
