#include <ingestion/writer_config.hpp>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

namespace Commpute {

namespace {

uint64_t parse_positive(const char* name, const char* value) {
    const std::string s(value);
    size_t consumed = 0;
    unsigned long long v = 0;
    try {
        v = std::stoull(s, &consumed, 10);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != s.size() || s[0] == '-') {
        throw std::invalid_argument(std::string(name) + " must be a positive integer, got '" + s + "'");
    }
    return v;
}

} // namespace

size_t WriterConfig::default_concurrency() {
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

void WriterConfig::validate() const {
    if (concurrency == 0) {
        throw std::invalid_argument("concurrency must be at least 1");
    }
    segment_padded().validate();
    sector_size(seal_proof);
}

WriterConfig WriterConfig::from_env() {
    WriterConfig config;

    if (const char* v = std::getenv("COMMPUTE_CONCURRENCY")) {
        config.concurrency = static_cast<size_t>(parse_positive("COMMPUTE_CONCURRENCY", v));
    }
    if (const char* v = std::getenv("COMMPUTE_SEGMENT_SIZE")) {
        config.segment_padded_size = parse_positive("COMMPUTE_SEGMENT_SIZE", v);
    }
    if (const char* v = std::getenv("COMMPUTE_SEAL_PROOF")) {
        config.seal_proof = parse_seal_proof(v);
    }

    config.validate();
    return config;
}

} // namespace Commpute
