#pragma once
// Store configuration

#include <cstdlib>
#include <string>

namespace tristore {

struct StoreConfig {
    std::string name = "store";          // Prefix for log lines
    bool verbose = false;                // Log writes and rejections to stderr
    bool verify_candidates = true;       // Drop composite-key collisions from results
    size_t reserve_triples = 0;          // Preallocate for this many triples

    // Defaults overlaid with TRISTORE_VERBOSE / TRISTORE_RESERVE
    static StoreConfig from_env() {
        StoreConfig config;
        if (const char* verbose = std::getenv("TRISTORE_VERBOSE")) {
            std::string v(verbose);
            config.verbose = !(v.empty() || v == "0" || v == "false" || v == "off");
        }
        if (const char* reserve = std::getenv("TRISTORE_RESERVE")) {
            char* end = nullptr;
            unsigned long long n = std::strtoull(reserve, &end, 10);
            if (end != reserve && *end == '\0') {
                config.reserve_triples = static_cast<size_t>(n);
            }
        }
        return config;
    }
};

} // namespace tristore
