#include "util/id.hpp"
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <random>

namespace agentflow::util {

namespace {

std::mt19937_64& id_engine() {
    static std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

std::mutex g_id_mutex;

bool is_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

ElementId generate_id() {
    uint64_t hi;
    uint64_t lo;
    {
        std::lock_guard<std::mutex> lock(g_id_mutex);
        hi = id_engine()();
        lo = id_engine()();
    }

    // version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
        static_cast<unsigned>(hi >> 32),
        static_cast<unsigned>((hi >> 16) & 0xFFFF),
        static_cast<unsigned>(hi & 0xFFFF),
        static_cast<unsigned>(lo >> 48),
        static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return ElementId(buf, 36);
}

bool is_valid_id(const std::string& id) {
    if (id.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < id.size(); i++) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (id[i] != '-') {
                return false;
            }
        } else if (!is_hex(id[i])) {
            return false;
        }
    }
    return id[14] == '4';
}

} // namespace agentflow::util
