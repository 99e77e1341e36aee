#include "core/FileState.hpp"

#include <cstdio>

namespace hashflow {

namespace {
const std::string kNoDigest;
}

float percentOf(const FileState& s) {
    if (const auto* p = std::get_if<InProgress>(&s)) return p->percent;
    if (isCompleted(s)) return 100.0f;
    return 0.0f;
}

const std::string& digestOf(const FileState& s) {
    if (const auto* c = std::get_if<Completed>(&s)) return c->digest;
    return kNoDigest;
}

std::string describe(const FileState& s) {
    if (isPending(s)) return "pending";
    if (const auto* p = std::get_if<InProgress>(&s)) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%.1f%%", static_cast<double>(p->percent));
        return buf;
    }
    return "completed " + digestOf(s);
}

}
