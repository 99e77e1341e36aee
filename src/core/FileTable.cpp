#include "core/FileTable.hpp"

#include <algorithm>
#include <cmath>

#include "core/Constants.hpp"

namespace fs = std::filesystem;

namespace hashflow {

bool FileTable::add(const fs::path& identity) {
    if (find(identity)) return false;
    FileTask task;
    task.identity = identity;
    tasks.push_back(std::move(task));
    return true;
}

bool FileTable::apply(const FileEvent& event) {
    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [&](const FileTask& t) { return t.identity == event.identity; });
    if (it == tasks.end()) return false;
    it->state = event.state;
    return true;
}

bool FileTable::setSize(const fs::path& identity, uint64_t sizeBytes) {
    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [&](const FileTask& t) { return t.identity == identity; });
    if (it == tasks.end()) return false;
    it->sizeBytes = sizeBytes;
    return true;
}

bool FileTable::remove(const fs::path& identity) {
    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [&](const FileTask& t) { return t.identity == identity; });
    if (it == tasks.end()) return false;
    tasks.erase(it);
    return true;
}

const FileTask* FileTable::find(const fs::path& identity) const {
    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [&](const FileTask& t) { return t.identity == identity; });
    return it == tasks.end() ? nullptr : &*it;
}

bool FileTable::allCompleted() const {
    return !tasks.empty() &&
           std::all_of(tasks.begin(), tasks.end(), [](const FileTask& t) { return isCompleted(t.state); });
}

std::optional<float> aggregateProgress(const std::vector<FileTask>& entries) {
    std::optional<float> lowest;
    for (const auto& t : entries) {
        const auto* p = std::get_if<InProgress>(&t.state);
        // A file that has only just started says nothing about overall progress yet
        if (p && p->percent > 0.0f) {
            if (!lowest || p->percent < *lowest) lowest = p->percent;
        }
    }
    return lowest;
}

std::string formatTitle(const std::vector<FileTask>& entries) {
    auto progress = aggregateProgress(entries);
    if (!progress) return Constants::APP_NAME;
    long rounded = std::lround(*progress);
    return std::to_string(rounded) + "% - " + Constants::APP_NAME;
}

DigestMatch compareWithFirst(const std::vector<FileTask>& entries, size_t index) {
    if (index >= entries.size()) return DigestMatch::Unknown;
    const auto* first = std::get_if<Completed>(&entries.front().state);
    const auto* other = std::get_if<Completed>(&entries[index].state);
    if (!first || !other) return DigestMatch::Unknown;
    return first->digest == other->digest ? DigestMatch::Match : DigestMatch::Mismatch;
}

}
