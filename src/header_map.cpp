#include "stomp/header_map.hpp"

#include <algorithm>

namespace stomp {

namespace {
    template <typename Entries>
    auto FindEntry(Entries& entries, const std::string& name) {
        return std::find_if(entries.begin(), entries.end(),
                            [&name](const auto& entry) { return entry.first == name; });
    }
}

HeaderMap::HeaderMap(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        Add(entry.first, entry.second);
    }
}

bool HeaderMap::Add(std::string name, std::string value) {
    if (Contains(name)) {
        return false;
    }
    entries_.emplace_back(std::move(name), std::move(value));
    return true;
}

void HeaderMap::Set(std::string name, std::string value) {
    auto it = FindEntry(entries_, name);
    if (it != entries_.end()) {
        it->second = std::move(value);
        return;
    }
    entries_.emplace_back(std::move(name), std::move(value));
}

bool HeaderMap::Erase(const std::string& name) {
    auto it = FindEntry(entries_, name);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool HeaderMap::Contains(const std::string& name) const {
    return FindEntry(entries_, name) != entries_.end();
}

const std::string* HeaderMap::Find(const std::string& name) const {
    auto it = FindEntry(entries_, name);
    return it != entries_.end() ? &it->second : nullptr;
}

std::string HeaderMap::GetOr(const std::string& name, const std::string& fallback) const {
    const std::string* value = Find(name);
    return value ? *value : fallback;
}

} // namespace stomp
