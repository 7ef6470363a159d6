#ifndef STOMP_HEADER_MAP_HPP
#define STOMP_HEADER_MAP_HPP

#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace stomp {

/// Ordered header mapping of a STOMP frame
/// Keeps insertion order for encoding. Add() never replaces an existing name,
/// which gives the first-occurrence-wins rule used when decoding.
class HeaderMap {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    HeaderMap() = default;

    /// Build from a list of entries; a repeated name keeps its first value
    HeaderMap(std::initializer_list<Entry> entries);

    /// Append a header unless the name is already present
    /// @return true if the header was inserted
    bool Add(std::string name, std::string value);

    /// Replace the value of an existing header in place, or append it
    void Set(std::string name, std::string value);

    /// Remove a header by name
    /// @return true if a header was removed
    bool Erase(const std::string& name);

    bool Contains(const std::string& name) const;

    /// Get a header value, or nullptr when absent
    const std::string* Find(const std::string& name) const;

    /// Get a header value, or fallback when absent
    std::string GetOr(const std::string& name, const std::string& fallback = {}) const;

    size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const HeaderMap& other) const { return entries_ == other.entries_; }
    bool operator!=(const HeaderMap& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

} // namespace stomp

#endif // STOMP_HEADER_MAP_HPP
