#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

using ListingId = std::int64_t;

struct Registration {
    ListingId id = 0;
    std::filesystem::path path; // absolute, normalised
    std::string file_name() const { return path.filename().string(); }
};

// Listings the registry currently acknowledges for this node.
// Internally locked; the transfer workers read it while the sync engine writes.
class RegistrationTable {
public:
    // Inserts unless the id exists or another entry already uses the same
    // base name (first registered wins).
    bool try_insert(ListingId id, const std::filesystem::path& path);
    bool erase(ListingId id);
    void clear();

    std::optional<Registration> find_by_name(const std::string& file_name) const;
    std::optional<Registration> find_by_path(const std::filesystem::path& path) const;
    bool contains_path(const std::filesystem::path& path) const;

    std::vector<Registration> list() const;
    std::vector<std::filesystem::path> paths() const;
    std::size_t size() const;
    bool empty() const;
private:
    mutable std::mutex m_;
    std::unordered_map<ListingId, std::filesystem::path> map_; // listing id -> path
};
