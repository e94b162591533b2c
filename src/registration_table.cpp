#include "registration_table.hpp"
#include <algorithm>

bool RegistrationTable::try_insert(ListingId id, const std::filesystem::path& path){
    std::lock_guard lg(m_);
    if(map_.count(id)) return false;
    const auto name = path.filename();
    for(const auto& entry : map_){
        if(entry.second.filename() == name) return false;
    }
    map_.emplace(id, path);
    return true;
}

bool RegistrationTable::erase(ListingId id){
    std::lock_guard lg(m_);
    return map_.erase(id) > 0;
}

void RegistrationTable::clear(){
    std::lock_guard lg(m_);
    map_.clear();
}

std::optional<Registration> RegistrationTable::find_by_name(const std::string& file_name) const {
    std::lock_guard lg(m_);
    for(const auto& entry : map_){
        if(entry.second.filename().string() == file_name){
            return Registration{entry.first, entry.second};
        }
    }
    return std::nullopt;
}

std::optional<Registration> RegistrationTable::find_by_path(const std::filesystem::path& path) const {
    std::lock_guard lg(m_);
    for(const auto& entry : map_){
        if(entry.second == path) return Registration{entry.first, entry.second};
    }
    return std::nullopt;
}

bool RegistrationTable::contains_path(const std::filesystem::path& path) const {
    return find_by_path(path).has_value();
}

std::vector<Registration> RegistrationTable::list() const {
    std::lock_guard lg(m_);
    std::vector<Registration> out;
    out.reserve(map_.size());
    for(const auto& entry : map_) out.push_back(Registration{entry.first, entry.second});
    std::sort(out.begin(), out.end(),
              [](const Registration& a, const Registration& b){ return a.id < b.id; });
    return out;
}

std::vector<std::filesystem::path> RegistrationTable::paths() const {
    std::lock_guard lg(m_);
    std::vector<std::filesystem::path> out;
    out.reserve(map_.size());
    for(const auto& entry : map_) out.push_back(entry.second);
    return out;
}

std::size_t RegistrationTable::size() const {
    std::lock_guard lg(m_);
    return map_.size();
}

bool RegistrationTable::empty() const {
    std::lock_guard lg(m_);
    return map_.empty();
}
