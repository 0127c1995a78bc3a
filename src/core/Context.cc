#include "fleet/core/Context.hh"

#include <algorithm>

namespace fleet {

Context::Context(std::initializer_list<std::pair<const std::string, std::any>> values) : values_(values) {}

Context::Context(const Context& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    values_ = other.values_;
}

Context& Context::operator=(const Context& other) {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        values_ = other.values_;
    }
    return *this;
}

bool Context::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.find(key) != values_.end();
}

bool Context::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.erase(key) > 0;
}

std::vector<std::string> Context::keys() const {
    std::vector<std::string> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(values_.size());
        for (const auto& [key, value] : values_) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::size_t Context::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

bool Context::empty() const {
    return size() == 0;
}

} // namespace fleet
