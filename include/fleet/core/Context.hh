#pragma once

#include "fleet/utils/ErrorHandling.hh"
#include <any>
#include <initializer_list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fleet {

// Shared key/value state for one event run. Every handler of the event sees
// the same instance; execution order decides which writes a handler observes.
class Context {
  public:
    Context() = default;
    Context(std::initializer_list<std::pair<const std::string, std::any>> values);

    Context(const Context& other);
    Context& operator=(const Context& other);

    template <typename T> void set(const std::string& key, T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = std::any(std::move(value));
    }

    // Throws FleetException when the key is absent or holds another type.
    template <typename T> T get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            throwError("Context key '" + key + "' not found");
        }
        const T* value = std::any_cast<T>(&it->second);
        if (!value) {
            throwError("Context key '" + key + "' has incorrect type");
        }
        return *value;
    }

    template <typename T> T getOr(const std::string& key, T defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return defaultValue;
        }
        const T* value = std::any_cast<T>(&it->second);
        return value ? *value : defaultValue;
    }

    // Applies fn to the stored T in place, default-constructing it first when
    // the key is absent. Used for accumulating entries such as traces.
    template <typename T, typename Fn> void update(const std::string& key, Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = values_[key];
        if (!slot.has_value()) {
            slot = T{};
        }
        T* value = std::any_cast<T>(&slot);
        if (!value) {
            throwError("Context key '" + key + "' has incorrect type");
        }
        fn(*value);
    }

    bool has(const std::string& key) const;
    bool erase(const std::string& key);
    std::vector<std::string> keys() const;
    std::size_t size() const;
    bool empty() const;

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::any> values_;
};

} // namespace fleet
