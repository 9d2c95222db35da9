#include "capabilities/capability_map.hpp"

#include <stdexcept>

namespace capabilities {

Capabilities::Capabilities() : map_(json::object()) {}

Capabilities::Capabilities(const CapabilityMap &map) : map_(json::object()) {
    if (!map.is_object()) {
        throw std::invalid_argument("Capabilities must be a JSON object, got: " + map.dump());
    }
    for (auto it = map.begin(); it != map.end(); ++it) {
        set_capability(it.key(), it.value());
    }
}

Capabilities::Capabilities(const std::string &key, const json &value) : map_(json::object()) {
    set_capability(key, value);
}

CapabilityMap Capabilities::to_capability_map() const {
    return map_;
}

Capabilities &Capabilities::set_capability(const std::string &key, const json &value) {
    if (value.is_null()) {
        map_.erase(key);
    } else {
        map_[key] = value;
    }
    return *this;
}

json Capabilities::get_capability(const std::string &key) const {
    auto found = map_.find(key);
    if (found == map_.end()) {
        return nullptr;
    }
    return *found;
}

bool Capabilities::has_capability(const std::string &key) const {
    return map_.contains(key);
}

std::string Capabilities::get_browser_name() const {
    auto found = map_.find("browserName");
    if (found == map_.end() || !found->is_string()) {
        return "";
    }
    return found->get<std::string>();
}

Capabilities Capabilities::merge(const CapabilitySet &other) const {
    CapabilityMap merged = other.to_capability_map();
    if (!merged.is_object()) {
        merged = json::object();
    }
    for (auto it = map_.begin(); it != map_.end(); ++it) {
        merged[it.key()] = it.value();
    }
    return Capabilities(merged);
}

} // namespace capabilities
