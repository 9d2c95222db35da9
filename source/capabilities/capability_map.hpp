#ifndef WDSESSION_CAPABILITY_MAP_HPP
#define WDSESSION_CAPABILITY_MAP_HPP

// Capability maps and the CapabilitySet interface implemented by every
// option-set collaborator (browser options, plain capabilities).
// Uses nlohmann/json for capability values.

#include <nlohmann/json.hpp>
#include <string>

namespace capabilities {

using json = nlohmann::json;

// A JSON object mapping capability name to any JSON value.
using CapabilityMap = json;

// Anything that can produce a capability map.
class CapabilitySet {
public:
    virtual ~CapabilitySet() = default;

    virtual CapabilityMap to_capability_map() const = 0;
};

// A plain capability map. Setting a capability to null removes it.
class Capabilities : public CapabilitySet {
public:
    Capabilities();

    // Throws std::invalid_argument if map is not a JSON object.
    explicit Capabilities(const CapabilityMap &map);

    Capabilities(const std::string &key, const json &value);

    CapabilityMap to_capability_map() const override;

    Capabilities &set_capability(const std::string &key, const json &value);

    // Returns null when the capability is absent.
    json get_capability(const std::string &key) const;

    bool has_capability(const std::string &key) const;

    // Returns empty when browserName is absent or not a string.
    std::string get_browser_name() const;

    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }

    // Keys present on both sides take this object's value; every other key
    // passes through unchanged.
    Capabilities merge(const CapabilitySet &other) const;

    bool operator==(const Capabilities &other) const { return map_ == other.map_; }
    bool operator!=(const Capabilities &other) const { return !(*this == other); }

private:
    CapabilityMap map_;
};

} // namespace capabilities

#endif // WDSESSION_CAPABILITY_MAP_HPP
