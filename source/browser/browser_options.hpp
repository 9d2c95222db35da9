#ifndef WDSESSION_BROWSER_OPTIONS_HPP
#define WDSESSION_BROWSER_OPTIONS_HPP

// Browser option sets. Each one is a CapabilitySet: it turns its settings
// into a W3C capability map with a browserName and a vendor-prefixed options
// object. The session builder only sees the resulting map.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "capabilities/capability_map.hpp"

namespace browser_options {

using json = nlohmann::json;

// Settings shared by every browser (standard W3C capabilities plus any
// extension capability set by the caller).
class DriverOptions : public capabilities::CapabilitySet {
public:
    explicit DriverOptions(const std::string &browser_name);

    DriverOptions &set_capability(const std::string &key, const json &value);

    // "none" | "eager" | "normal"
    DriverOptions &set_page_load_strategy(const std::string &strategy);

    DriverOptions &set_accept_insecure_certs(bool accept);

    // "dismiss" | "accept" | "dismiss and notify" | "accept and notify" | "ignore"
    DriverOptions &set_unhandled_prompt_behavior(const std::string &behavior);

    DriverOptions &set_platform_name(const std::string &platform_name);

    DriverOptions &set_browser_version(const std::string &browser_version);

    const std::string &browser_name() const { return browser_name_; }

    capabilities::CapabilityMap to_capability_map() const override;

protected:
    // Vendor options object, stored under vendor_key(). Skipped when null.
    virtual json vendor_options() const = 0;
    virtual std::string vendor_key() const = 0;

private:
    std::string browser_name_;
    capabilities::Capabilities extra_capabilities_;
};

// Chrome: goog:chromeOptions.
class ChromeOptions : public DriverOptions {
public:
    ChromeOptions();

    ChromeOptions &add_argument(const std::string &argument);
    ChromeOptions &add_arguments(const std::vector<std::string> &arguments);
    ChromeOptions &set_binary(const std::string &binary_path);
    ChromeOptions &set_headless(bool headless);

    const std::vector<std::string> &arguments() const { return arguments_; }

protected:
    json vendor_options() const override;
    std::string vendor_key() const override { return "goog:chromeOptions"; }

private:
    std::vector<std::string> arguments_;
    std::string binary_path_;
};

// Firefox: moz:firefoxOptions.
class FirefoxOptions : public DriverOptions {
public:
    FirefoxOptions();

    FirefoxOptions &add_argument(const std::string &argument);
    FirefoxOptions &set_binary(const std::string &binary_path);
    FirefoxOptions &add_preference(const std::string &name, const json &value);
    FirefoxOptions &set_headless(bool headless);

protected:
    json vendor_options() const override;
    std::string vendor_key() const override { return "moz:firefoxOptions"; }

private:
    std::vector<std::string> arguments_;
    std::string binary_path_;
    json preferences_ = json::object();
};

// Internet Explorer: se:ieOptions.
class InternetExplorerOptions : public DriverOptions {
public:
    InternetExplorerOptions();

    InternetExplorerOptions &add_command_switch(const std::string &command_switch);
    InternetExplorerOptions &set_ignore_zoom_setting(bool ignore);

protected:
    json vendor_options() const override;
    std::string vendor_key() const override { return "se:ieOptions"; }

private:
    std::vector<std::string> command_switches_;
    bool ignore_zoom_setting_ = false;
};

} // namespace browser_options

#endif // WDSESSION_BROWSER_OPTIONS_HPP
