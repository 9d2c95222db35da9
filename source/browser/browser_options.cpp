#include "browser/browser_options.hpp"

#include <algorithm>
#include <sstream>

namespace browser_options {

DriverOptions::DriverOptions(const std::string &browser_name) : browser_name_(browser_name) {}

DriverOptions &DriverOptions::set_capability(const std::string &key, const json &value) {
    extra_capabilities_.set_capability(key, value);
    return *this;
}

DriverOptions &DriverOptions::set_page_load_strategy(const std::string &strategy) {
    return set_capability("pageLoadStrategy", strategy);
}

DriverOptions &DriverOptions::set_accept_insecure_certs(bool accept) {
    return set_capability("acceptInsecureCerts", accept);
}

DriverOptions &DriverOptions::set_unhandled_prompt_behavior(const std::string &behavior) {
    return set_capability("unhandledPromptBehavior", behavior);
}

DriverOptions &DriverOptions::set_platform_name(const std::string &platform_name) {
    return set_capability("platformName", platform_name);
}

DriverOptions &DriverOptions::set_browser_version(const std::string &browser_version) {
    return set_capability("browserVersion", browser_version);
}

capabilities::CapabilityMap DriverOptions::to_capability_map() const {
    capabilities::CapabilityMap map = json::object();
    map["browserName"] = browser_name_;
    json options = vendor_options();
    if (!options.is_null()) {
        map[vendor_key()] = options;
    }
    // Explicit capabilities win over the generated ones.
    capabilities::CapabilityMap extra = extra_capabilities_.to_capability_map();
    for (auto it = extra.begin(); it != extra.end(); ++it) {
        map[it.key()] = it.value();
    }
    return map;
}

ChromeOptions::ChromeOptions() : DriverOptions("chrome") {}

ChromeOptions &ChromeOptions::add_argument(const std::string &argument) {
    arguments_.push_back(argument);
    return *this;
}

ChromeOptions &ChromeOptions::add_arguments(const std::vector<std::string> &arguments) {
    arguments_.insert(arguments_.end(), arguments.begin(), arguments.end());
    return *this;
}

ChromeOptions &ChromeOptions::set_binary(const std::string &binary_path) {
    binary_path_ = binary_path;
    return *this;
}

ChromeOptions &ChromeOptions::set_headless(bool headless) {
    auto existing = std::find(arguments_.begin(), arguments_.end(), "--headless=new");
    if (headless && existing == arguments_.end()) {
        arguments_.push_back("--headless=new");
    } else if (!headless && existing != arguments_.end()) {
        arguments_.erase(existing);
    }
    return *this;
}

json ChromeOptions::vendor_options() const {
    json options = json::object();
    options["args"] = arguments_;
    if (!binary_path_.empty()) {
        options["binary"] = binary_path_;
    }
    return options;
}

FirefoxOptions::FirefoxOptions() : DriverOptions("firefox") {}

FirefoxOptions &FirefoxOptions::add_argument(const std::string &argument) {
    arguments_.push_back(argument);
    return *this;
}

FirefoxOptions &FirefoxOptions::set_binary(const std::string &binary_path) {
    binary_path_ = binary_path;
    return *this;
}

FirefoxOptions &FirefoxOptions::add_preference(const std::string &name, const json &value) {
    preferences_[name] = value;
    return *this;
}

FirefoxOptions &FirefoxOptions::set_headless(bool headless) {
    auto existing = std::find(arguments_.begin(), arguments_.end(), "-headless");
    if (headless && existing == arguments_.end()) {
        arguments_.push_back("-headless");
    } else if (!headless && existing != arguments_.end()) {
        arguments_.erase(existing);
    }
    return *this;
}

json FirefoxOptions::vendor_options() const {
    json options = json::object();
    options["args"] = arguments_;
    if (!binary_path_.empty()) {
        options["binary"] = binary_path_;
    }
    if (!preferences_.empty()) {
        options["prefs"] = preferences_;
    }
    return options;
}

InternetExplorerOptions::InternetExplorerOptions() : DriverOptions("internet explorer") {}

InternetExplorerOptions &InternetExplorerOptions::add_command_switch(const std::string &command_switch) {
    command_switches_.push_back(command_switch);
    return *this;
}

InternetExplorerOptions &InternetExplorerOptions::set_ignore_zoom_setting(bool ignore) {
    ignore_zoom_setting_ = ignore;
    return *this;
}

json InternetExplorerOptions::vendor_options() const {
    json options = json::object();
    // IEDriverServer expects the switches as one space-separated string.
    std::ostringstream switches;
    for (size_t index = 0; index < command_switches_.size(); index++) {
        if (index > 0) {
            switches << ' ';
        }
        switches << command_switches_[index];
    }
    if (!command_switches_.empty()) {
        options["ie.browserCommandLineSwitches"] = switches.str();
    }
    options["ignoreZoomSetting"] = ignore_zoom_setting_;
    return options;
}

} // namespace browser_options
