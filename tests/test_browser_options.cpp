// Tests for the browser option sets: the capability maps they produce and
// that every key they emit passes W3C validation.

#include "browser/browser_options.hpp"
#include "capabilities/capability_validator.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace test_browser_options {

static bool report(bool success, const std::string &description) {
    std::cout << (success ? "  OK: " : "  FAIL: ") << description << std::endl;
    return success;
}

static bool is_valid(const json &map) {
    return capability_validator::validate(map).success;
}

// Test: the shared setters write standard capability names.
static bool test_standard_setters() {
    browser_options::FirefoxOptions options;
    options.set_page_load_strategy("eager")
        .set_accept_insecure_certs(true)
        .set_unhandled_prompt_behavior("dismiss and notify")
        .set_platform_name("linux")
        .set_browser_version("128");
    json map = options.to_capability_map();
    bool success = map["browserName"] == "firefox" && map["pageLoadStrategy"] == "eager" &&
                   map["acceptInsecureCerts"] == true &&
                   map["unhandledPromptBehavior"] == "dismiss and notify" &&
                   map["platformName"] == "linux" && map["browserVersion"] == "128" && is_valid(map);
    if (!success) {
        std::cout << "  map was: " << map.dump() << std::endl;
    }
    return report(success, "Standard setters produce W3C capability names");
}

// Test: Chrome arguments, binary and headless toggle.
static bool test_chrome_options() {
    browser_options::ChromeOptions options;
    options.add_argument("--no-first-run")
        .add_arguments({"--disable-sync", "--window-size=1280,800"})
        .set_binary("/opt/chrome/chrome")
        .set_headless(true)
        .set_headless(true);
    json headless = options.to_capability_map();
    bool headless_once = options.arguments().size() == 4 && options.arguments().back() == "--headless=new";

    options.set_headless(false);
    json headed = options.to_capability_map();

    std::vector<std::string> expected_headed = {"--no-first-run", "--disable-sync", "--window-size=1280,800"};
    bool success = headless_once && headless["browserName"] == "chrome" &&
                   headless["goog:chromeOptions"]["binary"] == "/opt/chrome/chrome" &&
                   headless["goog:chromeOptions"]["args"].size() == 4 &&
                   headed["goog:chromeOptions"]["args"] == json(expected_headed) &&
                   options.arguments() == expected_headed && is_valid(headless);
    return report(success, "Chrome arguments, binary and headless toggle are written to goog:chromeOptions");
}

// Test: Chrome without a binary omits the key.
static bool test_chrome_options_defaults() {
    json map = browser_options::ChromeOptions().to_capability_map();
    bool success = map.size() == 2 && map["goog:chromeOptions"]["args"] == json::array() &&
                   !map["goog:chromeOptions"].contains("binary");
    return report(success, "Default Chrome options carry an empty argument list only");
}

// Test: Firefox preferences, binary and headless toggle.
static bool test_firefox_options() {
    browser_options::FirefoxOptions options;
    options.add_argument("-private")
        .set_binary("/usr/lib/firefox/firefox")
        .add_preference("browser.startup.page", 0)
        .add_preference("dom.webnotifications.enabled", false)
        .set_headless(true);
    json headless = options.to_capability_map();
    options.set_headless(false);
    json headed = options.to_capability_map();

    const json &firefox = headless["moz:firefoxOptions"];
    bool success = firefox["args"] == json::array({"-private", "-headless"}) &&
                   firefox["binary"] == "/usr/lib/firefox/firefox" &&
                   firefox["prefs"]["browser.startup.page"] == 0 &&
                   firefox["prefs"]["dom.webnotifications.enabled"] == false &&
                   headed["moz:firefoxOptions"]["args"] == json::array({"-private"}) && is_valid(headless);
    bool no_prefs_by_default = !browser_options::FirefoxOptions().to_capability_map()["moz:firefoxOptions"].contains("prefs");
    return report(success && no_prefs_by_default, "Firefox arguments, binary and prefs are written to moz:firefoxOptions");
}

// Test: IE command switches are joined by single spaces.
static bool test_internet_explorer_options() {
    browser_options::InternetExplorerOptions options;
    options.add_command_switch("-private").add_command_switch("-nohome").set_ignore_zoom_setting(true);
    json map = options.to_capability_map();
    json defaults = browser_options::InternetExplorerOptions().to_capability_map();
    bool success = map["browserName"] == "internet explorer" &&
                   map["se:ieOptions"]["ie.browserCommandLineSwitches"] == "-private -nohome" &&
                   map["se:ieOptions"]["ignoreZoomSetting"] == true &&
                   !defaults["se:ieOptions"].contains("ie.browserCommandLineSwitches") &&
                   defaults["se:ieOptions"]["ignoreZoomSetting"] == false && is_valid(map);
    return report(success, "IE switches are space-joined in se:ieOptions");
}

// Test: explicit capabilities override generated ones; null removes.
static bool test_explicit_capability_overrides() {
    browser_options::ChromeOptions options;
    options.set_capability("browserName", "chromium").set_capability("se:cheese", "cheddar");
    options.set_capability("se:cheese", nullptr);
    json map = options.to_capability_map();
    bool success = map["browserName"] == "chromium" && !map.contains("se:cheese") &&
                   options.browser_name() == "chrome";
    return report(success, "Explicit capabilities win over generated ones");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_standard_setters();
    all_passed &= test_chrome_options();
    all_passed &= test_chrome_options_defaults();
    all_passed &= test_firefox_options();
    all_passed &= test_internet_explorer_options();
    all_passed &= test_explicit_capability_overrides();
    return all_passed;
}

} // namespace test_browser_options
