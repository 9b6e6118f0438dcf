#pragma once

#include <istream>
#include <optional>
#include <stdexcept>
#include <string>

#include "ble_types.h"
#include "proxy_transport.h"
#include "scales/scale_adapters.h"

// Command-line selectable settings file; defaults to "default.settings" if not provided via --config
constexpr const char* DEFAULT_CONFIG_FILENAME = "default.settings";

enum class TransportKind { Local, MqttProxy };

struct AppConfig {
    TransportKind transport = TransportKind::Local;
    std::optional<std::string> scale_address;
    int scan_timeout_sec = 15;
    int read_timeout_sec = 60;
    UserProfile user;
    std::optional<ProxyConfig> mqtt_proxy;
    RenphoOptions renpho;
};

class SettingsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// "key = value", key lowercased, value unquoted.
bool parse_config_line(const std::string& line, std::string& outKey, std::string& outValue);

// Throws SettingsError for a missing or invalid required value. Unknown
// keys and malformed lines are reported on std::cerr and skipped.
// The scanner does not need a user profile; pass require_user = false.
AppConfig load_settings(std::istream& in, const std::string& source_name = "<settings>", bool require_user = true);
AppConfig load_settings_file(const std::string& path, bool require_user = true);

std::string resolve_config_path(const std::string& filename);
std::string parse_config_arg(int argc, char* argv[]);
bool has_flag(int argc, char* argv[], const char* flag);
