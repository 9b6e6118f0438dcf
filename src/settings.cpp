#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "settings.h"

namespace {

bool parse_bool(const std::string& v, bool& out) {
    if (iequals_ascii(v, "true") || iequals_ascii(v, "yes") || v == "1") {
        out = true;
        return true;
    }
    if (iequals_ascii(v, "false") || iequals_ascii(v, "no") || v == "0") {
        out = false;
        return true;
    }
    return false;
}

bool parse_int(const std::string& v, int& out) {
    try {
        size_t used = 0;
        int parsed = std::stoi(v, &used);
        if (used != v.size()) return false;
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_double(const std::string& v, double& out) {
    try {
        size_t used = 0;
        double parsed = std::stod(v, &used);
        if (used != v.size()) return false;
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// "13,09,15" or "0x13, 0x09" or "13 09 15"
std::optional<ByteArray> parse_byte_list(const std::string& v) {
    std::string normalized = v;
    for (auto& c : normalized) {
        if (c == ',') c = ' ';
    }
    std::istringstream tokens(normalized);
    ByteArray out;
    std::string tok;
    while (tokens >> tok) {
        try {
            size_t used = 0;
            unsigned long b = std::stoul(tok, &used, 16);
            if (used != tok.size() || b > 0xFFul) return std::nullopt;
            out.push_back(static_cast<uint8_t>(b));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    if (out.empty()) return std::nullopt;
    return out;
}

struct Loader {
    AppConfig cfg;
    ProxyConfig proxy;
    bool has_proxy_section = false;
    bool has_height = false;
    bool has_age = false;
    bool has_gender = false;
    std::string source;

    void warn(size_t lineNum, const std::string& what) const {
        std::cerr << "Warning: " << source << ":" << lineNum << ": " << what << "\n";
    }

    void apply(const std::string& section, const std::string& key, const std::string& value, size_t lineNum) {
        if (section == "scale") {
            if (key == "transport") {
                if (iequals_ascii(value, "local")) cfg.transport = TransportKind::Local;
                else if (iequals_ascii(value, "mqtt-proxy")) cfg.transport = TransportKind::MqttProxy;
                else throw SettingsError(source + ": unknown transport '" + value + "' (local, mqtt-proxy)");
            } else if (key == "address") {
                if (!value.empty()) cfg.scale_address = value;
            } else if (key == "scan_timeout_sec") {
                if (!parse_int(value, cfg.scan_timeout_sec) || cfg.scan_timeout_sec <= 0) {
                    throw SettingsError(source + ": scan_timeout_sec must be a positive integer");
                }
            } else if (key == "read_timeout_sec") {
                if (!parse_int(value, cfg.read_timeout_sec) || cfg.read_timeout_sec <= 0) {
                    throw SettingsError(source + ": read_timeout_sec must be a positive integer");
                }
            } else {
                warn(lineNum, "unknown key '" + key + "' in [scale]");
            }
        } else if (section == "user") {
            if (key == "height") {
                if (!parse_double(value, cfg.user.height) || cfg.user.height <= 0.0) {
                    throw SettingsError(source + ": user height must be a positive number (cm)");
                }
                has_height = true;
            } else if (key == "age") {
                if (!parse_int(value, cfg.user.age) || cfg.user.age <= 0) {
                    throw SettingsError(source + ": user age must be a positive integer");
                }
                has_age = true;
            } else if (key == "gender") {
                if (iequals_ascii(value, "male")) cfg.user.gender = Gender::Male;
                else if (iequals_ascii(value, "female")) cfg.user.gender = Gender::Female;
                else throw SettingsError(source + ": user gender must be 'male' or 'female'");
                has_gender = true;
            } else if (key == "athlete") {
                if (!parse_bool(value, cfg.user.is_athlete)) {
                    throw SettingsError(source + ": user athlete must be true or false");
                }
            } else {
                warn(lineNum, "unknown key '" + key + "' in [user]");
            }
        } else if (section == "mqtt_proxy") {
            has_proxy_section = true;
            if (key == "broker_url") proxy.broker_url = value;
            else if (key == "username") proxy.username = value;
            else if (key == "password") proxy.password = value;
            else if (key == "device_id") proxy.device_id = value;
            else if (key == "topic_prefix") proxy.topic_prefix = value;
            else warn(lineNum, "unknown key '" + key + "' in [mqtt_proxy]");
        } else if (section == "renpho") {
            if (key == "char_notify") {
                cfg.renpho.notify_char = value;
            } else if (key == "char_write") {
                cfg.renpho.write_char = value;
            } else if (key == "unlock") {
                auto bytes = parse_byte_list(value);
                if (!bytes) throw SettingsError(source + ": renpho unlock must be a list of hex bytes");
                cfg.renpho.unlock_command = std::move(*bytes);
            } else {
                warn(lineNum, "unknown key '" + key + "' in [renpho]");
            }
        } else {
            warn(lineNum, "setting outside a known section ignored");
        }
    }

    AppConfig finish(bool require_user) {
        if (require_user && (!has_height || !has_age || !has_gender)) {
            throw SettingsError(source + ": [user] requires height, age and gender");
        }
        if (has_proxy_section) cfg.mqtt_proxy = proxy;
        if (cfg.transport == TransportKind::MqttProxy) {
            if (!cfg.mqtt_proxy || cfg.mqtt_proxy->broker_url.empty() || cfg.mqtt_proxy->device_id.empty()) {
                throw SettingsError(source + ": transport mqtt-proxy needs [mqtt_proxy] broker_url and device_id");
            }
        }
        return cfg;
    }
};

}  // namespace

bool parse_config_line(const std::string& line, std::string& outKey, std::string& outValue) {
    auto posEq = line.find('=');
    if (posEq == std::string::npos) return false;

    std::string left = trim(line.substr(0, posEq));
    std::string right = trim(line.substr(posEq + 1));
    if (left.empty()) return false;

    // Optional quotes around the value
    if (right.size() >= 2 && right.front() == '"' && right.back() == '"') {
        right = right.substr(1, right.size() - 2);
    }

    outKey = to_lower(left);
    outValue = right;
    return true;
}

AppConfig load_settings(std::istream& in, const std::string& source_name, bool require_user) {
    Loader loader;
    loader.source = source_name;

    std::string currentSection;
    std::string line;
    size_t lineNum = 0;

    while (std::getline(in, line)) {
        ++lineNum;
        std::string raw = trim(line);
        if (raw.empty()) continue;

        // Skip comments
        if (raw.rfind("//", 0) == 0 || raw.rfind("#", 0) == 0 || raw.rfind(";", 0) == 0) continue;

        // Section header [ ... ]
        if (raw.front() == '[' && raw.back() == ']') {
            currentSection = to_lower(trim(raw.substr(1, raw.size() - 2)));
            if (currentSection != "scale" && currentSection != "user" && currentSection != "mqtt_proxy" &&
                currentSection != "renpho") {
                loader.warn(lineNum, "unknown section [" + currentSection + "]");
            }
            continue;
        }

        std::string key;
        std::string value;
        if (!parse_config_line(raw, key, value)) {
            loader.warn(lineNum, "invalid config line: " + line);
            continue;
        }
        loader.apply(currentSection, key, value, lineNum);
    }

    return loader.finish(require_user);
}

AppConfig load_settings_file(const std::string& path, bool require_user) {
    std::ifstream in(path);
    if (!in) throw SettingsError("Config not found: " + path);
    return load_settings(in, path, require_user);
}

// Resolve config path for the given filename:
// - In Release: use current working directory only.
// - In Debug: also check exactly two directories up from CWD.
std::string resolve_config_path(const std::string& filename) {
    namespace fs = std::filesystem;
    std::error_code ec;

    fs::path direct(filename);
    if (direct.is_absolute()) return fs::exists(direct, ec) && !ec ? direct.string() : std::string{};

    const fs::path cwd = fs::current_path(ec);
    if (ec) return {};

    fs::path candidate = cwd / filename;
    if (fs::exists(candidate, ec) && !ec) return candidate.string();

#if !defined(NDEBUG)
    fs::path up2 = cwd.parent_path().parent_path();
    candidate = up2 / filename;
    if (fs::exists(candidate, ec) && !ec) return candidate.string();
#endif

    return {};
}

// Parse --config=<file> or --config <file>; return chosen filename (defaults to DEFAULT_CONFIG_FILENAME)
std::string parse_config_arg(int argc, char* argv[]) {
    std::string cfg = DEFAULT_CONFIG_FILENAME;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 < argc) {
                cfg = argv[++i];
            } else {
                std::cerr << "Warning: --config provided without filename. Using default '" << cfg << "'.\n";
            }
        } else if (arg.rfind("--config=", 0) == 0) {
            cfg = arg.substr(std::string("--config=").size());
        }
    }
    return cfg;
}

bool has_flag(int argc, char* argv[], const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}
