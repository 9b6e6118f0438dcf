#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "acquisition.h"
#include "acquisition_error.h"
#include "local_ble_transport.h"
#include "mosquitto_bus.h"
#include "proxy_transport.h"
#include "settings.h"

namespace {

constexpr int SCAN_TIMEOUT_SEC = 15;

// --name=<int>
std::optional<int> int_arg(int argc, char* argv[], const std::string& name) {
    const std::string prefix = name + "=";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind(prefix, 0) != 0) continue;
        try {
            return std::stoi(arg.substr(prefix.size()));
        } catch (const std::exception&) {
            std::cerr << "Warning: ignoring invalid " << arg << "\n";
        }
    }
    return std::nullopt;
}

void print_listing(const std::vector<DeviceListing>& devices) {
    size_t recognized = 0;
    for (const auto& d : devices) {
        std::cout << std::left << std::setw(20) << d.entry.address << std::right << std::setw(5) << d.entry.rssi
                  << " dBm  " << std::left << std::setw(24) << (d.entry.name.empty() ? "(no name)" : d.entry.name)
                  << std::right;
        if (!d.adapter.empty()) {
            std::cout << " <- " << d.adapter;
            ++recognized;
        }
        std::cout << std::endl;
    }
    std::cout << "[Scan] " << devices.size() << " device(s), " << recognized << " recognized scale(s)." << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        // The settings file is optional here; without one the local adapter is used
        AppConfig cfg;
        const std::string cfgPath = resolve_config_path(parse_config_arg(argc, argv));
        if (!cfgPath.empty()) {
            std::cout << "Using config: " << cfgPath << std::endl;
            cfg = load_settings_file(cfgPath, false);
        }

        std::unique_ptr<MosquittoBus> bus;
        std::unique_ptr<ProxyTransport> proxy;
        if (cfg.transport == TransportKind::MqttProxy) {
            const ProxyConfig& pc = *cfg.mqtt_proxy;
            bus = std::make_unique<MosquittoBus>(pc.broker_url, "ble-scale-scan-" + pc.device_id, pc.username,
                                                 pc.password);
            proxy = std::make_unique<ProxyTransport>(*bus, pc);
        }

        if (has_flag(argc, argv, "--beep")) {
            if (!proxy) {
                std::cerr << "[Error] --beep needs transport = mqtt-proxy in the settings file" << std::endl;
                return EXIT_FAILURE;
            }
            proxy->publish_beep(int_arg(argc, argv, "--freq"), int_arg(argc, argv, "--duration"),
                                int_arg(argc, argv, "--repeat"));
            std::cout << "[Scan] Beep request sent to " << proxy->topics().beep << std::endl;
            return EXIT_SUCCESS;
        }

        std::unique_ptr<LocalBleTransport> local;
        BleTransport* transport = proxy.get();
        if (!transport) {
            local = std::make_unique<LocalBleTransport>();
            transport = local.get();
        }

        const AdapterList adapters = default_adapter_order(cfg.renpho);
        const int seconds = cfgPath.empty() ? SCAN_TIMEOUT_SEC : cfg.scan_timeout_sec;
        std::cout << "[Scan] Scanning via " << transport->kind() << " for up to " << seconds << "s..." << std::endl;
        print_listing(scan_devices(*transport, adapters, std::chrono::seconds(seconds)));
        return EXIT_SUCCESS;
    } catch (const AcquisitionError& e) {
        std::cerr << "[Error] " << e.what() << " (" << error_kind_name(e.kind()) << ")" << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "[Error] " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
