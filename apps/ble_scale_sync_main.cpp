#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#if defined(_WIN32)
#include "simpleble/Config.h"
#endif

#include "acquisition.h"
#include "acquisition_error.h"
#include "local_ble_transport.h"
#include "mosquitto_bus.h"
#include "proxy_transport.h"
#include "settings.h"

int main(int argc, char* argv[]) {
#if defined(_WIN32)
    // WinRT teardown robustness between runs
    SimpleBLE::Config::WinRT::experimental_use_own_mta_apartment = true;
    SimpleBLE::Config::WinRT::experimental_reinitialize_winrt_apartment_on_main_thread = true;
#endif

    const bool verbose = has_flag(argc, argv, "--verbose");

    try {
        // Choose config filename from command line or default
        const std::string cfgName = parse_config_arg(argc, argv);

        const std::string cfgPath = resolve_config_path(cfgName);
        if (cfgPath.empty()) {
            std::cerr << "[Error] Config '" << cfgName << "' not found. CWD="
                      << std::filesystem::current_path().string() << "\n";
            return EXIT_FAILURE;
        }
        std::cout << "Using config: " << cfgPath << std::endl;
        const AppConfig cfg = load_settings_file(cfgPath);

        AdapterList adapters = default_adapter_order(cfg.renpho);

        AcquisitionOptions opts;
        opts.target_address = cfg.scale_address;
        opts.scan_budget = std::chrono::seconds(cfg.scan_timeout_sec);
        opts.read_budget = std::chrono::seconds(cfg.read_timeout_sec);
        opts.on_live_data = [](const ScaleReading& r) {
            std::cout << "[Sync] Live: " << r.weight << " kg";
            if (r.impedance > 0) std::cout << ", " << r.impedance << " ohm";
            std::cout << std::endl;
        };
        if (verbose) {
            opts.on_frame = [](const ByteArray& bytes, const std::string& devTag) { print_hex_bytes(bytes, devTag); };
        }

        std::unique_ptr<MosquittoBus> bus;
        std::unique_ptr<BleTransport> transport;
        if (cfg.transport == TransportKind::MqttProxy) {
            const ProxyConfig& proxy = *cfg.mqtt_proxy;
            bus = std::make_unique<MosquittoBus>(proxy.broker_url, "ble-scale-sync-" + proxy.device_id,
                                                 proxy.username, proxy.password);
            transport = std::make_unique<ProxyTransport>(*bus, proxy);
        } else {
            transport = std::make_unique<LocalBleTransport>();
        }

        const BodyComposition bc = acquire_and_compute(*transport, adapters, cfg.user, opts);
        std::cout << composition_to_json(bc).dump(2) << std::endl;
        return EXIT_SUCCESS;
    } catch (const AcquisitionError& e) {
        std::cerr << "[Error] " << e.what() << " (" << error_kind_name(e.kind()) << ")" << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "[Error] " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
