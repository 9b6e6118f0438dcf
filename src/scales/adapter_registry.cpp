#include "scale_adapters.h"

AdapterList default_adapter_order(const RenphoOptions& renpho) {
    AdapterList adapters;
    adapters.push_back(std::make_unique<RenphoAdapter>(renpho));
    adapters.push_back(std::make_unique<DigooAdapter>());
    // Hoffen advertises ffb0 too; it must win over MGB's service match
    adapters.push_back(std::make_unique<HoffenAdapter>());
    adapters.push_back(std::make_unique<BeurerSanitasAdapter>());
    adapters.push_back(std::make_unique<ExingtechY1Adapter>());
    adapters.push_back(std::make_unique<ChipseaBroadcastAdapter>());
    adapters.push_back(std::make_unique<MgbAdapter>());
    adapters.push_back(std::make_unique<InlifeAdapter>());
    adapters.push_back(std::make_unique<StandardWeightScaleAdapter>());
    return adapters;
}
