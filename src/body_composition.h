#pragma once

#include <optional>

#include <nlohmann/json.hpp>

#include "ble_types.h"

struct BodyComposition {
    double weight = 0.0;
    int impedance = 0;
    double bmi = 0.0;
    double body_fat_percent = 0.0;
    double water_percent = 0.0;
    double bone_mass = 0.0;    // kg
    double muscle_mass = 0.0;  // kg
    int visceral_fat = 0;      // 1-59
    int physique_rating = 0;   // 1-9
    int bmr = 0;               // kcal/day
    int metabolic_age = 0;
};

// Composition values some scales report themselves. Unset fields are derived.
struct VendorComposition {
    std::optional<double> fat_percent;
    std::optional<double> water_percent;
    std::optional<double> muscle_percent;  // of body weight
    std::optional<double> bone_mass;       // kg
    std::optional<double> visceral_fat;

    bool empty() const {
        return !fat_percent && !water_percent && !muscle_percent && !bone_mass && !visceral_fat;
    }
    void clear() { *this = VendorComposition{}; }
};

// Bio-impedance model. Returns std::nullopt when weight, height or impedance
// is zero; the result is a pure function of its inputs.
std::optional<BodyComposition> calculate_body_composition(double weight, int impedance,
                                                          const UserProfile& profile);

// Full record for a finished reading: impedance model when available, BMI
// estimate otherwise, then vendor-reported values laid over the derived ones.
// A reading with weight <= 0 yields an all-zero record.
BodyComposition build_body_composition(const ScaleReading& reading, const UserProfile& profile,
                                       const VendorComposition& vendor = {});

nlohmann::json composition_to_json(const BodyComposition& bc);
