#include <algorithm>
#include <cmath>

#include "body_composition.h"

namespace {

struct LbmCoefficients {
    double c1, c2, c3, c4;
};

LbmCoefficients lbm_coefficients(const UserProfile& p) {
    if (p.gender == Gender::Male) {
        return p.is_athlete ? LbmCoefficients{0.637, 0.205, -0.180, 12.5}
                            : LbmCoefficients{0.503, 0.165, -0.158, 17.8};
    }
    return p.is_athlete ? LbmCoefficients{0.550, 0.180, -0.150, 8.5}
                        : LbmCoefficients{0.490, 0.150, -0.130, 11.5};
}

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

int visceral_rating(double fat_percent, int age) {
    double v = 1.0;
    if (fat_percent > 10.0) {
        v = (fat_percent * 0.55) - 4.0 + (age * 0.08);
    }
    return std::clamp(static_cast<int>(std::trunc(v)), 1, 59);
}

int physique_rating(double fat_percent, double muscle_mass, double weight) {
    if (fat_percent > 25.0) {
        return muscle_mass > (weight * 0.4) ? 2 : 1;
    }
    if (fat_percent < 18.0) {
        if (muscle_mass > (weight * 0.45)) return 9;
        if (muscle_mass > (weight * 0.4)) return 8;
        return 7;
    }
    if (muscle_mass > (weight * 0.45)) return 6;
    if (muscle_mass < (weight * 0.38)) return 4;
    return 5;
}

double bmi_of(double weight, double height_cm) {
    if (height_cm <= 0.0) return 0.0;
    const double height_m = height_cm / 100.0;
    return weight / (height_m * height_m);
}

// Mifflin-St Jeor
double bmr_of(double weight, const UserProfile& p) {
    double bmr = (10.0 * weight) + (6.25 * p.height) - (5.0 * p.age);
    bmr += (p.gender == Gender::Male) ? 5.0 : -161.0;
    if (p.is_athlete) bmr *= 1.05;
    return bmr;
}

int metabolic_age_of(double weight, double bmr, const UserProfile& p) {
    const double ideal_bmr = (10.0 * weight) + (6.25 * p.height) - (5.0 * 25) + 5.0;
    int age = p.age + static_cast<int>(std::floor((ideal_bmr - bmr) / 15.0));
    if (age < 12) age = 12;
    if (p.is_athlete && age > p.age) age = p.age - 5;
    return age;
}

// Everything downstream of lean body mass.
BodyComposition derive_from_lbm(double weight, double lbm, int impedance, const UserProfile& p) {
    const double fat_percent = std::clamp((weight - lbm) / weight * 100.0, 3.0, 60.0);
    const double water_percent = (lbm * (p.is_athlete ? 0.74 : 0.73) / weight) * 100.0;
    const double bone_mass = lbm * 0.042;
    const double muscle_mass = lbm * (p.is_athlete ? 0.60 : 0.54);
    const double bmr = bmr_of(weight, p);

    BodyComposition bc;
    bc.weight = weight;
    bc.impedance = impedance;
    bc.bmi = round2(bmi_of(weight, p.height));
    bc.body_fat_percent = round2(fat_percent);
    bc.water_percent = round2(water_percent);
    bc.bone_mass = round2(bone_mass);
    bc.muscle_mass = round2(muscle_mass);
    bc.visceral_fat = visceral_rating(fat_percent, p.age);
    bc.physique_rating = physique_rating(fat_percent, muscle_mass, weight);
    bc.bmr = static_cast<int>(std::trunc(bmr));
    bc.metabolic_age = metabolic_age_of(weight, bmr, p);
    return bc;
}

// Deurenberg (1991) adult body-fat estimate from BMI
double estimate_fat_from_bmi(double weight, const UserProfile& p) {
    const double bmi = bmi_of(weight, p.height);
    const double sex = (p.gender == Gender::Male) ? 1.0 : 0.0;
    return (1.2 * bmi) + (0.23 * p.age) - (10.8 * sex) - 5.4;
}

}  // namespace

std::optional<BodyComposition> calculate_body_composition(double weight, int impedance,
                                                          const UserProfile& profile) {
    if (profile.height <= 0.0 || weight <= 0.0 || impedance <= 0) {
        return std::nullopt;
    }

    const LbmCoefficients k = lbm_coefficients(profile);
    const double h2r = (profile.height * profile.height) / impedance;
    double lbm = (k.c1 * h2r) + (k.c2 * weight) + (k.c3 * profile.age) + k.c4;
    lbm = std::min(lbm, weight * 0.96);

    return derive_from_lbm(weight, lbm, impedance, profile);
}

BodyComposition build_body_composition(const ScaleReading& reading, const UserProfile& profile,
                                       const VendorComposition& vendor) {
    if (reading.weight <= 0.0) {
        BodyComposition empty;
        empty.impedance = reading.impedance;
        return empty;
    }
    const double weight = reading.weight;

    BodyComposition bc;
    if (auto calc = calculate_body_composition(weight, reading.impedance, profile)) {
        bc = *calc;
    } else {
        const double fat = std::clamp(vendor.fat_percent.value_or(estimate_fat_from_bmi(weight, profile)),
                                      3.0, 60.0);
        bc = derive_from_lbm(weight, weight * (1.0 - fat / 100.0), reading.impedance, profile);
    }

    if (vendor.empty()) return bc;

    if (vendor.fat_percent) bc.body_fat_percent = round2(std::clamp(*vendor.fat_percent, 3.0, 60.0));
    if (vendor.water_percent) bc.water_percent = round2(std::clamp(*vendor.water_percent, 20.0, 80.0));
    if (vendor.muscle_percent && *vendor.muscle_percent > 0.0) {
        bc.muscle_mass = round2(weight * std::min(*vendor.muscle_percent, 100.0) / 100.0);
    }
    if (vendor.bone_mass && *vendor.bone_mass >= 0.0) bc.bone_mass = round2(*vendor.bone_mass);

    if (vendor.visceral_fat) {
        bc.visceral_fat = std::clamp(static_cast<int>(std::trunc(*vendor.visceral_fat)), 1, 59);
    } else {
        bc.visceral_fat = visceral_rating(bc.body_fat_percent, profile.age);
    }
    bc.physique_rating = physique_rating(bc.body_fat_percent, bc.muscle_mass, weight);
    return bc;
}

nlohmann::json composition_to_json(const BodyComposition& bc) {
    return nlohmann::json{
        {"weight", bc.weight},
        {"impedance", bc.impedance},
        {"bmi", bc.bmi},
        {"bodyFatPercent", bc.body_fat_percent},
        {"waterPercent", bc.water_percent},
        {"boneMass", bc.bone_mass},
        {"muscleMass", bc.muscle_mass},
        {"visceralFat", bc.visceral_fat},
        {"physiqueRating", bc.physique_rating},
        {"bmr", bc.bmr},
        {"metabolicAge", bc.metabolic_age},
    };
}
