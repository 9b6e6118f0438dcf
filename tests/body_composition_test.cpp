#include <gtest/gtest.h>

#include "body_composition.h"
#include "test_helpers.h"

namespace {

UserProfile profile(double height, int age, Gender gender, bool athlete = false) {
    UserProfile p;
    p.height = height;
    p.age = age;
    p.gender = gender;
    p.is_athlete = athlete;
    return p;
}

}  // namespace

TEST(CalculateBodyComposition, MaleReferenceValues) {
    auto bc = calculate_body_composition(80.0, 500, profile(183, 30, Gender::Male));
    ASSERT_TRUE(bc);
    EXPECT_DOUBLE_EQ(bc->weight, 80.0);
    EXPECT_EQ(bc->impedance, 500);
    EXPECT_NEAR(bc->bmi, 23.89, 1e-9);
    EXPECT_NEAR(bc->body_fat_percent, 25.06, 1e-9);
    EXPECT_NEAR(bc->water_percent, 54.70, 1e-9);
    EXPECT_NEAR(bc->bone_mass, 2.52, 1e-9);
    EXPECT_NEAR(bc->muscle_mass, 32.37, 1e-9);
    EXPECT_EQ(bc->visceral_fat, 12);
    EXPECT_EQ(bc->physique_rating, 2);
    EXPECT_EQ(bc->bmr, 1798);
    EXPECT_EQ(bc->metabolic_age, 31);
}

TEST(CalculateBodyComposition, FemaleReferenceValues) {
    auto bc = calculate_body_composition(65.0, 550, profile(165, 35, Gender::Female));
    ASSERT_TRUE(bc);
    EXPECT_NEAR(bc->body_fat_percent, 36.99, 1e-9);
    EXPECT_NEAR(bc->water_percent, 46.00, 1e-9);
    EXPECT_NEAR(bc->muscle_mass, 22.12, 1e-9);
    EXPECT_EQ(bc->visceral_fat, 19);
    EXPECT_EQ(bc->physique_rating, 1);
    EXPECT_EQ(bc->bmr, 1345);
    EXPECT_EQ(bc->metabolic_age, 49);
}

TEST(CalculateBodyComposition, AthleteCoefficients) {
    auto bc = calculate_body_composition(80.0, 500, profile(183, 30, Gender::Male, true));
    ASSERT_TRUE(bc);
    EXPECT_NEAR(bc->body_fat_percent, 17.29, 1e-9);
    EXPECT_NEAR(bc->water_percent, 61.20, 1e-9);
    EXPECT_NEAR(bc->muscle_mass, 39.70, 1e-9);
    EXPECT_EQ(bc->physique_rating, 9);
    EXPECT_EQ(bc->bmr, 1888);
    EXPECT_EQ(bc->metabolic_age, 25);
}

TEST(CalculateBodyComposition, LeanMassCappedAtNinetySixPercent) {
    // Low impedance on a tall, light user pushes LBM past body weight
    auto bc = calculate_body_composition(60.0, 200, profile(190, 20, Gender::Male));
    ASSERT_TRUE(bc);
    EXPECT_NEAR(bc->body_fat_percent, 4.0, 1e-9);
    EXPECT_EQ(bc->visceral_fat, 1);
    EXPECT_EQ(bc->metabolic_age, 18);
}

TEST(CalculateBodyComposition, UnavailableForZeroInputs) {
    EXPECT_FALSE(calculate_body_composition(0.0, 500, default_profile()));
    EXPECT_FALSE(calculate_body_composition(80.0, 0, default_profile()));
    EXPECT_FALSE(calculate_body_composition(80.0, 500, profile(0, 30, Gender::Male)));
}

TEST(CalculateBodyComposition, DeterministicAndClamped) {
    const UserProfile p = default_profile();
    auto a = calculate_body_composition(95.3, 420, p);
    auto b = calculate_body_composition(95.3, 420, p);
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->body_fat_percent, b->body_fat_percent);
    EXPECT_EQ(a->metabolic_age, b->metabolic_age);

    for (int imp : {50, 200, 500, 900, 1500}) {
        for (double w : {40.0, 70.0, 120.0, 180.0}) {
            auto bc = calculate_body_composition(w, imp, p);
            ASSERT_TRUE(bc);
            EXPECT_GE(bc->body_fat_percent, 3.0);
            EXPECT_LE(bc->body_fat_percent, 60.0);
            EXPECT_GE(bc->visceral_fat, 1);
            EXPECT_LE(bc->visceral_fat, 59);
            EXPECT_GE(bc->physique_rating, 1);
            EXPECT_LE(bc->physique_rating, 9);
            EXPECT_GE(bc->metabolic_age, 12);
        }
    }
}

TEST(BuildBodyComposition, ZeroWeightGivesEmptyRecord) {
    const BodyComposition bc = build_body_composition({0.0, 450}, default_profile());
    EXPECT_DOUBLE_EQ(bc.weight, 0.0);
    EXPECT_EQ(bc.impedance, 450);
    EXPECT_DOUBLE_EQ(bc.bmi, 0.0);
    EXPECT_EQ(bc.bmr, 0);
}

TEST(BuildBodyComposition, WithoutImpedanceFallsBackToBmiEstimate) {
    const BodyComposition bc = build_body_composition({80.0, 0}, default_profile());
    EXPECT_DOUBLE_EQ(bc.weight, 80.0);
    EXPECT_EQ(bc.impedance, 0);
    // Deurenberg: 1.2 * 23.89 + 0.23 * 30 - 10.8 - 5.4
    EXPECT_NEAR(bc.body_fat_percent, 19.37, 0.01);
    expect_payload_ranges(bc);
}

TEST(BuildBodyComposition, VendorValuesAreClamped) {
    VendorComposition vendor;
    vendor.fat_percent = 75.0;
    vendor.water_percent = 10.0;
    vendor.visceral_fat = 80.0;
    const BodyComposition bc = build_body_composition({80.0, 0}, default_profile(), vendor);
    EXPECT_DOUBLE_EQ(bc.body_fat_percent, 60.0);
    EXPECT_DOUBLE_EQ(bc.water_percent, 20.0);
    EXPECT_EQ(bc.visceral_fat, 59);
}

TEST(BuildBodyComposition, VendorOverlayOnImpedanceModel) {
    VendorComposition vendor;
    vendor.fat_percent = 20.0;
    const BodyComposition bc = build_body_composition({80.0, 500}, default_profile(), vendor);
    EXPECT_DOUBLE_EQ(bc.body_fat_percent, 20.0);
    // Derived from the overlaid fat, not the model's 25.06 %
    EXPECT_EQ(bc.visceral_fat, 9);
    EXPECT_EQ(bc.bmr, 1798);
}

TEST(CompositionToJson, UsesCamelCaseKeys) {
    auto bc = calculate_body_composition(80.0, 500, default_profile());
    ASSERT_TRUE(bc);
    const nlohmann::json j = composition_to_json(*bc);
    for (const char* key : {"weight", "impedance", "bmi", "bodyFatPercent", "waterPercent", "boneMass", "muscleMass",
                            "visceralFat", "physiqueRating", "bmr", "metabolicAge"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j["impedance"].get<int>(), 500);
    EXPECT_EQ(j["metabolicAge"].get<int>(), 31);
}
