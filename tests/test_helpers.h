#pragma once

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "ble_types.h"
#include "body_composition.h"

inline BleDeviceInfo mock_device(const std::string& name, std::vector<std::string> services = {}) {
    BleDeviceInfo info;
    info.local_name = name;
    for (auto& s : services) info.service_uuids.push_back(normalize_uuid(s));
    return info;
}

inline UserProfile default_profile() {
    UserProfile p;
    p.height = 183;
    p.age = 30;
    p.gender = Gender::Male;
    p.is_athlete = false;
    return p;
}

// Zero-filled frame with helpers to place multi-byte fields.
struct Frame {
    explicit Frame(size_t size) : bytes(size, 0) {}

    Frame& u8(size_t off, uint8_t v) {
        bytes[off] = v;
        return *this;
    }
    Frame& u16_be(size_t off, uint16_t v) {
        bytes[off] = static_cast<uint8_t>(v >> 8);
        bytes[off + 1] = static_cast<uint8_t>(v & 0xFF);
        return *this;
    }
    Frame& u16_le(size_t off, uint16_t v) {
        bytes[off] = static_cast<uint8_t>(v & 0xFF);
        bytes[off + 1] = static_cast<uint8_t>(v >> 8);
        return *this;
    }
    Frame& u32_be(size_t off, uint32_t v) {
        for (int i = 0; i < 4; ++i) bytes[off + i] = static_cast<uint8_t>(v >> (24 - 8 * i));
        return *this;
    }

    ByteArray bytes;
};

inline void expect_payload_ranges(const BodyComposition& bc) {
    if (bc.bmi != 0.0) {
        EXPECT_GE(bc.bmi, 10.0);
        EXPECT_LE(bc.bmi, 60.0);
    }
    EXPECT_GE(bc.body_fat_percent, 3.0);
    EXPECT_LE(bc.body_fat_percent, 60.0);
    EXPECT_GE(bc.water_percent, 20.0);
    EXPECT_LE(bc.water_percent, 80.0);
    EXPECT_GE(bc.bone_mass, 0.0);
    EXPECT_GT(bc.muscle_mass, 0.0);
    EXPECT_GE(bc.visceral_fat, 1);
    EXPECT_LE(bc.visceral_fat, 59);
    EXPECT_GE(bc.physique_rating, 1);
    EXPECT_LE(bc.physique_rating, 9);
    EXPECT_GT(bc.bmr, 0);
    EXPECT_GE(bc.metabolic_age, 12);
}
