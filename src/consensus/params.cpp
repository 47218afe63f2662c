#include "coinjecture/params.hpp"

#ifndef COINJ_VERSION_STRING
#define COINJ_VERSION_STRING "0.0.0"
#endif

namespace coinjecture::params {

std::optional<HardwareTier> tier_from_u32(uint32_t value) {
    for (const auto& profile : TIER_PROFILES) {
        if (static_cast<uint32_t>(profile.tier) == value) {
            return profile.tier;
        }
    }
    return std::nullopt;
}

bool is_valid_tier(HardwareTier tier) {
    return tier_profile(tier) != nullptr;
}

const TierProfile* tier_profile(HardwareTier tier) {
    for (const auto& profile : TIER_PROFILES) {
        if (profile.tier == tier) {
            return &profile;
        }
    }
    return nullptr;
}

std::pair<size_t, size_t> element_range(HardwareTier tier) {
    const TierProfile* profile = tier_profile(tier);
    if (!profile) {
        return {1, 0};
    }
    return {profile->min_elements, profile->max_elements};
}

const char* to_string(HardwareTier tier) {
    const TierProfile* profile = tier_profile(tier);
    return profile ? profile->name : "unknown";
}

const char* version() {
    return COINJ_VERSION_STRING;
}

} // namespace coinjecture::params
