/**
 * @file protocol_types.cpp
 * @brief Transport profile lookup
 */

#include <kcenon/fastdrop/core/protocol_types.h>

namespace kcenon::fastdrop {

auto profile_for_discovery_id(std::string_view discovery_id)
    -> std::optional<transport_profile> {
    for (const auto& profile : {quic_profile, tcp_profile}) {
        if (profile.discovery_id == discovery_id) {
            return profile;
        }
    }
    return std::nullopt;
}

}  // namespace kcenon::fastdrop
