/**
 * @file oob_channel.h
 * @brief Out-of-band discovery channel consumed by the session layer
 *
 * A short-range, low-bandwidth radio used only to bootstrap the data
 * channel: advertise presence with one small readable payload, scan for
 * nearby advertisers, and read a payload from a chosen device.
 */

#ifndef KCENON_FASTDROP_DISCOVERY_OOB_CHANNEL_H
#define KCENON_FASTDROP_DISCOVERY_OOB_CHANNEL_H

#include <kcenon/fastdrop/core/types.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::fastdrop {

/**
 * @brief Device seen during a scan
 */
struct discovered_device {
    std::string address;
    std::string display_name;
    std::vector<std::string> discovery_ids;
};

/**
 * @brief Everything a sender broadcasts
 */
struct advertisement {
    std::string display_name;
    std::vector<std::string> discovery_ids;
    std::string payload_id;
    std::vector<std::byte> payload;
};

/**
 * @brief Out-of-band channel interface
 *
 * The advertisement is a process-wide, single-writer resource: a second
 * advertise() while one is active fails with already_advertising.
 */
class oob_channel {
public:
    virtual ~oob_channel() = default;

    /**
     * @brief Block until the radio is powered on
     *
     * There is no upper bound on the wait.
     * @return radio_unavailable if the radio is shut down while waiting
     */
    [[nodiscard]] virtual auto await_powered_on() -> result<void> = 0;

    /**
     * @brief Start broadcasting
     * @return already_advertising, payload_too_large or radio_unavailable
     */
    [[nodiscard]] virtual auto advertise(const advertisement& ad) -> result<void> = 0;

    virtual void stop_advertising() = 0;

    [[nodiscard]] virtual auto is_advertising() const -> bool = 0;

    /**
     * @brief Listen for advertisers for a fixed wall-clock window
     */
    [[nodiscard]] virtual auto scan(std::chrono::milliseconds duration)
        -> result<std::vector<discovered_device>> = 0;

    /**
     * @brief End the scan in progress early
     *
     * The interrupted scan() returns cancelled. No effect when nothing is
     * scanning.
     */
    virtual void stop_scan() = 0;

    /**
     * @brief Read one payload from a discovered device
     * @return payload_unavailable if the device no longer exposes it
     */
    [[nodiscard]] virtual auto read(const discovered_device& device, std::string_view payload_id)
        -> result<std::vector<std::byte>> = 0;
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_DISCOVERY_OOB_CHANNEL_H
