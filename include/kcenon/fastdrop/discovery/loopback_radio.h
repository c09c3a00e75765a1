/**
 * @file loopback_radio.h
 * @brief In-process out-of-band channel for tests and the local demo
 */

#ifndef KCENON_FASTDROP_DISCOVERY_LOOPBACK_RADIO_H
#define KCENON_FASTDROP_DISCOVERY_LOOPBACK_RADIO_H

#include <kcenon/fastdrop/core/protocol_types.h>
#include <kcenon/fastdrop/discovery/oob_channel.h>

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace kcenon::fastdrop {

/**
 * @brief Shared medium every loopback_radio broadcasts into
 */
class loopback_airspace {
public:
    void publish(const std::string& address, advertisement ad);
    void withdraw(const std::string& address);
    [[nodiscard]] auto snapshot(const std::string& exclude) const
        -> std::vector<discovered_device>;
    [[nodiscard]] auto lookup(const std::string& address) const -> std::optional<advertisement>;

private:
    mutable std::mutex mutex_;
    std::map<std::string, advertisement> broadcasts_;
};

/**
 * @brief oob_channel over a loopback_airspace
 */
class loopback_radio : public oob_channel {
public:
    /**
     * @param airspace Shared medium
     * @param address Hardware-style address of this radio
     * @param powered Initial power state
     * @param max_payload Largest readable payload
     */
    loopback_radio(std::shared_ptr<loopback_airspace> airspace,
                   std::string address,
                   bool powered = true,
                   std::size_t max_payload = max_oob_payload_size);
    ~loopback_radio() override;

    [[nodiscard]] auto await_powered_on() -> result<void> override;
    [[nodiscard]] auto advertise(const advertisement& ad) -> result<void> override;
    void stop_advertising() override;
    [[nodiscard]] auto is_advertising() const -> bool override;
    [[nodiscard]] auto scan(std::chrono::milliseconds duration)
        -> result<std::vector<discovered_device>> override;
    void stop_scan() override;
    [[nodiscard]] auto read(const discovered_device& device, std::string_view payload_id)
        -> result<std::vector<std::byte>> override;

    void set_powered(bool powered);

    /**
     * @brief Stop advertising and wake every blocked call with radio_unavailable
     */
    void shutdown();

    [[nodiscard]] auto address() const -> const std::string& { return address_; }

private:
    std::shared_ptr<loopback_airspace> airspace_;
    std::string address_;
    std::size_t max_payload_;

    mutable std::mutex mutex_;
    std::condition_variable state_changed_;
    bool powered_;
    bool advertising_ = false;
    bool shut_down_ = false;
    std::size_t active_scans_ = 0;
    bool scan_stopped_ = false;
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_DISCOVERY_LOOPBACK_RADIO_H
