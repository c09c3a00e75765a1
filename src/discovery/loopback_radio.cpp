/**
 * @file loopback_radio.cpp
 * @brief Implementation of the in-process out-of-band channel
 */

#include <kcenon/fastdrop/discovery/loopback_radio.h>

#include <kcenon/fastdrop/core/logging.h>

namespace kcenon::fastdrop {

// loopback_airspace implementation

void loopback_airspace::publish(const std::string& address, advertisement ad) {
    std::lock_guard<std::mutex> lock(mutex_);
    broadcasts_[address] = std::move(ad);
}

void loopback_airspace::withdraw(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    broadcasts_.erase(address);
}

auto loopback_airspace::snapshot(const std::string& exclude) const
    -> std::vector<discovered_device> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<discovered_device> devices;
    for (const auto& [address, ad] : broadcasts_) {
        if (address == exclude) {
            continue;
        }
        devices.push_back(discovered_device{address, ad.display_name, ad.discovery_ids});
    }
    return devices;
}

auto loopback_airspace::lookup(const std::string& address) const
    -> std::optional<advertisement> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = broadcasts_.find(address);
    if (it == broadcasts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// loopback_radio implementation

loopback_radio::loopback_radio(std::shared_ptr<loopback_airspace> airspace,
                               std::string address,
                               bool powered,
                               std::size_t max_payload)
    : airspace_(std::move(airspace)),
      address_(std::move(address)),
      max_payload_(max_payload),
      powered_(powered) {}

loopback_radio::~loopback_radio() {
    shutdown();
}

auto loopback_radio::await_powered_on() -> result<void> {
    std::unique_lock<std::mutex> lock(mutex_);
    state_changed_.wait(lock, [this] { return powered_ || shut_down_; });
    if (shut_down_) {
        return unexpected(error{error_code::radio_unavailable, "radio shut down"});
    }
    return {};
}

auto loopback_radio::advertise(const advertisement& ad) -> result<void> {
    if (ad.payload.size() > max_payload_) {
        return unexpected(error{error_code::payload_too_large,
                                "payload of " + std::to_string(ad.payload.size()) +
                                    " bytes exceeds " + std::to_string(max_payload_)});
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_ || !powered_) {
            return unexpected(error{error_code::radio_unavailable, "radio is not powered"});
        }
        if (advertising_) {
            return unexpected(error{error_code::already_advertising,
                                    "an advertisement is already active on " + address_});
        }
        advertising_ = true;
    }

    airspace_->publish(address_, ad);
    FD_LOG_INFO(log_category::discovery,
                "Advertising '" + ad.display_name + "' with " +
                    std::to_string(ad.payload.size()) + "-byte payload");
    return {};
}

void loopback_radio::stop_advertising() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!advertising_) {
            return;
        }
        advertising_ = false;
    }
    airspace_->withdraw(address_);
    FD_LOG_INFO(log_category::discovery, "Advertising stopped");
}

auto loopback_radio::is_advertising() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return advertising_;
}

auto loopback_radio::scan(std::chrono::milliseconds duration)
    -> result<std::vector<discovered_device>> {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (shut_down_ || !powered_) {
            return unexpected(error{error_code::radio_unavailable, "radio is not powered"});
        }
        ++active_scans_;
        // The window runs to completion unless the radio goes away or the scan is stopped
        state_changed_.wait_for(lock, duration, [this] { return shut_down_ || scan_stopped_; });
        const bool stopped = scan_stopped_;
        if (--active_scans_ == 0) {
            scan_stopped_ = false;
        }
        if (shut_down_) {
            return unexpected(error{error_code::radio_unavailable, "radio shut down during scan"});
        }
        if (stopped) {
            return unexpected(error{error_code::cancelled, "scan stopped"});
        }
    }

    auto devices = airspace_->snapshot(address_);
    FD_LOG_DEBUG(log_category::discovery,
                 "Scan finished: " + std::to_string(devices.size()) + " device(s)");
    return devices;
}

void loopback_radio::stop_scan() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_scans_ == 0) {
            return;
        }
        scan_stopped_ = true;
    }
    state_changed_.notify_all();
}

auto loopback_radio::read(const discovered_device& device, std::string_view payload_id)
    -> result<std::vector<std::byte>> {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_ || !powered_) {
            return unexpected(error{error_code::radio_unavailable, "radio is not powered"});
        }
    }

    auto ad = airspace_->lookup(device.address);
    if (!ad) {
        return unexpected(error{error_code::payload_unavailable,
                                device.address + " is no longer advertising"});
    }
    if (ad->payload_id != payload_id) {
        return unexpected(error{error_code::payload_unavailable,
                                device.address + " exposes no payload " + std::string(payload_id)});
    }
    return std::move(ad->payload);
}

void loopback_radio::set_powered(bool powered) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        powered_ = powered;
    }
    state_changed_.notify_all();
}

void loopback_radio::shutdown() {
    stop_advertising();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
    }
    state_changed_.notify_all();
}

}  // namespace kcenon::fastdrop
