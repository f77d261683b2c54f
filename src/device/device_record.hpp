/*
 * device_record.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Static device identity records and manual host overrides

**************************************************/

#ifndef PURELINK_DEVICE_DEVICE_RECORD_HPP
#define PURELINK_DEVICE_DEVICE_RECORD_HPP

#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include <nlohmann/json.hpp>

namespace purelink::device {

/**
 * @brief Static identity and credential data for one appliance
 */
struct DeviceRecord {
    std::string name;         ///< Human readable name, e.g. "Living Room"
    std::string serial;       ///< Unique serial, e.g. "AB1-UK-0001A"
    std::string credentials;  ///< Local credential blob, opaque here
    std::string productType;  ///< Vendor product type code, e.g. "455"
    bool active{true};        ///< Account marks the device as in use

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Build a record from JSON
     * @throws ConfigurationException if name or serial is missing
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> DeviceRecord;
};

/**
 * @brief Identity handed to discovery for a device lookup
 */
struct DeviceIdentity {
    std::string serial;
    std::string productType;

    auto operator==(const DeviceIdentity&) const -> bool = default;
};

/**
 * @brief Uppercase a serial number for case-insensitive comparison
 */
[[nodiscard]] auto normalizeSerial(const std::string& serial) -> std::string;

/**
 * @class HostOverrideMap
 * @brief Serial to address overrides for devices that skip discovery.
 *
 * Serials are uppercased on insert and on lookup.
 */
class HostOverrideMap {
public:
    HostOverrideMap() = default;
    HostOverrideMap(
        std::initializer_list<std::pair<const std::string, std::string>> init);

    void set(const std::string& serial, const std::string& address);

    [[nodiscard]] auto find(const std::string& serial) const
        -> std::optional<std::string>;

    [[nodiscard]] auto size() const -> std::size_t { return hosts_.size(); }
    [[nodiscard]] auto empty() const -> bool { return hosts_.empty(); }

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> HostOverrideMap;

private:
    std::unordered_map<std::string, std::string> hosts_;
};

}  // namespace purelink::device

#endif  // PURELINK_DEVICE_DEVICE_RECORD_HPP
