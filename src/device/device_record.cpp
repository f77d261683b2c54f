/*
 * device_record.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_record.hpp"

#include <algorithm>
#include <cctype>

#include "common/connection_exceptions.hpp"

namespace purelink::device {

auto DeviceRecord::toJson() const -> nlohmann::json {
    // Credentials stay out of status output.
    return {{"name", name},
            {"serial", serial},
            {"productType", productType},
            {"active", active}};
}

auto DeviceRecord::fromJson(const nlohmann::json& j) -> DeviceRecord {
    if (!j.is_object()) {
        throw ConfigurationException("device", "entry is not an object");
    }

    DeviceRecord record;
    record.name = j.value("name", "");
    record.serial = j.value("serial", "");
    record.credentials = j.value("credentials", "");
    record.productType = j.value("productType", "");
    record.active = j.value("active", true);

    if (record.serial.empty()) {
        throw ConfigurationException("device", "missing serial");
    }
    if (record.name.empty()) {
        throw ConfigurationException("device " + record.serial,
                                     "missing name");
    }
    return record;
}

auto normalizeSerial(const std::string& serial) -> std::string {
    std::string result = serial;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

HostOverrideMap::HostOverrideMap(
    std::initializer_list<std::pair<const std::string, std::string>> init) {
    for (const auto& [serial, address] : init) {
        set(serial, address);
    }
}

void HostOverrideMap::set(const std::string& serial,
                          const std::string& address) {
    hosts_[normalizeSerial(serial)] = address;
}

auto HostOverrideMap::find(const std::string& serial) const
    -> std::optional<std::string> {
    auto it = hosts_.find(normalizeSerial(serial));
    if (it == hosts_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

auto HostOverrideMap::toJson() const -> nlohmann::json {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [serial, address] : hosts_) {
        j[serial] = address;
    }
    return j;
}

auto HostOverrideMap::fromJson(const nlohmann::json& j) -> HostOverrideMap {
    HostOverrideMap map;
    if (j.is_null()) {
        return map;
    }
    if (!j.is_object()) {
        throw ConfigurationException("hosts", "expected an object");
    }
    for (const auto& [serial, address] : j.items()) {
        if (!address.is_string()) {
            throw ConfigurationException("hosts",
                                         "address for " + serial +
                                             " is not a string");
        }
        map.set(serial, address.get<std::string>());
    }
    return map;
}

}  // namespace purelink::device
