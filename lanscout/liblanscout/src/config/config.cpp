/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file config.cpp
 * @brief Configuration file parsing
 **/

#include "lanscout/config.hpp"

#include "common/utils.hpp"
#include "common/env_vars.hpp"
#include "common/filesystem.hpp"
#include "common/os_utils.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lanscout
{

static const std::string DEFAULT_CONFIG_PATH = "~/.lanscout/config.json";
static const std::string DEFAULT_DEVICE_NAME = "lanscout";

std::string StorageConfig::path_of(const std::string &file_name) const
{
    return Filesystem::join(Filesystem::expand_home(directory), file_name);
}

LanscoutConfig LanscoutConfig::defaults()
{
    LanscoutConfig config{};
    auto host_name = OsUtils::get_host_name();
    config.appliance.client.identity.device_name = (host_name && !host_name->empty()) ?
        host_name.release() : DEFAULT_DEVICE_NAME;
    return config;
}

template <typename T>
static void read_optional(const json &section, const std::string &key, T &value)
{
    const auto field = section.find(key);
    if (section.end() != field) {
        value = field->get<T>();
    }
}

static void read_optional_millis(const json &section, const std::string &key, std::chrono::milliseconds &value)
{
    const auto field = section.find(key);
    if (section.end() != field) {
        value = std::chrono::milliseconds(field->get<uint32_t>());
    }
}

static lanscout_status read_optional_port(const json &section, const std::string &key, uint16_t &value)
{
    const auto field = section.find(key);
    if (section.end() == field) {
        return LANSCOUT_SUCCESS;
    }
    const auto port = field->get<uint32_t>();
    CHECK((0 < port) && (port <= UINT16_MAX), LANSCOUT_INVALID_CONFIG, "Invalid port {} for '{}'", port, key);
    value = static_cast<uint16_t>(port);
    return LANSCOUT_SUCCESS;
}

static lanscout_status get_section(const json &document, const std::string &name, json &section)
{
    const auto found = document.find(name);
    if (document.end() == found) {
        section = json::object();
        return LANSCOUT_SUCCESS;
    }
    CHECK(found->is_object(), LANSCOUT_INVALID_CONFIG, "Configuration section '{}' must be an object", name);
    section = *found;
    return LANSCOUT_SUCCESS;
}

static lanscout_status parse_probe(const json &section, ProbeConfig &probe)
{
    auto status = read_optional_port(section, "port", probe.params.port);
    CHECK_SUCCESS(status);
    read_optional_millis(section, "timeout_ms", probe.params.timeout);
    read_optional(section, "interface", probe.interface_name);
    read_optional(section, "resolve_hostnames", probe.params.resolve_hostnames);
    read_optional(section, "refused_counts_as_alive", probe.params.refused_counts_as_alive);

    CHECK(probe.params.timeout.count() > 0, LANSCOUT_INVALID_CONFIG, "probe.timeout_ms must be positive");
    return LANSCOUT_SUCCESS;
}

static lanscout_status parse_appliance(const json &section, ApplianceConfig &appliance)
{
    read_optional(section, "service_type", appliance.discovery.service_type);
    read_optional(section, "host", appliance.host);
    auto status = read_optional_port(section, "https_port", appliance.discovery.https_port);
    CHECK_SUCCESS(status);
    read_optional_millis(section, "discovery_timeout_ms", appliance.client.discovery_timeout);
    read_optional_millis(section, "poll_interval_ms", appliance.client.poll_interval);
    read_optional(section, "max_poll_attempts", appliance.client.max_poll_attempts);
    read_optional_millis(section, "http_timeout_ms", appliance.http.timeout);
    read_optional(section, "verify_tls", appliance.http.verify_tls);
    read_optional(section, "ca_file", appliance.http.ca_file);
    read_optional(section, "app_id", appliance.client.identity.app_id);
    read_optional(section, "app_name", appliance.client.identity.app_name);
    read_optional(section, "app_version", appliance.client.identity.app_version);

    std::string device_name;
    read_optional(section, "device_name", device_name);
    if (!device_name.empty()) {
        appliance.client.identity.device_name = device_name;
    }

    CHECK(!appliance.discovery.service_type.empty(), LANSCOUT_INVALID_CONFIG, "appliance.service_type is empty");
    CHECK(!appliance.client.identity.app_id.empty(), LANSCOUT_INVALID_CONFIG, "appliance.app_id is empty");
    CHECK(appliance.client.discovery_timeout.count() > 0, LANSCOUT_INVALID_CONFIG,
        "appliance.discovery_timeout_ms must be positive");
    CHECK(appliance.http.timeout.count() > 0, LANSCOUT_INVALID_CONFIG, "appliance.http_timeout_ms must be positive");
    return LANSCOUT_SUCCESS;
}

static lanscout_status parse_storage(const json &section, StorageConfig &storage)
{
    read_optional(section, "directory", storage.directory);
    read_optional(section, "device_store", storage.device_store);
    read_optional(section, "token_store", storage.token_store);
    read_optional(section, "vendor_database", storage.vendor_database);

    CHECK(!storage.directory.empty(), LANSCOUT_INVALID_CONFIG, "storage.directory is empty");
    CHECK(!storage.device_store.empty(), LANSCOUT_INVALID_CONFIG, "storage.device_store is empty");
    CHECK(!storage.token_store.empty(), LANSCOUT_INVALID_CONFIG, "storage.token_store is empty");
    return LANSCOUT_SUCCESS;
}

Expected<LanscoutConfig> LanscoutConfig::parse(const std::string &content)
{
    auto config = defaults();
    try {
        const auto document = json::parse(content);
        CHECK_AS_EXPECTED(document.is_object(), LANSCOUT_INVALID_CONFIG, "Configuration is not a JSON object");

        json section;
        auto status = get_section(document, "probe", section);
        CHECK_SUCCESS_AS_EXPECTED(status);
        status = parse_probe(section, config.probe);
        CHECK_SUCCESS_AS_EXPECTED(status);

        status = get_section(document, "appliance", section);
        CHECK_SUCCESS_AS_EXPECTED(status);
        status = parse_appliance(section, config.appliance);
        CHECK_SUCCESS_AS_EXPECTED(status);

        status = get_section(document, "storage", section);
        CHECK_SUCCESS_AS_EXPECTED(status);
        status = parse_storage(section, config.storage);
        CHECK_SUCCESS_AS_EXPECTED(status);

        status = get_section(document, "policy", section);
        CHECK_SUCCESS_AS_EXPECTED(status);
        read_optional(section, "fallback_to_probe", config.policy.fallback_to_probe);
    } catch (const json::exception &e) {
        LOGGER__ERROR("Invalid configuration: {}", e.what());
        return make_unexpected(LANSCOUT_INVALID_CONFIG);
    }

    // Probing and discovery go out of the same interface
    config.appliance.discovery.interface_name = config.probe.interface_name;
    return config;
}

Expected<LanscoutConfig> LanscoutConfig::load_file(const std::string &file_path)
{
    TRY(const auto content, Filesystem::read_file(file_path), "Failed reading configuration file {}", file_path);
    TRY(auto config, parse(content), "Failed parsing configuration file {}", file_path);
    LOGGER__DEBUG("Configuration loaded from {}", file_path);
    return config;
}

Expected<LanscoutConfig> LanscoutConfig::load(const std::string &explicit_path)
{
    if (!explicit_path.empty()) {
        return load_file(Filesystem::expand_home(explicit_path));
    }

    auto env_path = get_env_variable(LANSCOUT_CONFIG_PATH_ENV_VAR);
    if (env_path) {
        return load_file(Filesystem::expand_home(env_path.value()));
    }

    const auto default_path = Filesystem::expand_home(DEFAULT_CONFIG_PATH);
    if (!Filesystem::does_file_exists(default_path)) {
        LOGGER__DEBUG("No configuration file at {}, using defaults", default_path);
        return defaults();
    }
    return load_file(default_path);
}

} /* namespace lanscout */
