/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file scan_coordinator.cpp
 * @brief Scan coordinator implementation
 **/

#include "lanscout/scan_coordinator.hpp"
#include "lanscout/service_discovery.hpp"
#include "lanscout/http_transport.hpp"
#include "lanscout/token_store.hpp"

#include "common/utils.hpp"
#include "common/filesystem.hpp"

namespace lanscout
{

static Expected<std::shared_ptr<ServiceDiscovery>> create_discovery(const ApplianceConfig &config,
    EventPtr shutdown_event)
{
    std::shared_ptr<ServiceDiscovery> discovery;
    if (!config.host.empty()) {
        ApplianceEndpoint endpoint{};
        endpoint.instance_name = config.host;
        endpoint.host = config.host;
        endpoint.https_port = config.discovery.https_port;
        LOGGER__INFO("Using configured appliance at {}", endpoint.base_url());
        discovery = make_shared_nothrow<StaticServiceDiscovery>(endpoint);
    } else {
        discovery = make_shared_nothrow<MdnsServiceDiscovery>(config.discovery, shutdown_event);
    }
    CHECK_NOT_NULL_AS_EXPECTED(discovery, LANSCOUT_OUT_OF_HOST_MEMORY);
    return discovery;
}

static Expected<std::shared_ptr<ApplianceClient>> create_appliance_client(const LanscoutConfig &config,
    EventPtr shutdown_event)
{
    TRY(auto discovery, create_discovery(config.appliance, shutdown_event));
    TRY(auto transport, CurlHttpTransport::create(config.appliance.http));

    auto token_store = make_shared_nothrow<FileTokenStore>(config.storage.path_of(config.storage.token_store));
    CHECK_NOT_NULL_AS_EXPECTED(token_store, LANSCOUT_OUT_OF_HOST_MEMORY);

    auto client = make_shared_nothrow<ApplianceClient>(config.appliance.client, discovery, transport, token_store,
        shutdown_event);
    CHECK_NOT_NULL_AS_EXPECTED(client, LANSCOUT_OUT_OF_HOST_MEMORY);
    return client;
}

Expected<std::unique_ptr<ScanCoordinator>> ScanCoordinator::create(const LanscoutConfig &config, bool use_appliance,
    EventPtr shutdown_event)
{
    CHECK_ARG_NOT_NULL(shutdown_event);

    auto status = Filesystem::create_directory(Filesystem::expand_home(config.storage.directory));
    CHECK_SUCCESS_AS_EXPECTED(status, "Failed creating storage directory {}", config.storage.directory);

    TRY(std::shared_ptr<DeviceStore> store,
        JsonFileDeviceStore::create(config.storage.path_of(config.storage.device_store)));
    TRY(std::shared_ptr<SubnetProber> prober,
        SubnetProber::create(config.probe.params, config.probe.interface_name, shutdown_event));

    std::shared_ptr<ApplianceClient> appliance_client;
    if (use_appliance) {
        TRY(appliance_client, create_appliance_client(config, shutdown_event));
    }

    auto coordinator = make_unique_nothrow<ScanCoordinator>(appliance_client, prober, store,
        config.policy.fallback_to_probe, shutdown_event);
    CHECK_NOT_NULL_AS_EXPECTED(coordinator, LANSCOUT_OUT_OF_HOST_MEMORY);
    return coordinator;
}

ScanCoordinator::ScanCoordinator(std::shared_ptr<ApplianceClient> appliance_client,
    std::shared_ptr<SubnetProber> prober, std::shared_ptr<DeviceStore> store, bool fallback_to_probe,
    EventPtr shutdown_event, DeviceReconciler::Clock clock) :
    m_appliance_client(std::move(appliance_client)),
    m_prober(std::move(prober)),
    m_store(store),
    m_reconciler(store, std::move(clock)),
    m_fallback_to_probe(fallback_to_probe),
    m_shutdown_event(std::move(shutdown_event)),
    m_last_source(m_appliance_client ? DeviceSource::APPLIANCE : DeviceSource::PROBE)
{}

Expected<DeviceView> ScanCoordinator::scan()
{
    if (nullptr != m_appliance_client) {
        auto view = scan_appliance();
        if (view) {
            return view;
        }
        if (LANSCOUT_SHUTDOWN_EVENT_SIGNALED == view.status()) {
            LOGGER__INFO("Scan aborted");
            return make_unexpected(LANSCOUT_SHUTDOWN_EVENT_SIGNALED);
        }
        CHECK_AS_EXPECTED(m_fallback_to_probe, view.status(), "Appliance path failed with status {}", view.status());
        LOGGER__WARNING("Appliance path failed with status {}, probing the subnet instead", view.status());
    }

    return scan_probe();
}

Expected<DeviceView> ScanCoordinator::scan_appliance()
{
    auto status = m_appliance_client->start();
    if (LANSCOUT_SUCCESS != status) {
        return make_unexpected(status);
    }

    auto devices = m_appliance_client->fetch_devices();
    if (!devices && (LANSCOUT_SESSION_FAILURE == devices.status())) {
        LOGGER__INFO("Appliance session expired, authorizing again");
        status = m_appliance_client->start();
        if (LANSCOUT_SUCCESS != status) {
            return make_unexpected(status);
        }
        auto retried = m_appliance_client->fetch_devices();
        if (!retried) {
            return make_unexpected(retried.status());
        }
        status = m_reconciler.apply_appliance_result(retried.value());
    } else if (!devices) {
        return make_unexpected(devices.status());
    } else {
        status = m_reconciler.apply_appliance_result(devices.value());
    }
    CHECK_SUCCESS_AS_EXPECTED(status);

    {
        std::lock_guard<std::mutex> lock(m_view_mutex);
        m_last_source = DeviceSource::APPLIANCE;
        m_last_probe_result.clear();
    }

    DeviceView view{};
    view.source = DeviceSource::APPLIANCE;
    view.devices = m_reconciler.display_view(DeviceSource::APPLIANCE);
    LOGGER__INFO("Appliance reported {} devices", view.devices.size());
    return view;
}

Expected<DeviceView> ScanCoordinator::scan_probe()
{
    auto result = m_prober->scan();
    if (!result) {
        if (LANSCOUT_SHUTDOWN_EVENT_SIGNALED != result.status()) {
            LOGGER__ERROR("Subnet probe failed with status {}", result.status());
        }
        return make_unexpected(result.status());
    }

    DeviceView view{};
    view.source = DeviceSource::PROBE;
    view.devices = DeviceReconciler::merge(DeviceSource::PROBE, {}, result.value());

    std::lock_guard<std::mutex> lock(m_view_mutex);
    m_last_source = DeviceSource::PROBE;
    m_last_probe_result = view.devices;
    LOGGER__INFO("Subnet probe found {} hosts", view.devices.size());
    return view;
}

DeviceView ScanCoordinator::current_view() const
{
    std::lock_guard<std::mutex> lock(m_view_mutex);
    DeviceView view{};
    view.source = m_last_source;
    view.devices = m_reconciler.display_view(m_last_source, m_last_probe_result);
    return view;
}

lanscout_status ScanCoordinator::forget()
{
    if (nullptr != m_appliance_client) {
        auto status = m_appliance_client->forget();
        CHECK_SUCCESS(status, "Failed forgetting the appliance authorization");
    }

    auto status = m_store->clear();
    CHECK_SUCCESS(status, "Failed clearing the device history");

    std::lock_guard<std::mutex> lock(m_view_mutex);
    m_last_probe_result.clear();
    return LANSCOUT_SUCCESS;
}

lanscout_status ScanCoordinator::abort()
{
    CHECK_NOT_NULL(m_shutdown_event, LANSCOUT_INVALID_OPERATION);
    return m_shutdown_event->signal();
}

} /* namespace lanscout */
