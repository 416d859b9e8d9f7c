#include "app/orchestrator.h"
#include "matter/wifi_commissioning_cluster.h"
#include "provisioning/network_store.h"
#include "runtime/task_pool.h"
#include "test_fakes.h"

#include <lib/support/TestPersistentStorageDelegate.h>
#include <zephyr/kernel.h>
#include <zephyr/ztest.h>

#include <cstring>

using ::app::Orchestrator;
using matter::WiFiCommissioningCluster;
using provisioning::NetworkStatus;
using runtime::CancelToken;
using Status = chip::Protocols::InteractionModel::Status;

namespace
{

constexpr size_t kOrchestratorStackSize = 8192;

K_THREAD_STACK_DEFINE(sOrchestratorStack, kOrchestratorStackSize);
struct k_thread sOrchestratorThread;

chip::ByteSpan Bytes(const char * text)
{
    return chip::ByteSpan(reinterpret_cast<const uint8_t *>(text), strlen(text));
}

struct Harness
{
    chip::TestPersistentStorageDelegate storage;
    test::FakeWiFi wifi{ "Home", "pw1" };
    test::FakeChannel channel;
    test::FakeStack stack;
    Orchestrator orchestrator{ storage, wifi, channel, stack,
                               Orchestrator::Config{ "Test", chip::System::Clock::Seconds32(900) } };
    CancelToken token;
    CHIP_ERROR result = CHIP_NO_ERROR;
};

void OrchestratorEntry(void * harnessArg, void *, void *)
{
    auto * harness   = static_cast<Harness *>(harnessArg);
    harness->result = harness->orchestrator.Run(harness->token);
}

void Start(Harness & harness)
{
    zassert_equal(harness.orchestrator.Init(), CHIP_NO_ERROR);
    k_thread_create(&sOrchestratorThread, sOrchestratorStack, K_THREAD_STACK_SIZEOF(sOrchestratorStack), OrchestratorEntry,
                    &harness, nullptr, nullptr, CONFIG_NETPROV_TASK_PRIORITY, 0, K_NO_WAIT);
}

void Stop(Harness & harness)
{
    harness.token.Cancel();
    zassert_equal(k_thread_join(&sOrchestratorThread, K_SECONDS(5)), 0, "orchestrator did not stop");
    zassert_equal(harness.result, CHIP_ERROR_CANCELLED);
    zassert_equal(runtime::TaskPool::Instance().Available(), runtime::TaskPool::kWorkerCount);
}

void StoreHomeNetwork(Harness & harness)
{
    provisioning::NetworkList networks;
    provisioning::WiFiCredentials home;
    (void) home.ssid.Set("Home");
    (void) home.password.Set("pw1");
    zassert_equal(networks.Append(home), CHIP_NO_ERROR);

    uint8_t buffer[CONFIG_NETPROV_PERSIST_BUFFER_SIZE];
    provisioning::NetworkStore store(harness.storage);
    zassert_equal(store.Save(networks, chip::MutableByteSpan(buffer)), CHIP_NO_ERROR);
}

bool ConnectedTo(provisioning::NetworkContext & context, const char * ssid)
{
    auto state = context.Lock();
    return state->status.HasValue() && state->status.Value().status == NetworkStatus::kSuccess &&
        state->status.Value().ssid.Equals(Bytes(ssid));
}

} // namespace

ZTEST_SUITE(orchestrator, nullptr, nullptr, nullptr, nullptr, nullptr);

ZTEST(orchestrator, test_commissioning_to_operating)
{
    static Harness harness;
    WiFiCommissioningCluster cluster(harness.orchestrator.Context());
    WiFiCommissioningCluster::NetworkConfigResult result;

    Start(harness);

    // Uncommissioned: BLE channel plus a session with a commissioning window.
    zassert_true(test::WaitUntil([] { return harness.channel.Runs() == 1 && harness.stack.BleTransportRuns() == 1; }));
    zassert_equal(harness.orchestrator.GetPhase(), Orchestrator::Phase::kCommissioning);

    zassert_equal(cluster.AddOrUpdateNetwork(Bytes("Home"), Bytes("pw1"), result), Status::Success);
    zassert_equal(result.status, NetworkStatus::kSuccess);
    zassert_true(test::WaitUntil([] {
        return harness.storage.HasKey(provisioning::NetworkStore::kStorageKey) &&
            !harness.orchestrator.Context().Lock()->changed;
    }));

    harness.stack.SetCommissioned(true);
    zassert_equal(cluster.ConnectNetwork(Bytes("Home")), Status::Success);

    // Operating: the manager joins, then the session moves to the network.
    zassert_true(test::WaitUntil([] { return harness.orchestrator.GetPhase() == Orchestrator::Phase::kOperating; }));
    zassert_true(test::WaitUntil([] { return ConnectedTo(harness.orchestrator.Context(), "Home"); }));
    zassert_true(test::WaitUntil([] {
        return harness.stack.NetworkTransportRuns() == 1 && harness.stack.DiscoveryRuns() == 1;
    }));
    zassert_equal(harness.wifi.EnableCalls(), 1);
    zassert_equal(harness.channel.Runs(), 1);

    // A new address restarts the network session and the broadcast.
    harness.wifi.ChangeAddress();
    zassert_true(test::WaitUntil([] {
        return harness.stack.NetworkTransportRuns() == 2 && harness.stack.DiscoveryRuns() == 2;
    }));

    Stop(harness);
}

ZTEST(orchestrator, test_commissioned_device_starts_operating)
{
    static Harness harness;

    StoreHomeNetwork(harness);
    harness.stack.SetCommissioned(true);

    Start(harness);

    // Stored networks are joined without any connect request.
    zassert_true(test::WaitUntil([] { return ConnectedTo(harness.orchestrator.Context(), "Home"); }));
    zassert_true(test::WaitUntil([] { return harness.stack.DiscoveryRuns() == 1; }));
    zassert_equal(harness.orchestrator.GetPhase(), Orchestrator::Phase::kOperating);
    zassert_equal(harness.channel.Runs(), 0);
    zassert_equal(harness.stack.BleTransportRuns(), 0);

    // Link loss ends the interface session until the manager rejoins.
    harness.wifi.SetConnected(false);
    zassert_true(test::WaitUntil([] { return harness.stack.DiscoveryRuns() == 2 && harness.wifi.IsConnected(); }));

    Stop(harness);
}

ZTEST(orchestrator, test_unreadable_storage_starts_empty)
{
    static Harness harness;
    const uint8_t garbage[] = { 0xff, 0xff };

    zassert_equal(harness.storage.SyncSetKeyValue(provisioning::NetworkStore::kStorageKey, garbage, sizeof(garbage)),
                  CHIP_NO_ERROR);
    harness.stack.SetCommissioned(true);

    Start(harness);

    // A fabric without networks still needs commissioning.
    zassert_true(test::WaitUntil([] { return harness.channel.Runs() == 1; }));
    zassert_equal(harness.orchestrator.GetPhase(), Orchestrator::Phase::kCommissioning);
    zassert_true(harness.orchestrator.Context().Lock()->networks.Empty());

    Stop(harness);
}

ZTEST(orchestrator, test_failed_session_restarts_the_phase)
{
    static Harness harness;

    StoreHomeNetwork(harness);
    harness.stack.SetCommissioned(true);

    Start(harness);

    zassert_true(test::WaitUntil([] {
        return harness.stack.DiscoveryRuns() == 1 && harness.stack.ResponderRuns() == 1;
    }));
    zassert_equal(harness.wifi.EnableCalls(), 1);

    // Fail-safe expiry ends the session, which ends the operating phase. It
    // is entered again after the restart delay with fresh members.
    const int64_t failedAt = k_uptime_get();
    harness.stack.ExpireFailSafe();

    zassert_true(test::WaitUntil([] { return harness.wifi.EnableCalls() == 2; }));
    zassert_true(k_uptime_get() - failedAt >= CONFIG_NETPROV_PHASE_RESTART_DELAY_MS);
    zassert_true(test::WaitUntil([] {
        return harness.stack.ResponderRuns() == 2 && harness.stack.NetworkTransportRuns() == 2 &&
            harness.stack.DiscoveryRuns() == 2;
    }));
    zassert_equal(harness.orchestrator.GetPhase(), Orchestrator::Phase::kOperating);
    zassert_true(ConnectedTo(harness.orchestrator.Context(), "Home"));

    Stop(harness);
}

ZTEST(orchestrator, test_storage_failure_restarts_until_the_write_succeeds)
{
    static Harness harness;
    WiFiCommissioningCluster cluster(harness.orchestrator.Context());
    WiFiCommissioningCluster::NetworkConfigResult result;

    StoreHomeNetwork(harness);
    harness.stack.SetCommissioned(true);

    Start(harness);
    zassert_true(test::WaitUntil([] { return harness.stack.DiscoveryRuns() == 1; }));

    harness.storage.AddPoisonKey(provisioning::NetworkStore::kStorageKey);
    zassert_equal(cluster.AddOrUpdateNetwork(Bytes("Office"), Bytes("secret"), result), Status::Success);

    // Every restarted session retries the write and fails again.
    zassert_true(test::WaitUntil([] { return harness.stack.DiscoveryRuns() >= 3; }));
    zassert_true(harness.orchestrator.Context().Lock()->changed);

    harness.storage.ClearPoisonKeys();
    zassert_true(test::WaitUntil([] { return !harness.orchestrator.Context().Lock()->changed; }));

    provisioning::NetworkList stored;
    uint8_t buffer[CONFIG_NETPROV_PERSIST_BUFFER_SIZE];
    provisioning::NetworkStore store(harness.storage);
    zassert_equal(store.Load(stored, chip::MutableByteSpan(buffer)), CHIP_NO_ERROR);
    zassert_equal(stored.Size(), 2);

    // Once written, the phase stays up.
    k_sleep(K_MSEC(CONFIG_NETPROV_PHASE_RESTART_DELAY_MS));
    const int runs = harness.stack.DiscoveryRuns();
    k_sleep(K_MSEC(CONFIG_NETPROV_PHASE_RESTART_DELAY_MS * 4));
    zassert_equal(harness.stack.DiscoveryRuns(), runs);

    Stop(harness);
}
