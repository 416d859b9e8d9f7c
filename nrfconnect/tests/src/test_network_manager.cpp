#include "provisioning/network_context.h"
#include "provisioning/network_manager.h"
#include "runtime/race_group.h"
#include "runtime/task.h"
#include "test_fakes.h"

#include <zephyr/ztest.h>

#include <cstring>

using provisioning::ConnectionStatus;
using provisioning::NetworkContext;
using provisioning::NetworkManager;
using provisioning::NetworkStatus;
using provisioning::WiFiCredentials;
using runtime::CancelToken;

namespace
{

chip::ByteSpan Bytes(const char * text)
{
    return chip::ByteSpan(reinterpret_cast<const uint8_t *>(text), strlen(text));
}

void AddNetwork(NetworkContext & context, const char * ssid, const char * password)
{
    WiFiCredentials entry;
    (void) entry.ssid.Set(ssid);
    (void) entry.password.Set(password);

    auto state = context.Lock();
    zassert_equal(state->networks.Append(entry), CHIP_NO_ERROR);
}

bool LastStatus(NetworkContext & context, ConnectionStatus & status)
{
    auto state = context.Lock();
    VerifyOrReturnValue(state->status.HasValue(), false);
    status = state->status.Value();
    return true;
}

class CountingObserver : public NetworkContext::Observer
{
public:
    void OnStatusChanged() override { atomic_inc(&mCalls); }

    atomic_t mCalls = ATOMIC_INIT(0);
};

// Runs the manager next to `check` until `check` returns.
template <typename Check>
CHIP_ERROR RunManager(NetworkManager & manager, Check check)
{
    CancelToken parent;
    auto checker = runtime::MakeTask("check", [&](CancelToken &) { return check(); });

    runtime::RaceGroup race("manager");
    ReturnErrorOnFailure(race.Add(manager));
    ReturnErrorOnFailure(race.Add(checker));
    return race.Run(parent);
}

} // namespace

ZTEST_SUITE(network_manager, nullptr, nullptr, nullptr, nullptr, nullptr);

ZTEST(network_manager, test_request_made_before_start_is_served)
{
    NetworkContext context;
    test::FakeWiFi wifi("Home", "pw1");
    NetworkManager manager(context, wifi);
    CountingObserver observer;

    context.SetObserver(&observer);
    AddNetwork(context, "Home", "pw1");
    zassert_equal(context.RequestConnect(Bytes("Home")), CHIP_NO_ERROR);

    CHIP_ERROR err = RunManager(manager, [&]() -> CHIP_ERROR {
        ConnectionStatus status;
        VerifyOrReturnError(test::WaitUntil([&] { return LastStatus(context, status); }), CHIP_ERROR_TIMEOUT);
        return CHIP_NO_ERROR;
    });
    zassert_equal(err, CHIP_NO_ERROR);

    ConnectionStatus status;
    zassert_true(LastStatus(context, status));
    zassert_true(status.ssid.Equals(Bytes("Home")));
    zassert_equal(status.status, NetworkStatus::kSuccess);
    zassert_true(wifi.IsConnected());
    zassert_equal(wifi.ConnectCalls(), 1);
    zassert_false(context.HasConnectRequest());
    zassert_true(atomic_get(&observer.mCalls) >= 1);
    zassert_equal(manager.GetState(), NetworkManager::State::kIdle);
}

ZTEST(network_manager, test_unknown_network_reports_not_found)
{
    NetworkContext context;
    test::FakeWiFi wifi;
    NetworkManager manager(context, wifi);

    CHIP_ERROR err = RunManager(manager, [&]() -> CHIP_ERROR {
        ReturnErrorOnFailure(context.RequestConnect(Bytes("Nowhere")));
        ConnectionStatus status;
        VerifyOrReturnError(test::WaitUntil([&] { return LastStatus(context, status); }), CHIP_ERROR_TIMEOUT);
        return CHIP_NO_ERROR;
    });
    zassert_equal(err, CHIP_NO_ERROR);

    ConnectionStatus status;
    zassert_true(LastStatus(context, status));
    zassert_true(status.ssid.Equals(Bytes("Nowhere")));
    zassert_equal(status.status, NetworkStatus::kNetworkIDNotFound);
    zassert_equal(status.value, 0);
    zassert_equal(wifi.ConnectCalls(), 0);
}

ZTEST(network_manager, test_wrong_password_reports_auth_failure)
{
    NetworkContext context;
    test::FakeWiFi wifi("Home", "pw1");
    NetworkManager manager(context, wifi);

    AddNetwork(context, "Home", "wrong");

    CHIP_ERROR err = RunManager(manager, [&]() -> CHIP_ERROR {
        ReturnErrorOnFailure(context.RequestConnect(Bytes("Home")));
        ConnectionStatus status;
        VerifyOrReturnError(test::WaitUntil([&] {
                                return LastStatus(context, status) && status.status == NetworkStatus::kAuthFailure;
                            }),
                            CHIP_ERROR_TIMEOUT);
        return CHIP_NO_ERROR;
    });
    zassert_equal(err, CHIP_NO_ERROR);
    zassert_false(wifi.IsConnected());
}

ZTEST(network_manager, test_link_loss_reconnects_known_networks_in_order)
{
    NetworkContext context;
    test::FakeWiFi wifi("Home", "pw1");
    NetworkManager manager(context, wifi);

    AddNetwork(context, "Office", "secret");
    AddNetwork(context, "Home", "pw1");

    CHIP_ERROR err = RunManager(manager, [&]() -> CHIP_ERROR {
        // First round: Office is unreachable, Home joins.
        VerifyOrReturnError(test::WaitUntil([&] { return wifi.IsConnected(); }), CHIP_ERROR_TIMEOUT);
        VerifyOrReturnError(wifi.ConnectCalls() == 2, CHIP_ERROR_INTERNAL);

        wifi.SetConnected(false);
        VerifyOrReturnError(test::WaitUntil([&] { return wifi.IsConnected() && wifi.ConnectCalls() >= 4; }),
                            CHIP_ERROR_TIMEOUT);
        return CHIP_NO_ERROR;
    });
    zassert_equal(err, CHIP_NO_ERROR);

    ConnectionStatus status;
    zassert_true(LastStatus(context, status));
    zassert_true(status.ssid.Equals(Bytes("Home")));
    zassert_equal(status.status, NetworkStatus::kSuccess);
}

ZTEST(network_manager, test_unreachable_networks_are_retried_at_the_reconnect_interval)
{
    NetworkContext context;
    test::FakeWiFi wifi("Home", "pw1");
    NetworkManager manager(context, wifi);

    AddNetwork(context, "Office", "secret");

    CHIP_ERROR err = RunManager(manager, [&]() -> CHIP_ERROR {
        VerifyOrReturnError(test::WaitUntil([&] { return wifi.ConnectCalls() >= 1; }), CHIP_ERROR_TIMEOUT);

        // Well inside one reconnect interval: no second round yet.
        k_sleep(K_MSEC(CONFIG_NETPROV_RECONNECT_INTERVAL_MS / 2));
        VerifyOrReturnError(wifi.ConnectCalls() == 1, CHIP_ERROR_INTERNAL);

        VerifyOrReturnError(test::WaitUntil([&] { return wifi.ConnectCalls() >= 2; }), CHIP_ERROR_TIMEOUT);
        return CHIP_NO_ERROR;
    });
    zassert_equal(err, CHIP_NO_ERROR);
    zassert_false(wifi.IsConnected());

    ConnectionStatus status;
    zassert_true(LastStatus(context, status));
    zassert_equal(status.status, NetworkStatus::kNetworkNotFound);
}
