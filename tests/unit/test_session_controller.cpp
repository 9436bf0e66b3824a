// tests/unit/test_session_controller.cpp
#include <gtest/gtest.h>
#include "services/session_controller.hpp"
#include "services/interface_inventory.hpp"
#include "services/safety_validator.hpp"
#include "services/status_publisher.hpp"
#include "services/settings_store.hpp"
#include "infrastructure/hotspot_configurator.hpp"
#include "fakes/fake_command_runner.hpp"
#include "fakes/fake_interface_probe.hpp"
#include "fakes/fake_process_control.hpp"
#include "fakes/temp_directory.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace apguard;
using namespace apguard::services;

// ==================== Test Fixture ====================
class SessionControllerTest : public ::testing::Test
{
protected:
    fakes::TempDirectory dir;
    core::BackendConfig config;
    fakes::FakeCommandRunner runner;
    fakes::FakeInterfaceProbe probe;
    fakes::FakeProcessControl processes;

    std::unique_ptr<InterfaceInventory> inventory;
    std::unique_ptr<SafetyValidator> validator;
    std::unique_ptr<infrastructure::HotspotConfigurator> configurator;
    std::unique_ptr<SessionStore> store;
    std::unique_ptr<StatusPublisher> status;
    std::unique_ptr<SettingsStore> settings;
    std::unique_ptr<SessionController> controller;

    core::SessionRequest request;

    void SetUp() override
    {
        config.paths.status_file = dir.file("status.json");
        config.paths.pid_file = dir.file("apguard.pid");
        config.paths.state_file = dir.file("session.json");
        config.paths.lock_file = dir.file("apguard.lock");
        config.timeouts.lock_ms = 2000;
        config.timeouts.stop_wait_ms = 300;

        // wlan0 free for hosting, eth0 carries the internet
        probe.add(fakes::wifi_attributes("wlan0"));
        probe.add(fakes::ethernet_attributes("eth0"));
        probe.default_routes = {"eth0"};

        inventory = std::make_unique<InterfaceInventory>(probe);
        validator = std::make_unique<SafetyValidator>();
        configurator = std::make_unique<infrastructure::HotspotConfigurator>(runner, config.network, config.timeouts);
        store = std::make_unique<SessionStore>(config.paths.state_file);
        status = std::make_unique<StatusPublisher>(config.paths.status_file, config.paths.pid_file, processes);
        settings = std::make_unique<SettingsStore>(dir.file("settings.json"), SettingsOwner{});
        controller = make_controller();

        request.ssid = "MyHotspot";
        request.passphrase = std::string("password123");
    }

    void TearDown() override
    {
        controller.reset();
    }

    std::unique_ptr<SessionController> make_controller()
    {
        return std::make_unique<SessionController>(config, *inventory, *validator, *configurator,
                                                   *store, *status, processes, settings.get());
    }

    // A session owned by another backend process, with its configuration really applied
    SessionState seed_foreign_session(pid_t pid, core::Phase phase)
    {
        infrastructure::ConfigurationPlan plan{request, "wlan0", "eth0"};
        SessionState state;
        state.phase = phase;
        state.session_id = "feedfacefeedface";
        state.pid = pid;
        state.pid_identity = processes.identity(pid);
        state.request = request;
        state.hotspot_interface = "wlan0";
        state.upstream_interface = "eth0";
        state.actions = configurator->apply(plan);
        store->save(state);
        status->publish(phase, "seeded");
        status->write_pid(pid);
        runner.clear_calls();
        return state;
    }

    // Polls until the controller reports its session over, up to `limit`
    bool wait_for_finish(std::chrono::milliseconds limit)
    {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!controller->session_finished() && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return controller->session_finished();
    }

    std::optional<StatusRecord> published()
    {
        return status->read_status();
    }

    void expect_host_clean()
    {
        EXPECT_TRUE(runner.connections.empty());
        EXPECT_TRUE(runner.user_chains().empty());
        EXPECT_EQ(runner.ip_forward, "0");
    }
};

// ==================== Start ====================
TEST_F(SessionControllerTest, StartBringsHotspotUp)
{
    auto result = controller->start(request);

    EXPECT_EQ(result.outcome, Outcome::Success);
    EXPECT_EQ(result.exit_code(), 0);
    EXPECT_EQ(result.message, "Hotspot 'MyHotspot' active on wlan0 via eth0");

    auto state = store->load();
    EXPECT_EQ(state.phase, core::Phase::Active);
    EXPECT_EQ(state.pid, processes.self);
    EXPECT_EQ(state.hotspot_interface, "wlan0");
    EXPECT_EQ(state.upstream_interface, "eth0");
    ASSERT_EQ(state.actions.size(), 2u);
    EXPECT_FALSE(state.deadline.has_value());

    ASSERT_TRUE(published().has_value());
    EXPECT_EQ(published()->phase, core::Phase::Active);
    EXPECT_FALSE(published()->error_code.has_value());
    EXPECT_EQ(status->read_pid().value_or(0), processes.self);

    EXPECT_EQ(runner.active_connections.count("apguard-hotspot"), 1u);
    EXPECT_TRUE(controller->owns_session());
    EXPECT_FALSE(controller->session_finished());
}

TEST_F(SessionControllerTest, StartRemembersSettings)
{
    controller->start(request);

    auto saved = settings->load();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->ssid, "MyHotspot");
    EXPECT_EQ(saved->passphrase.value_or(""), "password123");
}

TEST_F(SessionControllerTest, StartWithTimerRecordsDeadline)
{
    request.auto_off_minutes = 30;
    const auto before = epoch_seconds();

    auto result = controller->start(request);

    ASSERT_EQ(result.outcome, Outcome::Success);
    EXPECT_NE(result.message.find("auto-off in 30 min"), std::string::npos);
    auto state = store->load();
    ASSERT_TRUE(state.deadline.has_value());
    EXPECT_GE(*state.deadline, before + 30 * 60);
    EXPECT_LE(*state.deadline, epoch_seconds() + 30 * 60);
}

TEST_F(SessionControllerTest, InvalidRequestTouchesNothing)
{
    request.passphrase = std::string("short");

    auto result = controller->start(request);

    EXPECT_EQ(result.outcome, Outcome::InvalidArgument);
    EXPECT_EQ(result.exit_code(), 3);
    EXPECT_TRUE(runner.calls().empty());
    EXPECT_FALSE(std::filesystem::exists(config.paths.state_file));
    ASSERT_TRUE(published().has_value());
    EXPECT_EQ(published()->phase, core::Phase::Idle);
    EXPECT_EQ(published()->error_code.value_or(""), "invalid_argument");
}

TEST_F(SessionControllerTest, StartWhileActiveReportsAlreadyRunning)
{
    processes.alive.insert(555);
    auto seeded = seed_foreign_session(555, core::Phase::Active);

    auto result = controller->start(request);

    EXPECT_EQ(result.outcome, Outcome::AlreadyRunning);
    EXPECT_EQ(result.exit_code(), 0);
    EXPECT_TRUE(runner.calls().empty());
    auto state = store->load();
    EXPECT_EQ(state.session_id, seeded.session_id);
    EXPECT_EQ(state.phase, core::Phase::Active);
}

TEST_F(SessionControllerTest, LockoutBlocksBeforeAnyChange)
{
    probe.interfaces.erase("eth0");
    probe.interfaces["wlan0"] = fakes::wifi_attributes("wlan0", true);
    probe.default_routes = {"wlan0"};

    auto result = controller->start(request);

    EXPECT_EQ(result.outcome, Outcome::Blocked);
    EXPECT_EQ(result.exit_code(), 1);
    EXPECT_TRUE(runner.calls().empty());

    auto state = store->load();
    EXPECT_EQ(state.phase, core::Phase::Error);
    EXPECT_TRUE(state.actions.empty());
    ASSERT_TRUE(state.last_error.has_value());
    EXPECT_EQ(state.last_error->kind, core::ErrorKind::SafetyBlock);
    EXPECT_EQ(published()->error_code.value_or(""), "safety_block");
    EXPECT_FALSE(status->read_pid().has_value());
}

TEST_F(SessionControllerTest, ForceSingleInterfaceProceedsWithWarning)
{
    probe.interfaces.erase("eth0");
    probe.interfaces["wlan0"] = fakes::wifi_attributes("wlan0", true);
    probe.default_routes = {"wlan0"};
    request.force_single_interface = true;

    auto result = controller->start(request);

    EXPECT_EQ(result.outcome, Outcome::Success);
    EXPECT_FALSE(result.warnings.empty());
    EXPECT_FALSE(store->load().warnings.empty());
}

TEST_F(SessionControllerTest, HardwareProblemIsBlocked)
{
    auto blocked = fakes::wifi_attributes("wlan0");
    blocked.live.rfkill_blocked = true;
    probe.interfaces["wlan0"] = blocked;

    auto result = controller->start(request);

    EXPECT_EQ(result.outcome, Outcome::Blocked);
    EXPECT_EQ(published()->error_code.value_or(""), "hardware");
}

TEST_F(SessionControllerTest, ConfigurationFailureRollsBackEverything)
{
    runner.fail({"-j", "MASQUERADE"}, 1, "iptables: No chain/target/match by that name.");

    auto result = controller->start(request);

    EXPECT_EQ(result.outcome, Outcome::ConfigurationFailed);
    EXPECT_EQ(result.exit_code(), 2);

    auto state = store->load();
    EXPECT_EQ(state.phase, core::Phase::Error);
    EXPECT_TRUE(state.actions.empty());
    ASSERT_TRUE(state.last_error.has_value());
    EXPECT_EQ(state.last_error->kind, core::ErrorKind::ConfigurationError);
    EXPECT_EQ(published()->error_code.value_or(""), "configuration");
    EXPECT_FALSE(status->read_pid().has_value());
    EXPECT_FALSE(controller->owns_session());
    expect_host_clean();
}

TEST_F(SessionControllerTest, VpnRoutingWithoutTunnelFailsClosed)
{
    request.route_via_vpn = true;

    auto result = controller->start(request);

    EXPECT_EQ(result.outcome, Outcome::ConfigurationFailed);
    EXPECT_FALSE(runner.was_called({"-j", "MASQUERADE"}));
    expect_host_clean();
}

TEST_F(SessionControllerTest, NetworkManagerDownBlocksStart)
{
    runner.network_manager_running = false;

    auto result = controller->start(request);

    EXPECT_EQ(result.outcome, Outcome::Blocked);
    EXPECT_EQ(result.exit_code(), 1);
    EXPECT_NE(result.message.find("NetworkManager is not running"), std::string::npos);
    EXPECT_FALSE(runner.was_called({"connection", "add"}));
    EXPECT_EQ(store->load().phase, core::Phase::Error);
    EXPECT_EQ(published()->phase, core::Phase::Error);
    expect_host_clean();
}

TEST_F(SessionControllerTest, StartAfterErrorCleansLeftovers)
{
    auto seeded = seed_foreign_session(555, core::Phase::Error);
    EXPECT_FALSE(runner.connections.empty());

    auto result = controller->start(request);

    EXPECT_EQ(result.outcome, Outcome::Success);
    EXPECT_GE(runner.count({"connection", "delete"}), 1u);
    auto state = store->load();
    EXPECT_EQ(state.phase, core::Phase::Active);
    EXPECT_NE(state.session_id, seeded.session_id);
    EXPECT_EQ(state.actions.size(), 2u);
}

// ==================== Stop ====================
TEST_F(SessionControllerTest, StopWhileIdleIsNoOp)
{
    auto result = controller->stop();

    EXPECT_EQ(result.outcome, Outcome::NoOp);
    EXPECT_EQ(result.exit_code(), 0);
    EXPECT_TRUE(runner.calls().empty());
    EXPECT_EQ(store->load().phase, core::Phase::Idle);
}

TEST_F(SessionControllerTest, StopWhileIdleTwice)
{
    EXPECT_EQ(controller->stop().outcome, Outcome::NoOp);
    EXPECT_EQ(controller->stop().outcome, Outcome::NoOp);
    EXPECT_TRUE(runner.calls().empty());
}

TEST_F(SessionControllerTest, StopOwnSessionRestoresHost)
{
    ASSERT_EQ(controller->start(request).outcome, Outcome::Success);

    auto result = controller->stop();

    EXPECT_EQ(result.outcome, Outcome::Success);
    auto state = store->load();
    EXPECT_EQ(state.phase, core::Phase::Idle);
    EXPECT_TRUE(state.actions.empty());
    EXPECT_EQ(published()->phase, core::Phase::Idle);
    EXPECT_FALSE(status->read_pid().has_value());
    EXPECT_TRUE(controller->session_finished());
    expect_host_clean();
}

TEST_F(SessionControllerTest, SignalStopEndsOwnSession)
{
    ASSERT_EQ(controller->start(request).outcome, Outcome::Success);

    auto result = controller->stop_own_session("Hotspot stopped");

    EXPECT_EQ(result.outcome, Outcome::Success);
    EXPECT_TRUE(controller->session_finished());
    EXPECT_EQ(store->load().phase, core::Phase::Idle);
    expect_host_clean();

    // Second signal finds nothing to do
    EXPECT_EQ(controller->stop_own_session("Hotspot stopped").outcome, Outcome::NoOp);
}

TEST_F(SessionControllerTest, StalePidBecomesErrorAndStopClearsIt)
{
    seed_foreign_session(999, core::Phase::Active);

    auto report = controller->status_report();
    EXPECT_EQ(report["phase"], "error");
    EXPECT_EQ(report["backendAlive"], false);

    auto result = controller->stop();

    EXPECT_EQ(result.outcome, Outcome::Success);
    auto state = store->load();
    EXPECT_EQ(state.phase, core::Phase::Idle);
    EXPECT_FALSE(state.last_error.has_value());
    EXPECT_FALSE(status->read_pid().has_value());
    expect_host_clean();
}

TEST_F(SessionControllerTest, StopAsksForeignControllerToExit)
{
    processes.alive.insert(555);
    seed_foreign_session(555, core::Phase::Active);

    auto result = controller->stop();

    EXPECT_EQ(result.outcome, Outcome::Success);
    ASSERT_EQ(processes.terminated.size(), 1u);
    EXPECT_EQ(processes.terminated[0], 555);
    EXPECT_TRUE(processes.killed.empty());
    // The fake controller exits without cleaning up; its log is reverted for it
    EXPECT_EQ(store->load().phase, core::Phase::Idle);
    expect_host_clean();
}

TEST_F(SessionControllerTest, UnresponsiveForeignControllerIsKilled)
{
    processes.alive.insert(555);
    processes.ignores_term.insert(555);
    seed_foreign_session(555, core::Phase::Active);

    auto result = controller->stop();

    EXPECT_EQ(result.outcome, Outcome::Success);
    ASSERT_EQ(processes.killed.size(), 1u);
    EXPECT_NE(result.message.find("unresponsive"), std::string::npos);
    EXPECT_EQ(store->load().phase, core::Phase::Idle);
    expect_host_clean();
}

TEST_F(SessionControllerTest, ReusedPidIsNeverSignalled)
{
    processes.alive.insert(555);
    seed_foreign_session(555, core::Phase::Active);
    // The backend died and an unrelated process now holds its pid
    processes.identities[555] = "start-unrelated";

    EXPECT_EQ(controller->status_report()["backendAlive"], false);

    auto result = controller->stop();

    EXPECT_EQ(result.outcome, Outcome::Success);
    EXPECT_TRUE(processes.terminated.empty());
    EXPECT_TRUE(processes.killed.empty());
    EXPECT_EQ(store->load().phase, core::Phase::Idle);
    expect_host_clean();
}

TEST_F(SessionControllerTest, ReusedPidDoesNotBlockStart)
{
    processes.alive.insert(555);
    seed_foreign_session(555, core::Phase::Active);
    processes.identities[555] = "start-unrelated";

    auto result = controller->start(request);

    EXPECT_EQ(result.outcome, Outcome::Success);
    EXPECT_TRUE(processes.terminated.empty());
    auto state = store->load();
    EXPECT_EQ(state.pid, processes.self);
    EXPECT_EQ(state.pid_identity, processes.identity(processes.self));
}

TEST_F(SessionControllerTest, UnreadableStateClearedByStop)
{
    std::ofstream(config.paths.state_file) << "{ not json";

    auto result = controller->stop();

    EXPECT_EQ(result.outcome, Outcome::Success);
    EXPECT_EQ(store->load().phase, core::Phase::Idle);
}

// ==================== Auto-off ====================
TEST_F(SessionControllerTest, DeadlineStopsActiveSession)
{
    request.auto_off_minutes = 5;
    ASSERT_EQ(controller->start(request).outcome, Outcome::Success);
    const std::string session_id = store->load().session_id;

    controller->handle_deadline(session_id);

    EXPECT_EQ(store->load().phase, core::Phase::Idle);
    EXPECT_NE(published()->message.find("auto-off"), std::string::npos);
    EXPECT_TRUE(controller->session_finished());
    expect_host_clean();
}

TEST_F(SessionControllerTest, DeadlineForOtherSessionIgnored)
{
    request.auto_off_minutes = 5;
    ASSERT_EQ(controller->start(request).outcome, Outcome::Success);
    runner.clear_calls();

    controller->handle_deadline("0000000000000000");

    EXPECT_EQ(store->load().phase, core::Phase::Active);
    EXPECT_TRUE(runner.calls().empty());
    EXPECT_FALSE(controller->session_finished());
}

TEST_F(SessionControllerTest, DeadlineAfterStopIgnored)
{
    request.auto_off_minutes = 5;
    ASSERT_EQ(controller->start(request).outcome, Outcome::Success);
    const std::string session_id = store->load().session_id;
    controller->stop();
    runner.clear_calls();

    controller->handle_deadline(session_id);

    EXPECT_EQ(store->load().phase, core::Phase::Idle);
    EXPECT_TRUE(runner.calls().empty());
}

TEST_F(SessionControllerTest, AutoOffTimerFiresOnItsOwn)
{
    config.timeouts.auto_off_minute_ms = 100;
    controller = make_controller();
    request.auto_off_minutes = 1;

    ASSERT_EQ(controller->start(request).outcome, Outcome::Success);
    EXPECT_TRUE(controller->timer_armed());

    ASSERT_TRUE(wait_for_finish(std::chrono::seconds(5)));
    EXPECT_FALSE(controller->timer_armed());
    EXPECT_EQ(store->load().phase, core::Phase::Idle);
    EXPECT_NE(published()->message.find("auto-off"), std::string::npos);
    expect_host_clean();
}

TEST_F(SessionControllerTest, StopDisarmsAutoOffTimer)
{
    config.timeouts.auto_off_minute_ms = 200;
    controller = make_controller();
    request.auto_off_minutes = 1;

    ASSERT_EQ(controller->start(request).outcome, Outcome::Success);
    ASSERT_EQ(controller->stop().outcome, Outcome::Success);
    EXPECT_FALSE(controller->timer_armed());
    runner.clear_calls();

    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    EXPECT_TRUE(runner.calls().empty());
    EXPECT_EQ(store->load().phase, core::Phase::Idle);
    EXPECT_EQ(published()->message, "Hotspot stopped");
}

// ==================== Upstream changes ====================
TEST_F(SessionControllerTest, NewDefaultRouteMovesNat)
{
    request.mac_filter_mode = core::MacFilterMode::BlockList;
    request.mac_addresses = {"aa:bb:cc:dd:ee:ff"};
    ASSERT_EQ(controller->start(request).outcome, Outcome::Success);

    probe.add(fakes::ethernet_attributes("eth1"));
    probe.default_routes = {"eth1"};
    controller->check_upstream();

    auto state = store->load();
    EXPECT_EQ(state.phase, core::Phase::Active);
    EXPECT_EQ(state.upstream_interface, "eth1");
    EXPECT_EQ(runner.rules("nat", "APGUARD_POSTROUTING")[0], "-s 10.42.0.0/24 -o eth1 -j MASQUERADE");
    EXPECT_EQ(runner.rules("filter", "FORWARD")[0], "-i wlan0 -j APGUARD_MACFILTER");
    EXPECT_EQ(published()->message, "Hotspot 'MyHotspot' active on wlan0 via eth1");

    // The persisted log reverts the rerouted chains
    ASSERT_EQ(controller->stop().outcome, Outcome::Success);
    expect_host_clean();
}

TEST_F(SessionControllerTest, UnchangedUpstreamLeavesFirewallAlone)
{
    ASSERT_EQ(controller->start(request).outcome, Outcome::Success);
    runner.clear_calls();

    controller->check_upstream();

    EXPECT_FALSE(runner.was_called({"iptables"}));
    EXPECT_EQ(store->load().upstream_interface, "eth0");
}

TEST_F(SessionControllerTest, LostDefaultRouteKeepsCurrentUpstream)
{
    ASSERT_EQ(controller->start(request).outcome, Outcome::Success);
    runner.clear_calls();

    probe.default_routes.clear();
    controller->check_upstream();

    EXPECT_FALSE(runner.was_called({"iptables"}));
    EXPECT_EQ(store->load().phase, core::Phase::Active);
}

TEST_F(SessionControllerTest, VpnSessionStopsWhenTunnelGoesDown)
{
    probe.add(fakes::tunnel_attributes("tun0"));
    request.route_via_vpn = true;
    ASSERT_EQ(controller->start(request).outcome, Outcome::Success);
    ASSERT_EQ(store->load().upstream_interface, "tun0");

    probe.interfaces.erase("tun0");
    controller->check_upstream();

    EXPECT_TRUE(controller->session_finished());
    EXPECT_EQ(store->load().phase, core::Phase::Idle);
    EXPECT_NE(published()->message.find("VPN tunnel went down"), std::string::npos);
    expect_host_clean();
}

TEST_F(SessionControllerTest, UpstreamCheckIgnoredWithoutOwnSession)
{
    seed_foreign_session(999, core::Phase::Active);

    controller->check_upstream();

    EXPECT_TRUE(runner.calls().empty());
}

// ==================== Status ====================
TEST_F(SessionControllerTest, StatusReportWhileIdle)
{
    auto report = controller->status_report();

    EXPECT_EQ(report["phase"], "idle");
    EXPECT_EQ(report["backendAlive"], false);
    EXPECT_TRUE(report["deadline"].is_null());
}

TEST_F(SessionControllerTest, StatusReportWhileActive)
{
    request.auto_off_minutes = 10;
    ASSERT_EQ(controller->start(request).outcome, Outcome::Success);

    auto report = controller->status_report();

    EXPECT_EQ(report["phase"], "active");
    EXPECT_EQ(report["backendAlive"], true);
    EXPECT_EQ(report["hotspotInterface"], "wlan0");
    EXPECT_EQ(report["ssid"], "MyHotspot");
    EXPECT_TRUE(report["deadline"].is_number_integer());
    EXPECT_FALSE(report.contains("password"));
}

TEST_F(SessionControllerTest, OutcomeExitCodes)
{
    EXPECT_EQ(exit_code_for(Outcome::Success), 0);
    EXPECT_EQ(exit_code_for(Outcome::NoOp), 0);
    EXPECT_EQ(exit_code_for(Outcome::AlreadyRunning), 0);
    EXPECT_EQ(exit_code_for(Outcome::Blocked), 1);
    EXPECT_EQ(exit_code_for(Outcome::ConfigurationFailed), 2);
    EXPECT_EQ(exit_code_for(Outcome::InvalidArgument), 3);
    EXPECT_EQ(to_string(Outcome::AlreadyRunning), "already_running");
}
