// tests/unit/test_session_store.cpp
#include <gtest/gtest.h>
#include "services/session_store.hpp"
#include "fakes/temp_directory.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

using namespace apguard;
using namespace apguard::services;

// ==================== Test Fixture ====================
class SessionStoreTest : public ::testing::Test
{
protected:
    fakes::TempDirectory dir;
    std::unique_ptr<SessionStore> store;

    void SetUp() override
    {
        store = std::make_unique<SessionStore>(dir.file("run/session.json"));
    }

    SessionState active_state()
    {
        SessionState state;
        state.phase = core::Phase::Active;
        state.session_id = "0123456789abcdef";
        state.pid = 4321;
        core::SessionRequest request;
        request.ssid = "MyHotspot";
        request.passphrase = std::string("password123");
        request.auto_off_minutes = 15;
        state.request = request;
        state.hotspot_interface = "wlan0";
        state.upstream_interface = "eth0";
        state.deadline = 1700000900;
        state.actions.push_back({infrastructure::ActionType::AccessPointProfile,
                                 {{"connection", "apguard-hotspot"}, {"interface", "wlan0"}}});
        state.actions.push_back({infrastructure::ActionType::Nat,
                                 {{"ip_forward", "0"}, {"postrouting_chain", "APGUARD_POSTROUTING"}}});
        state.warnings = {"wlan0 will be disconnected from Home"};
        return state;
    }
};

// ==================== Load and save ====================
TEST_F(SessionStoreTest, MissingFileIsIdle)
{
    auto state = store->load();

    EXPECT_EQ(state.phase, core::Phase::Idle);
    EXPECT_TRUE(state.actions.empty());
    EXPECT_FALSE(state.last_error.has_value());
}

TEST_F(SessionStoreTest, SavedStateLoadsBack)
{
    auto state = active_state();
    store->save(state);

    auto loaded = store->load();

    EXPECT_EQ(loaded.phase, core::Phase::Active);
    EXPECT_EQ(loaded.session_id, "0123456789abcdef");
    EXPECT_EQ(loaded.pid, 4321);
    EXPECT_EQ(loaded.hotspot_interface, "wlan0");
    EXPECT_EQ(loaded.upstream_interface, "eth0");
    EXPECT_EQ(loaded.deadline.value_or(0), 1700000900);
    ASSERT_EQ(loaded.actions.size(), 2u);
    EXPECT_EQ(loaded.actions[1].type, infrastructure::ActionType::Nat);
    EXPECT_EQ(loaded.actions[1].get("ip_forward"), "0");
    ASSERT_TRUE(loaded.request.has_value());
    EXPECT_EQ(loaded.request->ssid, "MyHotspot");
    EXPECT_EQ(loaded.request->auto_off_minutes.value_or(0), 15);
    EXPECT_EQ(loaded.warnings, state.warnings);
    EXPECT_GT(loaded.updated_at, 0);
}

TEST_F(SessionStoreTest, PasswordNeverPersisted)
{
    auto state = active_state();
    store->save(state);

    std::ifstream in(store->path());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_EQ(contents.str().find("password123"), std::string::npos);
    EXPECT_FALSE(store->load().request->passphrase.has_value());
}

TEST_F(SessionStoreTest, FileIsPrivate)
{
    auto state = active_state();
    store->save(state);

    struct stat st;
    ASSERT_EQ(stat(store->path().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(SessionStoreTest, LastErrorPersisted)
{
    SessionState state;
    state.phase = core::Phase::Error;
    state.last_error = LastError{core::ErrorKind::SafetyBlock, "wlan0 is your only internet connection"};
    store->save(state);

    auto loaded = store->load();

    ASSERT_TRUE(loaded.last_error.has_value());
    EXPECT_EQ(loaded.last_error->kind, core::ErrorKind::SafetyBlock);
    EXPECT_EQ(loaded.last_error->message, "wlan0 is your only internet connection");
}

TEST_F(SessionStoreTest, CorruptFileLoadsAsError)
{
    dir.write("run/session.json", "{ \"phase\": \"active\", \"actions\": [ {");

    auto state = store->load();

    EXPECT_EQ(state.phase, core::Phase::Error);
    EXPECT_TRUE(state.actions.empty());
    ASSERT_TRUE(state.last_error.has_value());
    EXPECT_EQ(state.last_error->kind, core::ErrorKind::ConfigurationError);
}

TEST_F(SessionStoreTest, UnknownPhaseLoadsAsError)
{
    dir.write("run/session.json", "{ \"phase\": \"paused\" }");

    EXPECT_EQ(store->load().phase, core::Phase::Error);
}

TEST_F(SessionStoreTest, UnknownActionLoadsAsError)
{
    dir.write("run/session.json", "{ \"phase\": \"active\", \"actions\": [ {\"type\": \"teleport\"} ] }");

    auto state = store->load();

    EXPECT_EQ(state.phase, core::Phase::Error);
    EXPECT_TRUE(state.actions.empty());
}

// ==================== Ownership ====================
TEST_F(SessionStoreTest, DirectoryIsPrivateToOwner)
{
    auto state = active_state();
    store->save(state);

    struct stat st;
    ASSERT_EQ(stat(dir.file("run").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0700u);
    EXPECT_EQ(st.st_uid, geteuid());
}

TEST_F(SessionStoreTest, LoosePermissionsOnExistingDirectoryAreTightened)
{
    std::filesystem::create_directories(dir.file("run"));
    chmod(dir.file("run").c_str(), 0777);

    auto state = active_state();
    store->save(state);

    struct stat st;
    ASSERT_EQ(stat(dir.file("run").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0700u);
}

TEST_F(SessionStoreTest, RecordWrittenByAnotherUserIsNotTrusted)
{
    auto state = active_state();
    store->save(state);

    SessionStore strict(store->path(), geteuid() + 1);
    auto loaded = strict.load();

    EXPECT_EQ(loaded.phase, core::Phase::Error);
    EXPECT_TRUE(loaded.actions.empty());
    EXPECT_EQ(loaded.pid, 0);
    ASSERT_TRUE(loaded.last_error.has_value());
    EXPECT_NE(loaded.last_error->message.find("owned by uid"), std::string::npos);
}

TEST_F(SessionStoreTest, SymlinkedRecordIsNotTrusted)
{
    SessionStore elsewhere(dir.file("other/session.json"));
    auto state = active_state();
    elsewhere.save(state);
    std::filesystem::create_directories(dir.file("run"));
    std::filesystem::create_symlink(dir.file("other/session.json"), store->path());

    auto loaded = store->load();

    EXPECT_EQ(loaded.phase, core::Phase::Error);
    EXPECT_TRUE(loaded.actions.empty());
}

TEST_F(SessionStoreTest, SaveRefusesDirectoryOfAnotherUser)
{
    SessionStore strict(store->path(), geteuid() + 1);
    SessionState state = active_state();

    EXPECT_THROW(strict.save(state), core::ConfigurationError);
    EXPECT_FALSE(std::filesystem::exists(store->path()));
}

TEST_F(SessionStoreTest, PlantedTempFileIsNotWrittenThrough)
{
    const std::string victim = dir.write("victim.txt", "untouched");
    std::filesystem::create_directories(dir.file("run"));
    std::filesystem::create_symlink(victim, store->path() + ".tmp." + std::to_string(getpid()));

    auto state = active_state();
    state.pid_identity = "987654";
    store->save(state);

    std::ifstream in(victim);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_EQ(contents.str(), "untouched");

    auto loaded = store->load();
    EXPECT_EQ(loaded.phase, core::Phase::Active);
    EXPECT_EQ(loaded.pid_identity, "987654");
}

// ==================== Helpers ====================
TEST_F(SessionStoreTest, ControllerExpectedWhileSessionLive)
{
    SessionState state;
    for (auto phase : {core::Phase::Validating, core::Phase::Starting, core::Phase::Active, core::Phase::Stopping})
    {
        state.phase = phase;
        EXPECT_TRUE(state.expects_controller()) << core::to_string(phase);
    }
    for (auto phase : {core::Phase::Idle, core::Phase::Error})
    {
        state.phase = phase;
        EXPECT_FALSE(state.expects_controller()) << core::to_string(phase);
    }
}

TEST_F(SessionStoreTest, SessionIdsAreHexAndDistinct)
{
    const std::string first = generate_session_id();
    const std::string second = generate_session_id();

    EXPECT_EQ(first.size(), 16u);
    for (char c : first)
    {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)));
    }
    EXPECT_NE(first, second);
}
