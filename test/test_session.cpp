/**
 * Gridlight - Device Session Tests
 *
 * Connection lifecycle, auto-detection, clear-on-connect/disconnect and
 * transport failure handling, driven through an in-memory transport.
 */

#include <unity.h>
#include <memory>
#include <string>
#include <vector>

#include "device/session.hpp"
#include "mocks/fake_transport.hpp"

using namespace gridlight;
using namespace gridlight::device;
using gridlight::test::FakeTransport;
using gridlight::test::FakeTransportState;

//==============================================================================
// Fixture
//==============================================================================

struct SessionFixture {
    std::shared_ptr<FakeTransportState> state;
    std::vector<std::pair<bool, std::string>> statuses;
    std::vector<std::string> errors;
    std::vector<int64_t> waits;
    // Last, so teardown can still record into the logs above
    std::unique_ptr<DeviceSession> session;

    explicit SessionFixture(int64_t delayUs = 1000) : state(new FakeTransportState) {
        state->ports.push_back("Midi Through Port-0");
        state->ports.push_back("SmartPAD MIDI 1");
        state->ports.push_back("Other Synth");

        ProtocolConfig cfg;
        cfg.interCommandDelayUs = delayUs;
        session.reset(new DeviceSession(
            std::unique_ptr<DeviceTransport>(new FakeTransport(state)), ProtocolEncoder(cfg)));
        session->setStatusCallback([this](bool connected, const std::string& msg) {
            statuses.push_back(std::make_pair(connected, msg));
        });
        session->setErrorCallback([this](const std::string& msg) { errors.push_back(msg); });
        session->setWaitFunction([this](int64_t us) { waits.push_back(us); });
    }

    const std::string& lastStatus() const { return statuses.back().second; }
    bool lastConnected() const { return statuses.back().first; }

    void resetLog() {
        state->sent.clear();
        statuses.clear();
        errors.clear();
        waits.clear();
    }
};

static bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

//==============================================================================
// Connecting
//==============================================================================

static void test_connect_opens_and_clears_grid() {
    SessionFixture f;
    TEST_ASSERT_TRUE(f.session->connect("SmartPAD MIDI 1"));
    TEST_ASSERT_TRUE(f.session->isConnected());
    TEST_ASSERT_EQUAL_STRING("SmartPAD MIDI 1", f.session->getConnectedAddress().c_str());
    TEST_ASSERT_TRUE(f.lastConnected());
    TEST_ASSERT_EQUAL_STRING("SmartPAD MIDI 1", f.lastStatus().c_str());

    TEST_ASSERT_EQUAL_INT(64, f.state->countKind(DeviceCommand::NOTE_OFF));
    TEST_ASSERT_EQUAL_INT(0, f.state->countKind(DeviceCommand::NOTE_ON));
    TEST_ASSERT_EQUAL_INT(1, (int)f.waits.size());
    TEST_ASSERT_EQUAL_INT(2000, (int)f.waits[0]);
}

static void test_connect_empty_address_fails() {
    SessionFixture f;
    TEST_ASSERT_FALSE(f.session->connect(""));
    TEST_ASSERT_FALSE(f.session->isConnected());
    TEST_ASSERT_FALSE(f.lastConnected());
    TEST_ASSERT_EQUAL_INT(1, (int)f.errors.size());
    TEST_ASSERT_EQUAL_INT(0, (int)f.state->opened.size());
}

static void test_connect_same_address_is_noop() {
    SessionFixture f;
    f.session->connect("SmartPAD MIDI 1");
    f.resetLog();

    TEST_ASSERT_TRUE(f.session->connect("SmartPAD MIDI 1"));
    TEST_ASSERT_EQUAL_INT(1, (int)f.state->opened.size());
    TEST_ASSERT_EQUAL_INT(0, (int)f.state->sent.size());
    TEST_ASSERT_TRUE(f.lastConnected());
    TEST_ASSERT_EQUAL_STRING("Already connected to SmartPAD MIDI 1", f.lastStatus().c_str());
}

static void test_connect_other_address_disconnects_first() {
    SessionFixture f;
    f.session->connect("SmartPAD MIDI 1");
    f.resetLog();

    TEST_ASSERT_TRUE(f.session->connect("Other Synth"));
    TEST_ASSERT_EQUAL_INT(1, f.state->closeCount);
    TEST_ASSERT_EQUAL_INT(2, (int)f.state->opened.size());
    TEST_ASSERT_EQUAL_STRING("Other Synth", f.session->getConnectedAddress().c_str());
    // Clear on the old port, clear on the new one
    TEST_ASSERT_EQUAL_INT(128, f.state->countKind(DeviceCommand::NOTE_OFF));
}

static void test_connect_open_failure_reports() {
    SessionFixture f;
    f.state->failOpen = true;
    TEST_ASSERT_FALSE(f.session->connect("SmartPAD MIDI 1"));
    TEST_ASSERT_FALSE(f.session->isConnected());
    TEST_ASSERT_FALSE(f.lastConnected());
    TEST_ASSERT_EQUAL_STRING("Failed to open SmartPAD MIDI 1", f.lastStatus().c_str());
    TEST_ASSERT_EQUAL_INT(1, (int)f.errors.size());
    TEST_ASSERT_TRUE(f.session->getConnectedAddress().empty());
}

//==============================================================================
// Auto-detection
//==============================================================================

static void test_keyword_selector_is_case_insensitive() {
    KeywordPortSelector selector;
    std::vector<std::string> ports;
    ports.push_back("Midi Through");
    ports.push_back("MIDIPLUS Pad");
    TEST_ASSERT_EQUAL_STRING("MIDIPLUS Pad", selector.selectPort(ports).c_str());
}

static void test_keyword_selector_port_order_wins() {
    KeywordPortSelector selector;
    std::vector<std::string> ports;
    ports.push_back("USB MIDI Interface");
    ports.push_back("SmartPAD");
    TEST_ASSERT_EQUAL_STRING("USB MIDI Interface", selector.selectPort(ports).c_str());
}

static void test_keyword_selector_no_match_is_empty() {
    std::vector<std::string> keywords(1, "launchpad");
    KeywordPortSelector selector(keywords);
    std::vector<std::string> ports(1, "SmartPAD");
    TEST_ASSERT_TRUE(selector.selectPort(ports).empty());
    TEST_ASSERT_TRUE(selector.selectPort(std::vector<std::string>()).empty());
}

static void test_connect_auto_picks_matching_port() {
    SessionFixture f;
    TEST_ASSERT_TRUE(f.session->connectAuto(KeywordPortSelector()));
    TEST_ASSERT_EQUAL_STRING("SmartPAD MIDI 1", f.session->getConnectedAddress().c_str());
}

static void test_connect_auto_without_ports() {
    SessionFixture f;
    f.state->ports.clear();
    TEST_ASSERT_FALSE(f.session->connectAuto(KeywordPortSelector()));
    TEST_ASSERT_EQUAL_STRING("No MIDI output ports found.", f.lastStatus().c_str());
}

static void test_connect_auto_without_match() {
    SessionFixture f;
    f.state->ports.clear();
    f.state->ports.push_back("Other Synth");
    TEST_ASSERT_FALSE(f.session->connectAuto(KeywordPortSelector()));
    TEST_ASSERT_FALSE(f.session->isConnected());
    TEST_ASSERT_TRUE(startsWith(f.lastStatus(), "Pad device port not automatically found"));
}

static void test_port_listing_failure_is_reported() {
    SessionFixture f;
    f.state->failList = true;
    TEST_ASSERT_EQUAL_INT(0, (int)f.session->listAvailableAddresses().size());
    TEST_ASSERT_EQUAL_INT(1, (int)f.errors.size());
}

//==============================================================================
// Disconnecting
//==============================================================================

static void test_disconnect_clears_settles_and_closes() {
    SessionFixture f;
    f.session->connect("SmartPAD MIDI 1");
    f.resetLog();

    f.session->disconnect();
    TEST_ASSERT_FALSE(f.session->isConnected());
    TEST_ASSERT_EQUAL_INT(64, f.state->countKind(DeviceCommand::NOTE_OFF));
    TEST_ASSERT_EQUAL_INT(2, (int)f.waits.size());
    TEST_ASSERT_EQUAL_INT(2000, (int)f.waits[0]);
    TEST_ASSERT_EQUAL_INT(5 * 1000 + 50000, (int)f.waits[1]);
    TEST_ASSERT_EQUAL_INT(1, f.state->closeCount);
    TEST_ASSERT_FALSE(f.lastConnected());
    TEST_ASSERT_EQUAL_STRING("Disconnected from SmartPAD MIDI 1", f.lastStatus().c_str());
}

static void test_disconnect_without_clear() {
    SessionFixture f;
    f.session->connect("SmartPAD MIDI 1");
    f.resetLog();

    f.session->disconnect(false);
    TEST_ASSERT_EQUAL_INT(0, (int)f.state->sent.size());
    TEST_ASSERT_EQUAL_INT(0, (int)f.waits.size());
    TEST_ASSERT_EQUAL_INT(1, f.state->closeCount);
}

static void test_disconnect_with_zero_delay_skips_pauses() {
    SessionFixture f(0);
    f.session->connect("SmartPAD MIDI 1");
    f.resetLog();

    f.session->disconnect();
    TEST_ASSERT_EQUAL_INT(64, f.state->countKind(DeviceCommand::NOTE_OFF));
    TEST_ASSERT_EQUAL_INT(0, (int)f.waits.size());
}

static void test_disconnect_when_idle_reports_disconnected() {
    SessionFixture f;
    f.session->disconnect();
    TEST_ASSERT_EQUAL_INT(0, f.state->closeCount);
    TEST_ASSERT_EQUAL_STRING("Disconnected", f.lastStatus().c_str());
}

static void test_destructor_clears_connected_device() {
    SessionFixture f;
    f.session->connect("SmartPAD MIDI 1");
    f.resetLog();

    std::shared_ptr<FakeTransportState> state = f.state;
    f.session.reset();
    TEST_ASSERT_EQUAL_INT(64, state->countKind(DeviceCommand::NOTE_OFF));
    TEST_ASSERT_EQUAL_INT(1, state->closeCount);
    // Callbacks are detached before teardown
    TEST_ASSERT_EQUAL_INT(0, (int)f.statuses.size());
}

//==============================================================================
// Sending
//==============================================================================

static void test_send_requires_connection() {
    SessionFixture f;
    TEST_ASSERT_FALSE(f.session->setPad(0, grid::PAD_RED));
    TEST_ASSERT_FALSE(f.session->showGrid(grid::blankGrid()));
    TEST_ASSERT_FALSE(f.session->clearDevice());
    TEST_ASSERT_EQUAL_INT(0, (int)f.state->sent.size());
}

static void test_set_pad_sends_off_then_on() {
    SessionFixture f;
    f.session->connect("SmartPAD MIDI 1");
    f.resetLog();

    TEST_ASSERT_TRUE(f.session->setPad(grid::padIndex(1, 2), grid::PAD_PURPLE));
    TEST_ASSERT_EQUAL_INT(2, (int)f.state->sent.size());
    TEST_ASSERT_TRUE(f.state->sent[0] == DeviceCommand::noteOff(0, 18));
    TEST_ASSERT_TRUE(f.state->sent[1] == DeviceCommand::noteOn(0, 18, 49));
    TEST_ASSERT_EQUAL_INT(1, (int)f.waits.size());
    TEST_ASSERT_EQUAL_INT(1000, (int)f.waits[0]);
}

static void test_set_pad_invalid_index_fails() {
    SessionFixture f;
    f.session->connect("SmartPAD MIDI 1");
    f.resetLog();
    TEST_ASSERT_FALSE(f.session->setPad(64, grid::PAD_RED));
    TEST_ASSERT_EQUAL_INT(0, (int)f.state->sent.size());
    TEST_ASSERT_TRUE(f.session->isConnected());
}

static void test_show_grid_sends_lit_pads() {
    SessionFixture f;
    f.session->connect("SmartPAD MIDI 1");
    f.resetLog();

    grid::PadGrid colors = grid::blankGrid();
    colors[5] = grid::PAD_GREEN;
    colors[6] = grid::PAD_RED;
    TEST_ASSERT_TRUE(f.session->showGrid(colors));
    TEST_ASSERT_EQUAL_INT(64, f.state->countKind(DeviceCommand::NOTE_OFF));
    TEST_ASSERT_EQUAL_INT(2, f.state->countKind(DeviceCommand::NOTE_ON));
    TEST_ASSERT_EQUAL_INT(0, f.state->countKind(DeviceCommand::WAIT));
}

static void test_lost_connection_drops_session() {
    SessionFixture f;
    f.session->connect("SmartPAD MIDI 1");
    f.resetLog();

    f.state->sendCount = 0;
    f.state->failSendAt = 3;
    f.state->failSendLost = true;
    TEST_ASSERT_FALSE(f.session->showGrid(grid::blankGrid()));
    TEST_ASSERT_FALSE(f.session->isConnected());
    TEST_ASSERT_EQUAL_INT(2, (int)f.state->sent.size());
    TEST_ASSERT_FALSE(f.lastConnected());
    TEST_ASSERT_TRUE(startsWith(f.lastStatus(), "Connection to SmartPAD MIDI 1 lost"));
    TEST_ASSERT_EQUAL_INT(1, (int)f.errors.size());
}

static void test_transient_send_error_continues_batch() {
    SessionFixture f;
    f.session->connect("SmartPAD MIDI 1");
    f.resetLog();

    f.state->sendCount = 0;
    f.state->failSendAt = 1;
    f.state->failSendLost = false;
    TEST_ASSERT_FALSE(f.session->showGrid(grid::blankGrid()));
    TEST_ASSERT_TRUE(f.session->isConnected());
    TEST_ASSERT_EQUAL_INT(63, (int)f.state->sent.size());
    TEST_ASSERT_EQUAL_INT(1, (int)f.errors.size());
}

static void test_vanished_port_reads_as_disconnected() {
    SessionFixture f;
    f.session->connect("SmartPAD MIDI 1");
    f.state->portVanished = true;
    TEST_ASSERT_FALSE(f.session->isConnected());
    TEST_ASSERT_FALSE(f.session->setPad(0, grid::PAD_RED));

    // Reconnecting replaces the dead handle
    TEST_ASSERT_TRUE(f.session->connect("SmartPAD MIDI 1"));
    TEST_ASSERT_TRUE(f.session->isConnected());
}

//==============================================================================
// Test Runner
//==============================================================================

void run_session_tests() {
    // Connecting
    RUN_TEST(test_connect_opens_and_clears_grid);
    RUN_TEST(test_connect_empty_address_fails);
    RUN_TEST(test_connect_same_address_is_noop);
    RUN_TEST(test_connect_other_address_disconnects_first);
    RUN_TEST(test_connect_open_failure_reports);

    // Auto-detection
    RUN_TEST(test_keyword_selector_is_case_insensitive);
    RUN_TEST(test_keyword_selector_port_order_wins);
    RUN_TEST(test_keyword_selector_no_match_is_empty);
    RUN_TEST(test_connect_auto_picks_matching_port);
    RUN_TEST(test_connect_auto_without_ports);
    RUN_TEST(test_connect_auto_without_match);
    RUN_TEST(test_port_listing_failure_is_reported);

    // Disconnecting
    RUN_TEST(test_disconnect_clears_settles_and_closes);
    RUN_TEST(test_disconnect_without_clear);
    RUN_TEST(test_disconnect_with_zero_delay_skips_pauses);
    RUN_TEST(test_disconnect_when_idle_reports_disconnected);
    RUN_TEST(test_destructor_clears_connected_device);

    // Sending
    RUN_TEST(test_send_requires_connection);
    RUN_TEST(test_set_pad_sends_off_then_on);
    RUN_TEST(test_set_pad_invalid_index_fails);
    RUN_TEST(test_show_grid_sends_lit_pads);
    RUN_TEST(test_lost_connection_drops_session);
    RUN_TEST(test_transient_send_error_continues_batch);
    RUN_TEST(test_vanished_port_reads_as_disconnected);
}
