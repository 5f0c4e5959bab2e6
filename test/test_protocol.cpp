/**
 * Gridlight - Device Protocol Encoder Tests
 *
 * Note mapping, velocity table and command ordering for single pad and
 * full grid updates.
 */

#include <unity.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "device/protocol.hpp"

using namespace gridlight;
using namespace gridlight::device;

static ProtocolEncoder encoderWithDelay(int64_t delayUs) {
    ProtocolConfig cfg;
    cfg.interCommandDelayUs = delayUs;
    return ProtocolEncoder(cfg);
}

static int countKind(const CommandList& cmds, DeviceCommand::Kind kind) {
    int n = 0;
    for (const DeviceCommand& c : cmds) if (c.kind == kind) ++n;
    return n;
}

//==============================================================================
// Mapping tables
//==============================================================================

static void test_pad_note_uses_row_stride_of_sixteen() {
    TEST_ASSERT_EQUAL_INT(0, ProtocolEncoder::padNote(0));
    TEST_ASSERT_EQUAL_INT(7, ProtocolEncoder::padNote(7));
    TEST_ASSERT_EQUAL_INT(16, ProtocolEncoder::padNote(8));
    TEST_ASSERT_EQUAL_INT(35, ProtocolEncoder::padNote(grid::padIndex(2, 3)));
    TEST_ASSERT_EQUAL_INT(119, ProtocolEncoder::padNote(63));
}

static void test_pad_note_rejects_invalid_pad() {
    bool threw = false;
    try {
        ProtocolEncoder::padNote(64);
    }
    catch (const std::out_of_range&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
}

static void test_note_to_pad_inverse() {
    TEST_ASSERT_EQUAL_INT(0, ProtocolEncoder::padIndexForNote(0));
    TEST_ASSERT_EQUAL_INT(19, ProtocolEncoder::padIndexForNote(35));
    TEST_ASSERT_EQUAL_INT(63, ProtocolEncoder::padIndexForNote(119));
    // Columns 8..15 of each row are not on the grid
    TEST_ASSERT_EQUAL_INT(-1, ProtocolEncoder::padIndexForNote(8));
    TEST_ASSERT_EQUAL_INT(-1, ProtocolEncoder::padIndexForNote(128));
    TEST_ASSERT_EQUAL_INT(-1, ProtocolEncoder::padIndexForNote(-3));
}

static void test_color_velocities() {
    TEST_ASSERT_EQUAL_INT(0, ProtocolEncoder::colorVelocity(grid::PAD_OFF));
    TEST_ASSERT_EQUAL_INT(1, ProtocolEncoder::colorVelocity(grid::PAD_WHITE));
    TEST_ASSERT_EQUAL_INT(17, ProtocolEncoder::colorVelocity(grid::PAD_YELLOW));
    TEST_ASSERT_EQUAL_INT(33, ProtocolEncoder::colorVelocity(grid::PAD_LIGHTBLUE));
    TEST_ASSERT_EQUAL_INT(49, ProtocolEncoder::colorVelocity(grid::PAD_PURPLE));
    TEST_ASSERT_EQUAL_INT(65, ProtocolEncoder::colorVelocity(grid::PAD_DARKBLUE));
    TEST_ASSERT_EQUAL_INT(81, ProtocolEncoder::colorVelocity(grid::PAD_GREEN));
    TEST_ASSERT_EQUAL_INT(97, ProtocolEncoder::colorVelocity(grid::PAD_RED));
}

//==============================================================================
// Single pad
//==============================================================================

static void test_single_lit_pad_is_off_wait_on() {
    ProtocolEncoder enc = encoderWithDelay(1000);
    CommandList cmds = enc.encodeSingle(9, grid::PAD_GREEN);
    TEST_ASSERT_EQUAL_INT(3, (int)cmds.size());
    TEST_ASSERT_TRUE(cmds[0] == DeviceCommand::noteOff(0, 17));
    TEST_ASSERT_TRUE(cmds[1] == DeviceCommand::wait(1000));
    TEST_ASSERT_TRUE(cmds[2] == DeviceCommand::noteOn(0, 17, 81));
}

static void test_every_pad_and_color_sends_off_before_on() {
    ProtocolEncoder enc = encoderWithDelay(1000);
    const std::vector<grid::PadColor>& colors = grid::allColors();
    TEST_ASSERT_EQUAL_INT(8, (int)colors.size());
    for (int pad = 0; pad < grid::PAD_COUNT; ++pad) {
        for (grid::PadColor color : colors) {
            CommandList cmds = enc.encodeSingle(pad, color);
            int note = ProtocolEncoder::padNote(pad);
            TEST_ASSERT_TRUE(cmds[0] == DeviceCommand::noteOff(0, note));
            if (color == grid::PAD_OFF) {
                TEST_ASSERT_EQUAL_INT(1, (int)cmds.size());
                continue;
            }
            TEST_ASSERT_EQUAL_INT(3, (int)cmds.size());
            TEST_ASSERT_TRUE(cmds[1] == DeviceCommand::wait(1000));
            TEST_ASSERT_TRUE(cmds[2] == DeviceCommand::noteOn(0, note, ProtocolEncoder::colorVelocity(color)));
        }
    }
}

static void test_single_off_pad_is_note_off_only() {
    ProtocolEncoder enc = encoderWithDelay(1000);
    CommandList cmds = enc.encodeSingle(0, grid::PAD_OFF);
    TEST_ASSERT_EQUAL_INT(1, (int)cmds.size());
    TEST_ASSERT_EQUAL_INT(DeviceCommand::NOTE_OFF, cmds[0].kind);
}

static void test_single_pad_without_delay_has_no_wait() {
    ProtocolEncoder enc = encoderWithDelay(0);
    CommandList cmds = enc.encodeSingle(1, grid::PAD_RED);
    TEST_ASSERT_EQUAL_INT(2, (int)cmds.size());
    TEST_ASSERT_EQUAL_INT(0, countKind(cmds, DeviceCommand::WAIT));
}

static void test_single_pad_uses_configured_channel() {
    ProtocolConfig cfg;
    cfg.channel = 3;
    ProtocolEncoder enc(cfg);
    CommandList cmds = enc.encodeSingle(2, grid::PAD_WHITE);
    TEST_ASSERT_EQUAL_INT(3, cmds.front().channel);
    TEST_ASSERT_EQUAL_INT(3, cmds.back().channel);
}

//==============================================================================
// Full grid
//==============================================================================

static void test_grid_sends_all_offs_then_lit_ons() {
    ProtocolEncoder enc = encoderWithDelay(1000);
    grid::PadGrid colors = grid::blankGrid();
    colors[0] = grid::PAD_RED;
    colors[63] = grid::PAD_YELLOW;
    CommandList cmds = enc.encodeGrid(colors);

    TEST_ASSERT_EQUAL_INT(64 + 1 + 2, (int)cmds.size());
    for (int i = 0; i < 64; ++i) {
        TEST_ASSERT_EQUAL_INT(DeviceCommand::NOTE_OFF, cmds[i].kind);
        TEST_ASSERT_EQUAL_INT(ProtocolEncoder::padNote(i), cmds[i].note);
    }
    TEST_ASSERT_TRUE(cmds[64] == DeviceCommand::wait(2000));
    TEST_ASSERT_TRUE(cmds[65] == DeviceCommand::noteOn(0, 0, 97));
    TEST_ASSERT_TRUE(cmds[66] == DeviceCommand::noteOn(0, 119, 17));
}

static void test_grid_without_delay_has_no_wait() {
    ProtocolEncoder enc = encoderWithDelay(0);
    grid::PadGrid colors;
    colors.fill(grid::PAD_WHITE);
    CommandList cmds = enc.encodeGrid(colors);
    TEST_ASSERT_EQUAL_INT(128, (int)cmds.size());
    TEST_ASSERT_EQUAL_INT(0, countKind(cmds, DeviceCommand::WAIT));
    TEST_ASSERT_EQUAL_INT(64, countKind(cmds, DeviceCommand::NOTE_ON));
}

static void test_fully_lit_grid_is_in_address_order() {
    ProtocolEncoder enc = encoderWithDelay(1000);
    const std::vector<grid::PadColor>& palette = grid::allColors();
    grid::PadGrid colors;
    // Cycle through the lit colors so every velocity appears
    for (int i = 0; i < grid::PAD_COUNT; ++i) colors[i] = palette[1 + i % (palette.size() - 1)];
    CommandList cmds = enc.encodeGrid(colors);

    TEST_ASSERT_EQUAL_INT(64 + 1 + 64, (int)cmds.size());
    for (int i = 0; i < 64; ++i) {
        TEST_ASSERT_TRUE(cmds[i] == DeviceCommand::noteOff(0, ProtocolEncoder::padNote(i)));
    }
    TEST_ASSERT_TRUE(cmds[64] == DeviceCommand::wait(2000));
    for (int i = 0; i < 64; ++i) {
        int note = ProtocolEncoder::padNote(i);
        TEST_ASSERT_TRUE(cmds[65 + i] == DeviceCommand::noteOn(0, note, ProtocolEncoder::colorVelocity(colors[i])));
        if (i > 0) TEST_ASSERT_TRUE(cmds[65 + i].note > cmds[64 + i].note);
    }
}

static void test_clear_is_offs_and_pause_only() {
    ProtocolEncoder enc = encoderWithDelay(500);
    CommandList cmds = enc.encodeClear();
    TEST_ASSERT_EQUAL_INT(65, (int)cmds.size());
    TEST_ASSERT_EQUAL_INT(64, countKind(cmds, DeviceCommand::NOTE_OFF));
    TEST_ASSERT_EQUAL_INT(0, countKind(cmds, DeviceCommand::NOTE_ON));
    TEST_ASSERT_TRUE(cmds.back() == DeviceCommand::wait(1000));
}

static void test_grid_from_names() {
    ProtocolEncoder enc = encoderWithDelay(0);
    std::vector<std::string> names(64, "OFF");
    names[8] = "purple";
    CommandList cmds = enc.encodeGrid(names);
    TEST_ASSERT_EQUAL_INT(65, (int)cmds.size());
    TEST_ASSERT_TRUE(cmds.back() == DeviceCommand::noteOn(0, 16, 49));
}

static void test_grid_from_wrong_length_names_throws() {
    ProtocolEncoder enc;
    std::vector<std::string> names(63, "RED");
    bool threw = false;
    try {
        enc.encodeGrid(names);
    }
    catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
}

static void test_command_to_string() {
    TEST_ASSERT_EQUAL_STRING("on ch0 n16 v49", DeviceCommand::noteOn(0, 16, 49).toString().c_str());
    TEST_ASSERT_EQUAL_STRING("off ch2 n5", DeviceCommand::noteOff(2, 5).toString().c_str());
    TEST_ASSERT_EQUAL_STRING("wait 1000us", DeviceCommand::wait(1000).toString().c_str());
}

//==============================================================================
// Test Runner
//==============================================================================

void run_protocol_tests() {
    // Mapping tables
    RUN_TEST(test_pad_note_uses_row_stride_of_sixteen);
    RUN_TEST(test_pad_note_rejects_invalid_pad);
    RUN_TEST(test_note_to_pad_inverse);
    RUN_TEST(test_color_velocities);

    // Single pad
    RUN_TEST(test_single_lit_pad_is_off_wait_on);
    RUN_TEST(test_every_pad_and_color_sends_off_before_on);
    RUN_TEST(test_single_off_pad_is_note_off_only);
    RUN_TEST(test_single_pad_without_delay_has_no_wait);
    RUN_TEST(test_single_pad_uses_configured_channel);

    // Full grid
    RUN_TEST(test_grid_sends_all_offs_then_lit_ons);
    RUN_TEST(test_grid_without_delay_has_no_wait);
    RUN_TEST(test_fully_lit_grid_is_in_address_order);
    RUN_TEST(test_clear_is_offs_and_pause_only);
    RUN_TEST(test_grid_from_names);
    RUN_TEST(test_grid_from_wrong_length_names_throws);
    RUN_TEST(test_command_to_string);
}
