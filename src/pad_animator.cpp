#include "plugin.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <mutex>
#include <vector>
#include "grid/sequence.hpp"
#include "grid/animation_file.hpp"
#include "grid/layout_library.hpp"
#include "device/session.hpp"
#include "device/port_select.hpp"
#include "device/rack_midi_transport.hpp"
#include "animator/playback_driver.hpp"
#include "animator/view.hpp"
#include "animator/ui.hpp"
#include "graphics/pad_lighting.hpp"
#include "ui/menu_helpers.hpp"

using namespace gridlight;
using gridlight::graphics::PadLighting;

static const float MAX_FRAME_DELAY_PARAM_MS = 2000.f;
static const int64_t MAX_INTER_COMMAND_DELAY_US = 10000;

// Device work queued for the driver thread. The session is only ever used
// from that thread once the driver runs.
struct DeviceRequests {
    bool refresh = false;
    std::vector<std::pair<int, grid::PadColor>> pads;
    bool disconnect = false;
    bool autoConnect = false;
    std::string connectName;
    int driverId = -2; // >= -1 switches driver
};

struct PadAnimator : Module,
    public animator::PadAnimatorView,
    public animator::PadAnimatorController {
    enum ParamId {
        // Transport
        PLAY_PARAM,
        PAUSE_PARAM,
        STOP_PARAM,

        // Frame editing
        PREV_FRAME_PARAM,
        NEXT_FRAME_PARAM,
        ADD_FRAME_PARAM,
        DUPLICATE_FRAME_PARAM,
        DELETE_FRAME_PARAM,

        // Sequence properties
        LOOP_PARAM,
        DELAY_PARAM,

        BRUSH_PARAM,
        PARAMS_LEN
    };

    enum InputId {
        PLAY_INPUT,
        STOP_INPUT,
        INPUTS_LEN
    };

    enum OutputId {
        OUTPUTS_LEN
    };

    enum LightId {
        PLAYING_LIGHT,
        CONNECTED_LIGHT,
        ENUMS(BRUSH_LIGHT, 3),
        LIGHTS_LEN
    };

    // Button actions collected on the audio thread
    enum Action {
        ACTION_PLAY = 1 << 0,
        ACTION_PAUSE = 1 << 1,
        ACTION_STOP = 1 << 2,
        ACTION_PREV = 1 << 3,
        ACTION_NEXT = 1 << 4,
        ACTION_ADD = 1 << 5,
        ACTION_DUPLICATE = 1 << 6,
        ACTION_DELETE = 1 << 7
    };

    // Guards sequence and the playback display state below
    mutable std::mutex engineMutex;
    grid::AnimationSequence sequence;
    grid::PadGrid lastPlayedGrid = grid::blankGrid();
    int lastPlayedIndex = -1;
    bool holdingLastFrame = false;

    std::unique_ptr<device::DeviceSession> session;
    std::unique_ptr<animator::PlaybackDriver> driver;
    grid::LayoutLibrary layouts;
    std::string animationsDir;

    std::mutex requestMutex;
    DeviceRequests requests;

    mutable std::mutex statusMutex;
    std::string statusMessage;
    std::string connectedName;

    // Settings mirrored for the UI and audio threads
    std::atomic<bool> deviceConnected;
    std::atomic<bool> playingMirror;
    std::atomic<int> midiDriverId;
    std::atomic<int64_t> interCommandDelayUs;
    std::atomic<bool> autoConnect;
    std::atomic<int> lastDelayParamMs;
    std::atomic<bool> lastLoopParam;
    // Last device that connected, reused on patch load
    std::string deviceName;

    int pendingActions = 0;
    dsp::SchmittTrigger playTrigger;
    dsp::SchmittTrigger pauseTrigger;
    dsp::SchmittTrigger stopTrigger;
    dsp::SchmittTrigger prevTrigger;
    dsp::SchmittTrigger nextTrigger;
    dsp::SchmittTrigger addTrigger;
    dsp::SchmittTrigger duplicateTrigger;
    dsp::SchmittTrigger deleteTrigger;
    dsp::SchmittTrigger playInputTrigger;
    dsp::SchmittTrigger stopInputTrigger;

    PadAnimator()
        : layouts(asset::user("Gridlight")),
          deviceConnected(false), playingMirror(false), midiDriverId(-1),
          interCommandDelayUs(1000), autoConnect(true),
          lastDelayParamMs(grid::DEFAULT_FRAME_DELAY_MS), lastLoopParam(true) {
        config(PARAMS_LEN, INPUTS_LEN, OUTPUTS_LEN, LIGHTS_LEN);

        configButton(PLAY_PARAM, "Play");
        configButton(PAUSE_PARAM, "Pause");
        configButton(STOP_PARAM, "Stop");
        configButton(PREV_FRAME_PARAM, "Previous frame");
        configButton(NEXT_FRAME_PARAM, "Next frame");
        configButton(ADD_FRAME_PARAM, "Add blank frame");
        configButton(DUPLICATE_FRAME_PARAM, "Duplicate frame");
        configButton(DELETE_FRAME_PARAM, "Delete frame");

        configSwitch(LOOP_PARAM, 0.f, 1.f, 1.f, "Loop", {"Off", "On"});
        configParam(DELAY_PARAM, (float)grid::MIN_FRAME_DELAY_MS, MAX_FRAME_DELAY_PARAM_MS,
                    (float)grid::DEFAULT_FRAME_DELAY_MS, "Frame delay", " ms");
        paramQuantities[DELAY_PARAM]->snapEnabled = true;

        std::vector<std::string> brushLabels;
        for (grid::PadColor c : grid::allColors()) brushLabels.push_back(grid::colorName(c));
        configSwitch(BRUSH_PARAM, 0.f, (float)(grid::PAD_COLOR_COUNT - 1), (float)grid::PAD_RED, "Brush", brushLabels);

        configInput(PLAY_INPUT, "Play trigger");
        configInput(STOP_INPUT, "Stop trigger");

        configLight(PLAYING_LIGHT, "Playing");
        configLight(CONNECTED_LIGHT, "Device connected");
        configLight(BRUSH_LIGHT, "Brush color");

        animationsDir = asset::user("Gridlight/animations");

        midiDriverId = device::RackMidiTransport::defaultDriverId();
        session.reset(new device::DeviceSession(
            std::unique_ptr<device::DeviceTransport>(new device::RackMidiTransport(midiDriverId))));
        session->setStatusCallback([this](bool connected, const std::string& message) {
            onDeviceStatus(connected, message);
        });
        session->setErrorCallback([this](const std::string& message) {
            setStatus(message);
        });

        layouts.onError = [this](const std::string& message) { setStatus(message); };

        sequence.addListener([this](grid::SequenceEvent event, int value) {
            onSequenceEvent(event, value);
        });

        driver.reset(new animator::PlaybackDriver(
            [this]() { return playbackTick(); },
            [this]() { serviceDevice(); }));
        driver->start();
    }

    ~PadAnimator() {
        // Stop the worker before tearing down the device it uses
        driver->stop();
        session->disconnect(true);
    }

    // ------------------------------------------------------------------
    // Status

    void setStatus(const std::string& message) {
        std::lock_guard<std::mutex> lock(statusMutex);
        statusMessage = message;
    }

    void onDeviceStatus(bool connected, const std::string& message) {
        // A failed reconnect can report while the old port is still open
        bool open = session->isConnected();
        deviceConnected = open;
        {
            std::lock_guard<std::mutex> lock(statusMutex);
            statusMessage = message;
            connectedName = open ? session->getConnectedAddress() : std::string();
            if (open) deviceName = connectedName;
        }
        INFO("Gridlight device status: %s (%s)", connected ? "connected" : "disconnected", message.c_str());
    }

    // ------------------------------------------------------------------
    // Sequence observer. Runs with engineMutex held.

    void onSequenceEvent(grid::SequenceEvent event, int value) {
        switch (event) {
            case grid::EDIT_FRAME_CHANGED:
                if (sequence.getPlaybackState() == grid::PLAYBACK_STOPPED && !holdingLastFrame)
                    requestRefresh();
                break;
            case grid::PLAYBACK_STATE_CHANGED:
                playingMirror = (value == grid::PLAYBACK_PLAYING);
                if (value == grid::PLAYBACK_PLAYING)
                    driver->arm(sequence.getFrameDelayMs());
                break;
            case grid::PROPERTIES_CHANGED:
                driver->reschedule(sequence.getFrameDelayMs());
                syncPropertyParams();
                break;
            default:
                break;
        }
    }

    void syncPropertyParams() {
        // The knob tops out below the longest delay a file may carry
        int knobMs = std::min(sequence.getFrameDelayMs(), (int)MAX_FRAME_DELAY_PARAM_MS);
        if (lastDelayParamMs != knobMs) {
            lastDelayParamMs = knobMs;
            params[DELAY_PARAM].setValue((float)knobMs);
        }
        bool loop = sequence.getLoop();
        if (lastLoopParam != loop) {
            lastLoopParam = loop;
            params[LOOP_PARAM].setValue(loop ? 1.f : 0.f);
        }
    }

    // ------------------------------------------------------------------
    // Device requests (any thread)

    void requestRefresh() {
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            requests.refresh = true;
            requests.pads.clear();
        }
        driver->poke();
    }

    void requestPad(int pad, grid::PadColor color) {
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            if (!requests.refresh) requests.pads.push_back(std::make_pair(pad, color));
        }
        driver->poke();
    }

    void requestConnect(const std::string& name) {
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            requests.connectName = name;
            requests.autoConnect = false;
            requests.disconnect = false;
        }
        driver->poke();
    }

    void requestAutoConnect() {
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            requests.autoConnect = true;
            requests.connectName.clear();
            requests.disconnect = false;
        }
        driver->poke();
    }

    void requestDisconnect() {
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            requests.disconnect = true;
            requests.autoConnect = false;
            requests.connectName.clear();
        }
        driver->poke();
    }

    void requestDriver(int id) {
        if (id < 0) id = device::RackMidiTransport::defaultDriverId();
        midiDriverId = id;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            requests.driverId = id;
        }
        driver->poke();
    }

    // ------------------------------------------------------------------
    // Driver thread

    void syncEncoderConfig() {
        device::ProtocolConfig cfg = session->getEncoder().getConfig();
        int64_t delay = interCommandDelayUs;
        if (cfg.interCommandDelayUs != delay) {
            cfg.interCommandDelayUs = delay;
            session->getEncoder().setConfig(cfg);
        }
    }

    grid::PadGrid editFrameGrid() {
        std::lock_guard<std::mutex> lock(engineMutex);
        const grid::Frame* frame = sequence.getEditFrame();
        return frame ? frame->colors() : grid::blankGrid();
    }

    void serviceDevice() {
        DeviceRequests work;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            std::swap(work, requests);
        }
        syncEncoderConfig();

        if (work.driverId >= -1) {
            device::RackMidiTransport& transport = static_cast<device::RackMidiTransport&>(session->getTransport());
            if (transport.getDriverId() != work.driverId) {
                if (session->isConnected()) session->disconnect(true);
                transport.setDriverId(work.driverId);
            }
        }
        if (work.disconnect) {
            session->disconnect(true);
        }
        bool connected = false;
        if (!work.connectName.empty()) {
            connected = session->connect(work.connectName);
        }
        // A saved device that is gone falls back to keyword detection
        if (!connected && work.autoConnect) {
            connected = session->connectAuto(device::KeywordPortSelector());
        }
        if (connected) work.refresh = true;

        if (work.refresh) {
            bool stopped;
            {
                std::lock_guard<std::mutex> lock(engineMutex);
                stopped = sequence.getPlaybackState() == grid::PLAYBACK_STOPPED && !holdingLastFrame;
            }
            if (stopped) session->showGrid(editFrameGrid());
            return;
        }
        for (auto& pad : work.pads) {
            session->setPad(pad.first, pad.second);
        }
    }

    bool playbackTick() {
        syncEncoderConfig();
        if (!deviceConnected) {
            std::lock_guard<std::mutex> lock(engineMutex);
            holdingLastFrame = false;
            sequence.stop();
            return false;
        }

        grid::PadGrid frame;
        bool hasFrame;
        {
            std::lock_guard<std::mutex> lock(engineMutex);
            if (sequence.getPlaybackState() == grid::PLAYBACK_PAUSED) return false;
            int index = sequence.getPlaybackCursor();
            hasFrame = sequence.advance(frame);
            if (hasFrame) {
                lastPlayedGrid = frame;
                lastPlayedIndex = index;
                // Non-looping end: the final frame stays up for one more period
                holdingLastFrame = !sequence.isPlaying();
            }
            else {
                holdingLastFrame = false;
                lastPlayedIndex = -1;
            }
        }

        if (!hasFrame) {
            session->showGrid(editFrameGrid());
            return false;
        }
        session->showGrid(frame);
        return true;
    }

    // ------------------------------------------------------------------
    // Editing (caller holds engineMutex)

    void stopPlaybackLocked() {
        if (sequence.getPlaybackState() == grid::PLAYBACK_STOPPED && !holdingLastFrame) return;
        sequence.stop();
        holdingLastFrame = false;
        lastPlayedIndex = -1;
        driver->disarm();
        requestRefresh();
    }

    void playLocked() {
        if (!deviceConnected) {
            setStatus("Connect a pad device to play the animation.");
            return;
        }
        if (sequence.getPlaybackState() == grid::PLAYBACK_PAUSED) {
            sequence.resume();
            return;
        }
        stopPlaybackLocked();
        if (!sequence.start())
            setStatus("No frames to play.");
    }

    void pauseLocked() {
        sequence.pause();
        driver->disarm();
    }

    void stepEditFrameLocked(int delta) {
        int count = sequence.getFrameCount();
        if (count == 0) return;
        stopPlaybackLocked();
        int index = sequence.getEditCursor() + delta;
        sequence.selectEditFrame(rack::clamp(index, 0, count - 1));
    }

    void addFrameLocked() {
        stopPlaybackLocked();
        int at = sequence.getEditCursor() >= 0 ? sequence.getEditCursor() + 1 : -1;
        if (sequence.addFrame(at) == grid::FRAME_LIMIT_REACHED)
            setStatus(string::f("Frame limit reached (%d).", grid::MAX_FRAMES));
    }

    void duplicateFrameLocked() {
        stopPlaybackLocked();
        int current = sequence.getEditCursor();
        if (current == grid::NO_FRAME) {
            setStatus("No frame selected to duplicate.");
            return;
        }
        if (sequence.duplicateFrame(current) == grid::FRAME_LIMIT_REACHED)
            setStatus(string::f("Frame limit reached (%d).", grid::MAX_FRAMES));
    }

    void deleteFrameLocked() {
        stopPlaybackLocked();
        int current = sequence.getEditCursor();
        if (current == grid::NO_FRAME) {
            setStatus("No frame selected to delete.");
            return;
        }
        sequence.deleteFrame(current);
    }

    void applyActionsLocked(int actions) {
        if (actions & ACTION_STOP) stopPlaybackLocked();
        if (actions & ACTION_PAUSE) pauseLocked();
        if (actions & ACTION_PLAY) playLocked();
        if (actions & ACTION_PREV) stepEditFrameLocked(-1);
        if (actions & ACTION_NEXT) stepEditFrameLocked(1);
        if (actions & ACTION_ADD) addFrameLocked();
        if (actions & ACTION_DUPLICATE) duplicateFrameLocked();
        if (actions & ACTION_DELETE) deleteFrameLocked();
    }

    // ------------------------------------------------------------------
    // Audio thread

    void process(const ProcessArgs& args) override {
        if (playTrigger.process(params[PLAY_PARAM].getValue())) pendingActions |= ACTION_PLAY;
        if (pauseTrigger.process(params[PAUSE_PARAM].getValue())) pendingActions |= ACTION_PAUSE;
        if (stopTrigger.process(params[STOP_PARAM].getValue())) pendingActions |= ACTION_STOP;
        if (prevTrigger.process(params[PREV_FRAME_PARAM].getValue())) pendingActions |= ACTION_PREV;
        if (nextTrigger.process(params[NEXT_FRAME_PARAM].getValue())) pendingActions |= ACTION_NEXT;
        if (addTrigger.process(params[ADD_FRAME_PARAM].getValue())) pendingActions |= ACTION_ADD;
        if (duplicateTrigger.process(params[DUPLICATE_FRAME_PARAM].getValue())) pendingActions |= ACTION_DUPLICATE;
        if (deleteTrigger.process(params[DELETE_FRAME_PARAM].getValue())) pendingActions |= ACTION_DELETE;
        if (playInputTrigger.process(inputs[PLAY_INPUT].getVoltage(), 0.1f, 1.f)) pendingActions |= ACTION_PLAY;
        if (stopInputTrigger.process(inputs[STOP_INPUT].getVoltage(), 0.1f, 1.f)) pendingActions |= ACTION_STOP;

        int delayMs = (int)std::round(params[DELAY_PARAM].getValue());
        bool loop = params[LOOP_PARAM].getValue() > 0.5f;
        bool propertiesDirty = (delayMs != lastDelayParamMs) || (loop != lastLoopParam);

        if (pendingActions || propertiesDirty) {
            // Never block the audio thread; retry next sample
            std::unique_lock<std::mutex> lock(engineMutex, std::try_to_lock);
            if (lock.owns_lock()) {
                if (delayMs != lastDelayParamMs) {
                    lastDelayParamMs = delayMs;
                    sequence.setFrameDelayMs(delayMs);
                }
                if (loop != lastLoopParam) {
                    lastLoopParam = loop;
                    sequence.setLoop(loop);
                }
                int actions = pendingActions;
                pendingActions = 0;
                applyActionsLocked(actions);
            }
        }

        lights[PLAYING_LIGHT].setBrightnessSmooth(playingMirror ? 1.f : 0.f, args.sampleTime);
        lights[CONNECTED_LIGHT].setBrightness(deviceConnected ? 1.f : 0.f);
        PadLighting::setRGBLight(this, BRUSH_LIGHT, PadLighting::colorFor(getBrushColor()));
    }

    // ------------------------------------------------------------------
    // Menu operations (UI thread)

    void newAnimation() {
        std::lock_guard<std::mutex> lock(engineMutex);
        stopPlaybackLocked();
        sequence.newSequence();
        setStatus("New animation.");
    }

    void renameAnimation(const std::string& name) {
        if (name.empty()) return;
        std::lock_guard<std::mutex> lock(engineMutex);
        sequence.setName(name);
    }

    bool loadAnimation(const std::string& path) {
        std::lock_guard<std::mutex> lock(engineMutex);
        stopPlaybackLocked();
        if (!grid::loadAnimationFile(path, sequence)) {
            setStatus("Could not load " + system::getFilename(path));
            return false;
        }
        setStatus("Loaded " + sequence.getName());
        return true;
    }

    bool saveAnimation(const std::string& path) {
        std::lock_guard<std::mutex> lock(engineMutex);
        if (!grid::saveAnimationFile(path, sequence)) {
            setStatus("Could not save " + system::getFilename(path));
            return false;
        }
        setStatus("Saved " + system::getFilename(path));
        return true;
    }

    bool saveAnimationAs(const std::string& fileName) {
        std::string key = grid::LayoutLibrary::sanitizeName(fileName);
        if (key.empty()) {
            setStatus("Animation file name cannot be empty.");
            return false;
        }
        return saveAnimation(system::join(animationsDir, key + ".json"));
    }

    void deleteAnimation(const std::string& path) {
        if (grid::deleteAnimationFile(path)) setStatus("Deleted " + system::getFilename(path));
        else setStatus("Could not delete " + system::getFilename(path));
    }

    void applyLayout(const std::string& name) {
        grid::PadGrid colors;
        if (!layouts.loadLayout(name, colors)) {
            setStatus("Layout '" + name + "' not found.");
            return;
        }
        std::lock_guard<std::mutex> lock(engineMutex);
        stopPlaybackLocked();
        if (!sequence.replaceEditFrame(colors)) {
            setStatus("Select or add a frame before applying a layout.");
            return;
        }
        requestRefresh();
        setStatus("Applied layout " + name);
    }

    void saveLayout(const std::string& name) {
        grid::PadGrid colors = editFrameGrid();
        if (layouts.saveLayout(name, colors)) setStatus("Saved layout " + name);
    }

    void deleteLayout(const std::string& name) {
        if (layouts.deleteLayout(name)) setStatus("Deleted layout " + name);
    }

    void fillEditFrame(grid::PadColor color) {
        std::lock_guard<std::mutex> lock(engineMutex);
        stopPlaybackLocked();
        grid::PadGrid colors;
        colors.fill(color);
        if (sequence.replaceEditFrame(colors)) requestRefresh();
    }

    void moveEditFrame(int delta) {
        std::lock_guard<std::mutex> lock(engineMutex);
        stopPlaybackLocked();
        int from = sequence.getEditCursor();
        if (from == grid::NO_FRAME) return;
        sequence.moveFrame(from, from + delta);
    }

    // ------------------------------------------------------------------
    // PadAnimatorController

    void setPad(int pad, grid::PadColor color) {
        std::lock_guard<std::mutex> lock(engineMutex);
        stopPlaybackLocked();
        const grid::Frame* frame = sequence.getEditFrame();
        if (!frame) {
            setStatus("Add a frame to start painting.");
            return;
        }
        bool changed = frame->get(pad) != color;
        if (sequence.updateEditFrameCell(pad, color) && changed)
            requestPad(pad, color);
    }

    void paintPad(int pad) override { setPad(pad, getBrushColor()); }
    void erasePad(int pad) override { setPad(pad, grid::PAD_OFF); }

    void selectFrame(int index) override {
        std::lock_guard<std::mutex> lock(engineMutex);
        stopPlaybackLocked();
        sequence.selectEditFrame(index);
    }

    // ------------------------------------------------------------------
    // PadAnimatorView

    grid::PadGrid getDisplayGrid() const override {
        std::lock_guard<std::mutex> lock(engineMutex);
        if (sequence.getPlaybackState() != grid::PLAYBACK_STOPPED || holdingLastFrame) {
            if (lastPlayedIndex >= 0) return lastPlayedGrid;
        }
        const grid::Frame* frame = sequence.getEditFrame();
        return frame ? frame->colors() : grid::blankGrid();
    }

    grid::PadColor getBrushColor() const override {
        int v = (int)std::round(params[BRUSH_PARAM].value);
        return (grid::PadColor)rack::clamp(v, 0, grid::PAD_COLOR_COUNT - 1);
    }

    int getFrameCount() const override {
        std::lock_guard<std::mutex> lock(engineMutex);
        return sequence.getFrameCount();
    }

    bool getFrameGrid(int index, grid::PadGrid& out) const override {
        std::lock_guard<std::mutex> lock(engineMutex);
        const grid::Frame* frame = sequence.getFrame(index);
        if (!frame) return false;
        out = frame->colors();
        return true;
    }

    int getEditFrameIndex() const override {
        std::lock_guard<std::mutex> lock(engineMutex);
        return sequence.getEditCursor();
    }

    int getPlayingFrameIndex() const override {
        std::lock_guard<std::mutex> lock(engineMutex);
        if (sequence.getPlaybackState() == grid::PLAYBACK_STOPPED && !holdingLastFrame) return -1;
        return lastPlayedIndex;
    }

    bool isPlaying() const override { return playingMirror; }

    bool isPaused() const override {
        std::lock_guard<std::mutex> lock(engineMutex);
        return sequence.getPlaybackState() == grid::PLAYBACK_PAUSED;
    }

    bool isDeviceConnected() const override { return deviceConnected; }

    std::string getDeviceName() const override {
        std::lock_guard<std::mutex> lock(statusMutex);
        return connectedName;
    }

    std::string getSequenceName() const override {
        std::lock_guard<std::mutex> lock(engineMutex);
        return sequence.getName();
    }

    bool isSequenceModified() const override {
        std::lock_guard<std::mutex> lock(engineMutex);
        return sequence.isModified();
    }

    int getFrameDelayMs() const override {
        std::lock_guard<std::mutex> lock(engineMutex);
        return sequence.getFrameDelayMs();
    }

    std::string getStatusMessage() const override {
        std::lock_guard<std::mutex> lock(statusMutex);
        return statusMessage;
    }

    std::string getFilePath() const {
        std::lock_guard<std::mutex> lock(engineMutex);
        return sequence.getFilePath();
    }

    // ------------------------------------------------------------------
    // Lifecycle

    void onAdd(const AddEvent& e) override {
        if (!autoConnect) return;
        std::string name;
        {
            std::lock_guard<std::mutex> lock(statusMutex);
            name = deviceName;
        }
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            requests.autoConnect = true;
            requests.connectName = name;
            requests.disconnect = false;
        }
        driver->poke();
    }

    void onReset() override {
        std::lock_guard<std::mutex> lock(engineMutex);
        stopPlaybackLocked();
        sequence.newSequence();
    }

    json_t* dataToJson() override {
        json_t* rootJ = json_object();
        {
            std::lock_guard<std::mutex> lock(engineMutex);
            json_object_set_new(rootJ, "sequence", grid::sequenceDataToJson(sequence.toData()));
            json_object_set_new(rootJ, "filePath", json_string(sequence.getFilePath().c_str()));
        }
        {
            std::lock_guard<std::mutex> lock(statusMutex);
            json_object_set_new(rootJ, "deviceName", json_string(deviceName.c_str()));
        }
        json_object_set_new(rootJ, "midiDriverId", json_integer(midiDriverId));
        json_object_set_new(rootJ, "interCommandDelayUs", json_integer((json_int_t)interCommandDelayUs));
        json_object_set_new(rootJ, "autoConnect", json_boolean(autoConnect));
        return rootJ;
    }

    void dataFromJson(json_t* rootJ) override {
        if (json_t* seqJ = json_object_get(rootJ, "sequence")) {
            grid::SequenceData data;
            if (grid::sequenceDataFromJson(seqJ, data)) {
                json_t* pathJ = json_object_get(rootJ, "filePath");
                std::string path = json_is_string(pathJ) ? json_string_value(pathJ) : "";
                std::lock_guard<std::mutex> lock(engineMutex);
                stopPlaybackLocked();
                sequence.loadData(data, path);
            }
        }
        if (json_t* nameJ = json_object_get(rootJ, "deviceName")) {
            if (json_is_string(nameJ)) {
                std::lock_guard<std::mutex> lock(statusMutex);
                deviceName = json_string_value(nameJ);
            }
        }
        if (json_t* driverJ = json_object_get(rootJ, "midiDriverId")) {
            if (json_is_integer(driverJ)) requestDriver((int)json_integer_value(driverJ));
        }
        if (json_t* delayJ = json_object_get(rootJ, "interCommandDelayUs")) {
            if (json_is_integer(delayJ))
                interCommandDelayUs = std::min(std::max((int64_t)json_integer_value(delayJ), (int64_t)0), MAX_INTER_COMMAND_DELAY_US);
        }
        if (json_t* autoJ = json_object_get(rootJ, "autoConnect")) {
            autoConnect = json_boolean_value(autoJ);
        }
    }
};

// ============================================================================
// WIDGET
// ============================================================================

struct PadAnimatorWidget : ModuleWidget {
    PadAnimatorWidget(PadAnimator* module) {
        setModule(module);
        setPanel(createPanel(asset::plugin(pluginInstance, "res/panels/PadAnimator.svg")));

        addChild(createWidget<ScrewBlack>(Vec(RACK_GRID_WIDTH, 0)));
        addChild(createWidget<ScrewBlack>(Vec(box.size.x - 2 * RACK_GRID_WIDTH, 0)));
        addChild(createWidget<ScrewBlack>(Vec(RACK_GRID_WIDTH, RACK_GRID_HEIGHT - RACK_GRID_WIDTH)));
        addChild(createWidget<ScrewBlack>(Vec(box.size.x - 2 * RACK_GRID_WIDTH, RACK_GRID_HEIGHT - RACK_GRID_WIDTH)));

        animator::PadAnimatorView* view = module;
        animator::PadAnimatorController* ctrl = module;

        animator::AnimatorDisplayWidget* display = new animator::AnimatorDisplayWidget(view);
        display->box.pos = mm2px(Vec(5.0f, 12.0f));
        display->box.size = mm2px(Vec(71.28f, 17.0f));
        addChild(display);

        animator::PadGridWidget* padGrid = new animator::PadGridWidget(view, ctrl);
        padGrid->box.pos = mm2px(Vec(5.0f, 31.0f));
        padGrid->box.size = mm2px(Vec(71.28f, 71.28f));
        addChild(padGrid);

        animator::FrameStripWidget* strip = new animator::FrameStripWidget(view, ctrl);
        strip->box.pos = mm2px(Vec(5.0f, 104.0f));
        strip->box.size = mm2px(Vec(71.28f, 9.0f));
        addChild(strip);

        // Row 1: transport
        addParam(createParamCentered<VCVButton>(mm2px(Vec(10.0f, 118.5f)), module, PadAnimator::PLAY_PARAM));
        addParam(createParamCentered<VCVButton>(mm2px(Vec(19.0f, 118.5f)), module, PadAnimator::PAUSE_PARAM));
        addParam(createParamCentered<VCVButton>(mm2px(Vec(28.0f, 118.5f)), module, PadAnimator::STOP_PARAM));
        addChild(createLightCentered<MediumLight<GreenLight>>(mm2px(Vec(10.0f, 113.8f)), module, PadAnimator::PLAYING_LIGHT));
        addInput(createInputCentered<PJ301MPort>(mm2px(Vec(40.0f, 118.5f)), module, PadAnimator::PLAY_INPUT));
        addInput(createInputCentered<PJ301MPort>(mm2px(Vec(50.0f, 118.5f)), module, PadAnimator::STOP_INPUT));
        addParam(createParamCentered<CKSS>(mm2px(Vec(60.0f, 118.5f)), module, PadAnimator::LOOP_PARAM));
        addParam(createParamCentered<RoundSmallBlackKnob>(mm2px(Vec(71.0f, 118.5f)), module, PadAnimator::DELAY_PARAM));

        // Row 2: frame editing and brush
        addParam(createParamCentered<VCVButton>(mm2px(Vec(10.0f, 7.0f)), module, PadAnimator::PREV_FRAME_PARAM));
        addParam(createParamCentered<VCVButton>(mm2px(Vec(18.0f, 7.0f)), module, PadAnimator::NEXT_FRAME_PARAM));
        addParam(createParamCentered<VCVButton>(mm2px(Vec(28.0f, 7.0f)), module, PadAnimator::ADD_FRAME_PARAM));
        addParam(createParamCentered<VCVButton>(mm2px(Vec(36.0f, 7.0f)), module, PadAnimator::DUPLICATE_FRAME_PARAM));
        addParam(createParamCentered<VCVButton>(mm2px(Vec(44.0f, 7.0f)), module, PadAnimator::DELETE_FRAME_PARAM));
        addParam(createParamCentered<RoundBlackSnapKnob>(mm2px(Vec(58.0f, 7.0f)), module, PadAnimator::BRUSH_PARAM));
        addChild(createLightCentered<MediumLight<RedGreenBlueLight>>(mm2px(Vec(65.0f, 7.0f)), module, PadAnimator::BRUSH_LIGHT));
        addChild(createLightCentered<MediumLight<BlueLight>>(mm2px(Vec(72.0f, 7.0f)), module, PadAnimator::CONNECTED_LIGHT));
    }

    void appendDeviceMenu(Menu* menu, PadAnimator* module) {
        auto check = [](bool on){ return on ? "✓" : ""; };

        menu->addChild(createSubmenuItem("Device", "", [module, check](Menu* sub) {
            sub->addChild(createSubmenuItem("MIDI driver", "", [module, check](Menu* driverSub) {
                for (auto& d : device::RackMidiTransport::listDrivers()) {
                    int id = d.first;
                    driverSub->addChild(createMenuItem(d.second, check(module->midiDriverId == id), [module, id]() {
                        module->requestDriver(id);
                    }));
                }
            }));

            sub->addChild(new MenuSeparator);
            sub->addChild(createMenuLabel("Output port"));
            std::vector<std::string> ports = device::RackMidiTransport(module->midiDriverId).listAvailableAddresses();
            if (ports.empty()) sub->addChild(createMenuLabel("(no MIDI outputs)"));
            std::string current = module->getDeviceName();
            for (const std::string& port : ports) {
                sub->addChild(createMenuItem(port, check(port == current), [module, port]() {
                    module->requestConnect(port);
                }));
            }

            sub->addChild(new MenuSeparator);
            sub->addChild(createMenuItem("Auto-detect pad device", "", [module]() {
                module->requestAutoConnect();
            }));
            sub->addChild(createMenuItem("Disconnect", "", [module]() {
                module->requestDisconnect();
            }));
            sub->addChild(createMenuItem("Connect on patch load", check(module->autoConnect), [module]() {
                module->autoConnect = !module->autoConnect;
            }));
            sub->addChild(gridlight::ui::createFloatSlider(
                module,
                [](PadAnimator* m, float v) { m->interCommandDelayUs = (int64_t)std::round(v); },
                [](PadAnimator* m) { return (float)m->interCommandDelayUs; },
                0.f, (float)MAX_INTER_COMMAND_DELAY_US, 1000.f,
                "Inter-command delay", " ms", 0.001f, 2
            ));
        }));
    }

    void appendAnimationMenu(Menu* menu, PadAnimator* module) {
        menu->addChild(createSubmenuItem("Animation", "", [module](Menu* sub) {
            sub->addChild(createMenuItem("New animation", "", [module]() {
                module->newAnimation();
            }));

            sub->addChild(createMenuLabel("Name"));
            sub->addChild(new gridlight::ui::MenuTextEntry(module->getSequenceName(), "Animation name",
                [module](const std::string& text) { module->renameAnimation(text); }));

            std::string path = module->getFilePath();
            if (!path.empty()) {
                sub->addChild(createMenuItem("Save", system::getFilename(path), [module, path]() {
                    module->saveAnimation(path);
                }));
            }
            sub->addChild(createMenuLabel("Save as (file name, Enter to save)"));
            sub->addChild(new gridlight::ui::MenuTextEntry(
                path.empty() ? module->getSequenceName() : system::getStem(path), "file name",
                [module](const std::string& text) { module->saveAnimationAs(text); }));

            std::vector<std::string> files = grid::listAnimationFiles(module->animationsDir);
            sub->addChild(new MenuSeparator);
            sub->addChild(createSubmenuItem("Load", "", [module, files](Menu* loadSub) {
                if (files.empty()) loadSub->addChild(createMenuLabel("(no saved animations)"));
                for (const std::string& file : files) {
                    loadSub->addChild(createMenuItem(system::getStem(file), "", [module, file]() {
                        module->loadAnimation(file);
                    }));
                }
            }));
            sub->addChild(createSubmenuItem("Delete", "", [module, files](Menu* deleteSub) {
                if (files.empty()) deleteSub->addChild(createMenuLabel("(no saved animations)"));
                for (const std::string& file : files) {
                    deleteSub->addChild(createMenuItem(system::getStem(file), "", [module, file]() {
                        module->deleteAnimation(file);
                    }));
                }
            }));
        }));
    }

    void appendLayoutMenu(Menu* menu, PadAnimator* module) {
        menu->addChild(createSubmenuItem("Layouts", "", [module](Menu* sub) {
            std::vector<std::string> names = module->layouts.getLayoutNames();
            sub->addChild(createSubmenuItem("Apply to edit frame", "", [module, names](Menu* applySub) {
                if (names.empty()) applySub->addChild(createMenuLabel("(no saved layouts)"));
                for (const std::string& name : names) {
                    applySub->addChild(createMenuItem(name, "", [module, name]() {
                        module->applyLayout(name);
                    }));
                }
            }));
            sub->addChild(createMenuLabel("Save edit frame as (Enter to save)"));
            sub->addChild(new gridlight::ui::MenuTextEntry("", "layout name",
                [module](const std::string& text) { module->saveLayout(text); }));
            sub->addChild(createSubmenuItem("Delete", "", [module, names](Menu* deleteSub) {
                if (names.empty()) deleteSub->addChild(createMenuLabel("(no saved layouts)"));
                for (const std::string& name : names) {
                    deleteSub->addChild(createMenuItem(name, "", [module, name]() {
                        module->deleteLayout(name);
                    }));
                }
            }));
        }));
    }

    void appendContextMenu(Menu* menu) override {
        PadAnimator* module = dynamic_cast<PadAnimator*>(this->module);
        if (!module) return;

        menu->addChild(new MenuSeparator);
        appendDeviceMenu(menu, module);
        appendAnimationMenu(menu, module);
        appendLayoutMenu(menu, module);

        menu->addChild(createSubmenuItem("Edit frame", "", [module](Menu* sub) {
            sub->addChild(createMenuItem("Clear", "", [module]() {
                module->fillEditFrame(grid::PAD_OFF);
            }));
            sub->addChild(createMenuItem("Fill with brush", grid::colorName(module->getBrushColor()), [module]() {
                module->fillEditFrame(module->getBrushColor());
            }));
            sub->addChild(new MenuSeparator);
            sub->addChild(createMenuItem("Move earlier", "", [module]() { module->moveEditFrame(-1); }));
            sub->addChild(createMenuItem("Move later", "", [module]() { module->moveEditFrame(+1); }));
        }));
    }
};

Model* modelPadAnimator = createModel<PadAnimator, PadAnimatorWidget>("PadAnimator");
