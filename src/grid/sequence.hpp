// Gridlight: animation sequence model and playback state machine
#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "frame.hpp"

namespace gridlight {
namespace grid {

constexpr int MAX_FRAMES = 999;
constexpr int MIN_FRAME_DELAY_MS = 20;
constexpr int DEFAULT_FRAME_DELAY_MS = 200;
constexpr int NO_FRAME = -1;
// Returned by addFrame/duplicateFrame when the sequence is full
constexpr int FRAME_LIMIT_REACHED = -1;
// Returned by duplicateFrame when the source index is not a frame
constexpr int INVALID_FRAME_INDEX = -2;

extern const char* const DEFAULT_SEQUENCE_NAME;

enum PlaybackState {
    PLAYBACK_STOPPED = 0,
    PLAYBACK_PLAYING,
    PLAYBACK_PAUSED
};

enum SequenceEvent {
    FRAMES_CHANGED = 0,      // value: affected frame index
    FRAME_CONTENT_UPDATED,   // value: frame index
    EDIT_FRAME_CHANGED,      // value: new edit cursor (-1 for none)
    PROPERTIES_CHANGED,      // value: unused (-1)
    PLAYBACK_STATE_CHANGED   // value: new PlaybackState
};

typedef std::function<void(SequenceEvent, int)> SequenceListener;

// Serializable part of a sequence
struct SequenceData {
    std::string name;
    int frameDelayMs;
    bool loop;
    std::vector<Frame> frames;

    SequenceData() : name(DEFAULT_SEQUENCE_NAME), frameDelayMs(DEFAULT_FRAME_DELAY_MS), loop(true) {}
};

int clampFrameDelay(int ms);

class AnimationSequence {
public:
    AnimationSequence();

    // Observers
    int addListener(SequenceListener listener);
    void removeListener(int id);
    // Bumped on every notification
    uint64_t getRevision() const { return revision; }

    // Properties
    const std::string& getName() const { return data.name; }
    void setName(const std::string& name);
    int getFrameDelayMs() const { return data.frameDelayMs; }
    void setFrameDelayMs(int ms);
    bool getLoop() const { return data.loop; }
    void setLoop(bool loop);

    // Frames
    int getFrameCount() const { return (int)data.frames.size(); }
    bool isFull() const { return getFrameCount() >= MAX_FRAMES; }
    const Frame* getFrame(int index) const;
    const Frame* getEditFrame() const;

    int getEditCursor() const { return editCursor; }
    void selectEditFrame(int index);
    void clearEditSelection();

    // Frame edits. atIndex outside [0, count] appends.
    int addFrame(int atIndex = -1);
    int addFrame(const std::vector<std::string>& colorNames, int atIndex = -1);
    int addFrame(const Frame& source, int atIndex = -1);
    bool deleteFrame(int index);
    int duplicateFrame(int index);
    bool moveFrame(int from, int to);

    bool updateEditFrameCell(int pad, PadColor color);
    bool updateEditFrameCell(int pad, const std::string& colorName);
    bool replaceEditFrame(const PadGrid& colors);

    // Playback
    PlaybackState getPlaybackState() const { return playbackState; }
    bool isPlaying() const { return playbackState == PLAYBACK_PLAYING; }
    int getPlaybackCursor() const { return playbackCursor; }
    bool start(int fromIndex = -1);
    void pause();
    void resume();
    void stop();
    // Yields the colors for the current tick and moves the cursor on.
    // Returns false (and stops) when nothing is playing.
    bool advance(PadGrid& out);

    // Lifecycle
    void newSequence();
    SequenceData toData() const;
    void loadData(const SequenceData& loaded, const std::string& path = "");
    bool isModified() const { return modified; }
    void markSaved(const std::string& path);
    const std::string& getFilePath() const { return filePath; }

private:
    SequenceData data;
    int editCursor = NO_FRAME;
    PlaybackState playbackState = PLAYBACK_STOPPED;
    int playbackCursor = 0;
    bool modified = false;
    std::string filePath;

    std::vector<std::pair<int, SequenceListener>> listeners;
    int nextListenerId = 1;
    uint64_t revision = 0;

    void notify(SequenceEvent event, int value);
    void markModified() { modified = true; }
    void setEditCursor(int index, bool force);
    void setPlaybackState(PlaybackState state);
    void replaceAll(const SequenceData& next);
};

}} // namespace gridlight::grid
