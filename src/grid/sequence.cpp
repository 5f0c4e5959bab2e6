// Gridlight animation sequence
#include <algorithm>
#include "sequence.hpp"

namespace gridlight {
namespace grid {

const char* const DEFAULT_SEQUENCE_NAME = "New Animation";

int clampFrameDelay(int ms) {
    return std::max(ms, MIN_FRAME_DELAY_MS);
}

AnimationSequence::AnimationSequence() {}

int AnimationSequence::addListener(SequenceListener listener) {
    int id = nextListenerId++;
    listeners.push_back(std::make_pair(id, listener));
    return id;
}

void AnimationSequence::removeListener(int id) {
    listeners.erase(std::remove_if(listeners.begin(), listeners.end(),
                                   [id](const std::pair<int, SequenceListener>& l) { return l.first == id; }),
                    listeners.end());
}

void AnimationSequence::notify(SequenceEvent event, int value) {
    ++revision;
    // Listeners may re-enter (select a frame, remove themselves)
    std::vector<std::pair<int, SequenceListener>> current = listeners;
    for (auto& l : current) {
        if (l.second) l.second(event, value);
    }
}

// ---------------------------------------------------------------------------
// Properties

void AnimationSequence::setName(const std::string& name) {
    if (name == data.name) return;
    data.name = name;
    markModified();
    notify(PROPERTIES_CHANGED, -1);
}

void AnimationSequence::setFrameDelayMs(int ms) {
    ms = clampFrameDelay(ms);
    if (ms == data.frameDelayMs) return;
    data.frameDelayMs = ms;
    markModified();
    notify(PROPERTIES_CHANGED, -1);
}

void AnimationSequence::setLoop(bool loop) {
    if (loop == data.loop) return;
    data.loop = loop;
    markModified();
    notify(PROPERTIES_CHANGED, -1);
}

// ---------------------------------------------------------------------------
// Frame access and edit cursor

const Frame* AnimationSequence::getFrame(int index) const {
    if (index < 0 || index >= getFrameCount()) return nullptr;
    return &data.frames[index];
}

const Frame* AnimationSequence::getEditFrame() const {
    return getFrame(editCursor);
}

void AnimationSequence::setEditCursor(int index, bool force) {
    if (index == editCursor && !force) return;
    editCursor = index;
    notify(EDIT_FRAME_CHANGED, editCursor);
}

void AnimationSequence::selectEditFrame(int index) {
    if (data.frames.empty()) {
        setEditCursor(NO_FRAME, false);
        return;
    }
    if (index < 0 || index >= getFrameCount()) index = 0;
    setEditCursor(index, false);
}

void AnimationSequence::clearEditSelection() {
    setEditCursor(NO_FRAME, false);
}

// ---------------------------------------------------------------------------
// Frame edits

int AnimationSequence::addFrame(int atIndex) {
    return addFrame(Frame(), atIndex);
}

int AnimationSequence::addFrame(const std::vector<std::string>& colorNames, int atIndex) {
    return addFrame(Frame(colorNames), atIndex);
}

int AnimationSequence::addFrame(const Frame& source, int atIndex) {
    if (isFull()) return FRAME_LIMIT_REACHED;

    int count = getFrameCount();
    int index = (atIndex < 0 || atIndex > count) ? count : atIndex;
    data.frames.insert(data.frames.begin() + index, source.clone());

    // Keep the playing frame in place when inserting before it
    if (playbackState != PLAYBACK_STOPPED && index <= playbackCursor && count > 0) {
        ++playbackCursor;
    }

    markModified();
    notify(FRAMES_CHANGED, index);
    // The frame under the cursor is new even when the index is unchanged
    setEditCursor(index, true);
    return index;
}

bool AnimationSequence::deleteFrame(int index) {
    if (index < 0 || index >= getFrameCount()) return false;

    data.frames.erase(data.frames.begin() + index);
    int count = getFrameCount();

    int previous = editCursor;
    int next = previous;
    if (count == 0) {
        next = NO_FRAME;
    }
    else if (previous == index) {
        next = index > 0 ? index - 1 : 0;
    }
    else if (previous > index) {
        next = previous - 1;
    }

    if (playbackCursor > index) --playbackCursor;
    if (playbackCursor >= count) playbackCursor = 0;

    markModified();
    notify(FRAMES_CHANGED, index);
    setEditCursor(next, previous == index);

    if (count == 0 && playbackState != PLAYBACK_STOPPED) stop();
    return true;
}

int AnimationSequence::duplicateFrame(int index) {
    const Frame* source = getFrame(index);
    if (!source) return INVALID_FRAME_INDEX;
    // Copy first: inserting may reallocate the frame storage
    Frame copy = source->clone();
    return addFrame(copy, index + 1);
}

bool AnimationSequence::moveFrame(int from, int to) {
    int count = getFrameCount();
    if (from < 0 || from >= count || to < 0 || to >= count) return false;
    if (from == to) return false;

    Frame moving = data.frames[from];
    data.frames.erase(data.frames.begin() + from);
    data.frames.insert(data.frames.begin() + to, moving);

    int cursor = editCursor;
    if (cursor == from) cursor = to;
    else if (from < cursor && cursor <= to) --cursor;
    else if (to <= cursor && cursor < from) ++cursor;

    markModified();
    notify(FRAMES_CHANGED, to);
    setEditCursor(cursor, false);
    return true;
}

bool AnimationSequence::updateEditFrameCell(int pad, PadColor color) {
    if (editCursor == NO_FRAME || !isValidPad(pad)) return false;
    if (!data.frames[editCursor].set(pad, color)) return true;
    markModified();
    notify(FRAME_CONTENT_UPDATED, editCursor);
    return true;
}

bool AnimationSequence::updateEditFrameCell(int pad, const std::string& colorName) {
    return updateEditFrameCell(pad, normalizeColor(colorName));
}

bool AnimationSequence::replaceEditFrame(const PadGrid& colors) {
    if (editCursor == NO_FRAME) return false;
    Frame& frame = data.frames[editCursor];
    bool changed = false;
    for (int i = 0; i < PAD_COUNT; ++i) {
        if (frame.set(i, colors[i])) changed = true;
    }
    if (changed) {
        markModified();
        notify(FRAME_CONTENT_UPDATED, editCursor);
    }
    return true;
}

// ---------------------------------------------------------------------------
// Playback

void AnimationSequence::setPlaybackState(PlaybackState state) {
    if (state == playbackState) return;
    playbackState = state;
    notify(PLAYBACK_STATE_CHANGED, (int)state);
}

bool AnimationSequence::start(int fromIndex) {
    int count = getFrameCount();
    if (count == 0) {
        // Nothing to play; pollers still see the rejected start
        notify(PLAYBACK_STATE_CHANGED, (int)playbackState);
        return false;
    }
    if (fromIndex >= 0 && fromIndex < count) playbackCursor = fromIndex;
    else if (editCursor >= 0 && editCursor < count) playbackCursor = editCursor;
    else playbackCursor = 0;
    setPlaybackState(PLAYBACK_PLAYING);
    return true;
}

void AnimationSequence::pause() {
    if (playbackState != PLAYBACK_PLAYING) return;
    setPlaybackState(PLAYBACK_PAUSED);
}

void AnimationSequence::resume() {
    if (playbackState != PLAYBACK_PAUSED) return;
    if (data.frames.empty()) {
        stop();
        return;
    }
    if (playbackCursor >= getFrameCount()) playbackCursor = 0;
    setPlaybackState(PLAYBACK_PLAYING);
}

void AnimationSequence::stop() {
    if (playbackState == PLAYBACK_STOPPED && playbackCursor == 0) return;
    playbackCursor = 0;
    setPlaybackState(PLAYBACK_STOPPED);
}

bool AnimationSequence::advance(PadGrid& out) {
    int count = getFrameCount();
    if (playbackState != PLAYBACK_PLAYING || count == 0) {
        stop();
        return false;
    }
    if (playbackCursor < 0 || playbackCursor >= count) playbackCursor = 0;

    out = data.frames[playbackCursor].colors();
    ++playbackCursor;
    if (playbackCursor >= count) {
        playbackCursor = 0;
        // The captured frame is still returned; the next call reports stopped
        if (!data.loop) setPlaybackState(PLAYBACK_STOPPED);
    }
    return true;
}

// ---------------------------------------------------------------------------
// Lifecycle

void AnimationSequence::replaceAll(const SequenceData& next) {
    PlaybackState before = playbackState;
    playbackState = PLAYBACK_STOPPED;
    playbackCursor = 0;

    data.name = next.name;
    data.frameDelayMs = clampFrameDelay(next.frameDelayMs);
    data.loop = next.loop;
    data.frames.clear();
    int limit = std::min((int)next.frames.size(), MAX_FRAMES);
    for (int i = 0; i < limit; ++i) {
        data.frames.push_back(next.frames[i].clone());
    }
    editCursor = data.frames.empty() ? NO_FRAME : 0;
    modified = false;

    if (before != PLAYBACK_STOPPED) notify(PLAYBACK_STATE_CHANGED, (int)PLAYBACK_STOPPED);
    notify(FRAMES_CHANGED, -1);
    notify(PROPERTIES_CHANGED, -1);
    notify(EDIT_FRAME_CHANGED, editCursor);
}

void AnimationSequence::newSequence() {
    replaceAll(SequenceData());
    filePath.clear();
}

SequenceData AnimationSequence::toData() const {
    return data;
}

void AnimationSequence::loadData(const SequenceData& loaded, const std::string& path) {
    replaceAll(loaded);
    filePath = path;
}

void AnimationSequence::markSaved(const std::string& path) {
    filePath = path;
    modified = false;
}

}} // namespace gridlight::grid
