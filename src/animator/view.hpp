// Read-only PadAnimator state for UI widgets, plus the editing surface they drive
#pragma once
#include <string>
#include "../grid/frame.hpp"

namespace gridlight { namespace animator {

// Controller surface for widgets that edit the sequence
struct PadAnimatorController {
    virtual ~PadAnimatorController() {}
    virtual void paintPad(int pad) = 0;        // brush color
    virtual void erasePad(int pad) = 0;
    virtual void selectFrame(int index) = 0;
};

struct PadAnimatorView {
    virtual ~PadAnimatorView() {}
    // Snapshot of what the grid should show (edit frame, or the playing frame)
    virtual grid::PadGrid getDisplayGrid() const = 0;
    virtual grid::PadColor getBrushColor() const = 0;

    virtual int getFrameCount() const = 0;
    // False when index is out of range
    virtual bool getFrameGrid(int index, grid::PadGrid& out) const = 0;
    virtual int getEditFrameIndex() const = 0;    // -1 none
    virtual int getPlayingFrameIndex() const = 0; // -1 when not playing
    virtual bool isPlaying() const = 0;
    virtual bool isPaused() const = 0;

    virtual bool isDeviceConnected() const = 0;
    virtual std::string getDeviceName() const = 0;
    virtual std::string getSequenceName() const = 0;
    virtual bool isSequenceModified() const = 0;
    virtual int getFrameDelayMs() const = 0;
    // Last status or error line, for the display
    virtual std::string getStatusMessage() const = 0;
};

}} // namespace gridlight::animator
