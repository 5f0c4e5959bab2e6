// Gridlight animation file load/save
#include <algorithm>
#include <climits>
#include <rack.hpp>
#include "animation_file.hpp"

using namespace rack;

namespace gridlight {
namespace grid {

const char* const UNTITLED_ANIMATION_NAME = "Untitled Animation";

json_t* sequenceDataToJson(const SequenceData& data) {
    json_t* rootJ = json_object();
    json_object_set_new(rootJ, "name", json_string(data.name.c_str()));
    json_object_set_new(rootJ, "frame_delay_ms", json_integer(data.frameDelayMs));
    json_object_set_new(rootJ, "loop", json_boolean(data.loop));

    json_t* framesJ = json_array();
    for (const Frame& frame : data.frames) {
        json_t* frameJ = json_array();
        for (PadColor c : frame.colors()) {
            json_array_append_new(frameJ, json_string(colorName(c)));
        }
        json_array_append_new(framesJ, frameJ);
    }
    json_object_set_new(rootJ, "frames", framesJ);
    return rootJ;
}

static bool frameFromJson(json_t* frameJ, Frame& out) {
    if (!json_is_array(frameJ) || (int)json_array_size(frameJ) != PAD_COUNT) return false;
    PadGrid colors = blankGrid();
    size_t i;
    json_t* colorJ;
    json_array_foreach(frameJ, i, colorJ) {
        colors[i] = json_is_string(colorJ) ? normalizeColor(json_string_value(colorJ)) : PAD_OFF;
    }
    out = Frame(colors);
    return true;
}

bool sequenceDataFromJson(json_t* rootJ, SequenceData& out) {
    if (!json_is_object(rootJ)) return false;

    SequenceData data;
    json_t* nameJ = json_object_get(rootJ, "name");
    data.name = json_is_string(nameJ) ? json_string_value(nameJ) : UNTITLED_ANIMATION_NAME;

    json_t* delayJ = json_object_get(rootJ, "frame_delay_ms");
    if (json_is_number(delayJ)) {
        // Saturate before narrowing; files may hold any JSON number
        double ms = std::min(json_number_value(delayJ), (double)INT_MAX);
        data.frameDelayMs = clampFrameDelay((int)std::max(ms, (double)MIN_FRAME_DELAY_MS));
    }

    json_t* loopJ = json_object_get(rootJ, "loop");
    if (json_is_boolean(loopJ))
        data.loop = json_boolean_value(loopJ);

    json_t* framesJ = json_object_get(rootJ, "frames");
    if (json_is_array(framesJ)) {
        size_t i;
        json_t* frameJ;
        json_array_foreach(framesJ, i, frameJ) {
            if ((int)i >= MAX_FRAMES) {
                WARN("Animation '%s' has more than %d frames, truncating", data.name.c_str(), MAX_FRAMES);
                break;
            }
            Frame frame;
            if (!frameFromJson(frameJ, frame)) {
                WARN("Skipping invalid frame %d in animation '%s'", (int)i, data.name.c_str());
                continue;
            }
            data.frames.push_back(frame);
        }
    }

    out = data;
    return true;
}

bool loadAnimationFile(const std::string& path, AnimationSequence& sequence) {
    json_error_t error;
    json_t* rootJ = json_load_file(path.c_str(), 0, &error);
    if (!rootJ) {
        WARN("Could not parse animation %s: %s (line %d)", path.c_str(), error.text, error.line);
        return false;
    }

    SequenceData data;
    bool ok = sequenceDataFromJson(rootJ, data);
    json_decref(rootJ);
    if (!ok) {
        WARN("Animation %s is not a JSON object", path.c_str());
        return false;
    }

    sequence.loadData(data, path);
    INFO("Loaded animation '%s' (%d frames) from %s", data.name.c_str(), (int)data.frames.size(), path.c_str());
    return true;
}

bool writeJsonFile(const std::string& path, json_t* rootJ) {
    std::string dir = system::getDirectory(path);
    if (!dir.empty() && !system::isDirectory(dir))
        system::createDirectories(dir);

    std::string tmpPath = path + ".tmp";
    if (json_dump_file(rootJ, tmpPath.c_str(), JSON_INDENT(4)) != 0) {
        WARN("Could not write %s", tmpPath.c_str());
        system::remove(tmpPath);
        return false;
    }
    if (!system::rename(tmpPath, path)) {
        WARN("Could not move %s into place", path.c_str());
        system::remove(tmpPath);
        return false;
    }
    return true;
}

bool saveAnimationFile(const std::string& path, AnimationSequence& sequence) {
    json_t* rootJ = sequenceDataToJson(sequence.toData());
    bool ok = writeJsonFile(path, rootJ);
    json_decref(rootJ);
    if (!ok) return false;

    sequence.markSaved(path);
    INFO("Saved animation '%s' to %s", sequence.getName().c_str(), path.c_str());
    return true;
}

std::vector<std::string> listAnimationFiles(const std::string& dir) {
    std::vector<std::string> paths;
    if (!system::isDirectory(dir)) return paths;
    for (const std::string& entry : system::getEntries(dir)) {
        if (system::isFile(entry) && system::getExtension(entry) == ".json")
            paths.push_back(entry);
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

bool deleteAnimationFile(const std::string& path) {
    if (!system::isFile(path)) return false;
    if (!system::remove(path)) {
        WARN("Could not delete animation %s", path.c_str());
        return false;
    }
    INFO("Deleted animation %s", path.c_str());
    return true;
}

}} // namespace gridlight::grid
