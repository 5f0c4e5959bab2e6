// Gridlight: animation JSON files
#pragma once
#include <string>
#include <vector>
#include <jansson.h>
#include "sequence.hpp"

namespace gridlight {
namespace grid {

extern const char* const UNTITLED_ANIMATION_NAME;

// {name, frame_delay_ms, loop, frames: [[64 color names], ...]}
json_t* sequenceDataToJson(const SequenceData& data);

// Lenient: missing fields take defaults, oversized input is truncated,
// malformed frames are skipped. Fails only when rootJ is not an object.
bool sequenceDataFromJson(json_t* rootJ, SequenceData& out);

// On failure the sequence is left untouched
bool loadAnimationFile(const std::string& path, AnimationSequence& sequence);
// Marks the sequence saved on success
bool saveAnimationFile(const std::string& path, AnimationSequence& sequence);

// Full paths of the *.json files in dir, sorted by name
std::vector<std::string> listAnimationFiles(const std::string& dir);
bool deleteAnimationFile(const std::string& path);

// Writes rootJ with 4-space indentation via a temporary file so a failed
// write never clobbers the existing file. Does not steal the reference.
bool writeJsonFile(const std::string& path, json_t* rootJ);

}} // namespace gridlight::grid
