// Gridlight layout library
#include <algorithm>
#include <cctype>
#include <map>
#include <rack.hpp>
#include "layout_library.hpp"
#include "animation_file.hpp"

using namespace rack;

namespace gridlight {
namespace grid {

const char* const USER_LAYOUTS_SUBDIR = "user_static_layouts";

static bool isSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Non-ASCII bytes are kept so UTF-8 letters survive like word characters
static bool isWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

static std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return out;
}

static std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && isSpace(s[begin])) ++begin;
    while (end > begin && isSpace(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

LayoutLibrary::LayoutLibrary(const std::string& baseDir) {
    layoutsDir = system::join(baseDir, USER_LAYOUTS_SUBDIR);
    if (!system::isDirectory(layoutsDir))
        system::createDirectories(layoutsDir);
}

std::string LayoutLibrary::sanitizeName(const std::string& name) {
    std::string trimmed = trim(name);

    std::string kept;
    for (unsigned char c : trimmed) {
        if (isWordChar(c) || isSpace(c) || c == '-') kept += (char)c;
    }

    std::string collapsed;
    bool inRun = false;
    for (unsigned char c : kept) {
        if (isSpace(c) || c == '-') {
            if (!inRun) collapsed += '_';
            inRun = true;
        }
        else {
            collapsed += (char)c;
            inRun = false;
        }
    }
    return toLower(collapsed);
}

std::string LayoutLibrary::displayNameFromKey(const std::string& key) {
    std::string out;
    bool prevLetter = false;
    for (unsigned char c : key) {
        if (c == '_') c = ' ';
        bool letter = std::isalpha(c) != 0;
        if (letter) out += (char)(prevLetter ? std::tolower(c) : std::toupper(c));
        else out += (char)c;
        prevLetter = letter;
    }
    return out;
}

std::string LayoutLibrary::pathForKey(const std::string& key) const {
    return system::join(layoutsDir, key + ".json");
}

void LayoutLibrary::reportError(const std::string& message) const {
    WARN("%s", message.c_str());
    if (onError) onError(message);
}

void LayoutLibrary::listChanged() {
    if (onListChanged) onListChanged();
}

std::vector<LayoutEntry> LayoutLibrary::getLayouts() const {
    // display name -> key; a later file with the same display name wins
    std::map<std::string, std::string> byName;
    if (!system::isDirectory(layoutsDir)) return {};

    std::vector<std::string> entries = system::getEntries(layoutsDir);
    std::sort(entries.begin(), entries.end());
    for (const std::string& path : entries) {
        if (!system::isFile(path) || system::getExtension(path) != ".json") continue;
        std::string key = system::getStem(path);

        json_error_t error;
        json_t* rootJ = json_load_file(path.c_str(), 0, &error);
        if (!rootJ) {
            WARN("Could not parse layout file %s: %s. Skipping.", path.c_str(), error.text);
            continue;
        }
        json_t* nameJ = json_object_get(rootJ, "display_name");
        std::string displayName = json_is_string(nameJ) ? json_string_value(nameJ) : displayNameFromKey(key);
        json_decref(rootJ);
        byName[displayName] = key;
    }

    std::vector<LayoutEntry> layouts;
    for (auto& kv : byName) {
        LayoutEntry entry;
        entry.key = kv.second;
        entry.displayName = kv.first;
        layouts.push_back(entry);
    }
    return layouts;
}

std::vector<std::string> LayoutLibrary::getLayoutNames() const {
    std::vector<std::string> names;
    for (const LayoutEntry& entry : getLayouts()) names.push_back(entry.displayName);
    return names;
}

bool LayoutLibrary::resolvePath(const std::string& nameOrKey, std::string& path) const {
    std::string key = sanitizeName(nameOrKey);
    if (!key.empty() && system::isFile(pathForKey(key))) {
        path = pathForKey(key);
        return true;
    }
    std::string wanted = toLower(nameOrKey);
    for (const LayoutEntry& entry : getLayouts()) {
        if (toLower(entry.displayName) == wanted) {
            path = pathForKey(entry.key);
            return system::isFile(path);
        }
    }
    return false;
}

bool LayoutLibrary::saveLayout(const std::string& displayName, const std::vector<std::string>& colorNames) {
    if (trim(displayName).empty()) {
        reportError("Layout name cannot be empty.");
        return false;
    }
    if ((int)colorNames.size() != PAD_COUNT) {
        reportError("Invalid layout data: must be a list of 64 color names.");
        return false;
    }
    return saveLayout(displayName, Frame(colorNames).colors());
}

bool LayoutLibrary::saveLayout(const std::string& displayName, const PadGrid& colors) {
    std::string name = trim(displayName);
    if (name.empty()) {
        reportError("Layout name cannot be empty.");
        return false;
    }
    std::string key = sanitizeName(name);
    if (key.empty()) {
        reportError("Invalid layout name after sanitization.");
        return false;
    }

    json_t* rootJ = json_object();
    json_object_set_new(rootJ, "display_name", json_string(name.c_str()));
    json_t* dataJ = json_array();
    for (PadColor c : colors) json_array_append_new(dataJ, json_string(colorName(c)));
    json_object_set_new(rootJ, "layout_data", dataJ);

    std::string path = pathForKey(key);
    bool ok = writeJsonFile(path, rootJ);
    json_decref(rootJ);
    if (!ok) {
        reportError("Error saving layout '" + name + "' to " + path);
        return false;
    }
    INFO("Saved layout '%s' to %s", name.c_str(), path.c_str());
    listChanged();
    return true;
}

bool LayoutLibrary::loadLayout(const std::string& nameOrKey, PadGrid& out) const {
    std::string path;
    if (!resolvePath(nameOrKey, path)) return false;

    json_error_t error;
    json_t* rootJ = json_load_file(path.c_str(), 0, &error);
    if (!rootJ) {
        reportError("Error loading layout '" + nameOrKey + "' from " + path + ": " + error.text);
        return false;
    }

    json_t* dataJ = json_object_get(rootJ, "layout_data");
    if (!json_is_array(dataJ) || (int)json_array_size(dataJ) != PAD_COUNT) {
        json_decref(rootJ);
        reportError("Invalid data format in layout file: " + path);
        return false;
    }

    PadGrid colors = blankGrid();
    size_t i;
    json_t* colorJ;
    json_array_foreach(dataJ, i, colorJ) {
        colors[i] = json_is_string(colorJ) ? normalizeColor(json_string_value(colorJ)) : PAD_OFF;
    }
    json_decref(rootJ);
    out = colors;
    return true;
}

bool LayoutLibrary::deleteLayout(const std::string& nameOrKey) {
    std::string path;
    if (!resolvePath(nameOrKey, path)) return true;

    if (!system::remove(path)) {
        reportError("Error deleting layout file " + path);
        return false;
    }
    INFO("Deleted layout %s", path.c_str());
    listChanged();
    return true;
}

}} // namespace gridlight::grid
