// Gridlight: named static layouts stored one JSON file per layout
#pragma once
#include <functional>
#include <string>
#include <vector>
#include "frame.hpp"

namespace gridlight {
namespace grid {

extern const char* const USER_LAYOUTS_SUBDIR;

struct LayoutEntry {
    std::string key;          // sanitized file stem
    std::string displayName;  // as typed by the user
};

// Files live in <baseDir>/user_static_layouts/<key>.json as
// {"display_name": ..., "layout_data": [64 color names]}.
// Lookups accept either the key or a case-insensitive display name.
class LayoutLibrary {
public:
    explicit LayoutLibrary(const std::string& baseDir);

    // Trim, drop anything but word characters, whitespace and '-',
    // collapse whitespace/'-' runs to '_', lowercase
    static std::string sanitizeName(const std::string& name);
    // "my_layout" -> "My Layout"
    static std::string displayNameFromKey(const std::string& key);

    const std::string& getDirectory() const { return layoutsDir; }

    // Sorted by display name; unreadable files are skipped
    std::vector<LayoutEntry> getLayouts() const;
    std::vector<std::string> getLayoutNames() const;

    bool saveLayout(const std::string& displayName, const std::vector<std::string>& colorNames);
    bool saveLayout(const std::string& displayName, const PadGrid& colors);
    bool loadLayout(const std::string& nameOrKey, PadGrid& out) const;
    // A layout that does not exist counts as deleted
    bool deleteLayout(const std::string& nameOrKey);

    std::function<void(const std::string&)> onError;
    std::function<void()> onListChanged;

private:
    std::string layoutsDir;

    std::string pathForKey(const std::string& key) const;
    bool resolvePath(const std::string& nameOrKey, std::string& path) const;
    void reportError(const std::string& message) const;
    void listChanged();
};

}} // namespace gridlight::grid
