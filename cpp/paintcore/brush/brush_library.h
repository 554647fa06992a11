#pragma once

#include "paintcore/brush/brush.h"
#include "paintcore/core/types.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Registry of built-in and user-created brushes. Lookups return copies or
// const pointers; a brush held by a stroke is never affected by later edits.
class BrushLibrary {
public:
    static constexpr const char* kDefaultBrushId = "pencil";

    BrushLibrary();

    const Brush* find(const std::string& id) const;
    std::vector<Brush> all() const;
    std::vector<Brush> byCategory(BrushCategory category) const;

    // Returns the new id ("custom-<n>"), or an empty string with err set.
    std::string createCustomBrush(const std::string& baseId, const std::string& name, const BrushSettings& settings, EngineError& err);
    EngineError updateBrushSettings(const std::string& id, const BrushSettings& settings);
    EngineError deleteCustomBrush(const std::string& id);

    // Registers a decoded preset as a customizable brush under a fresh
    // "imported-<n>" id. Returns an empty string with err set when invalid.
    std::string importBrush(Brush brush, EngineError& err);

    std::size_t customCount() const noexcept { return custom_.size(); }

private:
    void addBuiltin(Brush brush);

    std::vector<Brush> builtins_;
    std::map<std::string, Brush> custom_;
    std::uint32_t nextCustomId_{1};
    std::uint32_t nextImportedId_{1};
};

namespace paintcore {

Brush makeDefaultBrush();

} // namespace paintcore
