#ifndef COLOURGEN_BREWER_TABLE_HPP
#define COLOURGEN_BREWER_TABLE_HPP

#include <colourgen/color.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace colourgen {

enum class BrewerFamily {
    Sequential,
    Diverging,
    Qualitative
};

inline const char* brewer_family_name(BrewerFamily family) {
    switch (family) {
        case BrewerFamily::Sequential: return "sequential";
        case BrewerFamily::Diverging: return "diverging";
        case BrewerFamily::Qualitative: return "qualitative";
        default: return "unknown";
    }
}

struct BrewerPalette {
    std::string name;             // Canonical casing, e.g. "RdYlBu"
    BrewerFamily family;
    std::vector<Color> anchors;   // Maximum-class anchor list, at least 3
};

/**
 * Immutable mapping from categorical palette name to anchor colours.
 *
 * The bundled ColorBrewer dataset is parsed once per process by instance();
 * a malformed entry throws ConfigurationError. Lookups are case-insensitive
 * exact matches against the canonical keys.
 */
class BrewerTable {
private:
    std::vector<BrewerPalette> palettes_;

    explicit BrewerTable(std::vector<BrewerPalette> palettes)
        : palettes_(std::move(palettes)) {}

public:
    struct RawEntry {
        const char* name;
        BrewerFamily family;
        const char* anchors;  // Comma separated hex colours
    };

    // Process-wide table, loaded on first use
    static const BrewerTable& instance();

    /**
     * Build a table from raw entries. Every anchor must parse and every entry
     * needs at least 3 anchors and a unique name, else ConfigurationError.
     */
    static BrewerTable load(const RawEntry* entries, std::size_t count);

    // Bundled dataset
    static BrewerTable load_builtin();

    const BrewerPalette* find(std::string_view name) const;

    std::optional<std::vector<Color>> lookup(std::string_view name) const {
        const BrewerPalette* palette = find(name);
        if (!palette) {
            return std::nullopt;
        }
        return palette->anchors;
    }

    bool contains(std::string_view name) const { return find(name) != nullptr; }

    std::vector<std::string> names() const;
    std::vector<std::string> names_in_family(BrewerFamily family) const;
    std::size_t size() const { return palettes_.size(); }
};

} // namespace colourgen

#endif // COLOURGEN_BREWER_TABLE_HPP
