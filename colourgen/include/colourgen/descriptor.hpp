#ifndef COLOURGEN_DESCRIPTOR_HPP
#define COLOURGEN_DESCRIPTOR_HPP

#include <colourgen/named_ramps.hpp>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace colourgen {

class BrewerTable;

/**
 * Raw, unclassified caller input: nothing, a string, an integer or a list
 * of strings.
 */
class ColourInput {
public:
    using Value = std::variant<std::monostate, std::string, int64_t, std::vector<std::string>>;

private:
    Value value_;

public:
    ColourInput() = default;
    ColourInput(const char* text) : value_(std::string(text ? text : "")) {}
    ColourInput(std::string text) : value_(std::move(text)) {}
    ColourInput(std::vector<std::string> colours) : value_(std::move(colours)) {}
    ColourInput(std::initializer_list<std::string> colours)
        : value_(std::vector<std::string>(colours)) {}

    template<typename T,
             typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
    ColourInput(T id) : value_(static_cast<int64_t>(id)) {}

    const Value& value() const { return value_; }
    bool empty() const { return std::holds_alternative<std::monostate>(value_); }
};

// Classified descriptor variants
struct NamedFunction {
    std::string name;
    RampFamily family;
};

struct CategoricalName {
    std::string key;  // Canonical BrewerTable key
};

struct RemoteId {
    int64_t id;
};

struct ColorList {
    std::vector<std::string> colours;  // At least two entries
};

struct ImageSource {
    std::string location;  // File path or URL
};

struct Absent {};

using ColorDescriptor = std::variant<Absent, NamedFunction, CategoricalName, RemoteId, ColorList, ImageSource>;

// Human-readable variant name for logs and diagnostics
const char* descriptor_kind_name(const ColorDescriptor& descriptor);

/**
 * Classify raw input into exactly one descriptor variant:
 *   list with >= 2 entries        -> ColorList
 *   list with 1 entry             -> classified as that string
 *   nothing, empty list or ""     -> Absent
 *   integer                       -> RemoteId
 *   registry ramp name            -> NamedFunction (case-sensitive)
 *   BrewerTable key (any casing)  -> CategoricalName
 *   any other string              -> ImageSource
 */
ColorDescriptor classify(const ColourInput& input,
                         const BrewerTable& table,
                         const NamedRampRegistry& registry);

} // namespace colourgen

#endif // COLOURGEN_DESCRIPTOR_HPP
