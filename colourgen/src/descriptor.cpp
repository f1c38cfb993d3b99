#include <colourgen/descriptor.hpp>
#include <colourgen/brewer_table.hpp>

namespace colourgen {

namespace {

ColorDescriptor classify_string(const std::string& text,
                                const BrewerTable& table,
                                const NamedRampRegistry& registry) {
    if (text.empty()) {
        return Absent{};
    }
    if (auto family = registry.family_of(text)) {
        return NamedFunction{text, *family};
    }
    if (const BrewerPalette* palette = table.find(text)) {
        return CategoricalName{palette->name};
    }
    return ImageSource{text};
}

} // namespace

const char* descriptor_kind_name(const ColorDescriptor& descriptor) {
    switch (descriptor.index()) {
        case 0: return "Absent";
        case 1: return "NamedFunction";
        case 2: return "CategoricalName";
        case 3: return "RemoteId";
        case 4: return "ColorList";
        case 5: return "ImageSource";
        default: return "Unknown";
    }
}

ColorDescriptor classify(const ColourInput& input,
                         const BrewerTable& table,
                         const NamedRampRegistry& registry) {
    const auto& value = input.value();

    if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
        if (list->size() >= 2) {
            return ColorList{*list};
        }
        if (list->size() == 1) {
            return classify_string(list->front(), table, registry);
        }
        return Absent{};
    }
    if (const auto* id = std::get_if<int64_t>(&value)) {
        return RemoteId{*id};
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return classify_string(*text, table, registry);
    }
    return Absent{};
}

} // namespace colourgen
