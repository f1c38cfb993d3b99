#include <colourgen/strategies.hpp>
#include <colourgen/debug_log.hpp>
#include <algorithm>
#include <cctype>
#include <new>
#include <stdexcept>

namespace colourgen {

const char* strategy_kind_name(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Vector: return "vector";
        case StrategyKind::NamedRamp: return "named-ramp";
        case StrategyKind::CategoricalTable: return "categorical-table";
        case StrategyKind::RemoteId: return "remote-id";
        case StrategyKind::Image: return "image";
        case StrategyKind::Default: return "default";
        default: return "unknown";
    }
}

// ---------------------------------------------------------------------------
// DefaultStrategy
// ---------------------------------------------------------------------------

const std::vector<Color>& DefaultStrategy::anchors(bool orange_blue) {
    static const std::vector<Color> ORANGE_BLUE = {
        Color(0x9E, 0x3D, 0x22), Color(0xD9, 0x62, 0x2B), Color(0xF4, 0xA4, 0x62),
        Color(0xF2, 0xF2, 0xF2),
        Color(0x9B, 0xC0, 0xDE), Color(0x4A, 0x8C, 0xC4), Color(0x2B, 0x5C, 0x8A)
    };
    static const std::vector<Color> EARTH_EMERALD = {
        Color(0x77, 0x4F, 0x38), Color(0xA0, 0x74, 0x4E), Color(0xCF, 0xAE, 0x83),
        Color(0xF1, 0xED, 0xE3),
        Color(0x95, 0xCD, 0xB0), Color(0x3E, 0x9E, 0x74), Color(0x0B, 0x6E, 0x4F)
    };
    return orange_blue ? ORANGE_BLUE : EARTH_EMERALD;
}

ColorFunction DefaultStrategy::function(bool orange_blue) {
    return make_linear_ramp(anchors(orange_blue));
}

Result<ColorFunction> DefaultStrategy::try_resolve(const ColorDescriptor&, bool orange_blue) const {
    return function(orange_blue);
}

// ---------------------------------------------------------------------------
// VectorStrategy
// ---------------------------------------------------------------------------

bool VectorStrategy::accepts(const ColorDescriptor& descriptor) const {
    const auto* list = std::get_if<ColorList>(&descriptor);
    return list && list->colours.size() >= 2;
}

Result<ColorFunction> VectorStrategy::try_resolve(const ColorDescriptor& descriptor, bool) const {
    if (!accepts(descriptor)) {
        return mismatch(descriptor, "a list of at least two colours");
    }
    try {
        return make_linear_ramp(std::get<ColorList>(descriptor).colours);
    } catch (const ColourgenException& e) {
        return e.to_failure();
    }
}

// ---------------------------------------------------------------------------
// NamedRampStrategy
// ---------------------------------------------------------------------------

bool NamedRampStrategy::accepts(const ColorDescriptor& descriptor) const {
    const auto* named = std::get_if<NamedFunction>(&descriptor);
    return named && named->family == family_;
}

Result<ColorFunction> NamedRampStrategy::try_resolve(const ColorDescriptor& descriptor, bool) const {
    if (!accepts(descriptor)) {
        return mismatch(descriptor, std::string("a ").append(ramp_family_name(family_)).append(" ramp name").c_str());
    }
    const auto& named = std::get<NamedFunction>(descriptor);
    if (!available_) {
        return Result<ColorFunction>::failure(
            FailureKind::UnknownName,
            "Ramp family '" + std::string(ramp_family_name(family_)) + "' is not available for '" + named.name + "'");
    }
    const NamedRamp* ramp = registry_.find(named.name);
    if (!ramp) {
        return Result<ColorFunction>::failure(FailureKind::UnknownName, "No ramp named '" + named.name + "'");
    }
    return ramp->function;
}

// ---------------------------------------------------------------------------
// CategoricalTableStrategy
// ---------------------------------------------------------------------------

bool CategoricalTableStrategy::accepts(const ColorDescriptor& descriptor) const {
    return std::holds_alternative<CategoricalName>(descriptor);
}

Result<ColorFunction> CategoricalTableStrategy::try_resolve(const ColorDescriptor& descriptor, bool) const {
    if (!accepts(descriptor)) {
        return mismatch(descriptor, "a palette table key");
    }
    const auto& key = std::get<CategoricalName>(descriptor).key;
    auto anchors = table_.lookup(key);
    if (!anchors) {
        return Result<ColorFunction>::failure(FailureKind::UnknownName, "No palette table entry '" + key + "'");
    }
    return make_linear_ramp(std::move(*anchors));
}

// ---------------------------------------------------------------------------
// RemoteIdStrategy
// ---------------------------------------------------------------------------

bool RemoteIdStrategy::accepts(const ColorDescriptor& descriptor) const {
    return std::holds_alternative<RemoteId>(descriptor);
}

Url RemoteIdStrategy::palette_url(int64_t id) const {
    Url url;
    url.scheme = "http";
    url.host = host_;
    url.port = port_;
    url.target = "/api/palette/" + std::to_string(id);
    return url;
}

std::vector<std::string> RemoteIdStrategy::parse_palette_body(std::string_view body) {
    static constexpr std::string_view OPEN_TAG = "<hex>";
    static constexpr std::string_view CLOSE_TAG = "</hex>";

    std::vector<std::string> colours;
    while (!body.empty()) {
        std::size_t end = body.find('\n');
        std::string_view line = body.substr(0, end);
        body = (end == std::string_view::npos) ? std::string_view{} : body.substr(end + 1);

        // First complete <hex>...</hex> pair on the line, if any
        std::size_t open = line.find(OPEN_TAG);
        if (open == std::string_view::npos) {
            continue;
        }
        std::size_t start = open + OPEN_TAG.size();
        std::size_t close = line.find(CLOSE_TAG, start);
        if (close == std::string_view::npos) {
            continue;
        }
        std::string digits(line.substr(start, close - start));
        bool valid = digits.size() == 6 &&
                     std::all_of(digits.begin(), digits.end(),
                                 [](unsigned char c) { return std::isxdigit(c) != 0; });
        if (!valid) {
            throw MalformedSourceError("Invalid hex tag content '" + digits.substr(0, 32) + "'");
        }
        std::transform(digits.begin(), digits.end(), digits.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        colours.push_back("#" + digits);
    }
    if (colours.empty()) {
        throw MalformedSourceError("Palette response contains no colours");
    }
    return colours;
}

Result<ColorFunction> RemoteIdStrategy::try_resolve(const ColorDescriptor& descriptor, bool) const {
    if (!accepts(descriptor)) {
        return mismatch(descriptor, "a remote palette id");
    }
    if (!transport_) {
        return Result<ColorFunction>::failure(FailureKind::SourceUnavailable, "No transport configured");
    }

    const int64_t id = std::get<RemoteId>(descriptor).id;
    const Url url = palette_url(id);
    try {
        COLOURGEN_DEBUG_LOG("Fetching palette %lld from %s:%u%s",
                            static_cast<long long>(id), url.host.c_str(),
                            static_cast<unsigned>(url.port), url.target.c_str());
        HttpResponse response = transport_->get(url, timeout_);
        if (!response.is_success()) {
            return Result<ColorFunction>::failure(
                FailureKind::SourceUnavailable,
                "Palette service returned HTTP " + std::to_string(response.status));
        }
        return make_linear_ramp(parse_palette_body(response.body));
    } catch (const ColourgenException& e) {
        return e.to_failure();
    }
}

// ---------------------------------------------------------------------------
// ImageStrategy
// ---------------------------------------------------------------------------

namespace {

// A bare word has no directory separator and no extension
bool looks_like_path(const std::string& location) {
    return location.find_first_of("/\\.") != std::string::npos;
}

} // namespace

ImageStrategy::ImageStrategy(std::shared_ptr<HttpTransport> transport,
                             std::shared_ptr<const ImageDecoder> decoder,
                             const ResolverConfig& config)
    : transport_(std::move(transport)),
      decoder_(std::move(decoder)),
      timeout_(config.fetch_timeout) {
    palette_config_.cluster_count = config.image_cluster_count;
    palette_config_.sample_limit = config.image_sample_limit;
}

bool ImageStrategy::accepts(const ColorDescriptor& descriptor) const {
    return std::holds_alternative<ImageSource>(descriptor);
}

std::vector<uint8_t> ImageStrategy::load_bytes(const std::string& location) const {
    if (looks_like_url(location)) {
        auto url = Url::parse(location);
        if (!url) {
            throw SourceUnavailableError("Malformed image URL '" + location + "'");
        }
        if (!transport_) {
            throw SourceUnavailableError("No transport configured for '" + location + "'");
        }
        HttpResponse response = transport_->get(*url, timeout_);
        if (!response.is_success()) {
            throw SourceUnavailableError("Image fetch returned HTTP " + std::to_string(response.status));
        }
        return std::vector<uint8_t>(response.body.begin(), response.body.end());
    }

    try {
        return read_file_bytes(location);
    } catch (const SourceUnavailableError&) {
        if (!looks_like_path(location)) {
            throw UnknownNameError("'" + location + "' is not a ramp, palette table key or image file");
        }
        throw;
    }
}

Result<ColorFunction> ImageStrategy::try_resolve(const ColorDescriptor& descriptor, bool) const {
    if (!accepts(descriptor)) {
        return mismatch(descriptor, "an image location");
    }
    if (!decoder_) {
        return Result<ColorFunction>::failure(FailureKind::SourceUnavailable, "No image decoder configured");
    }

    const auto& location = std::get<ImageSource>(descriptor).location;
    try {
        std::vector<uint8_t> bytes = load_bytes(location);
        PixelImage image = decoder_->decode(bytes);
        std::vector<Color> anchors = extract_representative_colors(image, palette_config_);
        COLOURGEN_DEBUG_LOG("Image %s: %ux%u, %zu representative colours",
                            location.c_str(), image.width, image.height, anchors.size());
        return make_linear_ramp(std::move(anchors));
    } catch (const ColourgenException& e) {
        return e.to_failure();
    } catch (const std::bad_alloc&) {
        return Result<ColorFunction>::failure(FailureKind::MalformedSource,
                                              "Image '" + location + "' is too large to decode");
    } catch (const std::length_error&) {
        return Result<ColorFunction>::failure(FailureKind::MalformedSource,
                                              "Image '" + location + "' is too large to decode");
    }
}

} // namespace colourgen
