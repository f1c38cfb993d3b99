#ifndef COLOURGEN_STRATEGIES_HPP
#define COLOURGEN_STRATEGIES_HPP

#include <colourgen/brewer_table.hpp>
#include <colourgen/color.hpp>
#include <colourgen/config.hpp>
#include <colourgen/descriptor.hpp>
#include <colourgen/errors.hpp>
#include <colourgen/http_client.hpp>
#include <colourgen/image_decoder.hpp>
#include <colourgen/image_palette.hpp>
#include <colourgen/named_ramps.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace colourgen {

enum class StrategyKind {
    Vector,
    NamedRamp,
    CategoricalTable,
    RemoteId,
    Image,
    Default
};

const char* strategy_kind_name(StrategyKind kind);

/**
 * One classification-plus-resolution rule. accepts() is a pure shape test on
 * the descriptor; try_resolve() reports every recoverable problem as a
 * Failure and never throws for bad input.
 */
class ColorStrategy {
public:
    virtual ~ColorStrategy() = default;

    virtual StrategyKind kind() const = 0;
    virtual bool accepts(const ColorDescriptor& descriptor) const = 0;
    virtual Result<ColorFunction> try_resolve(const ColorDescriptor& descriptor,
                                              bool orange_blue) const = 0;

protected:
    static Result<ColorFunction> mismatch(const ColorDescriptor& descriptor, const char* expected) {
        return Result<ColorFunction>::failure(
            FailureKind::ClassificationMismatch,
            std::string("Expected ") + expected + ", got " + descriptor_kind_name(descriptor));
    }
};

/**
 * Terminal fallback. Always succeeds.
 */
class DefaultStrategy : public ColorStrategy {
public:
    StrategyKind kind() const override { return StrategyKind::Default; }
    bool accepts(const ColorDescriptor&) const override { return true; }
    Result<ColorFunction> try_resolve(const ColorDescriptor& descriptor, bool orange_blue) const override;

    // Tableau-style orange->blue diverging when true, earth->emerald otherwise
    static ColorFunction function(bool orange_blue);
    static const std::vector<Color>& anchors(bool orange_blue);
};

class VectorStrategy : public ColorStrategy {
public:
    StrategyKind kind() const override { return StrategyKind::Vector; }
    bool accepts(const ColorDescriptor& descriptor) const override;
    Result<ColorFunction> try_resolve(const ColorDescriptor& descriptor, bool orange_blue) const override;
};

/**
 * Resolves NamedFunction descriptors of one ramp family. An unavailable
 * family still accepts its names but fails with UnknownName.
 */
class NamedRampStrategy : public ColorStrategy {
private:
    const NamedRampRegistry& registry_;
    RampFamily family_;
    bool available_;

public:
    NamedRampStrategy(const NamedRampRegistry& registry, RampFamily family, bool available = true)
        : registry_(registry), family_(family), available_(available) {}

    StrategyKind kind() const override { return StrategyKind::NamedRamp; }
    bool accepts(const ColorDescriptor& descriptor) const override;
    Result<ColorFunction> try_resolve(const ColorDescriptor& descriptor, bool orange_blue) const override;

    RampFamily family() const { return family_; }
};

class CategoricalTableStrategy : public ColorStrategy {
private:
    const BrewerTable& table_;

public:
    explicit CategoricalTableStrategy(const BrewerTable& table) : table_(table) {}

    StrategyKind kind() const override { return StrategyKind::CategoricalTable; }
    bool accepts(const ColorDescriptor& descriptor) const override;
    Result<ColorFunction> try_resolve(const ColorDescriptor& descriptor, bool orange_blue) const override;
};

/**
 * Fetches a palette by numeric id from the remote palette service.
 */
class RemoteIdStrategy : public ColorStrategy {
private:
    std::shared_ptr<HttpTransport> transport_;
    std::string host_;
    uint16_t port_;
    std::chrono::milliseconds timeout_;

public:
    RemoteIdStrategy(std::shared_ptr<HttpTransport> transport, const ResolverConfig& config)
        : transport_(std::move(transport)),
          host_(config.service_host),
          port_(config.service_port),
          timeout_(config.fetch_timeout) {}

    StrategyKind kind() const override { return StrategyKind::RemoteId; }
    bool accepts(const ColorDescriptor& descriptor) const override;
    Result<ColorFunction> try_resolve(const ColorDescriptor& descriptor, bool orange_blue) const override;

    Url palette_url(int64_t id) const;

    /**
     * Extract "#XXXXXX" from every line containing <hex>XXXXXX</hex>, in
     * line order. Throws MalformedSourceError if a tag holds anything other
     * than 6 hex digits or if no tag is found.
     */
    static std::vector<std::string> parse_palette_body(std::string_view body);
};

/**
 * Derives a ramp from the dominant colours of a local image or http(s) URL.
 */
class ImageStrategy : public ColorStrategy {
private:
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<const ImageDecoder> decoder_;
    std::chrono::milliseconds timeout_;
    ImagePaletteConfig palette_config_;

    std::vector<uint8_t> load_bytes(const std::string& location) const;

public:
    ImageStrategy(std::shared_ptr<HttpTransport> transport,
                  std::shared_ptr<const ImageDecoder> decoder,
                  const ResolverConfig& config);

    StrategyKind kind() const override { return StrategyKind::Image; }
    bool accepts(const ColorDescriptor& descriptor) const override;
    Result<ColorFunction> try_resolve(const ColorDescriptor& descriptor, bool orange_blue) const override;
};

} // namespace colourgen

#endif // COLOURGEN_STRATEGIES_HPP
