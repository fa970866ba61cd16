#include "images/image_registry.hpp"

#include "images/data_analysis_image.hpp"
#include "images/infra_cli_image.hpp"
#include "images/render_script_image.hpp"
#include "utils/logging.hpp"

namespace sandgrade::images {
namespace {

std::string ImageOr(const config::ImageConfig& config, const char* fallback) {
    return config.image.empty() ? std::string(fallback) : config.image;
}

std::vector<std::string> CommandOr(const config::ImageConfig& config, std::vector<std::string> fallback) {
    return config.command.empty() ? std::move(fallback) : config.command;
}

}  // namespace

void ImageRegistry::Register(std::unique_ptr<ExecutionImage> image) {
    const auto track = image->GetTrack();
    utils::LogDebug("registry", "image registered",
                    {{"track", core::ToString(track)}, {"image", image->ImageRef()}});
    images_[track] = std::move(image);
}

const ExecutionImage* ImageRegistry::Get(core::Track track) const {
    auto it = images_.find(track);
    if (it == images_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ImageRegistry::Has(core::Track track) const {
    return images_.find(track) != images_.end();
}

std::vector<const ExecutionImage*> ImageRegistry::List() const {
    std::vector<const ExecutionImage*> images;
    for (const auto& [_, image] : images_) {
        images.push_back(image.get());
    }
    return images;
}

ImageRegistry ImageRegistry::FromConfig(const config::EngineConfig& config) {
    ImageRegistry registry;
    registry.Register(std::make_unique<RenderScriptImage>(
        ImageOr(config.images.render_script, RenderScriptImage::kDefaultImage),
        CommandOr(config.images.render_script, RenderScriptImage::DefaultCommand())));
    registry.Register(std::make_unique<DataAnalysisImage>(
        config.runtime.datasets_dir,
        ImageOr(config.images.data_analysis, DataAnalysisImage::kDefaultImage),
        CommandOr(config.images.data_analysis, DataAnalysisImage::DefaultCommand())));
    registry.Register(std::make_unique<InfraCliImage>(
        ImageOr(config.images.infra_cli, InfraCliImage::kDefaultImage),
        CommandOr(config.images.infra_cli, InfraCliImage::DefaultCommand())));
    return registry;
}

}  // namespace sandgrade::images
