#pragma once

#include "images/execution_image.hpp"

namespace sandgrade::images {

// Markup/script submissions rendered in a headless browser; checks are
// selector assertions against the resulting DOM.
class RenderScriptImage : public TrackImage {
public:
    static constexpr const char* kDefaultImage = "sandgrade/render-script:1";

    explicit RenderScriptImage(std::string image_ref = kDefaultImage,
                               std::vector<std::string> command = DefaultCommand());

    static std::vector<std::string> DefaultCommand();

protected:
    std::string SourceFileName(const core::TestSpec& spec) const override;
    std::string ValidateCheck(const core::CheckSpec& check, const core::TestSpec& spec) const override;
};

}  // namespace sandgrade::images
