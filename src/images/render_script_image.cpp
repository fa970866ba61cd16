#include "images/render_script_image.hpp"

namespace sandgrade::images {

RenderScriptImage::RenderScriptImage(std::string image_ref, std::vector<std::string> command)
    : TrackImage(core::Track::kRenderScript,
                 std::move(image_ref),
                 std::move(command)) {}

std::vector<std::string> RenderScriptImage::DefaultCommand() {
    return {"node", "/opt/reporter/render-reporter.js", kSourcePlaceholder};
}

std::string RenderScriptImage::SourceFileName(const core::TestSpec&) const {
    return "index.html";
}

std::string RenderScriptImage::ValidateCheck(const core::CheckSpec& check, const core::TestSpec&) const {
    const auto& params = check.params;
    if (check.kind == "script_runs") {
        return {};
    }
    if (!HasString(params, "selector")) {
        return check.kind.empty() ? "missing kind" : "requires a 'selector'";
    }
    if (check.kind == "element_exists") {
        return {};
    }
    if (check.kind == "selector_count") {
        if (!HasNumber(params, "count") && !HasNumber(params, "min") && !HasNumber(params, "max")) {
            return "selector_count requires 'count', 'min' or 'max'";
        }
        return {};
    }
    if (check.kind == "text_contains") {
        return HasString(params, "text") ? std::string() : "text_contains requires 'text'";
    }
    if (check.kind == "attribute_equals") {
        if (!HasString(params, "attribute") || !params.contains("value")) {
            return "attribute_equals requires 'attribute' and 'value'";
        }
        return {};
    }
    return "unknown render-script check kind '" + check.kind + "'";
}

}  // namespace sandgrade::images
