#pragma once

#include <map>
#include <memory>
#include <vector>

#include "config/config_schema.hpp"
#include "images/execution_image.hpp"

namespace sandgrade::images {

// Track -> image table. Filled at startup, read-only afterwards.
class ImageRegistry {
public:
    void Register(std::unique_ptr<ExecutionImage> image);
    const ExecutionImage* Get(core::Track track) const;
    bool Has(core::Track track) const;
    std::vector<const ExecutionImage*> List() const;

    static ImageRegistry FromConfig(const config::EngineConfig& config);

private:
    std::map<core::Track, std::unique_ptr<ExecutionImage>> images_;
};

}  // namespace sandgrade::images
