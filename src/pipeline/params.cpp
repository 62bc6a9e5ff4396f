#include "pipeline/params.hpp"

#include "log/log.hpp"

#include <utility>
#include <vector>

namespace kmake::pipeline {

BuildResult<BuildParameters> validate_parameters(const config::BuildConfig& cfg) {
    const std::vector<std::pair<const char*, const std::string*>> required = {
        {"PLATFORM", &cfg.platform},
        {"TARGET", &cfg.target},
    };

    for (const auto& [name, value] : required) {
        if (value->empty()) {
            return BuildError::configuration(std::string("Undefined variable \"") + name + "\"");
        }
    }

    KMAKE_LOG_DEBUG("params", "platform=" << cfg.platform << " target=" << cfg.target);
    return BuildParameters{cfg.platform, cfg.target};
}

} // namespace kmake::pipeline
