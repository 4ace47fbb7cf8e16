#include "core/builder_registry.hpp"
#include "builders/dotnet/dotnet_builder.hpp"
#include "builders/node/node_builder.hpp"
#include "builders/python/python_builder.hpp"

namespace builder_registry {

const std::vector<builder_abi::PlatformBuilder> &all_builders() {
    static const std::vector<builder_abi::PlatformBuilder> builders = {
        dotnet_builder::make_builder(),
        node_builder::make_builder(),
        python_builder::make_builder(),
    };
    return builders;
}

const builder_abi::PlatformBuilder *find_builder(project_platform::ProjectPlatform platform) {
    for (const auto &builder : all_builders()) {
        if (builder.platform == platform) {
            return &builder;
        }
    }
    return nullptr;
}

} // namespace builder_registry
