#ifndef POLYBUILD_BUILDER_REGISTRY_HPP
#define POLYBUILD_BUILDER_REGISTRY_HPP

// The closed set of platform builders, looked up by platform.

#include <vector>

#include "core/builder_abi.hpp"

namespace builder_registry {

// nullptr for Unknown (or any platform without a builder). The returned table
// lives for the whole program and is safe to share between threads.
const builder_abi::PlatformBuilder *find_builder(project_platform::ProjectPlatform platform);

// Every registered builder, in detection priority order.
const std::vector<builder_abi::PlatformBuilder> &all_builders();

} // namespace builder_registry

#endif // POLYBUILD_BUILDER_REGISTRY_HPP
