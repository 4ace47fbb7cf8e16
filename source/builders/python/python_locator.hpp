#ifndef POLYBUILD_PYTHON_LOCATOR_HPP
#define POLYBUILD_PYTHON_LOCATOR_HPP

// Finds a Python interpreter: the configured one, then python3/python on PATH,
// then the usual install locations.

#include <string>
#include <vector>

#include "core/builder_abi.hpp"

namespace python_locator {

// Checked in order after PATH.
extern const std::vector<std::string> COMMON_LOCATIONS;

// Full path (or the configured name) of the interpreter, or "" when none is found.
// Not cached: every call searches again.
std::string find_python_executable(const builder_abi::BuildContext &context);

} // namespace python_locator

#endif // POLYBUILD_PYTHON_LOCATOR_HPP
