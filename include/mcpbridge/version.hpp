#ifndef MCPBRIDGE_VERSION_HPP
#define MCPBRIDGE_VERSION_HPP

#include <string>

namespace mcpbridge
{

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace mcpbridge

#endif // MCPBRIDGE_VERSION_HPP
