#ifndef MCPBRIDGE_HPP
#define MCPBRIDGE_HPP

// Main header that includes everything

#include <mcpbridge/bridge.hpp>
#include <mcpbridge/config.hpp>
#include <mcpbridge/errors.hpp>
#include <mcpbridge/result.hpp>
#include <mcpbridge/router.hpp>
#include <mcpbridge/summary.hpp>
#include <mcpbridge/transport.hpp>
#include <mcpbridge/types.hpp>
#include <mcpbridge/version.hpp>

#endif // MCPBRIDGE_HPP
