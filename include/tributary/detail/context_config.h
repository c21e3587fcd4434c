// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"

#include <cstdlib>
#include <string>
#include <string_view>

namespace tributary {

///\brief Settings a root context is created with. Children inherit the settings of their root.
///
/// The core never consults the environment on its own. Hosts that want the usual environment
/// driven behaviour construct the configuration with from_environment() and pass it along.
struct Context_config
{
    // Record the location of every processor a context passes through.
    bool        flow_trace = false;

    // Identifies the running server instance on every context it creates.
    std::string server_id = default_server_id;

    static Context_config from_environment()
    {
        Context_config config;
        if (const char* value = std::getenv(env_flow_trace)) {
            config.flow_trace = parse_flag(value);
        }
        if (const char* value = std::getenv(env_server_id)) {
            if (*value) {
                config.server_id = value;
            }
        }
        return config;
    }

    static bool parse_flag(std::string_view value)
    {
        return value == "1" || value == "true" || value == "TRUE" || value == "True" ||
               value == "on" || value == "ON" || value == "yes";
    }
};

} // namespace tributary
