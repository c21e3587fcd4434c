// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include <cstddef>
#include <cstdint>

namespace tributary {

    // Server id recorded on contexts whose configuration does not name one.
    constexpr const char* default_server_id                 = "tributary";

    // Separator between a parent id and the ordinal of one of its children.
    constexpr char        child_id_separator                = '_';

    // A context holds one slot of its own completion counter until its terminal call has been
    // processed. While an external completion link is outstanding, it holds one more.
    constexpr int32_t     own_processing_slots              = 1;
    constexpr int32_t     external_completion_slots         = 1;

    // Environment variables consulted by Context_config::from_environment().
    constexpr const char* env_flow_trace                    = "TRIBUTARY_FLOW_TRACE";
    constexpr const char* env_server_id                     = "TRIBUTARY_SERVER_ID";

    // Whenever control data is read and written in an array by multiple threads, the layout used
    // should not cause cache invalidations (false sharing). This setting is architecture specific,
    // but it's not really that different among different x86 CPUs.
    constexpr size_t      assumed_cache_line_size           = 0x40;
}
