// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"

#include <cstdint>
#include <string>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace tributary {

using context_id_type = std::string;


// Random (version 4) UUID in its canonical textual form. Used for root context ids, which
// double as correlation ids when the source did not provide one.
inline context_id_type make_context_id()
{
    // the generator is not thread safe, one per thread avoids a lock on every creation
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}


// Descendants are numbered per tree, in creation order starting from 1: "<root>_1",
// "<root>_2", ... The length of an id does not depend on the depth of the context.
inline context_id_type make_child_context_id(const context_id_type& root_id, uint64_t sequence)
{
    context_id_type id;
    id.reserve(root_id.size() + 1 + 20);
    id += root_id;
    id += child_id_separator;
    id += std::to_string(sequence);
    return id;
}

} // namespace tributary
