// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

///\file
///\brief Public facade for the Tributary library.
///
///  Tributary is a header-only library that tracks a unit of work (an event) as it fans out
///  into nested, possibly concurrent scopes, and reports when all of it is done. This header
///  is the single entry point that applications should include.
///
///  The library is composed of three broad areas:
///  - *Event contexts* (the context tree, its terminal calls and its notification channels)
///  - *Synchronization primitives* (single-shot channels, deferred signals, the completion
///    counter)
///  - *Utilities* (configuration, logging, exceptions, id generation, delay fuzzing)


#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB
#define TRIBUTARY_UNDEF_BOOST_ALL_NO_LIB
#endif


#ifndef __cpp_inline_variables
#error Inline variables are not supported. Tributary requires this and other C++17 features.
#endif

#if defined(__clang__)
#   if !__has_feature(cxx_rtti)
#       error "Tributary requires RTTI (Run-Time Type Information). Enable it for your build (e.g. remove -fno-rtti)."
#   endif
#elif defined(__GNUC__)
#   if !defined(__GXX_RTTI)
#       error "Tributary requires RTTI (Run-Time Type Information). Rebuild with -frtti."
#   endif
#elif defined(_MSC_VER)
#   if !defined(_CPPRTTI)
#       error "Tributary requires RTTI (Run-Time Type Information). Rebuild with /GR."
#   endif
#endif


// -- Utilities --------------------------------------------------------------
// Logging goes through a replaceable callback, filtered by a process-wide level. The delay
// fuzzer perturbs the timing of the synchronization points; it is off unless a test enables
// it.
#include "detail/config.h"
#include "detail/logging.h"
#include "detail/delay_fuzzer.h"
#include "detail/exception.h"
#include "detail/id_types.h"
#include "detail/context_config.h"

// -- Synchronization primitives ---------------------------------------------
#include "detail/notification_channel.h"
#include "detail/deferred_signal.h"
#include "detail/completion_counter.h"

// -- Event contexts ---------------------------------------------------------
// The interfaces of the collaborators a context talks to (flow, exception handler, component
// location) come first; the context tree itself is split into declaration and definitions.
#include "detail/collaborators.h"
#include "detail/processing_time.h"
#include "detail/processors_trace.h"
#include "detail/context_registry.h"
#include "detail/event_context.h"
#include "detail/event_context_impl.h"


#ifdef TRIBUTARY_UNDEF_BOOST_ALL_NO_LIB
#undef BOOST_ALL_NO_LIB
#undef TRIBUTARY_UNDEF_BOOST_ALL_NO_LIB
#endif
