// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "collaborators.h"
#include "completion_counter.h"
#include "context_config.h"
#include "deferred_signal.h"
#include "id_types.h"
#include "notification_channel.h"
#include "processing_time.h"
#include "processors_trace.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace tributary {


enum class context_state : uint8_t
{
    pending,
    succeeded,
    failed
};

inline const char* to_string(context_state state) noexcept
{
    switch (state) {
        case context_state::pending:   return "pending";
        case context_state::succeeded: return "succeeded";
        case context_state::failed:    return "failed";
    }
    return "unknown";
}


// What the before-response and response channels deliver.
struct Response
{
    Event_ptr           result;     // may be null, also on success
    std::exception_ptr  error;      // set iff the context failed

    bool failed() const noexcept { return static_cast<bool>(error); }
};


// The completion channel carries no information besides having fired. It never fails.
struct completion_t {};


namespace detail {

// Shared by every context of one tree.
struct Context_tree
{
    explicit Context_tree(context_id_type root_id_)
        : root_id(std::move(root_id_))
    {}

    const context_id_type   root_id;
    std::atomic<uint64_t>   children_created{0};
};

struct Context_creation
{
    context_id_type                     id;
    std::string                         server_id;
    std::optional<std::string>          correlation_id;
    bool                                inherit_correlation = false;
    Location_ptr                        location;
    Exception_handler_ptr               exception_handler;
    Deferred_signal                     external_completion;
    std::shared_ptr<Event_context>      parent;
    std::shared_ptr<Context_tree>       tree;
    std::shared_ptr<Processing_time>    processing_time;
    Context_config                      config;
    bool                                explicit_id = false;
};

} // namespace detail


///\brief Tracks a unit of work as it fans out into nested, possibly concurrent scopes.
///
/// A context is completed once by a terminal call, success() or error(); later terminal calls
/// are ignored. The terminal call publishes the outcome on two channels, before_response() and
/// then response(). Independently of the outcome, completion() fires once the context's own
/// processing is done, every child context has completed, and the external completion link
/// (if there is one) has signaled. Completion therefore propagates bottom-up through the tree:
/// a context never completes before any of its descendants.
///
/// Contexts are shared objects, created through the static factories or create_child(). The
/// creator and any observer that captured the context share its ownership. A parent only counts
/// its children. A child keeps its parent alive until the child has completed and refers to it
/// weakly after that, so no ownership cycles can form.
class Event_context: public std::enable_shared_from_this<Event_context>
{
public:
    using ptr                = std::shared_ptr<Event_context>;
    using Response_channel   = Notification_channel<Response>;
    using Completion_channel = Notification_channel<completion_t>;
    using time_point         = std::chrono::system_clock::time_point;

    // -- root contexts created by a flow -------------------------------------------------------
    // The exception handler is taken from the flow. The id is generated and doubles as the
    // correlation id unless one is given.

    static ptr create(
        const std::shared_ptr<const Flow>& flow,
        Location_ptr location,
        const Context_config& config = Context_config());

    static ptr create(
        const std::shared_ptr<const Flow>& flow,
        Location_ptr location,
        std::string correlation_id,
        const Context_config& config = Context_config());

    // external_completion may be null; otherwise the context cannot complete before it fires.
    static ptr create(
        const std::shared_ptr<const Flow>& flow,
        Location_ptr location,
        std::optional<std::string> correlation_id,
        Deferred_signal external_completion,
        const Context_config& config = Context_config());

    // -- root contexts bridging a connector boundary -------------------------------------------
    // The id is supplied by the caller and must not be in use by another live context.

    static ptr create(
        context_id_type id,
        std::string server_id,
        Location_ptr location,
        Exception_handler_ptr exception_handler,
        const Context_config& config = Context_config());

    static ptr create(
        context_id_type id,
        std::string server_id,
        Location_ptr location,
        std::string correlation_id,
        Exception_handler_ptr exception_handler,
        const Context_config& config = Context_config());

    static ptr create(
        context_id_type id,
        std::string server_id,
        Location_ptr location,
        std::optional<std::string> correlation_id,
        Deferred_signal external_completion,
        Exception_handler_ptr exception_handler,
        const Context_config& config = Context_config());

    ///\brief Create a context for a nested scope of this one.
    ///
    /// The child is registered with this context before it is returned, so this context cannot
    /// complete until the child has. Without an explicit handler the child uses this context's
    /// exception handler; without an explicit correlation id it shares this context's.
    /// Throws illegal_state_error if this context has already completed.
    ptr create_child(
        Location_ptr location,
        Exception_handler_ptr exception_handler = nullptr,
        std::optional<std::string> correlation_id = std::nullopt);

    ~Event_context();

    Event_context(const Event_context&) = delete;
    Event_context& operator=(const Event_context&) = delete;

    // -- terminal calls ------------------------------------------------------------------------

    ///\brief Complete successfully, optionally with a result.
    ///
    /// Returns false, and does nothing else, if the context was already completed.
    bool success();
    bool success(Event_ptr result);

    ///\brief Complete with an error.
    ///
    /// The exception handler is invoked with the error; the response channels fire once the
    /// signal it returns has resolved. The returned signal resolves after that: cleanly, or with
    /// a handler_failure if the handler failed. If the context was already completed the call
    /// has no effect and the returned signal is already resolved, flagged already_completed.
    /// Throws std::invalid_argument for a null error.
    Deferred_signal error(std::exception_ptr error);

    // -- fan-in --------------------------------------------------------------------------------

    ///\brief Register one more participant this context has to wait for.
    ///
    /// create_child() does this on its own. Each successful call must be matched by exactly
    /// one child_completed(). Throws illegal_state_error once completion() has fired.
    void add_child();

    // Deregister a participant added with add_child(). Called from a completion observer, the
    // completion it triggers runs once that observer has returned.
    void child_completed();

    // -- notification channels -----------------------------------------------------------------

    Response_channel&   before_response()   noexcept { return m_before_response; }
    Response_channel&   response()          noexcept { return m_response;        }
    Completion_channel& completion()        noexcept { return m_completion;      }

    // -- identity and bookkeeping --------------------------------------------------------------

    const context_id_type& id()                  const noexcept { return m_id;                       }
    const std::string& correlation_id()          const noexcept { return m_correlation_id;           }
    bool is_correlation_id_from_source()         const noexcept { return m_correlation_from_source;  }
    const std::string& server_id()               const noexcept { return m_server_id;                }
    time_point received_time()                   const noexcept { return m_received_time;            }
    const Location_ptr& originating_location()   const noexcept { return m_location;                 }
    const Exception_handler_ptr& exception_handler() const noexcept { return m_exception_handler;   }
    const Context_config& config()               const noexcept { return m_config;                   }

    // Empty for root contexts, and once the parent has been destroyed after this context
    // completed.
    ptr parent_context() const { return m_parent.lock(); }
    const context_id_type& parent_id()           const noexcept { return m_parent_id;                }
    bool has_parent()                            const noexcept { return !m_parent_id.empty();       }

    context_state state() const noexcept { return m_state.load(std::memory_order_acquire); }
    bool is_terminated()  const noexcept { return state() != context_state::pending; }
    bool is_complete()    const noexcept { return m_completion.fired(); }

    // Outstanding participants: own processing, live children, and an unsignaled external
    // completion link.
    int32_t pending_count() const noexcept { return m_pending.pending(); }

    // Shared by all contexts of a tree; null unless the flow collects statistics.
    std::shared_ptr<const Processing_time> processing_time() const { return m_processing_time; }

    const Processors_trace& processors_trace() const noexcept { return m_trace; }

    void add_executed_processor(std::string processor_path)
    {
        m_trace.add_executed_processor(std::move(processor_path));
    }

private:
    explicit Event_context(detail::Context_creation&& creation);

    static ptr make(detail::Context_creation&& creation);

    static std::shared_ptr<Processing_time> processing_time_for(const Flow& flow);

    bool try_terminate(context_state terminal_state) noexcept;
    void respond(Response response);
    void finish_error(
        const std::exception_ptr& error,
        const std::exception_ptr& handler_error,
        bool handler_failed,
        const Deferred_signal& result);
    void release_slot();
    void complete();
    void on_external_completion(const Signal_result& result);

    const context_id_type                   m_id;
    const std::string                       m_server_id;
    std::string                             m_correlation_id;
    bool                                    m_correlation_from_source = false;
    const Location_ptr                      m_location;
    const Exception_handler_ptr             m_exception_handler;
    const Context_config                    m_config;
    const time_point                        m_received_time;
    const uint64_t                          m_branch_start_ns;

    const std::weak_ptr<Event_context>      m_parent;
    const context_id_type                   m_parent_id;
    std::shared_ptr<Event_context>          m_parent_hold;      // released by complete()

    std::atomic<context_state>              m_state{context_state::pending};
    Completion_counter                      m_pending;
    const std::shared_ptr<detail::Context_tree> m_tree;     // root id, descendant numbering
    bool                                    m_registered = false;

    std::shared_ptr<Processing_time>        m_processing_time;
    Processors_trace                        m_trace;

    Response_channel                        m_before_response;
    Response_channel                        m_response;
    Completion_channel                      m_completion;
};


inline std::ostream& operator<<(std::ostream& os, const Event_context& context);

} // namespace tributary
