// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "context_registry.h"
#include "delay_fuzzer.h"
#include "event_context.h"
#include "exception.h"
#include "logging.h"
#include "time_utils.h"

#include <deque>
#include <stdexcept>
#include <utility>

namespace tributary {


inline
Event_context::Event_context(detail::Context_creation&& creation)
    : m_id(std::move(creation.id))
    , m_server_id(std::move(creation.server_id))
    , m_location(std::move(creation.location))
    , m_exception_handler(std::move(creation.exception_handler))
    , m_config(std::move(creation.config))
    , m_received_time(creation.parent
        ? creation.parent->m_received_time
        : std::chrono::system_clock::now())
    , m_branch_start_ns(monotonic_now_ns())
    , m_parent(creation.parent)
    , m_parent_id(creation.parent ? creation.parent->m_id : context_id_type())
    , m_parent_hold(creation.parent)
    , m_pending(own_processing_slots +
        (creation.external_completion ? external_completion_slots : 0))
    , m_tree(creation.tree
        ? std::move(creation.tree)
        : std::make_shared<detail::Context_tree>(m_id))
    , m_processing_time(std::move(creation.processing_time))
    , m_trace(m_config.flow_trace)
{
    if (creation.correlation_id && !creation.correlation_id->empty()) {
        m_correlation_id = std::move(*creation.correlation_id);
        m_correlation_from_source = true;
    }
    else
    if (creation.inherit_correlation && creation.parent) {
        m_correlation_id = creation.parent->m_correlation_id;
        m_correlation_from_source = creation.parent->m_correlation_from_source;
    }
    else {
        // the id is a fresh UUID, which is all a generated correlation id needs to be
        m_correlation_id = m_id;
        m_correlation_from_source = false;
    }
}


inline
Event_context::~Event_context()
{
    if (!m_registered) {
        return;
    }
    Context_registry::instance().unregister(m_id, this);

    if (!m_completion.fired()) {
        ls_warning() << "context " << m_id << " destroyed before completing ("
                     << to_string(state()) << ", " << m_pending.pending() << " pending)";
    }
}


inline
Event_context::ptr Event_context::make(detail::Context_creation&& creation)
{
    if (!creation.location) {
        throw std::invalid_argument("an event context requires a component location");
    }
    if (!creation.exception_handler) {
        throw std::invalid_argument("an event context requires an exception handler");
    }
    if (creation.explicit_id && creation.id.empty()) {
        throw std::invalid_argument("an explicit event context id must not be empty");
    }

    Deferred_signal external_completion = creation.external_completion;

    ptr context(new Event_context(std::move(creation)));
    if (!Context_registry::instance().try_register(context->m_id, context)) {
        throw std::invalid_argument(
            "event context id '" + context->m_id + "' is in use by another live context");
    }
    context->m_registered = true;

    ls_debug() << "created " << *context;

    if (external_completion) {
        // the link keeps the context alive until it has signaled
        external_completion->subscribe([context](const Signal_result& result) {
            context->on_external_completion(result);
        });
    }
    return context;
}


inline
std::shared_ptr<Processing_time> Event_context::processing_time_for(const Flow& flow)
{
    if (!flow.statistics_enabled()) {
        return nullptr;
    }
    return std::make_shared<Processing_time>(flow.name());
}


inline
Event_context::ptr Event_context::create(
    const std::shared_ptr<const Flow>& flow,
    Location_ptr location,
    const Context_config& config)
{
    return create(flow, std::move(location), std::nullopt, nullptr, config);
}


inline
Event_context::ptr Event_context::create(
    const std::shared_ptr<const Flow>& flow,
    Location_ptr location,
    std::string correlation_id,
    const Context_config& config)
{
    return create(
        flow,
        std::move(location),
        std::optional<std::string>(std::move(correlation_id)),
        nullptr,
        config);
}


inline
Event_context::ptr Event_context::create(
    const std::shared_ptr<const Flow>& flow,
    Location_ptr location,
    std::optional<std::string> correlation_id,
    Deferred_signal external_completion,
    const Context_config& config)
{
    if (!flow) {
        throw std::invalid_argument("an event context requires a flow");
    }

    detail::Context_creation creation;
    creation.id                     = make_context_id();
    creation.server_id              = config.server_id;
    creation.correlation_id         = std::move(correlation_id);
    creation.location               = std::move(location);
    creation.exception_handler      = flow->exception_handler();
    creation.external_completion    = std::move(external_completion);
    creation.processing_time        = processing_time_for(*flow);
    creation.config                 = config;
    return make(std::move(creation));
}


inline
Event_context::ptr Event_context::create(
    context_id_type id,
    std::string server_id,
    Location_ptr location,
    Exception_handler_ptr exception_handler,
    const Context_config& config)
{
    return create(
        std::move(id),
        std::move(server_id),
        std::move(location),
        std::nullopt,
        nullptr,
        std::move(exception_handler),
        config);
}


inline
Event_context::ptr Event_context::create(
    context_id_type id,
    std::string server_id,
    Location_ptr location,
    std::string correlation_id,
    Exception_handler_ptr exception_handler,
    const Context_config& config)
{
    return create(
        std::move(id),
        std::move(server_id),
        std::move(location),
        std::optional<std::string>(std::move(correlation_id)),
        nullptr,
        std::move(exception_handler),
        config);
}


inline
Event_context::ptr Event_context::create(
    context_id_type id,
    std::string server_id,
    Location_ptr location,
    std::optional<std::string> correlation_id,
    Deferred_signal external_completion,
    Exception_handler_ptr exception_handler,
    const Context_config& config)
{
    detail::Context_creation creation;
    creation.id                     = std::move(id);
    creation.explicit_id            = true;
    creation.server_id              = server_id.empty() ? config.server_id : std::move(server_id);
    creation.correlation_id         = std::move(correlation_id);
    creation.location               = std::move(location);
    creation.exception_handler      = std::move(exception_handler);
    creation.external_completion    = std::move(external_completion);
    creation.config                 = config;
    return make(std::move(creation));
}


inline
Event_context::ptr Event_context::create_child(
    Location_ptr location,
    Exception_handler_ptr exception_handler,
    std::optional<std::string> correlation_id)
{
    if (!location) {
        throw std::invalid_argument("an event context requires a component location");
    }

    add_child();

    detail::Context_creation creation;
    creation.id                     = make_child_context_id(
        m_tree->root_id, m_tree->children_created.fetch_add(1, std::memory_order_relaxed) + 1);
    creation.server_id              = m_server_id;
    creation.correlation_id         = std::move(correlation_id);
    creation.inherit_correlation    = true;
    creation.location               = std::move(location);
    creation.exception_handler      = exception_handler ? std::move(exception_handler) : m_exception_handler;
    creation.parent                 = shared_from_this();
    creation.tree                   = m_tree;
    creation.processing_time        = m_processing_time;
    creation.config                 = m_config;

    try {
        return make(std::move(creation));
    }
    catch (...) {
        // the slot taken above belongs to a child that never came to be
        child_completed();
        throw;
    }
}


inline
bool Event_context::try_terminate(context_state terminal_state) noexcept
{
    TRIBUTARY_DELAY_FUZZ();
    context_state expected = context_state::pending;
    return m_state.compare_exchange_strong(
        expected, terminal_state, std::memory_order_acq_rel, std::memory_order_acquire);
}


inline
bool Event_context::success()
{
    return success(nullptr);
}


inline
bool Event_context::success(Event_ptr result)
{
    if (!try_terminate(context_state::succeeded)) {
        ls_warning() << "context " << m_id << " is already " << to_string(state())
                     << ", success() ignored";
        return false;
    }

    // observers may release the last outside reference
    const auto keep_alive = shared_from_this();
    respond(Response{std::move(result), nullptr});
    return true;
}


inline
Deferred_signal Event_context::error(std::exception_ptr error)
{
    if (!error) {
        throw std::invalid_argument("error() requires an exception");
    }

    if (!try_terminate(context_state::failed)) {
        ls_warning() << "context " << m_id << " is already " << to_string(state())
                     << ", error() ignored: " << describe_exception(error);
        return make_resolved_signal(true);
    }

    auto self = shared_from_this();
    auto result = make_deferred_signal();

    Deferred_signal handled;
    try {
        handled = m_exception_handler->handle(error, *this);
    }
    catch (...) {
        // reported through the returned signal, never synchronously
        handled = make_failed_signal(std::current_exception());
    }

    if (!handled) {
        finish_error(error, nullptr, true, result);
        return result;
    }

    handled->subscribe([self, error, result](const Signal_result& handler_result) {
        self->finish_error(error, handler_result.failure, !handler_result.succeeded(), result);
    });
    return result;
}


inline
void Event_context::finish_error(
    const std::exception_ptr& error,
    const std::exception_ptr& handler_error,
    bool handler_failed,
    const Deferred_signal& result)
{
    respond(Response{nullptr, error});

    Signal_result outcome;
    if (handler_failed) {
        handler_failure failure(m_id, error, handler_error);
        ls_error() << failure.what();
        outcome.failure = std::make_exception_ptr(failure);
    }
    result->fire(std::move(outcome));
}


inline
void Event_context::respond(Response response)
{
    if (m_processing_time) {
        m_processing_time->add_branch_time(m_branch_start_ns);
    }

    // both channels fire on this thread, in this order, before the own slot is given up
    m_before_response.fire(response);
    TRIBUTARY_DELAY_FUZZ();
    m_response.fire(std::move(response));

    release_slot();
}


inline
void Event_context::add_child()
{
    if (!m_pending.try_add()) {
        ls_warning() << "context " << m_id << " has completed, cannot add a child";
        throw illegal_state_error(
            "event context " + m_id + " has already completed, no more children can be added");
    }
}


inline
void Event_context::child_completed()
{
    release_slot();
}


inline
void Event_context::release_slot()
{
    if (m_pending.release()) {
        complete();
    }
}


inline
void Event_context::complete()
{
    // Completion climbs the tree in a loop. A completion started on this thread while the loop
    // runs, by a completion observer calling child_completed() for instance, is queued rather
    // than nested, so the stack depth does not depend on the depth of the tree.
    thread_local std::deque<ptr>* t_completing = nullptr;

    if (t_completing) {
        t_completing->push_back(shared_from_this());
        return;
    }

    std::deque<ptr> completing;
    completing.push_back(shared_from_this());

    struct Queue_guard
    {
        explicit Queue_guard(std::deque<ptr>& queue) { t_completing = &queue; }
        ~Queue_guard() { t_completing = nullptr; }
    } guard(completing);

    while (!completing.empty()) {
        ptr context = std::move(completing.front());
        completing.pop_front();

        ls_debug() << "context " << context->m_id << " completed ("
                   << to_string(context->state()) << ")";

        // complete() runs once per context, no other thread touches the hold
        ptr parent = std::move(context->m_parent_hold);

        // every observer of this context sees completion before the parent is told
        context->m_completion.fire(completion_t{});

        if (parent && parent->m_pending.release()) {
            completing.push_back(std::move(parent));
        }
    }
}


inline
void Event_context::on_external_completion(const Signal_result& result)
{
    if (!result.succeeded()) {
        ls_warning() << "external completion link of context " << m_id
                     << " failed, treating it as signaled: " << describe_exception(result.failure);
    }
    release_slot();
}


inline
std::ostream& operator<<(std::ostream& os, const Event_context& context)
{
    os << "Event_context{id=" << context.id()
       << ", correlation_id=" << context.correlation_id();
    if (context.has_parent()) {
        os << ", parent=" << context.parent_id();
    }
    os << ", state=" << to_string(context.state())
       << ", pending=" << context.pending_count();
    if (context.originating_location()) {
        os << ", location=" << *context.originating_location();
    }
    return os << '}';
}

} // namespace tributary
