// Shared test utilities for Tributary tests.
// Assertions, log capture, and the collaborator doubles (flow, exception handlers, events)
// that most of the context tests need.

#pragma once

#include <tributary/tributary.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>


namespace tributary::test {


// ---------------------------------------------------------------------------
// Custom terminate handler
// ---------------------------------------------------------------------------

/// Diagnostic terminate handler that prints the uncaught exception before aborting.
[[noreturn]] inline void custom_terminate_handler()
{
    std::fprintf(stderr, "std::terminate called!\n");
    std::fprintf(stderr, "Uncaught exceptions: %d\n", std::uncaught_exceptions());

    try {
        auto eptr = std::current_exception();
        if (eptr) {
            std::rethrow_exception(eptr);
        }
        else {
            std::fprintf(stderr, "terminate called without an active exception\n");
        }
    }
    catch (const std::exception& e) {
        std::fprintf(stderr, "Uncaught exception: %s\n", e.what());
    }
    catch (...) {
        std::fprintf(stderr, "Uncaught exception of unknown type\n");
    }

    std::abort();
}


// ---------------------------------------------------------------------------
// Assertions
// ---------------------------------------------------------------------------

inline void print_test_message(std::string_view prefix, std::string_view message)
{
    std::fprintf(stderr,
                 "%.*s%.*s\n",
                 static_cast<int>(prefix.size()),
                 prefix.data(),
                 static_cast<int>(message.size()),
                 message.data());
}

[[noreturn]] inline void fail(std::string_view prefix, std::string_view message)
{
    print_test_message(prefix, message);
    std::exit(1);
}

inline void expect(bool condition, std::string_view prefix, std::string_view message)
{
    if (!condition) {
        fail(prefix, message);
    }
}

inline void require_true(bool condition, std::string_view prefix, std::string_view message)
{
    expect(condition, prefix, message);
}

inline bool assert_true(bool condition, std::string_view prefix, std::string_view message)
{
    if (!condition) {
        print_test_message(prefix, message);
    }
    return condition;
}

/// Runs `action` and requires it to throw `Exception`.
template <typename Exception, typename Action>
void require_throws(Action&& action, std::string_view prefix, std::string_view message)
{
    try {
        action();
    }
    catch (const Exception&) {
        return;
    }
    catch (const std::exception& e) {
        fail(prefix, std::string(message) + " (threw " + e.what() + " instead)");
    }
    fail(prefix, std::string(message) + " (nothing was thrown)");
}

/// Polls `predicate` until it holds or `timeout` expires.
template <typename Predicate>
bool wait_until(Predicate&& predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return predicate();
        }
        std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
    return true;
}


// ---------------------------------------------------------------------------
// Log capture
// ---------------------------------------------------------------------------

/// Routes the library log into memory for the lifetime of the object.
class Log_capture
{
public:
    explicit Log_capture(log_level level = log_level::debug)
        : m_previous_level(get_log_level())
    {
        m_previous_callback = get_log_callback(&m_previous_user_data);
        set_log_callback(&Log_capture::callback, this);
        set_log_level(level);
    }

    ~Log_capture()
    {
        set_log_callback(m_previous_callback, m_previous_user_data);
        set_log_level(m_previous_level);
    }

    Log_capture(const Log_capture&) = delete;
    Log_capture& operator=(const Log_capture&) = delete;

    int count_containing(std::string_view needle, log_level level) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        int count = 0;
        for (const auto& entry : m_entries) {
            if (entry.first == level && entry.second.find(needle) != std::string::npos) {
                ++count;
            }
        }
        return count;
    }

    bool contains(std::string_view needle, log_level level) const
    {
        return count_containing(needle, level) > 0;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
    }

private:
    static void callback(log_level level, const char* message, void* user_data)
    {
        auto* self = static_cast<Log_capture*>(user_data);
        std::lock_guard<std::mutex> lock(self->m_mutex);
        self->m_entries.emplace_back(level, message);
    }

    mutable std::mutex                                  m_mutex;
    std::vector<std::pair<log_level, std::string>>      m_entries;
    log_callback_fn                                     m_previous_callback = nullptr;
    void*                                               m_previous_user_data = nullptr;
    log_level                                           m_previous_level;
};


// ---------------------------------------------------------------------------
// Collaborator doubles
// ---------------------------------------------------------------------------

struct Test_event : Event
{
    explicit Test_event(int value_) : value(value_) {}
    int value;
};

inline Event_ptr make_event(int value)
{
    return std::make_shared<const Test_event>(value);
}

inline int event_value(const Event_ptr& event)
{
    auto typed = std::dynamic_pointer_cast<const Test_event>(event);
    return typed ? typed->value : -1;
}


/// Handles every error synchronously, succeeding, and counts the calls.
class Counting_handler : public Exception_handler
{
public:
    Deferred_signal handle(std::exception_ptr error, Event_context& context) override
    {
        m_calls.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_last_error = error;
            m_last_context_id = context.id();
        }
        return make_resolved_signal();
    }

    int calls() const { return m_calls.load(); }

    std::exception_ptr last_error() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_error;
    }

    std::string last_context_id() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_context_id;
    }

private:
    std::atomic<int>        m_calls{0};
    mutable std::mutex      m_mutex;
    std::exception_ptr      m_last_error;
    std::string             m_last_context_id;
};


/// Hands out unresolved signals; the test resolves them when it sees fit.
class Deferred_handler : public Exception_handler
{
public:
    Deferred_signal handle(std::exception_ptr, Event_context&) override
    {
        auto signal = make_deferred_signal();
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.push_back(signal);
        return signal;
    }

    size_t pending() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pending.size();
    }

    // Resolves the oldest outstanding signal, with `failure` if given.
    bool resolve_next(std::exception_ptr failure = nullptr)
    {
        Deferred_signal signal;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_pending.empty()) {
                return false;
            }
            signal = m_pending.front();
            m_pending.erase(m_pending.begin());
        }
        Signal_result result;
        result.failure = std::move(failure);
        return signal->fire(std::move(result));
    }

private:
    mutable std::mutex              m_mutex;
    std::vector<Deferred_signal>    m_pending;
};


/// Throws from handle() instead of returning a signal.
class Throwing_handler : public Exception_handler
{
public:
    Deferred_signal handle(std::exception_ptr, Event_context&) override
    {
        throw std::runtime_error("handler exploded");
    }
};


/// Returns no signal at all.
class Null_signal_handler : public Exception_handler
{
public:
    Deferred_signal handle(std::exception_ptr, Event_context&) override
    {
        return nullptr;
    }
};


class Test_flow : public Flow
{
public:
    explicit Test_flow(
        std::string name,
        Exception_handler_ptr handler = std::make_shared<Counting_handler>(),
        bool statistics = false)
        : m_name(std::move(name))
        , m_handler(std::move(handler))
        , m_statistics(statistics)
    {}

    const std::string& name() const override { return m_name; }
    Exception_handler_ptr exception_handler() const override { return m_handler; }
    bool statistics_enabled() const override { return m_statistics; }

private:
    std::string             m_name;
    Exception_handler_ptr   m_handler;
    bool                    m_statistics;
};

inline std::shared_ptr<const Flow> make_flow(
    std::string name = "test-flow",
    Exception_handler_ptr handler = std::make_shared<Counting_handler>(),
    bool statistics = false)
{
    return std::make_shared<const Test_flow>(std::move(name), std::move(handler), statistics);
}

inline Location_ptr make_test_location(std::string path = "test-flow/source")
{
    return make_location("test-flow", std::move(path));
}


// ---------------------------------------------------------------------------
// Event recording
// ---------------------------------------------------------------------------

/// Thread-safe, ordered record of what the observers saw.
class Event_log
{
public:
    void record(std::string entry)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.push_back(std::move(entry));
    }

    std::vector<std::string> entries() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries;
    }

    // Position of the first occurrence, or -1.
    int index_of(const std::string& entry) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (size_t i = 0; i < m_entries.size(); ++i) {
            if (m_entries[i] == entry) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    int count(const std::string& entry) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        int n = 0;
        for (const auto& e : m_entries) {
            if (e == entry) {
                ++n;
            }
        }
        return n;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

private:
    mutable std::mutex          m_mutex;
    std::vector<std::string>    m_entries;
};


/// Records "<name>:before", "<name>:response" and "<name>:completion" as the channels fire.
inline void record_channels(Event_context& context, Event_log& log, const std::string& name)
{
    context.before_response().subscribe([&log, name](const Response&) {
        log.record(name + ":before");
    });
    context.response().subscribe([&log, name](const Response&) {
        log.record(name + ":response");
    });
    context.completion().subscribe([&log, name](const completion_t&) {
        log.record(name + ":completion");
    });
}

} // namespace tributary::test
