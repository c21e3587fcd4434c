// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "id_types.h"
#include "spinlock.h"

#include <memory>
#include <unordered_map>

namespace tributary {

class Event_context;

///\brief Process-wide index of live contexts by id.
///
/// Entries are weak: the registry never keeps a context alive. A context registers itself on
/// creation and removes its entry on destruction. An id can only be taken while no live context
/// holds it.
class Context_registry
{
public:
    static Context_registry& instance() noexcept
    {
        static Context_registry registry;
        return registry;
    }

    // False if a live context already uses the id.
    bool try_register(const context_id_type& id, const std::shared_ptr<Event_context>& context)
    {
        spinlock::locker l(m_sl);
        auto it = m_contexts.find(id);
        if (it != m_contexts.end() && !it->second.context.expired()) {
            return false;
        }
        m_contexts[id] = Entry{context.get(), context};
        return true;
    }

    // Only removes the entry if it still belongs to `owner`; the id may have been taken over
    // after owner expired.
    void unregister(const context_id_type& id, const Event_context* owner)
    {
        spinlock::locker l(m_sl);
        auto it = m_contexts.find(id);
        if (it != m_contexts.end() && it->second.owner == owner) {
            m_contexts.erase(it);
        }
    }

    std::shared_ptr<Event_context> find(const context_id_type& id) const
    {
        spinlock::locker l(m_sl);
        auto it = m_contexts.find(id);
        if (it == m_contexts.end()) {
            return nullptr;
        }
        return it->second.context.lock();
    }

    size_t size() const
    {
        spinlock::locker l(m_sl);
        return m_contexts.size();
    }

private:
    Context_registry() = default;

    struct Entry
    {
        const Event_context*            owner = nullptr;
        std::weak_ptr<Event_context>    context;
    };

    mutable spinlock                                    m_sl;
    std::unordered_map<context_id_type, Entry>          m_contexts;
};


inline std::shared_ptr<Event_context> find_context(const context_id_type& id)
{
    return Context_registry::instance().find(id);
}

} // namespace tributary
