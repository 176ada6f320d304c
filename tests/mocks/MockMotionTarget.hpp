/**
 * @file MockMotionTarget.hpp
 * @brief Fake and mock implementations of IMotionTarget
 */

#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "motion/MotionTarget.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Kinetic {
namespace Test {

// =============================================================================
// FakeMotionTarget
// =============================================================================

/**
 * @brief Host error that does not derive from std::exception
 */
struct HostFault {
    std::string property;
};

/**
 * @brief In-memory target recording every style write
 *
 * Computed values read back what was last written (or what the test seeded),
 * events are fired with Fire(), and children are returned for any selector
 * registered with AddChildren().
 */
class FakeMotionTarget : public IMotionTarget {
public:
    struct Write {
        std::string property;
        std::string value;
    };

    std::string GetComputedValue(const std::string& property) const override {
        auto it = m_styles.find(property);
        return it != m_styles.end() ? it->second : std::string();
    }

    void SetStyle(const std::string& property, const std::string& value) override {
        if (m_throwOnWrite) {
            throw std::runtime_error("target detached");
        }
        if (m_faultOnWrite) {
            throw HostFault{property};
        }
        m_styles[property] = value;
        m_writes.push_back({property, value});
    }

    Rect GetBoundingRect() const override { return m_rect; }

    void FlushStyles() override { ++m_flushCount; }

    ListenerId AddEventListener(InteractionEvent event, std::function<void()> handler) override {
        const ListenerId id = m_nextListenerId++;
        m_listeners.emplace(id, std::make_pair(event, std::move(handler)));
        return id;
    }

    void RemoveEventListener(ListenerId listenerId) override {
        m_listeners.erase(listenerId);
    }

    std::vector<IMotionTarget*> QuerySelectorAll(const std::string& selector) override {
        auto it = m_children.find(selector);
        return it != m_children.end() ? it->second : std::vector<IMotionTarget*>{};
    }

    // Test helpers

    void Seed(const std::string& property, const std::string& value) { m_styles[property] = value; }
    void SetRect(const Rect& rect) { m_rect = rect; }
    void SetThrowOnWrite(bool enabled) { m_throwOnWrite = enabled; }
    void SetFaultOnWrite(bool enabled) { m_faultOnWrite = enabled; }

    void AddChildren(const std::string& selector, std::vector<IMotionTarget*> children) {
        m_children[selector] = std::move(children);
    }

    /**
     * @brief Run every handler subscribed to event
     */
    void Fire(InteractionEvent event) {
        std::vector<std::function<void()>> handlers;
        for (const auto& [id, entry] : m_listeners) {
            if (entry.first == event) {
                handlers.push_back(entry.second);
            }
        }
        for (auto& handler : handlers) {
            handler();
        }
    }

    std::string Style(const std::string& property) const { return GetComputedValue(property); }
    const std::vector<Write>& GetWrites() const { return m_writes; }
    size_t CountWrites(const std::string& property) const {
        size_t count = 0;
        for (const auto& write : m_writes) {
            if (write.property == property) {
                ++count;
            }
        }
        return count;
    }
    void ClearWrites() { m_writes.clear(); }
    size_t GetListenerCount() const { return m_listeners.size(); }
    int GetFlushCount() const { return m_flushCount; }

private:
    std::map<std::string, std::string> m_styles;
    std::vector<Write> m_writes;
    Rect m_rect;
    std::map<ListenerId, std::pair<InteractionEvent, std::function<void()>>> m_listeners;
    ListenerId m_nextListenerId = 1;
    std::map<std::string, std::vector<IMotionTarget*>> m_children;
    int m_flushCount = 0;
    bool m_throwOnWrite = false;
    bool m_faultOnWrite = false;
};

// =============================================================================
// MockMotionTarget
// =============================================================================

/**
 * @brief GMock target for interaction checks
 */
class MockMotionTarget : public IMotionTarget {
public:
    MOCK_METHOD(std::string, GetComputedValue, (const std::string& property), (const, override));
    MOCK_METHOD(void, SetStyle, (const std::string& property, const std::string& value), (override));
    MOCK_METHOD(Rect, GetBoundingRect, (), (const, override));
    MOCK_METHOD(void, FlushStyles, (), (override));
    MOCK_METHOD(ListenerId, AddEventListener, (InteractionEvent event, std::function<void()> handler), (override));
    MOCK_METHOD(void, RemoveEventListener, (ListenerId listenerId), (override));
    MOCK_METHOD(std::vector<IMotionTarget*>, QuerySelectorAll, (const std::string& selector), (override));
};

} // namespace Test
} // namespace Kinetic
