/**
 * @file NavigationStack.hpp
 * @brief History of previously active views, enabling "back".
 */

#pragma once

#include <vector>

#include "application/ViewId.hpp"

namespace crmterm::application {

/**
 * @class NavigationStack
 * @brief Tracks the active view plus the views that led to it.
 *
 * The root (main menu) is never pushed: popping an empty history lands on it.
 * The active view is never present in the history at the same time.
 */
class NavigationStack {
public:
    explicit NavigationStack(ViewId root = ViewId::MainMenu);

    ViewId active() const { return m_active; }
    ViewId root() const { return m_root; }

    /** @brief Records the active view and activates @p view. No-op if @p view is already active. */
    void push(ViewId view);

    /** @brief Reactivates the most recent view, or the root when the history is empty. */
    void pop();

    /** @brief Activates @p view without recording the current one. */
    void replace(ViewId view);

    /** @brief Clears the history and activates the root. */
    void resetToRoot();

    const std::vector<ViewId>& history() const { return m_history; }

    bool contains(ViewId view) const;

private:
    ViewId m_root;
    ViewId m_active;
    std::vector<ViewId> m_history;
};

} // namespace crmterm::application
