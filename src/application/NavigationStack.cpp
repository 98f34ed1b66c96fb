#include "application/NavigationStack.hpp"

#include <algorithm>

namespace crmterm::application {

NavigationStack::NavigationStack(ViewId root) : m_root(root), m_active(root) {}

void NavigationStack::push(ViewId view) {
    if (view == m_active) {
        return;
    }
    m_history.push_back(m_active);
    m_active = view;
    // A view reached again through a longer path drops its earlier history entry.
    m_history.erase(std::remove(m_history.begin(), m_history.end(), m_active), m_history.end());
}

void NavigationStack::pop() {
    if (m_history.empty()) {
        m_active = m_root;
        return;
    }
    m_active = m_history.back();
    m_history.pop_back();
}

void NavigationStack::replace(ViewId view) {
    m_active = view;
    m_history.erase(std::remove(m_history.begin(), m_history.end(), m_active), m_history.end());
}

void NavigationStack::resetToRoot() {
    m_history.clear();
    m_active = m_root;
}

bool NavigationStack::contains(ViewId view) const {
    return std::find(m_history.begin(), m_history.end(), view) != m_history.end();
}

} // namespace crmterm::application
