/**
 * @file SessionController.hpp
 * @brief Routes input lines to the active screen and applies the navigation it requests.
 */

#pragma once

#include <map>
#include <memory>
#include <string>

#include "application/Session.hpp"
#include "application/ViewId.hpp"
#include "application/views/ViewHandler.hpp"

namespace crmterm::application {

/**
 * @class SessionController
 * @brief Top-level loop body: one call per user action, processed to completion.
 */
class SessionController {
public:
    /** @brief Registers a handler for every ViewId. @p session must outlive the controller. */
    explicit SessionController(Session& session);

    /** @brief Enter pressed with @p line in the input. */
    void Submit(const std::string& line);

    /** @brief Input line changed without submitting (live filtering). */
    void Edit(const std::string& text);

    /** @brief Escape key. */
    void Escape();

    /** @brief Ctrl+C: ends the session from any state. */
    void Interrupt();

    RenderedView Render() const;

    bool ShouldQuit() const { return m_session.quitRequested(); }
    ViewId ActiveView() const { return m_session.navigation().active(); }

    Session& session() { return m_session; }

private:
    ViewHandler& handlerFor(ViewId view) const;
    void registerHandler(std::unique_ptr<ViewHandler> handler);
    void apply(const Transition& transition);

    Session& m_session;
    std::map<ViewId, std::unique_ptr<ViewHandler>> m_handlers;
};

} // namespace crmterm::application
