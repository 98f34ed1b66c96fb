/**
 * @file ViewHandler.hpp
 * @brief Interface implemented by every screen, plus the navigation request it returns.
 */

#pragma once

#include <string>

#include "application/Session.hpp"
#include "application/ViewId.hpp"
#include "application/views/StyledText.hpp"

namespace crmterm::application {

/**
 * @struct Transition
 * @brief Navigation requested by a handler. Applied by the SessionController.
 */
struct Transition {
    enum class Kind {
        Stay,
        Push,    ///< Record the active view, activate target.
        Replace, ///< Activate target without recording the active view.
        Pop,     ///< Previous view (main menu when the history is empty).
        Root,    ///< Clear the history and reset every screen.
        Quit
    };

    Kind kind = Kind::Stay;
    ViewId target = ViewId::MainMenu;

    static Transition Stay() { return {Kind::Stay, ViewId::MainMenu}; }
    static Transition Push(ViewId view) { return {Kind::Push, view}; }
    static Transition Replace(ViewId view) { return {Kind::Replace, view}; }
    static Transition Pop() { return {Kind::Pop, ViewId::MainMenu}; }
    static Transition Root() { return {Kind::Root, ViewId::MainMenu}; }
    static Transition Quit() { return {Kind::Quit, ViewId::MainMenu}; }
};

/**
 * @class ViewHandler
 * @brief Input grammar and rendering of one screen.
 *
 * Handlers keep no state of their own; everything lives in the Session.
 */
class ViewHandler {
public:
    virtual ~ViewHandler() = default;

    virtual ViewId id() const = 0;

    /** @brief One submitted line (Enter). */
    virtual Transition handleInput(Session& session, const std::string& input) = 0;

    /** @brief Escape key. Defaults to leaving the screen. */
    virtual Transition handleEscape(Session& session) {
        (void)session;
        return Transition::Pop();
    }

    /** @brief Input line edited without submitting. */
    virtual void onEdit(Session& session, const std::string& text) {
        (void)session;
        (void)text;
    }

    /** @brief Screen activated by Push or Replace. */
    virtual void onEnter(Session& session) { (void)session; }

    /** @brief Screen reactivated by Pop or Root; reload derived data here. */
    virtual void onResume(Session& session) { (void)session; }

    virtual RenderedView render(const Session& session) const = 0;
};

} // namespace crmterm::application
