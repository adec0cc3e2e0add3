#pragma once

#include <QPoint>
#include <QPointF>
#include <QString>
#include <Qt>

#include <optional>

namespace geocore {

enum class MouseEventKind {
    Press,
    Move,
    Release
};

struct MouseEvent {
    QPoint position;                        // device coordinates
    std::optional<QPointF> worldPosition;   // map coordinates, when known
    Qt::MouseButton button = Qt::NoButton;
    int clickCount = 0;
    Qt::KeyboardModifiers modifiers;
    bool handled = false;
};

struct KeyEvent {
    int key = Qt::Key_unknown;
    Qt::KeyboardModifiers modifiers;
    bool handled = false;
};

/**
 * @brief Interactive map tool behaviour
 *
 * Handlers run synchronously on the dispatching thread and must return
 * quickly. Returning true claims the event; no later tool sees it.
 */
class IToolCapability
{
public:
    virtual ~IToolCapability() = default;

    virtual QString toolName() const = 0;
    virtual QString toolCategory() const = 0;
    virtual QString toolIcon() const { return QString(); }

    virtual void activate() = 0;
    virtual void deactivate() = 0;
    virtual bool isActive() const = 0;

    virtual bool onMousePress(MouseEvent& event) { Q_UNUSED(event); return false; }
    virtual bool onMouseMove(MouseEvent& event) { Q_UNUSED(event); return false; }
    virtual bool onMouseRelease(MouseEvent& event) { Q_UNUSED(event); return false; }
    virtual bool onKeyPress(KeyEvent& event) { Q_UNUSED(event); return false; }
};

} // namespace geocore
