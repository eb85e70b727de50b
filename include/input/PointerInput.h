#ifndef POINTERINPUT_H
#define POINTERINPUT_H

#include <QPointF>
#include <optional>

class QEvent;
class QMouseEvent;
class QTouchEvent;

/**
 * @brief A pointer location in client coordinates, independent of the device.
 */
struct PointerPosition
{
    enum class Source {
        Mouse,
        Touch
    };

    QPointF pos;
    Source source = Source::Mouse;
};

/**
 * PointerInput - Unifies mouse and touch events into PointerPosition
 *
 * Touch events use the first touch point; an event without points yields
 * nothing.
 */
class PointerInput {
public:
    PointerInput() = delete;

    static std::optional<PointerPosition> fromMouseEvent(const QMouseEvent* event);
    static std::optional<PointerPosition> fromTouchEvent(const QTouchEvent* event);

    // Dispatches on the event type; other events yield nothing
    static std::optional<PointerPosition> fromEvent(const QEvent* event);
};

#endif // POINTERINPUT_H
