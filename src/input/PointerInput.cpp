#include "input/PointerInput.h"

#include <QMouseEvent>
#include <QTouchEvent>

std::optional<PointerPosition> PointerInput::fromMouseEvent(const QMouseEvent* event)
{
    if (!event) {
        return std::nullopt;
    }
    return PointerPosition{event->position(), PointerPosition::Source::Mouse};
}

std::optional<PointerPosition> PointerInput::fromTouchEvent(const QTouchEvent* event)
{
    if (!event || event->points().isEmpty()) {
        return std::nullopt;
    }
    return PointerPosition{event->points().first().position(), PointerPosition::Source::Touch};
}

std::optional<PointerPosition> PointerInput::fromEvent(const QEvent* event)
{
    if (!event) {
        return std::nullopt;
    }

    switch (event->type()) {
    case QEvent::MouseButtonPress:
    case QEvent::MouseButtonRelease:
    case QEvent::MouseMove:
    case QEvent::MouseButtonDblClick:
        return fromMouseEvent(static_cast<const QMouseEvent*>(event));
    case QEvent::TouchBegin:
    case QEvent::TouchUpdate:
    case QEvent::TouchEnd:
        return fromTouchEvent(static_cast<const QTouchEvent*>(event));
    default:
        break;
    }
    return std::nullopt;
}
