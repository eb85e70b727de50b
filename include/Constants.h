#ifndef BOXEDIT_CONSTANTS_H
#define BOXEDIT_CONSTANTS_H

#include <QColor>

namespace BoxEdit {

// ============================================================================
// TIMER (milliseconds)
// ============================================================================
namespace Timer {
constexpr int kDrawClickSuppression = 100;    // Swallow the click that ends a draw gesture
constexpr int kMaxDrawClickSuppression = 1000;
}  // namespace Timer

// ============================================================================
// INTERACTION (screen pixels unless noted)
// ============================================================================
namespace Interaction {
constexpr qreal kMinBoxSize = 20.0;           // Smallest box a gesture may produce
constexpr qreal kMinBoxSizeLowerBound = 4.0;
constexpr qreal kMinBoxSizeUpperBound = 200.0;
constexpr int kHandleHitSize = 16;            // Resize handle hit area
constexpr int kHandleHitSizeMin = 6;
constexpr int kHandleHitSizeMax = 48;
constexpr int kHandleDrawSize = 8;
constexpr qreal kZoomStep = 1.15;
constexpr qreal kMinZoom = 0.1;
constexpr qreal kMaxZoom = 20.0;
}  // namespace Interaction

// ============================================================================
// CANVAS COLORS
// ============================================================================
namespace Colors {
inline const QColor kVerifiedBox(52, 199, 89);       // Green
inline const QColor kUnverifiedBox(255, 149, 0);     // Orange
inline const QColor kSelectedBox(0, 174, 255);       // Blue
inline const QColor kDrawPreview(0, 174, 255, 160);
inline const QColor kHandleFill(255, 255, 255);
inline const QColor kCanvasBackground(30, 30, 30);
}  // namespace Colors

}  // namespace BoxEdit

#endif // BOXEDIT_CONSTANTS_H
