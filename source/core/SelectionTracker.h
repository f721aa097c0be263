#pragma once

// ============================================================================
// SelectionTracker - Rectangular region selection on the page view
// ============================================================================
// State machine:
//
//   Idle --down--> Dragging --move--> Dragging --up--> Committed
//                     |                                  |
//                     +--up (area < threshold)--> Idle   +--down--> Dragging
//
// Page changes drop any selection; zoom changes drop an in-progress drag.
// All points are document space (see ViewportTransform).
// No Qt event types in here so it can be driven directly from tests.
// ============================================================================

#include <QPointF>
#include <QRectF>

/**
 * @brief Snapshot of the selection state machine.
 */
struct SelectionState {
    enum class Phase {
        Idle,       ///< No selection
        Dragging,   ///< Pointer held, anchor/current valid
        Committed   ///< Finished selection, rect valid
    };

    Phase phase = Phase::Idle;
    QPointF anchor;     ///< Dragging: pointer-down position
    QPointF current;    ///< Dragging: latest pointer position
    QRectF rect;        ///< Dragging: live rect; Committed: final rect

    bool isIdle() const { return phase == Phase::Idle; }
    bool isDragging() const { return phase == Phase::Dragging; }
    bool isCommitted() const { return phase == Phase::Committed; }
};

class SelectionTracker {
public:
    /// Selections smaller than this (square points) are treated as clicks
    static constexpr qreal MIN_SELECTION_AREA = 16.0;

    /**
     * @brief Start a drag. Discards any committed rectangle.
     * @return True if the visible highlight changed.
     */
    bool pointerDown(const QPointF& docPoint);

    /**
     * @brief Extend the drag. Ignored unless Dragging.
     * @return True if the highlight needs a redraw.
     */
    bool pointerMove(const QPointF& docPoint);

    /**
     * @brief Finish the drag.
     * @return True if a selection was committed; false if it was ignored
     *         or rejected as too small (state is then Idle).
     */
    bool pointerUp(const QPointF& docPoint);

    /**
     * @brief Drop the selection entirely (page change, document change).
     * @return True if something was cleared.
     */
    bool clear();

    /**
     * @brief Abort an in-progress drag (zoom change). A committed
     * selection is kept since document coordinates survive zoom.
     * @return True if a drag was cancelled.
     */
    bool cancelDrag();

    const SelectionState& state() const { return m_state; }

    /**
     * @brief Rectangle to highlight, or a null rect when Idle.
     */
    QRectF highlightRect() const { return m_state.isIdle() ? QRectF() : m_state.rect; }

    /**
     * @brief Committed rectangle, or a null rect if not Committed.
     */
    QRectF committedRect() const { return m_state.isCommitted() ? m_state.rect : QRectF(); }

    static bool isLargeEnough(const QRectF& rect)
    {
        return rect.width() * rect.height() >= MIN_SELECTION_AREA;
    }

private:
    SelectionState m_state;
};
