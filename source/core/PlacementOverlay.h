#pragma once

// ============================================================================
// PlacementOverlay - Interactive move/resize of a pasted image before insert
// ============================================================================
// Pure state machine in notes-surface pixel coordinates. The widget that
// draws the proxy (ImagePlacementWidget) and the Gesture Coordinator feed it
// pointer positions; nothing here touches Qt events or widgets.
//
//   Inactive --activate--> Active{Moving}
//   Active: down on corner  -> Resizing(corner), drag
//           down on body    -> Moving, drag
//           down outside    -> CommitRequested (caller calls commit())
//           up              -> drag ends, stays Active
//   commit() / cancel()     -> Inactive
// ============================================================================

#include <QPointF>
#include <QRectF>
#include <QSize>

struct PlacementState {
    enum class Phase { Inactive, Active };
    enum class Mode { Moving, Resizing };
    enum class Corner { TopLeft, TopRight, BottomLeft, BottomRight };

    Phase phase = Phase::Inactive;
    Mode mode = Mode::Moving;
    Corner corner = Corner::BottomRight;  ///< Valid when mode == Resizing
    QPointF anchor;         ///< Pointer position at the start of the current drag
    QRectF rect;            ///< Proxy rectangle on the notes surface
    bool dragging = false;  ///< Pointer currently held

    bool isActive() const { return phase == Phase::Active; }
};

class PlacementOverlay {
public:
    static constexpr qreal MIN_SIZE = 16.0;          ///< Smallest proxy edge (px)
    static constexpr qreal HANDLE_SIZE = 12.0;       ///< Corner handle hit square (px)
    static constexpr qreal MAX_INITIAL_SIZE = 400.0; ///< Initial size fits this box

    enum class HitZone {
        Outside,
        Body,
        TopLeft,
        TopRight,
        BottomLeft,
        BottomRight
    };

    enum class PressResult {
        Ignored,         ///< Overlay not active
        DragStarted,     ///< Move or resize drag began
        CommitRequested  ///< Press landed outside; caller should commit()
    };

    /**
     * @brief Show the proxy for an image.
     * @param imageSize Native pixel size of the payload.
     * @param surfaceBounds Visible area of the notes surface.
     * @param insertionScale Surface pixels to inserted image pixels.
     * @return False if a placement is already active (the paste is rejected)
     *         or the image is empty.
     */
    bool activate(const QSize& imageSize, const QRectF& surfaceBounds, qreal insertionScale = 1.0);

    /**
     * @brief Initial proxy rectangle: native size scaled down (aspect kept)
     * to fit MAX_INITIAL_SIZE and the surface, centred in the surface.
     */
    static QRectF initialRect(const QSize& imageSize, const QRectF& surfaceBounds);

    HitZone hitTest(const QPointF& pos) const;

    PressResult pointerDown(const QPointF& pos);

    /**
     * @return True if the rectangle changed.
     */
    bool pointerMove(const QPointF& pos);

    /**
     * @return True if a drag ended.
     */
    bool pointerUp(const QPointF& pos);

    /**
     * @brief Finish the placement.
     * @return Size to insert the image at; invalid QSize if not active.
     */
    QSize commit();

    /**
     * @brief Discard the placement without inserting.
     * @return True if a placement was active.
     */
    bool cancel();

    /**
     * @brief Update the surface bounds (editor resized) and pull the proxy
     * back inside them.
     */
    void setSurfaceBounds(const QRectF& bounds);
    QRectF surfaceBounds() const { return m_surface; }

    bool isActive() const { return m_state.isActive(); }
    const PlacementState& state() const { return m_state; }
    QRectF rect() const { return m_state.rect; }

    /**
     * @brief Size the image would be inserted at right now.
     */
    QSize insertionSize() const;

    static QRectF handleRect(const QRectF& rect, PlacementState::Corner corner);

private:
    static QPointF cornerPoint(const QRectF& rect, PlacementState::Corner corner);
    QRectF clampMove(const QRectF& rect) const;
    QRectF resizedRect(const QPointF& cornerPos) const;

    PlacementState m_state;
    QRectF m_surface;
    QPointF m_grabOffset;       ///< Pointer minus dragged point at press
    qreal m_insertionScale = 1.0;
};
