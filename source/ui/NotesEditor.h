#pragma once

// ============================================================================
// NotesEditor - Rich text notes pane
// ============================================================================
// Layout: formatting toolbar above a QTextEdit.
//   [B] [I] [U] [size] [Color] [• List] [1. List]
//
// Implements RichTextSurface for the capture pipeline. Captured images are
// stored as QTextDocument resources named "capture-<uuid>.png" and kept in
// a side table so they can be saved with the notes.
// ============================================================================

#include "../core/RichTextSurface.h"

#include <QImage>
#include <QMap>
#include <QTextCharFormat>
#include <QTextListFormat>
#include <QWidget>

class GestureCoordinator;
class ImagePlacementWidget;
class QSpinBox;
class QTextEdit;
class QToolBar;
class QToolButton;

class NotesEditor : public QWidget, public RichTextSurface {
    Q_OBJECT

public:
    static constexpr int MIN_FONT_SIZE = 8;
    static constexpr int MAX_FONT_SIZE = 72;
    static constexpr int DEFAULT_FONT_SIZE = 12;

    explicit NotesEditor(GestureCoordinator* coordinator, QWidget* parent = nullptr);
    ~NotesEditor() override;

    // ===== RichTextSurface =====
    void insertTextAtCursor(const QString& text) override;
    void insertImageAtCursor(const QImage& image, int width, int height) override;
    QRectF visibleArea() const override;

    // ===== Content =====

    /**
     * @brief Replace the content. Does not emit contentModified().
     * @param html Editor HTML (may reference images by resource name).
     * @param images Resources referenced by @p html.
     */
    void setContent(const QString& html, const QMap<QString, QImage>& images);

    void clearContent();

    QString html() const;

    /**
     * @brief Images still referenced by the current HTML.
     */
    QMap<QString, QImage> referencedImages() const;

    QTextEdit* textEdit() const { return m_textEdit; }

    // ===== Formatting =====
public slots:
    void toggleBold();
    void toggleItalic();
    void toggleUnderline();
    void setFontPointSize(int size);
    void chooseTextColor();
    void toggleBulletList();
    void toggleNumberedList();

signals:
    /**
     * @brief The user changed the notes.
     */
    void contentModified();

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private slots:
    void onCurrentCharFormatChanged(const QTextCharFormat& format);
    void onPlacementChanged();
    void onPlacementAboutToCommit(const QRectF& proxyRect);

private:
    void setupUi();
    void mergeFormat(const QTextCharFormat& format);
    void toggleList(QTextListFormat::Style style);
    void registerImage(const QString& name, const QImage& image);

    GestureCoordinator* m_coordinator = nullptr;  ///< Not owned

    QToolBar* m_toolbar = nullptr;
    QToolButton* m_boldButton = nullptr;
    QToolButton* m_italicButton = nullptr;
    QToolButton* m_underlineButton = nullptr;
    QSpinBox* m_fontSizeSpin = nullptr;
    QToolButton* m_colorButton = nullptr;
    QToolButton* m_bulletButton = nullptr;
    QToolButton* m_numberedButton = nullptr;
    QTextEdit* m_textEdit = nullptr;
    ImagePlacementWidget* m_placementWidget = nullptr;

    QMap<QString, QImage> m_images;   ///< Every image resource added to the document
    bool m_loading = false;           ///< Suppresses contentModified during setContent()
};
