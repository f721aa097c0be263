#include "NotesEditor.h"
#include "widgets/ImagePlacementWidget.h"
#include "../core/GestureCoordinator.h"

#include <QColorDialog>
#include <QDebug>
#include <QEvent>
#include <QFont>
#include <QSignalBlocker>
#include <QSpinBox>
#include <QTextCursor>
#include <QTextDocument>
#include <QTextEdit>
#include <QTextImageFormat>
#include <QTextList>
#include <QToolBar>
#include <QToolButton>
#include <QUrl>
#include <QUuid>
#include <QVBoxLayout>

// ============================================================================
// Constructor / Destructor
// ============================================================================

NotesEditor::NotesEditor(GestureCoordinator* coordinator, QWidget* parent)
    : QWidget(parent)
    , m_coordinator(coordinator)
{
    setupUi();

    connect(m_coordinator, &GestureCoordinator::placementChanged,
            this, &NotesEditor::onPlacementChanged);
}

NotesEditor::~NotesEditor() = default;

void NotesEditor::setupUi()
{
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_toolbar = new QToolBar(this);
    m_toolbar->setIconSize(QSize(16, 16));

    auto makeToggle = [this](const QString& text, const QString& tip) {
        auto* button = new QToolButton(m_toolbar);
        button->setText(text);
        button->setToolTip(tip);
        button->setCheckable(true);
        button->setFocusPolicy(Qt::NoFocus);
        m_toolbar->addWidget(button);
        return button;
    };

    m_boldButton = makeToggle(tr("B"), tr("Bold"));
    QFont boldFont = m_boldButton->font();
    boldFont.setBold(true);
    m_boldButton->setFont(boldFont);
    connect(m_boldButton, &QToolButton::clicked, this, &NotesEditor::toggleBold);

    m_italicButton = makeToggle(tr("I"), tr("Italic"));
    QFont italicFont = m_italicButton->font();
    italicFont.setItalic(true);
    m_italicButton->setFont(italicFont);
    connect(m_italicButton, &QToolButton::clicked, this, &NotesEditor::toggleItalic);

    m_underlineButton = makeToggle(tr("U"), tr("Underline"));
    QFont underlineFont = m_underlineButton->font();
    underlineFont.setUnderline(true);
    m_underlineButton->setFont(underlineFont);
    connect(m_underlineButton, &QToolButton::clicked, this, &NotesEditor::toggleUnderline);

    m_toolbar->addSeparator();

    m_fontSizeSpin = new QSpinBox(m_toolbar);
    m_fontSizeSpin->setRange(MIN_FONT_SIZE, MAX_FONT_SIZE);
    m_fontSizeSpin->setValue(DEFAULT_FONT_SIZE);
    m_fontSizeSpin->setToolTip(tr("Font Size"));
    m_toolbar->addWidget(m_fontSizeSpin);
    connect(m_fontSizeSpin, QOverload<int>::of(&QSpinBox::valueChanged),
            this, &NotesEditor::setFontPointSize);

    m_colorButton = new QToolButton(m_toolbar);
    m_colorButton->setText(tr("Color"));
    m_colorButton->setToolTip(tr("Text Color"));
    m_colorButton->setFocusPolicy(Qt::NoFocus);
    m_toolbar->addWidget(m_colorButton);
    connect(m_colorButton, &QToolButton::clicked, this, &NotesEditor::chooseTextColor);

    m_toolbar->addSeparator();

    m_bulletButton = new QToolButton(m_toolbar);
    m_bulletButton->setText(tr("• List"));
    m_bulletButton->setToolTip(tr("Bullet List"));
    m_bulletButton->setFocusPolicy(Qt::NoFocus);
    m_toolbar->addWidget(m_bulletButton);
    connect(m_bulletButton, &QToolButton::clicked, this, &NotesEditor::toggleBulletList);

    m_numberedButton = new QToolButton(m_toolbar);
    m_numberedButton->setText(tr("1. List"));
    m_numberedButton->setToolTip(tr("Numbered List"));
    m_numberedButton->setFocusPolicy(Qt::NoFocus);
    m_toolbar->addWidget(m_numberedButton);
    connect(m_numberedButton, &QToolButton::clicked, this, &NotesEditor::toggleNumberedList);

    layout->addWidget(m_toolbar);

    m_textEdit = new QTextEdit(this);
    m_textEdit->setAcceptRichText(true);
    m_textEdit->setPlaceholderText(tr("Take notes here. Select a region of the PDF, "
                                      "press S to capture it and P to paste it."));
    QFont font = m_textEdit->font();
    font.setPointSize(DEFAULT_FONT_SIZE);
    m_textEdit->document()->setDefaultFont(font);
    layout->addWidget(m_textEdit, 1);

    connect(m_textEdit, &QTextEdit::currentCharFormatChanged,
            this, &NotesEditor::onCurrentCharFormatChanged);
    connect(m_textEdit, &QTextEdit::textChanged, this, [this]() {
        if (!m_loading) {
            emit contentModified();
        }
    });

    m_placementWidget = new ImagePlacementWidget(m_coordinator, m_textEdit->viewport());
    connect(m_placementWidget, &ImagePlacementWidget::aboutToCommit,
            this, &NotesEditor::onPlacementAboutToCommit);

    m_textEdit->viewport()->installEventFilter(this);
}

// ============================================================================
// RichTextSurface
// ============================================================================

void NotesEditor::insertTextAtCursor(const QString& text)
{
    m_textEdit->textCursor().insertText(text);
    m_textEdit->ensureCursorVisible();
}

void NotesEditor::insertImageAtCursor(const QImage& image, int width, int height)
{
    if (image.isNull() || width <= 0 || height <= 0) {
        qWarning() << "NotesEditor::insertImageAtCursor: Invalid image or size" << width << height;
        return;
    }

    const QString name = QStringLiteral("capture-%1.png")
        .arg(QUuid::createUuid().toString(QUuid::WithoutBraces));
    registerImage(name, image);

    QTextImageFormat format;
    format.setName(name);
    format.setWidth(width);
    format.setHeight(height);

    m_textEdit->textCursor().insertImage(format);
    m_textEdit->ensureCursorVisible();
}

QRectF NotesEditor::visibleArea() const
{
    return QRectF(m_textEdit->viewport()->rect());
}

// ============================================================================
// Content
// ============================================================================

void NotesEditor::registerImage(const QString& name, const QImage& image)
{
    m_images.insert(name, image);
    m_textEdit->document()->addResource(QTextDocument::ImageResource, QUrl(name), image);
}

void NotesEditor::setContent(const QString& html, const QMap<QString, QImage>& images)
{
    m_loading = true;

    m_images.clear();
    m_textEdit->clear();
    m_textEdit->setHtml(html);
    // clear() drops document resources, so images go in after the HTML
    for (auto it = images.constBegin(); it != images.constEnd(); ++it) {
        registerImage(it.key(), it.value());
    }
    m_textEdit->moveCursor(QTextCursor::End);
    m_textEdit->viewport()->update();

    m_loading = false;
}

void NotesEditor::clearContent()
{
    setContent(QString(), {});
}

QString NotesEditor::html() const
{
    return m_textEdit->toHtml();
}

QMap<QString, QImage> NotesEditor::referencedImages() const
{
    const QString current = html();
    QMap<QString, QImage> used;
    for (auto it = m_images.constBegin(); it != m_images.constEnd(); ++it) {
        if (current.contains(it.key())) {
            used.insert(it.key(), it.value());
        }
    }
    return used;
}

// ============================================================================
// Formatting
// ============================================================================

void NotesEditor::mergeFormat(const QTextCharFormat& format)
{
    QTextCursor cursor = m_textEdit->textCursor();
    if (!cursor.hasSelection()) {
        cursor.select(QTextCursor::WordUnderCursor);
    }
    cursor.mergeCharFormat(format);
    m_textEdit->mergeCurrentCharFormat(format);
    m_textEdit->setFocus();
}

void NotesEditor::toggleBold()
{
    QTextCharFormat format;
    format.setFontWeight(m_textEdit->fontWeight() > QFont::Normal ? QFont::Normal : QFont::Bold);
    mergeFormat(format);
}

void NotesEditor::toggleItalic()
{
    QTextCharFormat format;
    format.setFontItalic(!m_textEdit->fontItalic());
    mergeFormat(format);
}

void NotesEditor::toggleUnderline()
{
    QTextCharFormat format;
    format.setFontUnderline(!m_textEdit->fontUnderline());
    mergeFormat(format);
}

void NotesEditor::setFontPointSize(int size)
{
    QTextCharFormat format;
    format.setFontPointSize(qBound(MIN_FONT_SIZE, size, MAX_FONT_SIZE));
    mergeFormat(format);
}

void NotesEditor::chooseTextColor()
{
    const QColor color = QColorDialog::getColor(m_textEdit->textColor(), this, tr("Text Color"));
    if (!color.isValid()) {
        return;
    }
    QTextCharFormat format;
    format.setForeground(color);
    mergeFormat(format);
}

void NotesEditor::toggleBulletList()
{
    toggleList(QTextListFormat::ListDisc);
}

void NotesEditor::toggleNumberedList()
{
    toggleList(QTextListFormat::ListDecimal);
}

void NotesEditor::toggleList(QTextListFormat::Style style)
{
    QTextCursor cursor = m_textEdit->textCursor();
    cursor.beginEditBlock();

    QTextList* list = cursor.currentList();
    if (list && list->format().style() == style) {
        // Same list type again removes the block from the list
        list->remove(cursor.block());
        QTextBlockFormat blockFormat = cursor.blockFormat();
        blockFormat.setIndent(0);
        cursor.setBlockFormat(blockFormat);
    } else {
        QTextListFormat listFormat;
        listFormat.setStyle(style);
        cursor.createList(listFormat);
    }

    cursor.endEditBlock();
    m_textEdit->setFocus();
}

void NotesEditor::onCurrentCharFormatChanged(const QTextCharFormat& format)
{
    const QSignalBlocker blockBold(m_boldButton);
    const QSignalBlocker blockItalic(m_italicButton);
    const QSignalBlocker blockUnderline(m_underlineButton);
    const QSignalBlocker blockSize(m_fontSizeSpin);

    m_boldButton->setChecked(format.fontWeight() > QFont::Normal);
    m_italicButton->setChecked(format.fontItalic());
    m_underlineButton->setChecked(format.fontUnderline());

    const qreal pointSize = format.fontPointSize();
    m_fontSizeSpin->setValue(pointSize > 0 ? qRound(pointSize) : DEFAULT_FONT_SIZE);
}

// ============================================================================
// Placement
// ============================================================================

void NotesEditor::onPlacementChanged()
{
    m_placementWidget->syncWithPlacement();
}

void NotesEditor::onPlacementAboutToCommit(const QRectF& proxyRect)
{
    // Insert where the proxy sits, not where the caret happened to be
    m_textEdit->setTextCursor(m_textEdit->cursorForPosition(proxyRect.topLeft().toPoint()));
}

bool NotesEditor::eventFilter(QObject* watched, QEvent* event)
{
    if (watched == m_textEdit->viewport() && event->type() == QEvent::Resize) {
        m_coordinator->setPlacementBounds(visibleArea());
        if (m_coordinator->isPlacementActive()) {
            m_placementWidget->syncWithPlacement();
        }
    }
    return QWidget::eventFilter(watched, event);
}
