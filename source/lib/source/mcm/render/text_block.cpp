#include <mcm/render/text_block.hpp>

#include <algorithm>
#include <cmath>

#include <QPainter>
#include <QColor>
#include <QPen>
#include <QTextCharFormat>

#include <mcm/qt_util.hpp>

QFont MakeFont(const std::string& family, float pixel_size, QFont::Weight weight, bool uppercase)
{
    QFont font{ ToQString(family) };
    font.setPixelSize(std::max(1, static_cast<int>(std::lround(pixel_size))));
    font.setWeight(weight);
    if (uppercase)
    {
        font.setCapitalization(QFont::AllUppercase);
    }
    return font;
}

TextBlock::TextBlock(const QString& text,
                     const QFont& font,
                     float width,
                     float line_height,
                     Qt::Alignment alignment,
                     const QList<QTextLayout::FormatRange>& formats)
    : m_Layout{ std::make_unique<QTextLayout>(text, font) }
{
    QTextOption option{ alignment };
    option.setWrapMode(QTextOption::WrapAtWordBoundaryOrAnywhere);
    m_Layout->setTextOption(option);
    m_Layout->setFormats(formats);

    const float line_advance{ static_cast<float>(font.pixelSize()) * line_height };

    m_Layout->beginLayout();
    while (true)
    {
        QTextLine line{ m_Layout->createLine() };
        if (!line.isValid())
        {
            break;
        }

        line.setLineWidth(width);
        const float centering{ (line_advance - static_cast<float>(line.height())) / 2.0f };
        line.setPosition(QPointF{ 0.0, m_Height + centering });
        m_Height += line_advance;
        ++m_LineCount;
    }
    m_Layout->endLayout();
}

float TextBlock::Height() const
{
    return m_Height;
}

size_t TextBlock::LineCount() const
{
    return m_LineCount;
}

void TextBlock::Draw(QPainter& painter, QPointF top_left) const
{
    m_Layout->draw(&painter, top_left);
}

DescriptionContent::DescriptionContent(const DescriptionLayout& layout, const FontFamilies& fonts, float font_size)
    : m_Layout{ layout }
    , m_ContentWidth{ layout.m_Box.m_Size.x - 2.0f * (layout.m_Border + layout.m_Padding) }
{
    using CardGeometry::c_DescriptionLineHeight;

    if (!layout.m_Restrictions.empty())
    {
        m_Restrictions.emplace(ToQString(layout.m_Restrictions),
                               MakeFont(fonts.m_Description, font_size, QFont::Bold, true),
                               m_ContentWidth,
                               c_DescriptionLineHeight,
                               Qt::AlignHCenter);
    }

    if (!layout.m_Body.empty())
    {
        m_Body.emplace(ToQString(layout.m_Body),
                       MakeFont(fonts.m_Description, font_size, QFont::Medium),
                       m_ContentWidth,
                       c_DescriptionLineHeight,
                       Qt::AlignHCenter);
    }

    if (layout.m_BadStuffPrefix.has_value())
    {
        const QString prefix{ ToQString(layout.m_BadStuffPrefix.value()) };
        const QString bad_stuff{ ToQString(layout.m_BadStuff) };

        QTextCharFormat prefix_format;
        prefix_format.setFontWeight(QFont::Bold);
        QTextCharFormat bad_stuff_format;
        bad_stuff_format.setFontItalic(true);

        const QList<QTextLayout::FormatRange> formats{
            { 0, static_cast<int>(prefix.size()), prefix_format },
            { static_cast<int>(prefix.size()), static_cast<int>(bad_stuff.size()), bad_stuff_format },
        };
        m_BadStuff.emplace(prefix + bad_stuff,
                           MakeFont(fonts.m_Description, font_size, QFont::Medium),
                           m_ContentWidth,
                           c_DescriptionLineHeight,
                           Qt::AlignLeft,
                           formats);
    }
}

float DescriptionContent::Height() const
{
    float height{ 2.0f * m_Layout.m_Padding };
    if (m_Restrictions.has_value())
    {
        height += m_Restrictions->Height() + m_Layout.m_RestrictionsMargin;
    }
    if (m_Body.has_value())
    {
        height += m_Body->Height();
    }
    if (m_BadStuff.has_value())
    {
        height += m_Layout.m_BadStuffMargin + m_Layout.m_BadStuffSeparator + m_Layout.m_BadStuffPadding;
        height += m_BadStuff->Height();
    }
    return height;
}

void DescriptionContent::Draw(QPainter& painter, QPointF inner_top_left) const
{
    painter.save();
    painter.setPen(QPen{ Qt::black });

    QPointF cursor{ inner_top_left + QPointF{ m_Layout.m_Padding, m_Layout.m_Padding } };
    if (m_Restrictions.has_value())
    {
        m_Restrictions->Draw(painter, cursor);
        cursor.ry() += m_Restrictions->Height() + m_Layout.m_RestrictionsMargin;
    }
    if (m_Body.has_value())
    {
        m_Body->Draw(painter, cursor);
        cursor.ry() += m_Body->Height();
    }
    if (m_BadStuff.has_value())
    {
        cursor.ry() += m_Layout.m_BadStuffMargin;

        const QRectF separator{ cursor.x(), cursor.y(), m_ContentWidth, m_Layout.m_BadStuffSeparator };
        painter.fillRect(separator, QColor{ 0, 0, 0, 51 });
        cursor.ry() += m_Layout.m_BadStuffSeparator + m_Layout.m_BadStuffPadding;

        m_BadStuff->Draw(painter, cursor);
    }

    painter.restore();
}
