#pragma once

#include <memory>
#include <optional>
#include <string>

#include <QFont>
#include <QList>
#include <QPointF>
#include <QTextLayout>

#include <mcm/layout/card_geometry.hpp>

class QPainter;

QFont MakeFont(const std::string& family, float pixel_size, QFont::Weight weight, bool uppercase = false);

/*
        A word wrapped paragraph with a fixed line advance of font size times line height,
        measuring and drawing go through the same line breaking
*/
class TextBlock
{
  public:
    TextBlock(const QString& text,
              const QFont& font,
              float width,
              float line_height,
              Qt::Alignment alignment,
              const QList<QTextLayout::FormatRange>& formats = {});

    float Height() const;
    size_t LineCount() const;

    void Draw(QPainter& painter, QPointF top_left) const;

  private:
    std::unique_ptr<QTextLayout> m_Layout;
    float m_Height{ 0.0f };
    size_t m_LineCount{ 0 };
};

// Restrictions header, body and monster bad stuff laid out for one font size
class DescriptionContent
{
  public:
    DescriptionContent(const DescriptionLayout& layout, const FontFamilies& fonts, float font_size);

    // Includes the inner padding, excludes the border
    float Height() const;

    void Draw(QPainter& painter, QPointF inner_top_left) const;

  private:
    const DescriptionLayout& m_Layout;
    float m_ContentWidth;

    std::optional<TextBlock> m_Restrictions;
    std::optional<TextBlock> m_Body;
    std::optional<TextBlock> m_BadStuff;
};
