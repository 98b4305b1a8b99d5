#include <mcm/render/rasterizer.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include <QFontMetricsF>
#include <QImage>
#include <QPainter>
#include <QPainterPath>
#include <QRadialGradient>

#include <fmt/format.h>

#include <mcm/qt_util.hpp>
#include <mcm/render/text_block.hpp>

namespace
{
inline constexpr ColorRGB8 c_PlaceholderParchment{ 0xf4, 0xe4, 0xbc };

QRectF ToQRectF(const SurfaceRect& rect)
{
    return QRectF{ rect.m_Position.x, rect.m_Position.y, rect.m_Size.x, rect.m_Size.y };
}

// Source rect of an image so that it covers the target without distortion
QRectF CoverSource(const QImage& image, const QRectF& target)
{
    const qreal image_aspect{ static_cast<qreal>(image.width()) / image.height() };
    const qreal target_aspect{ target.width() / target.height() };
    if (image_aspect > target_aspect)
    {
        const qreal width{ image.height() * target_aspect };
        return QRectF{ (image.width() - width) / 2.0, 0.0, width, static_cast<qreal>(image.height()) };
    }

    const qreal height{ image.width() / target_aspect };
    return QRectF{ 0.0, (image.height() - height) / 2.0, static_cast<qreal>(image.width()), height };
}

// Target rect of an image so that it fits inside the slot without distortion
QRectF ContainTarget(const QImage& image, const QRectF& slot)
{
    const qreal scale{ std::min(slot.width() / image.width(), slot.height() / image.height()) };
    const QSizeF size{ image.width() * scale, image.height() * scale };
    return QRectF{
        slot.center() - QPointF{ size.width() / 2.0, size.height() / 2.0 },
        size,
    };
}

void DrawBackground(QPainter& painter, const RenderUnit& unit, const QRectF& card_rect)
{
    painter.fillRect(card_rect, ToQColor(CardGeometry::c_CardBackground));

    if (unit.m_Template != nullptr)
    {
        const QImage& template_image{ unit.m_Template->m_Painted };
        painter.drawImage(card_rect, template_image, CoverSource(template_image, card_rect));
    }
    else
    {
        painter.fillRect(card_rect, ToQColor(c_PlaceholderParchment));
    }
}

void DrawArt(QPainter& painter, const RenderUnit& unit)
{
    if (!unit.m_Art.has_value())
    {
        return;
    }

    const ArtLayout& art{ unit.m_Layout.m_Art };
    const QRectF slot{ ToQRectF(art.m_Slot) };
    const QImage& art_image{ unit.m_Art->m_Painted };

    painter.save();
    painter.setCompositionMode(QPainter::CompositionMode_Multiply);
    painter.translate(slot.center());
    painter.scale(art.m_Scale, art.m_Scale);
    painter.translate(art.m_Translation.x * slot.width(), art.m_Translation.y * slot.height());
    painter.translate(-slot.center());
    painter.drawImage(ContainTarget(art_image, slot), art_image);
    painter.restore();
}

void DrawDescription(QPainter& painter, const RenderUnit& unit)
{
    if (!unit.m_Layout.m_Description.has_value())
    {
        return;
    }

    const DescriptionLayout& description{ unit.m_Layout.m_Description.value() };
    const DescriptionContent content{ description, unit.m_Fonts, unit.m_DescriptionFontSize };

    const float box_height{ std::min(content.Height() + 2.0f * description.m_Border, description.m_MaxHeight) };
    const QRectF box{
        description.m_Box.m_Position.x,
        description.m_Box.m_Position.y,
        description.m_Box.m_Size.x,
        box_height,
    };

    QPainterPath box_path;
    box_path.addRoundedRect(box, description.m_Radius, description.m_Radius);

    painter.save();

    painter.fillPath(box_path.translated(0.0, description.m_Border), QColor{ 0, 0, 0, 64 });

    painter.setClipPath(box_path, Qt::IntersectClip);
    if (unit.m_DescriptionTexture != nullptr)
    {
        const QImage& texture{ unit.m_DescriptionTexture->m_Painted };
        painter.drawImage(box, texture, CoverSource(texture, box));
    }
    else
    {
        painter.fillRect(box, ToQColor(c_PlaceholderParchment));
    }

    {
        const qreal corner_distance{ std::numbers::sqrt2 / 2.0 };
        QRadialGradient vignette{ QPointF{ 0.0, 0.0 }, 1.0 };
        vignette.setColorAt(0.0, Qt::transparent);
        vignette.setColorAt(0.4, Qt::transparent);
        vignette.setColorAt(1.0, QColor{ 0, 0, 0, 89 });

        painter.save();
        painter.translate(box.center());
        painter.scale(box.width() * corner_distance, box.height() * corner_distance);
        painter.fillRect(QRectF{ -1.0 / corner_distance, -1.0 / corner_distance, 2.0 / corner_distance, 2.0 / corner_distance }, vignette);
        painter.restore();
    }

    content.Draw(painter, box.topLeft() + QPointF{ description.m_Border, description.m_Border });

    painter.setClipping(false);
    const qreal half_border{ description.m_Border / 2.0 };
    painter.setPen(QPen{ ToQColor(CardGeometry::c_DescriptionBorderColor), description.m_Border });
    painter.setBrush(Qt::NoBrush);
    painter.drawRoundedRect(box.adjusted(half_border, half_border, -half_border, -half_border),
                            description.m_Radius,
                            description.m_Radius);

    painter.restore();
}

void DrawDiamonds(QPainter& painter, const RenderUnit& unit)
{
    if (!unit.m_Layout.m_Diamonds.has_value())
    {
        return;
    }

    const DiamondLayout& diamonds{ unit.m_Layout.m_Diamonds.value() };
    const QFont font{
        MakeFont(unit.m_Fonts.m_Meta,
                 diamonds.m_FontSize,
                 diamonds.m_IsRange ? QFont::Normal : QFont::Bold),
    };
    const QString value{ ToQString(diamonds.m_Value) };
    const qreal shadow_offset{ diamonds.m_FontSize / 16.0 };

    painter.save();
    painter.setFont(font);
    for (const dla::vec2& center : diamonds.m_Centers)
    {
        const QRectF text_rect{
            center.x - diamonds.m_FontSize * 4.0f,
            center.y - diamonds.m_FontSize,
            diamonds.m_FontSize * 8.0f,
            diamonds.m_FontSize * 2.0f,
        };

        painter.setPen(QColor{ 0, 0, 0, 204 });
        painter.drawText(text_rect.translated(shadow_offset, shadow_offset), Qt::AlignCenter, value);
        painter.setPen(Qt::white);
        painter.drawText(text_rect, Qt::AlignCenter, value);
    }
    painter.restore();
}

void DrawTitle(QPainter& painter, const RenderUnit& unit)
{
    const TitleLayout& title{ unit.m_Layout.m_Title };
    if (title.m_Text.empty())
    {
        return;
    }

    QFont font{ MakeFont(unit.m_Fonts.m_Title, title.m_FontSize, QFont::Bold, true) };
    font.setLetterSpacing(QFont::PercentageSpacing, 102.5);

    const TextBlock block{
        ToQString(title.m_Text),
        font,
        title.m_Width,
        CardGeometry::c_TitleLineHeight,
        Qt::AlignHCenter,
    };

    painter.save();
    painter.setPen(ToQColor(CardGeometry::c_TitleColor));
    block.Draw(painter, QPointF{ title.m_Left, title.m_CenterY - block.Height() / 2.0f });
    painter.restore();
}

void DrawFooter(QPainter& painter, const RenderUnit& unit)
{
    const FooterLayout& footer{ unit.m_Layout.m_Footer };

    const auto draw_line{
        [&](const FooterLine& line, QPointF top_left)
        {
            const QFont font{ MakeFont(unit.m_Fonts.m_Meta, line.m_FontSize, QFont::Bold) };
            const qreal height{ QFontMetricsF{ font }.height() };
            painter.setFont(font);
            painter.drawText(QRectF{ top_left, QSizeF{ unit.m_Layout.m_SurfaceSize.x, height } },
                             Qt::AlignLeft | Qt::AlignTop,
                             ToQString(line.m_Text));
            return height;
        }
    };

    painter.save();
    painter.setPen(ToQColor(CardGeometry::c_FooterColor));

    QPointF cursor{ footer.m_LeftAnchor.x, footer.m_LeftAnchor.y };
    for (const FooterLine& line : footer.m_Lines)
    {
        cursor.ry() += draw_line(line, cursor);
    }

    cursor = QPointF{ footer.m_LeftAnchor.x, footer.m_LeftAnchor.y };
    for (const FooterLine& line : footer.m_LinesAbove)
    {
        const QFont font{ MakeFont(unit.m_Fonts.m_Meta, line.m_FontSize, QFont::Bold) };
        cursor.ry() -= QFontMetricsF{ font }.height() - footer.m_StackOverlap;
        draw_line(line, cursor);
    }

    if (footer.m_Right.has_value())
    {
        draw_line(footer.m_Right.value(), QPointF{ footer.m_RightAnchor.x, footer.m_RightAnchor.y });
    }

    painter.restore();
}
} // namespace

Image Rasterize(const RenderUnit& unit, const RasterOptions& options)
{
    const dla::vec2 surface{ unit.m_Layout.m_SurfaceSize };
    const QSize image_size{
        static_cast<int>(std::lround(surface.x * options.m_PixelRatio)),
        static_cast<int>(std::lround(surface.y * options.m_PixelRatio)),
    };
    if (image_size.isEmpty())
    {
        throw std::invalid_argument{ fmt::format("Can not rasterize onto a {}x{} surface", image_size.width(), image_size.height()) };
    }

    QImage image{ image_size, QImage::Format_ARGB32_Premultiplied };
    image.fill(Qt::transparent);

    {
        QPainter painter{ &image };
        painter.setRenderHints(QPainter::Antialiasing | QPainter::TextAntialiasing | QPainter::SmoothPixmapTransform);
        painter.scale(options.m_PixelRatio, options.m_PixelRatio);

        const QRectF card_rect{ 0.0, 0.0, surface.x, surface.y };
        QPainterPath card_path;
        card_path.addRoundedRect(card_rect, unit.m_Layout.m_CornerRadius, unit.m_Layout.m_CornerRadius);
        painter.setClipPath(card_path);

        DrawBackground(painter, unit, card_rect);
        DrawArt(painter, unit);
        DrawDescription(painter, unit);
        DrawDiamonds(painter, unit);
        DrawTitle(painter, unit);
        DrawFooter(painter, unit);

        painter.end();
    }

    return Image::FromQImage(image);
}

CompositingRasterizer::CompositingRasterizer(const RenderConfig& config, AssetCache& assets, RasterOptions options)
    : m_Config{ config }
    , m_Assets{ assets }
    , m_Options{ options }
{
}

Image CompositingRasterizer::Capture(const CardRecord& card, size_t index)
{
    m_Assets.ResetBudget();

    Image image{ Rasterize(Compose(card, m_Config, m_Assets), m_Options) };
    if (!image.Valid())
    {
        throw std::runtime_error{ fmt::format("Capturing card {} \"{}\" produced no image", index + 1, card.m_Title) };
    }
    return image;
}
