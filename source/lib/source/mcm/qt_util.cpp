#include <mcm/qt_util.hpp>

#include <QByteArray>
#include <QString>

QString ToQString(const char* c_string)
{
    return QString::fromUtf8(c_string);
}

QString ToQString(const std::string& string)
{
    return QString::fromStdString(string);
}

QString ToQString(std::string_view string_view)
{
    return QString::fromUtf8(string_view.data(), static_cast<qsizetype>(string_view.size()));
}

QString ToQString(const fs::path& path)
{
    return QString::fromStdU16String(path.generic_u16string());
}

std::string ToStdString(const QString& string)
{
    return string.toStdString();
}

std::span<const std::byte> ToByteSpan(const QByteArray& bytes)
{
    return { reinterpret_cast<const std::byte*>(bytes.constData()), static_cast<size_t>(bytes.size()) };
}
