#pragma once

#include <string>
#include <string_view>

#include <mcm/util.hpp>

class QString;
class QByteArray;

QString ToQString(const char* c_string);
QString ToQString(const std::string& string);
QString ToQString(std::string_view string_view);
QString ToQString(const fs::path& path);

std::string ToStdString(const QString& string);

std::span<const std::byte> ToByteSpan(const QByteArray& bytes);
