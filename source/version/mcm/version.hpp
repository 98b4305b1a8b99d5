#pragma once

#include <string_view>

std::string_view McmVersion();
std::string_view McmBuildTime();

consteval std::string_view ConfigFormatVersion()
{
    return "MCM00001";
}
