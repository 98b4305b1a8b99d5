#include <mcm/version.hpp>

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

std::string_view McmVersion()
{
#ifdef MCM_VERSION
    return TOSTRING(MCM_VERSION);
#else
    return "<unknown version>";
#endif
}

std::string_view McmBuildTime()
{
#ifdef MCM_BUILD_TIME
    return TOSTRING(MCM_BUILD_TIME);
#else
    return "<unknown build time>";
#endif
}
