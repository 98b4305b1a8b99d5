#pragma once

#include <fstream>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <mcm/util/log.hpp>

class Log::LogImpl
{
  public:
    LogImpl(LogFlags log_flags, std::string_view log_name);
    ~LogImpl();

    static Log* GetInstance(std::string_view log_name);

    void RegisterInstance(Log* parent_log);
    void UnregisterInstance();

    uint32_t InstallHook(Log::LogHook hook);
    void UninstallHook(uint32_t hook_id);

    bool Accepts(Log::LogLevel level) const;

    void Print(const Log::DetailInformation& detail_info, Log::LogLevel level, std::string_view message);

    inline static std::string g_CardContext;

  private:
    std::string FormatLine(const Log::DetailInformation& detail_info, Log::LogLevel level, std::string_view message) const;

    void CreateLogFile();

    Log* m_ParentLog{ nullptr };

    const std::string m_LogName;
    const LogFlags m_LogFlags;

    struct InstalledLogHook
    {
        uint32_t m_HookId;
        Log::LogHook m_Hook;
    };
    std::vector<InstalledLogHook> m_LogHooks;
    uint32_t m_NextHookId{ 1 };

    std::ofstream m_FileStream;

    inline static std::map<std::string, LogImpl*, std::less<>> g_Instances;
};
