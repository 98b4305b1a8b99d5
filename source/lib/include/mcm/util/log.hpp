#pragma once

#include <ctime>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <mcm/util/at_scope_exit.hpp>
#include <mcm/util/log_flags.hpp>

template<typename T>
struct identity
{
    using type = T;
};
template<typename T>
using identity_t = typename identity<T>::type;

/*
        Named logs writing to the console and/or a file in logs/, exports run on a single thread
        so a log is not synchronized
*/
class Log
{
  public:
    Log(LogFlags log_flags, std::string_view log_name);
    ~Log();

    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

    static Log* GetInstance(std::string_view log_name);

    enum class LogLevel
    {
        Information,
        Debug,
        Warning,
        Error,
        Fatal
    };

    struct DetailInformation
    {
        std::time_t m_Time;
        std::string_view m_File;
        std::size_t m_Line;
        // Empty outside of a card scope
        std::string_view m_Card;
    };

    using LogHook = std::function<void(const DetailInformation&, LogLevel, std::string_view)>;
    uint32_t InstallHook(LogHook hook);
    void UninstallHook(uint32_t hook_id);

    // Every message until the returned guard is destroyed is tagged with this card
    [[nodiscard]] static auto EnterCard(std::string card)
    {
        std::string previous{ SetCardContext(std::move(card)) };
        return AtScopeExit{
            [previous = std::move(previous)]() mutable
            {
                SetCardContext(std::move(previous));
            }
        };
    }
    static std::string_view GetCardContext();

    bool Accepts(LogLevel level) const;

    void Print(const DetailInformation& detail_info, LogLevel level, std::string_view message);

    template<class... Args>
    struct LogMessageWrapper
    {
        consteval LogMessageWrapper(const char* message, std::source_location source_info = std::source_location::current())
            : m_Message{ message }
            , m_SourceInfo{ source_info }
        {
        }

        fmt::format_string<Args...> m_Message;
        std::source_location m_SourceInfo;
    };
    template<class... Args>
    using LogMessage = LogMessageWrapper<identity_t<Args>...>;

    template<class... Args>
    static void DoLog(std::string_view log_name, LogLevel level, const LogMessage<Args...>& message, Args&&... args)
    {
        Log* log_sink{ Log::GetInstance(log_name) };
        if (log_sink == nullptr || !log_sink->Accepts(level))
        {
            return;
        }

        const DetailInformation detail_info{
            std::time(nullptr),
            message.m_SourceInfo.file_name(),
            message.m_SourceInfo.line(),
            GetCardContext(),
        };
        const std::string formatted{ fmt::format(message.m_Message, std::forward<Args>(args)...) };
        log_sink->Print(detail_info, level, formatted);
    }

    static constexpr std::string_view c_MainLogName{ "Main-Log" };

  private:
    static std::string SetCardContext(std::string card);

    class LogImpl;
    std::unique_ptr<LogImpl> m_Impl;
};

template<class... Args>
void LogInfo(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Information, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogDebug(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Debug, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogWarning(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Warning, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogError(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Error, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogFatal(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Fatal, message, std::forward<Args>(args)...);
}
