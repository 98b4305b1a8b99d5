#include "log_impl.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <stdexcept>

#include <QDebug>
#include <QString>

#include <fmt/chrono.h>
#include <fmt/ranges.h>

namespace fs = std::filesystem;

Log::LogImpl::LogImpl(LogFlags log_flags, std::string_view log_name)
    : m_LogName{ log_name }
    , m_LogFlags{ log_flags }
{
    if (IsSet(m_LogFlags, LogFlags::File))
    {
        CreateLogFile();
    }
}

Log::LogImpl::~LogImpl()
{
    UnregisterInstance();
}

Log* Log::LogImpl::GetInstance(std::string_view log_name)
{
    const auto it{ g_Instances.find(log_name) };
    return it != g_Instances.end() ? it->second->m_ParentLog : nullptr;
}

void Log::LogImpl::RegisterInstance(Log* parent_log)
{
    if (g_Instances.contains(m_LogName))
    {
        throw std::logic_error{ fmt::format("Log name {} is already in use", m_LogName) };
    }

    m_ParentLog = parent_log;
    g_Instances[m_LogName] = this;
}

void Log::LogImpl::UnregisterInstance()
{
    const auto it{ g_Instances.find(m_LogName) };
    if (it != g_Instances.end() && it->second == this)
    {
        g_Instances.erase(it);
    }
    m_ParentLog = nullptr;
}

uint32_t Log::LogImpl::InstallHook(Log::LogHook hook)
{
    const uint32_t hook_id{ m_NextHookId++ };
    m_LogHooks.push_back({ hook_id, std::move(hook) });
    return hook_id;
}

void Log::LogImpl::UninstallHook(uint32_t hook_id)
{
    std::erase_if(m_LogHooks,
                  [hook_id](const InstalledLogHook& hook)
                  { return hook.m_HookId == hook_id; });
}

bool Log::LogImpl::Accepts(Log::LogLevel level) const
{
    return level != LogLevel::Debug || IsSet(m_LogFlags, LogFlags::Verbose);
}

void Log::LogImpl::Print(const Log::DetailInformation& detail_info, Log::LogLevel level, std::string_view message)
{
    const std::string line{ FormatLine(detail_info, level, message) };

    if (IsSet(m_LogFlags, LogFlags::Console))
    {
        qDebug().noquote() << QString::fromStdString(line);
    }
    if (m_FileStream.is_open())
    {
        m_FileStream << line << '\n'
                     << std::flush;
    }

    // Copied so hooks may uninstall themselves
    const std::vector<InstalledLogHook> hooks{ m_LogHooks };
    for (const InstalledLogHook& hook : hooks)
    {
        hook.m_Hook(detail_info, level, message);
    }

    if (level == LogLevel::Fatal && IsSet(m_LogFlags, LogFlags::FatalQuit))
    {
        std::exit(-1);
    }
}

std::string Log::LogImpl::FormatLine(const Log::DetailInformation& detail_info, Log::LogLevel level, std::string_view message) const
{
    static constexpr std::string_view c_LevelTags[]{
        " [INFO]",
        "[DEBUG]",
        " [WARN]",
        "[ERROR]",
        "[FATAL]",
    };
    std::string line{ c_LevelTags[static_cast<size_t>(level)] };

    std::vector<std::string> details;
    if (IsSet(m_LogFlags, LogFlags::DetailTime))
    {
        details.push_back(fmt::format("{:%H:%M:%S}", fmt::localtime(detail_info.m_Time)));
    }
    if (IsSet(m_LogFlags, LogFlags::DetailFile))
    {
        std::string_view file{ detail_info.m_File };
#ifdef MCM_SOURCE_ROOT
        if (file.starts_with(MCM_SOURCE_ROOT))
        {
            file.remove_prefix(std::strlen(MCM_SOURCE_ROOT));
        }
#endif
        details.push_back(IsSet(m_LogFlags, LogFlags::DetailLine)
                              ? fmt::format("{}:{}", file, detail_info.m_Line)
                              : std::string{ file });
    }
    if (IsSet(m_LogFlags, LogFlags::DetailCard) && !detail_info.m_Card.empty())
    {
        details.push_back(fmt::format("card {}", detail_info.m_Card));
    }

    if (!details.empty())
    {
        line += fmt::format("<{}>", fmt::join(details, "; "));
    }

    line += ": ";
    line += message;
    return line;
}

void Log::LogImpl::CreateLogFile()
{
    const fs::path logs_directory{ fs::absolute("logs") };
    fs::create_directories(logs_directory);

    // Oldest files go first once the folder is full
    std::vector<fs::directory_entry> log_files;
    for (const auto& entry : fs::directory_iterator{ logs_directory })
    {
        if (entry.is_regular_file() && entry.path().extension() == ".log")
        {
            log_files.push_back(entry);
        }
    }
    std::ranges::sort(log_files, {}, [](const fs::directory_entry& entry)
                      { return entry.last_write_time(); });

    static constexpr size_t c_MaxNumLogFiles{ 256 };
    const size_t num_to_remove{ log_files.size() >= c_MaxNumLogFiles ? log_files.size() - c_MaxNumLogFiles + 1 : 0 };
    for (size_t i = 0; i < num_to_remove; i++)
    {
        std::error_code error_code;
        if (!fs::remove(log_files[i].path(), error_code) && error_code)
        {
            qDebug().noquote() << QString::fromStdString(fmt::format(" [WARN]: Could not remove old log file {}: {}", log_files[i].path().string(), error_code.message()));
        }
    }

    const fs::path log_file{
        logs_directory / fmt::format("{}_{:%Y-%m-%d_%H-%M-%S}.log", m_LogName, fmt::localtime(std::time(nullptr)))
    };
    m_FileStream.open(log_file);
    if (!m_FileStream.is_open())
    {
        qDebug().noquote() << QString::fromStdString(fmt::format("[ERROR]: Could not open log file {}", log_file.string()));
    }
}
