#include <mcm/util/log.hpp>

#include <utility>

#include "log_impl.hpp"

Log::Log(LogFlags log_flags, std::string_view log_name)
    : m_Impl{ std::make_unique<LogImpl>(log_flags, log_name) }
{
    m_Impl->RegisterInstance(this);
}

Log::~Log() = default;

Log* Log::GetInstance(std::string_view log_name)
{
    return LogImpl::GetInstance(log_name);
}

uint32_t Log::InstallHook(LogHook hook)
{
    return m_Impl->InstallHook(std::move(hook));
}

void Log::UninstallHook(uint32_t hook_id)
{
    m_Impl->UninstallHook(hook_id);
}

std::string Log::SetCardContext(std::string card)
{
    return std::exchange(LogImpl::g_CardContext, std::move(card));
}

std::string_view Log::GetCardContext()
{
    return LogImpl::g_CardContext;
}

bool Log::Accepts(LogLevel level) const
{
    return m_Impl->Accepts(level);
}

void Log::Print(const DetailInformation& detail_info, LogLevel level, std::string_view message)
{
    m_Impl->Print(detail_info, level, message);
}
