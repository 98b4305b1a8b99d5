#include <mcm/export/export_job.hpp>

#include <exception>
#include <thread>

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>

#include <mcm/util/log.hpp>

ExportJob::ExportJob(std::vector<CardRecord> cards, CardRasterizer& rasterizer)
    : m_Cards{ std::move(cards) }
    , m_Rasterizer{ rasterizer }
{
}

ExportJob::~ExportJob()
{
    Cancel();
}

bool ExportJob::Step()
{
    if (IsFinished())
    {
        return false;
    }

    if (m_Cancelled)
    {
        LogInfo("Export cancelled after {} of {} cards", m_Cursor, m_Cards.size());
        Abort();
        m_State = State::Cancelled;
        return false;
    }

    switch (m_State)
    {
    case State::Idle:
        try
        {
            Begin();
        }
        catch (const std::exception& e)
        {
            Fail(e.what());
            return false;
        }

        m_State = m_Cards.empty() ? State::Finalizing : State::Processing;
        return true;

    case State::Processing:
        CaptureNextCard();
        if (m_State == State::Processing && m_Cursor == m_Cards.size())
        {
            m_State = State::Finalizing;
        }
        return !IsFinished();

    case State::Finalizing:
        try
        {
            Finish();
        }
        catch (const std::exception& e)
        {
            Fail(e.what());
            return false;
        }

        m_State = State::Done;
        if (!m_FailedCards.empty())
        {
            LogWarning("Export finished, {} of {} cards could not be captured", m_FailedCards.size(), m_Cards.size());
        }
        else
        {
            LogInfo("Export finished, {} cards", m_Cards.size());
        }
        return false;

    default:
        return false;
    }
}

void ExportJob::CaptureNextCard()
{
    const size_t index{ m_Cursor };
    const CardRecord& card{ m_Cards[index] };
    const auto card_scope{ Log::EnterCard(fmt::format("{}/{} \"{}\"", index + 1, m_Cards.size(), card.m_Title)) };

    if (m_SettleDelay.count() > 0)
    {
        std::this_thread::sleep_for(m_SettleDelay);
    }

    Image image{};
    try
    {
        image = m_Rasterizer.Capture(card, index);
    }
    catch (const std::exception& e)
    {
        LogError("Failed capturing card {} \"{}\": {}", index + 1, card.m_Title, e.what());
        m_FailedCards.push_back(index);
    }

    try
    {
        if (image.Valid())
        {
            ProcessCard(index, card, std::move(image));
        }
        EndCard(index);
    }
    catch (const std::exception& e)
    {
        Fail(e.what());
        return;
    }

    ++m_Cursor;
    ReportProgress();
}

ExportJob::State ExportJob::Run()
{
    while (Step())
    {
    }
    return m_State;
}

void ExportJob::Cancel()
{
    m_Cancelled = true;
}

bool ExportJob::IsCancelled() const
{
    return m_Cancelled;
}

ExportJob::State ExportJob::GetState() const
{
    return m_State;
}

bool ExportJob::IsFinished() const
{
    return m_State == State::Done ||
           m_State == State::Cancelled ||
           m_State == State::Failed;
}

size_t ExportJob::GetCurrent() const
{
    return m_Cursor;
}

size_t ExportJob::GetTotal() const
{
    return m_Cards.size();
}

const std::vector<size_t>& ExportJob::FailedCards() const
{
    return m_FailedCards;
}

const std::string& ExportJob::GetError() const
{
    return m_Error;
}

void ExportJob::SetProgressCallback(ProgressCallback callback)
{
    m_ProgressCallback = std::move(callback);
}

void ExportJob::SetSettleDelay(std::chrono::milliseconds settle_delay)
{
    m_SettleDelay = settle_delay;
}

void ExportJob::Begin()
{
}

void ExportJob::EndCard(size_t /*index*/)
{
}

void ExportJob::Abort()
{
}

void ExportJob::ReportProgress()
{
    if (m_ProgressCallback)
    {
        m_ProgressCallback(m_Cursor, m_Cards.size());
    }
}

const std::vector<CardRecord>& ExportJob::GetCards() const
{
    return m_Cards;
}

void ExportJob::Fail(std::string error)
{
    LogError("Export failed while {}: {}", magic_enum::enum_name(m_State), error);
    Abort();
    m_Error = std::move(error);
    m_State = State::Failed;
}
