#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include <mcm/card/card_record.hpp>
#include <mcm/image.hpp>
#include <mcm/render/rasterizer.hpp>

/*
        Processes one card per Step in input order, capture failures skip the card
        while packaging failures fail the whole job
*/
class ExportJob
{
  public:
    enum class State
    {
        Idle,
        Processing,
        Finalizing,
        Done,
        Cancelled,
        Failed,
    };

    using ProgressCallback = std::function<void(size_t current, size_t total)>;

    ExportJob(std::vector<CardRecord> cards, CardRasterizer& rasterizer);
    virtual ~ExportJob();

    ExportJob(const ExportJob&) = delete;
    ExportJob& operator=(const ExportJob&) = delete;

    // Returns false once the job reached a final state
    bool Step();
    State Run();

    // Safe to call from any thread, including signal handlers
    void Cancel();
    bool IsCancelled() const;

    State GetState() const;
    bool IsFinished() const;

    size_t GetCurrent() const;
    size_t GetTotal() const;

    const std::vector<size_t>& FailedCards() const;
    const std::string& GetError() const;

    void SetProgressCallback(ProgressCallback callback);
    void SetSettleDelay(std::chrono::milliseconds settle_delay);

  protected:
    virtual void Begin();
    virtual void ProcessCard(size_t index, const CardRecord& card, Image image) = 0;
    // Runs after every card, whether it could be captured or not
    virtual void EndCard(size_t index);
    virtual void Finish() = 0;

    // Called when the job is cancelled or failed, before the state changes
    virtual void Abort();

    virtual void ReportProgress();

    const std::vector<CardRecord>& GetCards() const;

    ProgressCallback m_ProgressCallback;

  private:
    void Fail(std::string error);
    void CaptureNextCard();

    std::vector<CardRecord> m_Cards;
    CardRasterizer& m_Rasterizer;

    std::atomic_bool m_Cancelled{ false };
    State m_State{ State::Idle };
    size_t m_Cursor{ 0 };

    std::chrono::milliseconds m_SettleDelay{ 0 };

    std::vector<size_t> m_FailedCards;
    std::string m_Error;
};
