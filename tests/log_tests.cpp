#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include <mcm/util/log.hpp>

namespace
{
struct RecordedMessage
{
    Log::LogLevel m_Level;
    std::string m_Card;
    std::string m_Message;
};

std::vector<RecordedMessage> LogAll(std::string_view log_name)
{
    std::vector<RecordedMessage> recorded;
    Log* log{ Log::GetInstance(log_name) };
    REQUIRE(log != nullptr);
    const uint32_t hook{ log->InstallHook(
        [&](const Log::DetailInformation& detail, Log::LogLevel level, std::string_view message)
        {
            recorded.push_back({ level, std::string{ detail.m_Card }, std::string{ message } });
        }) };

    Log::DoLog(log_name, Log::LogLevel::Debug, "debug {}", 1);
    Log::DoLog(log_name, Log::LogLevel::Information, "info {}", 2);
    {
        const auto card_scope{ Log::EnterCard("1/2 \"Gobelin\"") };
        Log::DoLog(log_name, Log::LogLevel::Warning, "warning {}", 3);
        {
            const auto nested_scope{ Log::EnterCard("2/2 \"Orque\"") };
            Log::DoLog(log_name, Log::LogLevel::Error, "error {}", 4);
        }
        Log::DoLog(log_name, Log::LogLevel::Warning, "warning {}", 5);
    }
    Log::DoLog(log_name, Log::LogLevel::Information, "info {}", 6);

    log->UninstallHook(hook);
    return recorded;
}
} // namespace

TEST_CASE("Debug messages need a verbose log", "[log_verbose]")
{
    {
        Log quiet_log{ LogFlags::None, "Quiet-Test-Log" };
        const auto recorded{ LogAll("Quiet-Test-Log") };
        REQUIRE(recorded.size() == 5);
        REQUIRE(recorded.front().m_Message == "info 2");
    }

    {
        Log verbose_log{ LogFlags::Verbose, "Verbose-Test-Log" };
        const auto recorded{ LogAll("Verbose-Test-Log") };
        REQUIRE(recorded.size() == 6);
        REQUIRE(recorded.front().m_Level == Log::LogLevel::Debug);
        REQUIRE(recorded.front().m_Message == "debug 1");
    }

    REQUIRE(Log::GetInstance("Quiet-Test-Log") == nullptr);
}

TEST_CASE("Card scopes tag messages and nest", "[log_card_scope]")
{
    Log card_log{ LogFlags::None, "Card-Test-Log" };
    const auto recorded{ LogAll("Card-Test-Log") };
    REQUIRE(recorded.size() == 5);
    REQUIRE(recorded[0].m_Card.empty());
    REQUIRE(recorded[1].m_Card == "1/2 \"Gobelin\"");
    REQUIRE(recorded[2].m_Card == "2/2 \"Orque\"");
    REQUIRE(recorded[3].m_Card == "1/2 \"Gobelin\"");
    REQUIRE(recorded[4].m_Card.empty());
    REQUIRE(Log::GetCardContext().empty());
}
