#include "test_base.hpp"
#include "core/announcer_errors.hpp"
#include "core/color_fetcher.hpp"
#include "core/postgres_color_source.hpp"
#include <stdexcept>

namespace
{
    class FakeColorSource : public ColorSource
    {
    public:
        ColorData fetchColors(const DatabaseCredentials &credentials) override
        {
            ++calls;
            last_server = credentials.server;
            if (calls <= failures)
            {
                throw std::runtime_error("connection refused");
            }
            return result;
        }

        int failures = 0;
        int calls = 0;
        std::string last_server;
        ColorData result;
    };

    ConfigSnapshot snapshotWithServer(const std::string &server)
    {
        ConfigSnapshot snapshot;
        snapshot.credentials = {server, "tickets", "user", "pw"};
        snapshot.voice.voice_id = "voice";
        return snapshot;
    }
}

class ColorFetcherTest : public TempDirTest
{
protected:
    ErrorRecovery::SleepFunction noSleep()
    {
        return [this](std::chrono::milliseconds)
        { ++sleep_calls_; };
    }

    int sleep_calls_ = 0;
};

TEST_F(ColorFetcherTest, ColorNamesFromCodes)
{
    EXPECT_EQ(colorNameFromCode(-65536), "Red");
    EXPECT_EQ(colorNameFromCode(-256), "Yellow");
    EXPECT_EQ(colorNameFromCode(-16711681), "Blue");
    EXPECT_EQ(colorNameFromCode(-16711936), "Green");
    EXPECT_EQ(colorNameFromCode(-23296), "Orange");
    EXPECT_EQ(colorNameFromCode(12345), "Unknown");
}

TEST_F(ColorFetcherTest, RotationAtShiftStartKeepsOrder)
{
    auto colors = rotateColors({-65536, -256, -16711681, -16711936}, 0);
    EXPECT_EQ(colors.at("color1"), "Red");
    EXPECT_EQ(colors.at("color2"), "Yellow");
    EXPECT_EQ(colors.at("color3"), "Blue");
    EXPECT_EQ(colors.at("color4"), "Green");
}

TEST_F(ColorFetcherTest, RotationAdvancesEveryInterval)
{
    const std::vector<long long> codes = {-65536, -256, -16711681, -16711936};

    // 45 minutes in: second interval, Yellow leads
    auto colors = rotateColors(codes, 45);
    EXPECT_EQ(colors.at("color1"), "Yellow");
    EXPECT_EQ(colors.at("color2"), "Blue");
    EXPECT_EQ(colors.at("color3"), "Green");
    EXPECT_EQ(colors.at("color4"), "Red");

    // 125 minutes in: interval 4 wraps back to the start
    EXPECT_EQ(rotateColors(codes, 125).at("color1"), "Red");
}

TEST_F(ColorFetcherTest, RotationWrapsNegativeMinutesIntoTheDay)
{
    const std::vector<long long> codes = {-65536, -256, -16711681};
    // -30 minutes -> 1410 minutes -> interval 47 % 3 = 2
    auto colors = rotateColors(codes, -30);
    EXPECT_EQ(colors.at("color1"), "Blue");
    EXPECT_EQ(colors.at("color2"), "Red");
    EXPECT_EQ(colors.at("color3"), "Yellow");
}

TEST_F(ColorFetcherTest, RotationOfNoColorsIsEmpty)
{
    EXPECT_TRUE(rotateColors({}, 100).empty());
}

TEST_F(ColorFetcherTest, ReturnsColorsFromSource)
{
    FakeColorSource source;
    source.result = {{"color1", "Red"}, {"color2", "Blue"}};
    ColorFetcher fetcher(source, RetryPolicy{}, noSleep());

    auto colors = fetcher.fetch(snapshotWithServer("db.local"));
    ASSERT_TRUE(colors);
    EXPECT_EQ(colors->at("color1"), "Red");
    EXPECT_EQ(source.last_server, "db.local");
    EXPECT_EQ(fetcher.getLastAttemptCount(), 1);
    EXPECT_EQ(sleep_calls_, 0);
}

TEST_F(ColorFetcherTest, RecoversFromTransientFailures)
{
    FakeColorSource source;
    source.failures = 2;
    source.result = {{"color1", "Green"}};
    ColorFetcher fetcher(source, RetryPolicy{}, noSleep());

    auto colors = fetcher.fetch(snapshotWithServer("db"));
    ASSERT_TRUE(colors);
    EXPECT_EQ(colors->at("color1"), "Green");
    EXPECT_EQ(fetcher.getLastAttemptCount(), 3);
    EXPECT_EQ(sleep_calls_, 2);
}

TEST_F(ColorFetcherTest, ExhaustedRetriesThrowAuxiliaryFetchError)
{
    FakeColorSource source;
    source.failures = 10;
    ColorFetcher fetcher(source, RetryPolicy{}, noSleep());

    EXPECT_THROW(fetcher.fetch(snapshotWithServer("db")), AuxiliaryFetchError);
    EXPECT_EQ(source.calls, 3);
    EXPECT_EQ(fetcher.getLastAttemptCount(), 3);
}

TEST_F(ColorFetcherTest, EmptyResultIsNullopt)
{
    FakeColorSource source;
    ColorFetcher fetcher(source, RetryPolicy{}, noSleep());
    EXPECT_FALSE(fetcher.fetch(snapshotWithServer("db")).has_value());
}
