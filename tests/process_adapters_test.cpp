#include "test_base.hpp"
#include "core/announcer_errors.hpp"
#include "core/audio_player.hpp"
#include "core/scoped_artifact.hpp"
#include "core/speech_synthesizer.hpp"

class ProcessAdaptersTest : public TempDirTest
{
};

TEST_F(ProcessAdaptersTest, PlayerSplitsArguments)
{
    ProcessAudioPlayer player("mpg123", "  -q   --no-control ");
    ASSERT_EQ(player.getArgs().size(), 2u);
    EXPECT_EQ(player.getArgs()[0], "-q");
    EXPECT_EQ(player.getArgs()[1], "--no-control");
}

TEST_F(ProcessAdaptersTest, PlayerSucceedsOnZeroExit)
{
    writeFile("clip.mp3", "audio");
    ProcessAudioPlayer player("true", "");
    EXPECT_NO_THROW(player.play(path("clip.mp3")));
}

TEST_F(ProcessAdaptersTest, PlayerFailsOnNonZeroExit)
{
    writeFile("clip.mp3", "audio");
    ProcessAudioPlayer player("false", "");
    EXPECT_THROW(player.play(path("clip.mp3")), PlaybackError);
}

TEST_F(ProcessAdaptersTest, PlayerRejectsMissingFile)
{
    ProcessAudioPlayer player("true", "");
    EXPECT_THROW(player.play(path("missing.mp3")), PlaybackError);
}

TEST_F(ProcessAdaptersTest, PlayerReportsUnreachablePathAsPlaybackError)
{
    // A path component beyond NAME_MAX makes stat fail with ENAMETOOLONG
    ProcessAudioPlayer player("true", "");
    const std::string unreachable = path(std::string(300, 'a') + "/clip.mp3");
    EXPECT_THROW(player.play(unreachable), PlaybackError);
}

TEST_F(ProcessAdaptersTest, SynthesizerFailsWhenToolFails)
{
    EdgeTtsSynthesizer synthesizer("false");
    EXPECT_THROW(synthesizer.synthesize("hello", VoiceSettings{"en-US-AriaNeural", "mp3"}), SynthesisError);
}

TEST_F(ProcessAdaptersTest, SynthesizerFailsWhenNoAudioIsWritten)
{
    EdgeTtsSynthesizer synthesizer("true");
    EXPECT_THROW(synthesizer.synthesize("hello", VoiceSettings{"en-US-AriaNeural", "mp3"}), SynthesisError);
}

TEST_F(ProcessAdaptersTest, ScopedArtifactDeletesFile)
{
    writeFile("speech.mp3", "audio");
    {
        ScopedArtifact artifact(path("speech.mp3"));
        EXPECT_EQ(artifact.path(), path("speech.mp3"));
        EXPECT_TRUE(exists("speech.mp3"));
    }
    EXPECT_FALSE(exists("speech.mp3"));
}
