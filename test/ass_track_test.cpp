#include <gtest/gtest.h>

#include <string_view>
#include <utility>

#include "subtitles/ass_track.hpp"

namespace assview {

namespace {

constexpr std::string_view Script = R"([Script Info]
Title: Track

[V4+ Styles]
Style: Default,Arial,20,&H00FFFFFF,&H000000FF,&H00000000,&H00000000,0,0,0,0,100,100,0,0,1,2,2,2,10,10,10,1

[Events]
Dialogue: 0,0:00:01.00,0:00:03.00,Default,,0,0,0,,First
Dialogue: 0,0:00:02.00,0:00:04.00,Default,,0,0,0,,{\an8}Second
Dialogue: 0,0:00:09.00,0:00:08.00,Default,,0,0,0,,Never
)";

} // namespace

TEST(AssSubtitleTrack, StartsEmpty)
{
	AssSubtitleTrack track;
	EXPECT_FALSE(track.HasSubtitles());
	EXPECT_TRUE(track.GetActiveCues(0).empty());
}

TEST(AssSubtitleTrack, LoadAndQuery)
{
	AssSubtitleTrack track;
	track.LoadSubtitles(Script);
	ASSERT_TRUE(track.HasSubtitles());
	EXPECT_EQ(track.document().scriptInfo.at("Title"), "Track");
	EXPECT_EQ(track.document().dialogues.size(), 3u);

	EXPECT_TRUE(track.GetActiveCues(500).empty());

	const std::vector<AssCue> cues = track.GetActiveCues(2500);
	ASSERT_EQ(cues.size(), 2u);
	EXPECT_EQ(cues[0].dialogue->displayText, "First");
	EXPECT_EQ(cues[0].style.position.vertical, VerticalAnchor::Bottom);
	EXPECT_EQ(cues[0].style.position.marginVertical, 10);
	EXPECT_EQ(cues[1].dialogue->displayText, "Second");
	EXPECT_EQ(cues[1].style.position.vertical, VerticalAnchor::Top);

	EXPECT_TRUE(track.GetActiveCues(8500).empty());
}

TEST(AssSubtitleTrack, CuesMatchResolver)
{
	AssSubtitleTrack track;
	track.LoadSubtitles(Script);
	for (const AssCue &cue : track.GetActiveCues(3000)) {
		EXPECT_EQ(cue.style, ResolveAssStyle(track.document(), *cue.dialogue, track.defaults()));
	}
}

TEST(AssSubtitleTrack, DefaultsApplyToCues)
{
	AssSubtitleTrack track;
	AssRenderDefaults defaults;
	defaults.margin = 42;
	track.SetDefaults(defaults);
	track.LoadSubtitles("[Events]\nDialogue: 0,0:00:00.00,0:00:01.00,Unknown,,0,0,0,,x\n");

	const std::vector<AssCue> cues = track.GetActiveCues(0);
	ASSERT_EQ(cues.size(), 1u);
	EXPECT_EQ(cues[0].style.position.marginVertical, 42);
}

TEST(AssSubtitleTrack, MovedTrackStillQueries)
{
	AssSubtitleTrack track;
	track.LoadSubtitles(Script);
	const AssSubtitleTrack moved = std::move(track);
	const std::vector<AssCue> cues = moved.GetActiveCues(1000);
	ASSERT_EQ(cues.size(), 1u);
	EXPECT_EQ(cues[0].dialogue, &moved.document().dialogues[0]);
}

TEST(AssSubtitleTrack, ReloadReplacesAndClearEmpties)
{
	AssSubtitleTrack track;
	track.LoadSubtitles(Script);
	track.LoadSubtitles("[Events]\nDialogue: 0,0:00:10.00,0:00:11.00,Default,,0,0,0,,Other\n");
	EXPECT_EQ(track.document().dialogues.size(), 1u);
	EXPECT_TRUE(track.GetActiveCues(2500).empty());
	EXPECT_EQ(track.GetActiveCues(10500).size(), 1u);

	track.Clear();
	EXPECT_FALSE(track.HasSubtitles());
	EXPECT_TRUE(track.GetActiveCues(10500).empty());
}

} // namespace assview
