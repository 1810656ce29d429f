#include "subtitles/ass_track.hpp"

#include <utility>

#include <magic_enum/magic_enum.hpp>

#include "subtitles/ass_parser.hpp"
#include "subtitles/ass_time.hpp"
#include "utils/log.hpp"

namespace assview {

void AssSubtitleTrack::LoadSubtitles(std::string_view content)
{
	Clear();

	document_ = ParseAssDocument(content);
	index_ = ActiveDialogueIndex(document_);

	Log("Loaded {} styles and {} subtitle entries", document_.styles.size(), document_.dialogues.size());
	if (index_.size() != document_.dialogues.size()) {
		LogWarn("{} subtitle entries end before they start and will never be shown", document_.dialogues.size() - index_.size());
	}
	if (!document_.dialogues.empty()) {
		const AssDialogue &first = document_.dialogues[0];
		Log("First subtitle: {}-{}: \"{}\"",
		    FormatAssTimestamp(first.startMs),
		    FormatAssTimestamp(first.endMs),
		    first.displayText);
	}
}

std::vector<AssCue> AssSubtitleTrack::GetActiveCues(int64_t currentTimeMs) const
{
	std::vector<AssCue> cues;
	for (const AssDialogue *dialogue : index_.Query(currentTimeMs)) {
		ResolvedAssStyle style = ResolveAssStyle(document_, *dialogue, defaults_);
		LogVerbose(LogCategory::Video, "Subtitle at {}ms: \"{}\" anchored {}/{} in {}",
		    currentTimeMs, dialogue->displayText,
		    magic_enum::enum_name(style.position.vertical),
		    magic_enum::enum_name(style.position.horizontal),
		    style.textStyle.color);
		cues.push_back({ dialogue, std::move(style) });
	}
	return cues;
}

void AssSubtitleTrack::Clear()
{
	index_ = ActiveDialogueIndex();
	document_ = AssDocument();
}

} // namespace assview
