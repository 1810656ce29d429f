/**
 * @file ass_track.hpp
 *
 * Subtitle state for one video, queried by the player once per frame.
 */
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "subtitles/ass_document.hpp"
#include "subtitles/ass_query.hpp"
#include "subtitles/ass_style_resolver.hpp"

namespace assview {

/**
 * @brief A dialogue that is on screen, with its resolved style.
 */
struct AssCue {
	const AssDialogue *dialogue;
	ResolvedAssStyle style;
};

/**
 * @brief Owns the parsed subtitles of the current video
 */
class AssSubtitleTrack {
public:
	AssSubtitleTrack() = default;
	~AssSubtitleTrack() = default;

	AssSubtitleTrack(const AssSubtitleTrack &) = delete;
	AssSubtitleTrack &operator=(const AssSubtitleTrack &) = delete;
	AssSubtitleTrack(AssSubtitleTrack &&) = default;
	AssSubtitleTrack &operator=(AssSubtitleTrack &&) = default;

	/**
	 * @brief Load subtitles from the text of an ASS script
	 * @param content Full script text, already read by the caller
	 */
	void LoadSubtitles(std::string_view content);

	/**
	 * @brief Get the cues to draw at the given time
	 * @param currentTimeMs Current playback time in milliseconds
	 * @return Active dialogues in source order, each with its resolved style
	 */
	std::vector<AssCue> GetActiveCues(int64_t currentTimeMs) const;

	/**
	 * @brief Clear subtitle data
	 */
	void Clear();

	/**
	 * @brief Check if subtitles are loaded
	 * @return True if subtitles are available
	 */
	bool HasSubtitles() const { return !document_.dialogues.empty(); }

	const AssDocument &document() const { return document_; }

	const AssRenderDefaults &defaults() const { return defaults_; }
	void SetDefaults(const AssRenderDefaults &defaults) { defaults_ = defaults; }

private:
	AssDocument document_;
	ActiveDialogueIndex index_;
	AssRenderDefaults defaults_;
};

} // namespace assview
