#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "subtitles/ass_document.hpp"

namespace assview {

/**
 * @brief Get every dialogue that is on screen at the given time
 * @param document Parsed script
 * @param timeMs Current playback time in milliseconds
 * @return Dialogues with start <= timeMs <= end, in source order
 */
std::vector<const AssDialogue *> GetActiveDialogues(const AssDocument &document, int64_t timeMs);

/**
 * @brief Start-sorted index over a document's dialogues.
 *
 * Returns exactly what GetActiveDialogues returns, without scanning every dialogue.
 * Holds pointers into the document's dialogue storage, so the document must outlive it
 * and must not be modified.
 */
class ActiveDialogueIndex {
public:
	ActiveDialogueIndex() = default;
	explicit ActiveDialogueIndex(const AssDocument &document);

	[[nodiscard]] std::vector<const AssDialogue *> Query(int64_t timeMs) const;

	/** @brief Number of dialogues that can ever be active. */
	[[nodiscard]] size_t size() const
	{
		return byStart_.size();
	}

private:
	std::vector<const AssDialogue *> byStart_;
	int64_t maxDurationMs_ = 0;
};

} // namespace assview
