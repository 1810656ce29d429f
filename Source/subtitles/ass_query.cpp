#include "subtitles/ass_query.hpp"

#include <algorithm>
#include <functional>
#include <limits>

namespace assview {

std::vector<const AssDialogue *> GetActiveDialogues(const AssDocument &document, int64_t timeMs)
{
	std::vector<const AssDialogue *> active;
	for (const AssDialogue &dialogue : document.dialogues) {
		if (timeMs >= dialogue.startMs && timeMs <= dialogue.endMs) {
			active.push_back(&dialogue);
		}
	}
	return active;
}

ActiveDialogueIndex::ActiveDialogueIndex(const AssDocument &document)
{
	byStart_.reserve(document.dialogues.size());
	for (const AssDialogue &dialogue : document.dialogues) {
		// A dialogue that ends before it starts contains no timestamp.
		if (dialogue.endMs < dialogue.startMs)
			continue;
		byStart_.push_back(&dialogue);
		maxDurationMs_ = std::max(maxDurationMs_, dialogue.endMs - dialogue.startMs);
	}
	std::stable_sort(byStart_.begin(), byStart_.end(), [](const AssDialogue *lhs, const AssDialogue *rhs) {
		return lhs->startMs < rhs->startMs;
	});
}

std::vector<const AssDialogue *> ActiveDialogueIndex::Query(int64_t timeMs) const
{
	// Only dialogues starting in [timeMs - maxDuration, timeMs] can contain timeMs.
	const int64_t earliestStart = timeMs < std::numeric_limits<int64_t>::min() + maxDurationMs_
	    ? std::numeric_limits<int64_t>::min()
	    : timeMs - maxDurationMs_;

	const auto first = std::lower_bound(byStart_.begin(), byStart_.end(), earliestStart,
	    [](const AssDialogue *dialogue, int64_t start) { return dialogue->startMs < start; });
	const auto last = std::upper_bound(first, byStart_.end(), timeMs,
	    [](int64_t time, const AssDialogue *dialogue) { return time < dialogue->startMs; });

	std::vector<const AssDialogue *> active;
	for (auto it = first; it != last; ++it) {
		if ((*it)->endMs >= timeMs)
			active.push_back(*it);
	}

	// All pointers refer to the same vector, so address order is source order.
	std::sort(active.begin(), active.end(), std::less<const AssDialogue *>());
	return active;
}

} // namespace assview
