#pragma once

#include <cstddef>
#include <iterator>
#include <string_view>

namespace assview {

/**
 * @brief Iterates over the slices of a string separated by a single character.
 *
 * Matches the semantics of a plain split: "a,,b" yields "a", "", "b", a trailing
 * separator yields a trailing empty slice and an empty string yields one empty slice.
 */
class SplitByCharIterator {
public:
	using iterator_category = std::forward_iterator_tag;
	using difference_type = std::ptrdiff_t;
	using value_type = std::string_view;
	using pointer = const std::string_view *;
	using reference = const std::string_view &;

	static SplitByCharIterator begin(std::string_view text, char splitBy) // NOLINT(readability-identifier-naming)
	{
		return SplitByCharIterator(splitBy, text, 0);
	}

	static SplitByCharIterator end(std::string_view text, char splitBy) // NOLINT(readability-identifier-naming)
	{
		return SplitByCharIterator(splitBy, text, std::string_view::npos);
	}

	[[nodiscard]] std::string_view operator*() const
	{
		return slice_;
	}

	[[nodiscard]] const std::string_view *operator->() const
	{
		return &slice_;
	}

	SplitByCharIterator &operator++()
	{
		const size_t next = offset_ + slice_.size();
		if (next >= text_.size()) {
			offset_ = std::string_view::npos;
			slice_ = {};
		} else {
			offset_ = next + 1;
			UpdateSlice();
		}
		return *this;
	}

	SplitByCharIterator operator++(int)
	{
		auto copy = *this;
		++(*this);
		return copy;
	}

	bool operator==(const SplitByCharIterator &rhs) const
	{
		return offset_ == rhs.offset_;
	}

	bool operator!=(const SplitByCharIterator &rhs) const
	{
		return !(*this == rhs);
	}

	/** @brief Everything from the start of the current slice to the end of the text. */
	[[nodiscard]] std::string_view remainder() const
	{
		return offset_ == std::string_view::npos ? std::string_view {} : text_.substr(offset_);
	}

private:
	SplitByCharIterator(char splitBy, std::string_view text, size_t offset)
	    : splitBy_(splitBy)
	    , text_(text)
	    , offset_(offset)
	{
		if (offset_ != std::string_view::npos)
			UpdateSlice();
	}

	void UpdateSlice()
	{
		const size_t separator = text_.find(splitBy_, offset_);
		slice_ = text_.substr(offset_, separator == std::string_view::npos ? std::string_view::npos : separator - offset_);
	}

	char splitBy_;
	std::string_view text_;
	size_t offset_;
	std::string_view slice_;
};

class SplitByChar {
public:
	explicit SplitByChar(std::string_view text, char splitBy)
	    : text_(text)
	    , splitBy_(splitBy)
	{
	}

	[[nodiscard]] SplitByCharIterator begin() const // NOLINT(readability-identifier-naming)
	{
		return SplitByCharIterator::begin(text_, splitBy_);
	}

	[[nodiscard]] SplitByCharIterator end() const // NOLINT(readability-identifier-naming)
	{
		return SplitByCharIterator::end(text_, splitBy_);
	}

private:
	std::string_view text_;
	char splitBy_;
};

} // namespace assview
