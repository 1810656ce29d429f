#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <SDL.h>
#include <fmt/format.h>

namespace assview {

enum class LogCategory {
	Application = SDL_LOG_CATEGORY_APPLICATION,
	Error = SDL_LOG_CATEGORY_ERROR,
	Assert = SDL_LOG_CATEGORY_ASSERT,
	System = SDL_LOG_CATEGORY_SYSTEM,
	Audio = SDL_LOG_CATEGORY_AUDIO,
	Video = SDL_LOG_CATEGORY_VIDEO,
	Render = SDL_LOG_CATEGORY_RENDER,
	Input = SDL_LOG_CATEGORY_INPUT,
	Test = SDL_LOG_CATEGORY_TEST,
};

constexpr auto defaultCategory = LogCategory::Application;

enum class LogPriority {
	Verbose = SDL_LOG_PRIORITY_VERBOSE,
	Debug = SDL_LOG_PRIORITY_DEBUG,
	Info = SDL_LOG_PRIORITY_INFO,
	Warn = SDL_LOG_PRIORITY_WARN,
	Error = SDL_LOG_PRIORITY_ERROR,
	Critical = SDL_LOG_PRIORITY_CRITICAL,
};

/**
 * @brief Sets the minimum priority that is emitted for a category.
 */
inline void SetLogPriority(LogCategory category, LogPriority priority)
{
	SDL_LogSetPriority(static_cast<int>(category), static_cast<SDL_LogPriority>(priority));
}

/**
 * @brief Sets the minimum priority that is emitted for every category.
 */
inline void SetLogPriority(LogPriority priority)
{
	SDL_LogSetAllPriority(static_cast<SDL_LogPriority>(priority));
}

namespace detail {

template <typename... Args>
std::string format(std::string_view fmt, Args &&...args)
{
	FMT_TRY
	{
		return fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
	}
	FMT_CATCH(const fmt::format_error &e)
	{
		// A broken format string must not take the caller down with it.
		std::string error = "Format error, fmt: ";
		error.append(fmt);
		error.append(" error: ");
		error.append(e.what());
		return error;
	}
}

template <typename... Args>
void LogMessage(LogCategory category, LogPriority priority, std::string_view fmt, Args &&...args)
{
	if (SDL_LogGetPriority(static_cast<int>(category)) > static_cast<SDL_LogPriority>(priority)) return;
	const std::string str = format(fmt, std::forward<Args>(args)...);
	SDL_LogMessage(static_cast<int>(category), static_cast<SDL_LogPriority>(priority), "%s", str.c_str());
}

} // namespace detail

template <typename... Args>
void Log(std::string_view fmt, Args &&...args)
{
	auto str = detail::format(fmt, std::forward<Args>(args)...);
	SDL_Log("%s", str.c_str());
}

template <typename... Args>
void LogVerbose(LogCategory category, std::string_view fmt, Args &&...args)
{
	detail::LogMessage(category, LogPriority::Verbose, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LogVerbose(std::string_view fmt, Args &&...args)
{
	LogVerbose(defaultCategory, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LogDebug(LogCategory category, std::string_view fmt, Args &&...args)
{
	detail::LogMessage(category, LogPriority::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LogDebug(std::string_view fmt, Args &&...args)
{
	LogDebug(defaultCategory, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LogInfo(LogCategory category, std::string_view fmt, Args &&...args)
{
	detail::LogMessage(category, LogPriority::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LogInfo(std::string_view fmt, Args &&...args)
{
	LogInfo(defaultCategory, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LogWarn(LogCategory category, std::string_view fmt, Args &&...args)
{
	detail::LogMessage(category, LogPriority::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LogWarn(std::string_view fmt, Args &&...args)
{
	LogWarn(defaultCategory, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LogError(LogCategory category, std::string_view fmt, Args &&...args)
{
	detail::LogMessage(category, LogPriority::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LogError(std::string_view fmt, Args &&...args)
{
	LogError(defaultCategory, fmt, std::forward<Args>(args)...);
}

} // namespace assview
