#pragma once
#include <string>
#include <functional>

namespace ek::log {

enum class Level { Trace, Debug, Info, Warn, Error, Critical };

using SinkFn = std::function<void(Level, const std::string&)>;

// Replaces the default spdlog output. Pass an empty function to restore it.
void set_sink(SinkFn sink) noexcept;

void write(Level lvl, const std::string& msg) noexcept;

	// Thin wrapper over spdlog with an optional single-line JSON mode.
	void set_json_mode(bool enabled) noexcept;
	bool json_mode() noexcept;
	// Minimum level forwarded to spdlog and custom sinks.
	void set_level(Level lvl) noexcept;
	Level level() noexcept;
	const char* level_name(Level lvl) noexcept;
	void trace(const std::string& msg) noexcept;
	void debug(const std::string& msg) noexcept;
	void info(const std::string& msg) noexcept;
	void warn(const std::string& msg) noexcept;
	void error(const std::string& msg) noexcept;
	void critical(const std::string& msg) noexcept;

} // namespace ek::log
