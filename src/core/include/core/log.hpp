#pragma once
#include <string>
#include <functional>

namespace ac::log {

enum class Level { Trace, Debug, Info, Warn, Error, Critical };

using SinkFn = std::function<void(Level, const std::string&)>;

void set_sink(SinkFn sink) noexcept;

void write(Level lvl, const std::string& msg) noexcept;

	// Thin wrapper over spdlog; a custom sink or JSON line mode can replace the default output.
	void set_json_mode(bool enabled) noexcept;
	bool json_mode() noexcept;
	// Messages below this level are dropped before reaching any sink.
	void set_level(Level lvl) noexcept;
	Level level() noexcept;
	const char* level_name(Level lvl) noexcept;
	// Escapes text for use inside a JSON string literal (quotes, backslashes, control characters).
	std::string json_escape(const std::string& text);
	void trace(const std::string& msg) noexcept;
	void debug(const std::string& msg) noexcept;
	void info(const std::string& msg) noexcept;
	void warn(const std::string& msg) noexcept;
	void error(const std::string& msg) noexcept;
	void critical(const std::string& msg) noexcept;

} // namespace ac::log
