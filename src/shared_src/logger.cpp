#include <time.h>

#include <stdexcept>

#include "logger.hpp"

const costream_ns::costream<std::cerr> Log_level_traits<LogLevel::LEVEL_FATAL>::outstream(costream_ns::LIGHT_RED);
const costream_ns::costream<std::cerr> Log_level_traits<LogLevel::LEVEL_INFO>::outstream(costream_ns::LAKE_BLUE);
const costream_ns::costream<std::cerr> Log_level_traits<LogLevel::LEVEL_WARNING>::outstream(costream_ns::LIGHT_YELLOW);
const costream_ns::costream<std::cerr> Log_level_traits<LogLevel::LEVEL_DEBUG>::outstream(costream_ns::LIGHT_PURPLE);

LogLevel parse_log_level(const std::string & name)
{
	if (name == "fatal") {
		return LogLevel::LEVEL_FATAL;
	}
	if (name == "warning") {
		return LogLevel::LEVEL_WARNING;
	}
	if (name == "info") {
		return LogLevel::LEVEL_INFO;
	}
	if (name == "debug") {
		return LogLevel::LEVEL_DEBUG;
	}
	throw std::invalid_argument("Undefined log level: " + name);
}

std::string get_ymd_hms_in_local_time_zone(time_t time) noexcept
{
	char datetime[100];
	struct tm local;

	localtime_r(&time, &local);
	strftime(datetime, 99, "%Y-%m-%d %H:%M:%S", &local);

	return datetime;
}

namespace ts_runner
{
	namespace log
	{
		LogSink & sink() noexcept
		{
			static LogSink s;
			return s;
		}

		void open_log_file(const std::string & path)
		{
			LogSink & s = sink();
			std::lock_guard<std::mutex> guard(s.mtx);
			if (s.log_file.is_open()) {
				s.log_file.close();
			}
			s.log_file.open(path, std::ios::out | std::ios::app);
			if (!s.log_file) {
				throw std::runtime_error("log file open failed: " + path);
			}
		}

		void set_log_level(LogLevel level) noexcept
		{
			sink().threshold = level;
		}

		void set_console_echo(bool echo) noexcept
		{
			sink().echo = echo;
		}

	} /* namespace log */

} /* namespace ts_runner */
