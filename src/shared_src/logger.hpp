#ifndef LOGGER_H
#define LOGGER_H

#include <iostream>
#include <fstream>
#include <sstream>
#include <atomic>
#include <mutex>
#include <string>
#include <typeinfo>
#include <boost/format.hpp>
#include <kerbal/utility/costream.hpp>

namespace costream_ns = kerbal::utility::costream;

/**
 * @addtogroup log_level
 * @{
 */
enum class LogLevel
{
	LEVEL_FATAL = 0, LEVEL_WARNING = 1, LEVEL_INFO = 2, LEVEL_DEBUG = 3
};

/**
 * 日志告警级别萃取器
 * @tparam level 日志告警级别
 */
template <LogLevel level>
struct Log_level_traits;

template <>
struct Log_level_traits<LogLevel::LEVEL_FATAL>
{
		static constexpr const char * str = "FATAL";
		static const costream_ns::costream<std::cerr> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_INFO>
{
		static constexpr const char * str = "INFO";
		static const costream_ns::costream<std::cerr> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_WARNING>
{
		static constexpr const char * str = "WARNING";
		static const costream_ns::costream<std::cerr> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_DEBUG>
{
		static constexpr const char * str = "DEBUG";
		static const costream_ns::costream<std::cerr> outstream;
};

/**
 * @}
 */

LogLevel parse_log_level(const std::string & name);

std::string get_ymd_hms_in_local_time_zone(time_t time) noexcept;

template <typename Tp>
void multi_args_write(std::ostream & log_fp, Tp && arg0)
{
	log_fp << arg0;
}

template <typename Tp, typename ...Up>
void multi_args_write(std::ostream & log_fp, Tp && arg0, Up&& ...args)
{
	log_fp << arg0;
	multi_args_write(log_fp, std::forward<Up>(args)...);
}

namespace ts_runner
{
	namespace log
	{
		/*                          datetime logLevelStr job_id srcFileName line */
		constexpr const char * templ = "[%s] %s job:%s [%s:%d] ";

		/**
		 * @brief 全局日志输出端。worker 线程并发写日志, 所有写操作都在 mtx 的保护下进行
		 */
		struct LogSink
		{
				std::mutex mtx;
				std::ofstream log_file;
				std::atomic<LogLevel> threshold { LogLevel::LEVEL_INFO };
				std::atomic<bool> echo { true }; ///< 是否同时以彩色输出到 stderr
		};

		LogSink & sink() noexcept;

		/**
		 * @brief 打开日志文件 (追加模式)。日志文件打开失败时抛出 std::runtime_error
		 */
		void open_log_file(const std::string & path);

		void set_log_level(LogLevel level) noexcept;

		void set_console_echo(bool echo) noexcept;

		template <typename Type>
		Type & cptr_cast(Type & src) noexcept
		{
			return src;
		}

		template <typename Type>
		const Type & cptr_cast(const Type & src) noexcept
		{
			return src;
		}

		template <typename Type>
		Type && cptr_cast(Type && src) noexcept
		{
			return std::move(src);
		}

		template <size_t N>
		constexpr const char* cptr_cast(const char (&src)[N]) noexcept
		{
			return src;
		}

		template <LogLevel level, typename ...T>
		void __log_write(const std::string & job_id, const char source_filename[], int line, T&& ... args) noexcept
		{
			try {
				LogSink & s = sink();
				if (static_cast<int>(level) > static_cast<int>(s.threshold.load())) {
					return;
				}

				const time_t now = time(NULL);
				const std::string datetime = get_ymd_hms_in_local_time_zone(now);

				std::ostringstream buffer;

				multi_args_write(buffer, boost::format(templ) % datetime % (const char *) Log_level_traits<level>::str % job_id % source_filename % line, std::forward<T>(args)...);

				std::lock_guard<std::mutex> guard(s.mtx);
				if (s.echo) {
					Log_level_traits<level>::outstream << buffer.str() << std::endl;
				}
				if (s.log_file.is_open()) {
					s.log_file << buffer.str() << std::endl;
					if (s.log_file.fail()) { //http://www.cplusplus.com/reference/ios/ios/fail/
						std::cerr << "write error!" << std::endl;
						s.log_file.clear();
					}
				}
			} catch (...) {
			}
		}

	} /* namespace log */

} /* namespace ts_runner */

template <LogLevel level, typename ...T>
void log_write(const std::string & job_id, const char source_filename[], int line, T&& ... args) noexcept
{
	ts_runner::log::__log_write<level>(job_id, source_filename, line, ts_runner::log::cptr_cast(std::forward<T>(args))...);
}

#define UNKNOWN_EXCEPTION_WHAT (const char*)("unknown exception")

#ifdef LOG_DEBUG
#	undef LOG_DEBUG
#endif
#ifdef DEBUG
#	define LOG_DEBUG(job_id, x...) \
	log_write<LogLevel::LEVEL_DEBUG>(job_id, __FILE__, __LINE__, ##x)
#else
#	define LOG_DEBUG(job_id, x...)
#endif

#ifdef LOG_INFO
#	undef LOG_INFO
#endif
#define LOG_INFO(job_id, x...) \
	log_write<LogLevel::LEVEL_INFO>(job_id, __FILE__, __LINE__, ##x)

#ifdef LOG_WARNING
#	undef LOG_WARNING
#endif
#define LOG_WARNING(job_id, x...)	 \
	log_write<LogLevel::LEVEL_WARNING>(job_id, __FILE__, __LINE__, ##x)

#ifdef LOG_FATAL
#	undef LOG_FATAL
#endif
#define LOG_FATAL(job_id, x...) \
	log_write<LogLevel::LEVEL_FATAL>(job_id, __FILE__, __LINE__, ##x)

#ifdef EXCEPT_WARNING
#	undef EXCEPT_WARNING
#endif
#define EXCEPT_WARNING(job_id, events, exception, x...)	LOG_WARNING(job_id, events, \
															" Error information: ", exception.what(), "  Exception type: ", typeid(exception).name(), ##x)
#ifdef UNKNOWN_EXCEPT_WARNING
#	undef UNKNOWN_EXCEPT_WARNING
#endif
#define UNKNOWN_EXCEPT_WARNING(job_id, events, x...)	LOG_WARNING(job_id, events, \
															" Error information: ", UNKNOWN_EXCEPTION_WHAT, ##x)

#ifdef EXCEPT_FATAL
#	undef EXCEPT_FATAL
#endif
#define EXCEPT_FATAL(job_id, events, exception, x...)	LOG_FATAL(job_id, events, \
															" Error information: ", exception.what(), "  Exception type: ", typeid(exception).name(), ##x)
#ifdef UNKNOWN_EXCEPT_FATAL
#	undef UNKNOWN_EXCEPT_FATAL
#endif
#define UNKNOWN_EXCEPT_FATAL(job_id, events, x...)	LOG_FATAL(job_id, events, \
															" Error information: ", UNKNOWN_EXCEPTION_WHAT, ##x)

#endif //LOGGER_H
