/*
 * runner_settings.hpp
 *
 *  Created on: 2026年10月17日
 */

#ifndef SRC_RUNNER_RUNNER_SETTINGS_HPP_
#define SRC_RUNNER_RUNNER_SETTINGS_HPP_

#include <chrono>
#include <functional>
#include <string>

#include <boost/filesystem/path.hpp>
#include <nlohmann/json.hpp>

#include "ContainerBackend.hpp"
#include "HostBackend.hpp"
#include "JobQueue.hpp"
#include "ResourceLimiter.hpp"
#include "Workspace.hpp"
#include "logger.hpp"

enum class BackendKind
{
	HOST, CONTAINER
};

const char * getBackendKindName(BackendKind kind);

BackendKind parseBackendKind(const std::string & name);

enum class StoreKind
{
	MEMORY, REDIS
};

const char * getStoreKindName(StoreKind kind);

StoreKind parseStoreKind(const std::string & name);

/**
 * @brief 进程启动时加载一次的配置, 之后只读, 显式传给各组件
 *
 * 加载顺序: 默认值 -> 配置文件 (缺省的键保留默认值) -> 环境变量覆盖 -> finalize 校验并派生各组件的共享参数
 */
class Settings
{
	public:
		typedef std::function<const char *(const char *)> getenv_type;

		struct
		{
				boost::filesystem::path log_file_path; ///< 为空时只输出到 stderr
				LogLevel log_level = LogLevel::LEVEL_INFO;
		} runtime;

		BackendKind backend = BackendKind::HOST;

		struct
		{
				StoreKind store = StoreKind::MEMORY;
				std::string redis_url = "redis://127.0.0.1:6379/0";
				std::string name = "exec";
				std::chrono::seconds result_ttl = std::chrono::seconds(500); ///< 终态 job 的保留期
				size_t redis_pool_size = 0; ///< 为 0 时取 worker 数 + 4
		} queue;

		std::chrono::milliseconds cancel_grace = std::chrono::milliseconds(500); ///< 取消时 SIGTERM 与 SIGKILL 之间的间隔

		JobQueueSettings job_queue;
		WorkspaceSettings workspace;
		LimiterSettings limiter;
		HostBackendSettings host;
		ContainerBackendSettings container;

		/**
		 * @throws std::runtime_error 文件无法打开
		 * @throws std::invalid_argument 内容不合法
		 */
		void parse(const boost::filesystem::path & config_file);

		void parse(const nlohmann::json & json_obj);

		/**
		 * @brief 以环境变量覆盖配置, 见 RUNNER_* 系列变量
		 * @throws std::invalid_argument 变量的值不合法
		 */
		void apply_environment(const getenv_type & getenv);

		/**
		 * @brief 校验配置, 并把共享的参数 (取消宽限期, 清理重试策略, 降权用户等) 同步到各组件
		 * @throws std::invalid_argument
		 */
		void finalize();

		/**
		 * @brief 依次执行 parse (若 config_file 非空), apply_environment, finalize
		 */
		static Settings load(const boost::filesystem::path & config_file, const getenv_type & getenv);
};

#endif /* SRC_RUNNER_RUNNER_SETTINGS_HPP_ */
