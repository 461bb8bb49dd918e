/*
 * ContainerBackend.hpp
 *
 *  Created on: 2026年10月15日
 */

#ifndef SRC_ENGINE_CONTAINERBACKEND_HPP_
#define SRC_ENGINE_CONTAINERBACKEND_HPP_

#include <map>
#include <memory>
#include <string>

#include "ProcessLauncher.hpp"
#include "SandboxBackend.hpp"
#include "retry.hpp"

struct ContainerBackendSettings
{
		std::string docker_path = "docker";
		std::string search_path = "/usr/local/bin:/usr/bin:/bin"; ///< 查找 docker 命令行工具的 PATH
		std::map<std::string, std::string> images; ///< 语言标识 -> 镜像, 未配置的语言使用默认镜像
		std::string user = "1000:1000"; ///< 容器内的非 root 身份
		std::string cpus = "0.5";
		int tmpfs_size_mb = 64;
		std::chrono::seconds start_timeout = std::chrono::seconds(30); ///< docker run 与 docker rm 的超时
		RetryPolicy remove_retry;
		std::chrono::milliseconds cancel_grace = std::chrono::milliseconds(500);
};

/**
 * @brief 容器后端: 每次执行创建一个一次性的容器, 执行结束后无条件销毁
 *
 * 容器无网络, 丢弃全部 capability, 根文件系统只读, 以非 root 身份运行,
 * 只有容量受限且不可执行的 tmpfs 可写 (仅当语言运行编译出的本地程序时, /build 可执行),
 * 源文件以只读方式挂载, 内存, CPU 与进程数配额在容器级施加。
 */
class ContainerBackend : public SandboxBackend
{
	private:
		ContainerBackendSettings settings;
		std::shared_ptr<ProcessLauncher> launcher;

		std::string docker_executable() const;

		ExecuteArgs make_run_args(const std::string & docker, const std::string & container_name, const std::string & image,
								  const BoundedCommandPlan & plan, const LanguageSpec & spec, const Workspace & workspace) const;

		ExecuteArgs make_exec_args(const std::string & docker, const std::string & container_name, const BoundedCommandPlan & plan,
								   const BoundedStep & step, bool with_stdin) const;

		ProtectedProcessDetails run_docker(const std::string & job_id, const ExecuteArgs & args, std::chrono::seconds timeout) const;

		void remove_container(const std::string & job_id, const std::string & docker, const std::string & container_name) const noexcept;

	public:
		static constexpr const char * container_workdir = "/work";
		static constexpr const char * container_builddir = "/build";
		static constexpr const char * container_tmpdir = "/tmp";

		ContainerBackend(const ContainerBackendSettings & settings, std::shared_ptr<ProcessLauncher> launcher);

		static const char * default_image(Language language);

		/**
		 * @return 语言对应的镜像, 优先使用配置
		 */
		std::string image_for(const LanguageSpec & spec) const;

		virtual const char * name() const noexcept override
		{
			return "container";
		}

		virtual PathLayout layout_for(const Workspace & workspace, const LanguageSpec & spec) const override;

		virtual ExecutionResult execute(const BoundedCommandPlan & plan, const LanguageSpec & spec, const Workspace & workspace,
										const std::string & stdin_data, const cancel_predicate & cancel_requested) override;
};

#endif /* SRC_ENGINE_CONTAINERBACKEND_HPP_ */
