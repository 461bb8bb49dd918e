/*
 * ProcessLauncher.hpp
 *
 *  Created on: 2026年10月14日
 */

#ifndef SRC_ENGINE_PROCESSLAUNCHER_HPP_
#define SRC_ENGINE_PROCESSLAUNCHER_HPP_

#include <string>

#include <kerbal/data_struct/optional/optional.hpp>

#include "ProtectedProcess.hpp"

/**
 * @brief 启动子进程的能力接口。各平台的实现满足同一契约, 启动时选定
 */
class ProcessLauncher
{
	public:
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		/**
		 * @brief 执行一条命令并等待其结束
		 * @param args argv, args[0] 必须已经是可执行文件的路径
		 * @param env KEY=VALUE 形式的完整环境
		 */
		virtual ProtectedProcessDetails launch(const ExecuteArgs & args, const ProtectedProcessConfig & config, const ExecuteArgs & env) = 0;

		/**
		 * @brief 按 search_path 查找可执行文件, 含有 '/' 的名字原样检查
		 * @return 找不到时为空
		 */
		virtual optional<std::string> resolve_executable(const std::string & program, const std::string & search_path) const = 0;

		virtual ~ProcessLauncher() noexcept = default;
};

class PosixProcessLauncher : public ProcessLauncher
{
	public:
		virtual ProtectedProcessDetails launch(const ExecuteArgs & args, const ProtectedProcessConfig & config, const ExecuteArgs & env) override;

		virtual optional<std::string> resolve_executable(const std::string & program, const std::string & search_path) const override;
};

#endif /* SRC_ENGINE_PROCESSLAUNCHER_HPP_ */
