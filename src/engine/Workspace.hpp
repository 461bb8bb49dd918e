/*
 * Workspace.hpp
 *
 *  Created on: 2026年10月13日
 */

#ifndef SRC_ENGINE_WORKSPACE_HPP_
#define SRC_ENGINE_WORKSPACE_HPP_

#include <string>

#include <sys/types.h>

#include <boost/filesystem.hpp>
#include <kerbal/data_struct/optional/optional.hpp>
#include <kerbal/utility/noncopyable.hpp>

#include "LanguageRegistry.hpp"
#include "retry.hpp"

struct WorkspaceSettings
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		boost::filesystem::path root = "/tmp/ts_runner"; ///< 所有工作区的父目录
		RetryPolicy cleanup_retry;

		/**
		 * @brief 工作区内的源文件需要被容器内的非 root 用户读取时为 true, 此时放宽目录与文件权限
		 */
		bool shared_with_container = false;

		optional<uid_t> owner_uid; ///< 不为空时将工作区 chown 给沙箱用户, 使其可以写 build 与 tmp 目录
		optional<gid_t> owner_gid;
};

class WorkspaceManager;

/**
 * @brief 一个 job 独占的临时目录。
 * 析构时保证释放, 无论执行以何种方式结束 (成功, 运行时错误, 超时, 取消, 内部错误)
 */
class Workspace : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		friend class WorkspaceManager;

		WorkspaceManager * manager;
		std::string job_id;
		boost::filesystem::path dir;
		boost::filesystem::path source;

		Workspace(WorkspaceManager * manager, const std::string & job_id, const boost::filesystem::path & dir, const boost::filesystem::path & source) noexcept;

	public:
		Workspace(Workspace && src) noexcept;

		~Workspace() noexcept;

		/**
		 * @brief 释放工作区。可重复调用, 只有第一次调用会真正删除目录
		 * @return 目录已不存在则返回 true
		 */
		bool release() noexcept;

		bool released() const noexcept
		{
			return manager == nullptr;
		}

		const std::string & get_job_id() const noexcept
		{
			return job_id;
		}

		const boost::filesystem::path & path() const noexcept
		{
			return dir;
		}

		/// 源文件的绝对路径
		const boost::filesystem::path & source_file() const noexcept
		{
			return source;
		}

		boost::filesystem::path build_dir() const
		{
			return dir / "build";
		}

		boost::filesystem::path tmp_dir() const
		{
			return dir / "tmp";
		}
};

class WorkspaceManager : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		WorkspaceSettings settings;

	public:
		explicit WorkspaceManager(const WorkspaceSettings & settings);

		/**
		 * @brief 创建一个唯一命名的目录并按语言的命名规则写入源文件
		 * @throws std::runtime_error 目录创建或源文件写入失败
		 */
		Workspace acquire(const std::string & job_id, const LanguageSpec & spec, const std::string & code);

		/**
		 * @brief 删除目录树。幂等, 失败时按策略退避重试, 预算耗尽后只记日志, 不抛出
		 * @return 目录已不存在则返回 true
		 */
		bool release(const std::string & job_id, const boost::filesystem::path & dir) noexcept;

		/**
		 * @brief 当前残留的工作区目录个数
		 */
		size_t live_count() const;

		const boost::filesystem::path & root() const noexcept
		{
			return settings.root;
		}

		const WorkspaceSettings & get_settings() const noexcept
		{
			return settings;
		}
};

#endif /* SRC_ENGINE_WORKSPACE_HPP_ */
