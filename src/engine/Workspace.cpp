/*
 * Workspace.cpp
 *
 *  Created on: 2026年10月13日
 */

#include "Workspace.hpp"
#include "logger.hpp"

#include <fstream>

#include <unistd.h>

namespace fs = boost::filesystem;

namespace
{
	constexpr const char * workspace_prefix = "job-";

	/**
	 * @brief 被杀死的子进程可能留下没有写权限的目录, 删除前先把权限恢复
	 */
	void restore_owner_permissions(const fs::path & dir) noexcept
	{
		boost::system::error_code ec;
		fs::permissions(dir, fs::owner_all | fs::add_perms, ec);
		fs::recursive_directory_iterator it(dir, ec), end;
		while (!ec && it != end) {
			boost::system::error_code perm_ec;
			if (fs::is_directory(it->symlink_status(perm_ec))) {
				fs::permissions(it->path(), fs::owner_all | fs::add_perms, perm_ec);
			}
			it.increment(ec);
		}
	}

	void set_owner(const fs::path & p, const WorkspaceSettings & settings)
	{
		if (!settings.owner_uid.has_value()) {
			return;
		}
		gid_t gid = settings.owner_gid.has_value() ? settings.owner_gid.value() : static_cast<gid_t>(-1);
		if (::chown(p.c_str(), settings.owner_uid.value(), gid) != 0) {
			throw std::runtime_error("chown workspace failed: " + p.string());
		}
	}

} /* namespace */

Workspace::Workspace(WorkspaceManager * manager, const std::string & job_id, const fs::path & dir, const fs::path & source) noexcept :
		manager(manager), job_id(job_id), dir(dir), source(source)
{
}

Workspace::Workspace(Workspace && src) noexcept :
		manager(src.manager), job_id(std::move(src.job_id)), dir(std::move(src.dir)), source(std::move(src.source))
{
	src.manager = nullptr;
}

Workspace::~Workspace() noexcept
{
	this->release();
}

bool Workspace::release() noexcept
{
	if (manager == nullptr) {
		return true;
	}
	WorkspaceManager * m = manager;
	manager = nullptr;
	return m->release(job_id, dir);
}

WorkspaceManager::WorkspaceManager(const WorkspaceSettings & settings) :
		settings(settings)
{
	fs::create_directories(this->settings.root);
}

Workspace WorkspaceManager::acquire(const std::string & job_id, const LanguageSpec & spec, const std::string & code)
{
	fs::path dir;
	while (true) {
		dir = settings.root / fs::unique_path(workspace_prefix + job_id + "-%%%%%%%%");
		// create_directory 返回 false 表示重名, 换一个名字重试
		if (fs::create_directory(dir)) {
			break;
		}
	}

	Workspace workspace(this, job_id, dir, dir / spec.source_filename);

	fs::perms dir_perms = settings.shared_with_container || settings.owner_uid.has_value() ?
			fs::owner_all | fs::group_read | fs::group_exe | fs::others_read | fs::others_exe :
			fs::owner_all;
	fs::permissions(dir, dir_perms);

	fs::create_directory(workspace.build_dir());
	fs::create_directory(workspace.tmp_dir());
	set_owner(workspace.build_dir(), settings);
	set_owner(workspace.tmp_dir(), settings);

	{
		std::ofstream fout(workspace.source_file().native(), std::ios::out | std::ios::binary | std::ios::trunc);
		if (!fout) {
			throw std::runtime_error("open source file failed: " + workspace.source_file().string());
		}
		fout << code;
		fout.close();
		if (fout.fail()) {
			throw std::runtime_error("write source file failed: " + workspace.source_file().string());
		}
	}
	fs::permissions(workspace.source_file(),
					settings.shared_with_container || settings.owner_uid.has_value() ?
							fs::owner_read | fs::owner_write | fs::group_read | fs::others_read :
							fs::owner_read | fs::owner_write);

	LOG_INFO(job_id, "Workspace acquired: ", dir);
	return workspace;
}

bool WorkspaceManager::release(const std::string & job_id, const fs::path & dir) noexcept
{
	auto remove_once = [&dir]() noexcept {
		boost::system::error_code ec;
		fs::remove_all(dir, ec);
		boost::system::error_code exists_ec;
		return !fs::exists(dir, exists_ec) && !exists_ec;
	};

	auto on_failure = [&job_id, &dir](int attempt) noexcept {
		LOG_WARNING(job_id, "Remove workspace failed, attempt: ", attempt, " path: ", dir);
		restore_owner_permissions(dir);
	};

	bool removed = false;
	try {
		removed = retry_idempotent(settings.cleanup_retry, remove_once, on_failure);
	} catch (const std::exception & e) {
		EXCEPT_FATAL(job_id, "Remove workspace failed.", e, " path: ", dir);
		return false;
	}
	if (!removed) {
		LOG_FATAL(job_id, "Remove workspace failed after all retries, path: ", dir);
		return false;
	}
	LOG_DEBUG(job_id, "Workspace released: ", dir);
	return true;
}

size_t WorkspaceManager::live_count() const
{
	size_t count = 0;
	for (fs::directory_iterator it(settings.root), end; it != end; ++it) {
		if (it->path().filename().string().compare(0, std::char_traits<char>::length(workspace_prefix), workspace_prefix) == 0) {
			++count;
		}
	}
	return count;
}
