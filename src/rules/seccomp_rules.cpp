#include <errno.h>
#include <seccomp.h>
#include <stdio.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <linux/seccomp.h>

#include <memory>
#include <stdexcept>

#include "seccomp_rules.hpp"

namespace
{
	/**
	 * @brief 一个辅助类, 用于确保 seccomp 上下文被释放
	 */
	struct filter_guard
	{
			scmp_filter_ctx ctx;

			explicit filter_guard(scmp_filter_ctx ctx) noexcept :
					ctx(ctx)
			{
			}

			~filter_guard() noexcept
			{
				if (ctx != NULL) {
					seccomp_release(ctx);
				}
			}
	};

	struct file_closer
	{
			void operator()(FILE * fp) const noexcept
			{
				fclose(fp);
			}
	};

	void check_rc(int rc, const char * what)
	{
		if (rc != 0) {
			throw std::runtime_error(std::string("seccomp: ") + what + " failed: " + strerror(-rc));
		}
	}

	void add_no_network_rules(scmp_filter_ctx ctx)
	{
		int syscalls_blacklist[] = {
			SCMP_SYS(ptrace), SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(unshare), SCMP_SYS(setns),
			SCMP_SYS(pivot_root), SCMP_SYS(chroot), SCMP_SYS(bpf), SCMP_SYS(perf_event_open),
			SCMP_SYS(kexec_load), SCMP_SYS(init_module), SCMP_SYS(finit_module), SCMP_SYS(delete_module) };

		for (int syscall : syscalls_blacklist) {
			check_rc(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), syscall, 0), "add rule");
		}
		// only unix domain sockets are allowed
		check_rc(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1, SCMP_A0(SCMP_CMP_NE, AF_UNIX)), "add socket rule");
	}

	/**
	 * @brief 将上下文导出为 BPF 指令。libseccomp 只能导出到文件描述符, 借助临时文件中转
	 */
	std::vector<struct sock_filter> export_bpf(scmp_filter_ctx ctx)
	{
		std::unique_ptr<FILE, file_closer> tmp(tmpfile());
		if (tmp == nullptr) {
			throw std::runtime_error(std::string("seccomp: create temporary file failed: ") + strerror(errno));
		}
		check_rc(seccomp_export_bpf(ctx, fileno(tmp.get())), "export bpf");

		std::vector<struct sock_filter> instructions;
		rewind(tmp.get());
		struct sock_filter instruction;
		while (fread(&instruction, sizeof(instruction), 1, tmp.get()) == 1) {
			instructions.push_back(instruction);
		}
		if (ferror(tmp.get()) || instructions.empty()) {
			throw std::runtime_error("seccomp: read exported bpf failed");
		}
		return instructions;
	}

} /* namespace */

const char * getSeccompPolicyName(SeccompPolicy policy)
{
	switch (policy) {
		case SeccompPolicy::NONE:
			return "none";
		case SeccompPolicy::NO_NETWORK:
			return "no_network";
	}
	return "unknown";
}

SeccompPolicy parseSeccompPolicy(const std::string & name)
{
	if (name == "none") {
		return SeccompPolicy::NONE;
	}
	if (name == "no_network") {
		return SeccompPolicy::NO_NETWORK;
	}
	throw std::invalid_argument("Undefined seccomp policy: " + name);
}

SeccompProgram SeccompProgram::compile(SeccompPolicy policy)
{
	SeccompProgram program;
	switch (policy) {
		case SeccompPolicy::NONE:
			return program;
		case SeccompPolicy::NO_NETWORK: {
			filter_guard guard(seccomp_init(SCMP_ACT_ALLOW));
			if (!guard.ctx) {
				throw std::runtime_error("seccomp: init filter context failed");
			}
			add_no_network_rules(guard.ctx);
			program.instructions = export_bpf(guard.ctx);
			return program;
		}
	}
	throw std::invalid_argument("Undefined seccomp policy");
}

const SeccompProgram & SeccompProgram::for_policy(SeccompPolicy policy)
{
	switch (policy) {
		case SeccompPolicy::NONE: {
			static const SeccompProgram none = compile(SeccompPolicy::NONE);
			return none;
		}
		case SeccompPolicy::NO_NETWORK: {
			static const SeccompProgram no_network = compile(SeccompPolicy::NO_NETWORK);
			return no_network;
		}
	}
	throw std::invalid_argument("Undefined seccomp policy");
}

int SeccompProgram::load() const noexcept
{
	if (instructions.empty()) {
		return 0;
	}
	// 非特权进程加载过滤器前必须设置 no_new_privs
	if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
		return errno;
	}
	struct sock_fprog prog;
	prog.len = static_cast<unsigned short>(instructions.size());
	prog.filter = const_cast<struct sock_filter *>(instructions.data());
	if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
		return errno;
	}
	return 0;
}
