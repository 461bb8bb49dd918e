/*
 * LanguageRegistry.hpp
 *
 *  Created on: 2026年10月13日
 */

#ifndef SRC_ENGINE_LANGUAGEREGISTRY_HPP_
#define SRC_ENGINE_LANGUAGEREGISTRY_HPP_

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <kerbal/data_struct/optional/optional.hpp>

#include "united_resource.hpp"

/**
 * @brief 命令模板。每个元素都是一个独立的 argv 元素, 可以含有 {source} 等占位符
 */
typedef std::vector<std::string> CommandTemplate;

/**
 * @brief 环境变量模板, 值可以含有占位符
 */
typedef std::vector<std::pair<std::string, std::string>> EnvironmentTemplate;

/**
 * @brief 一种语言的静态描述。启动时构造一次, 之后只读
 */
struct LanguageSpec
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		Language language;
		std::string id; ///< 小写的语言标识, 如 "python"

		std::string source_filename; ///< 源文件在工作区中的文件名
		bool filename_bound_to_entry_point; ///< 为 true 时文件名由工具链的入口类型名决定, 不随源码内容改变

		optional<CommandTemplate> build_command; ///< 编译步骤, 解释型语言为空
		CommandTemplate run_command;
		EnvironmentTemplate environment; ///< 运行时调优用的环境变量, 同时作用于编译与运行步骤

		TimeoutClass timeout_class;

		/**
		 * @brief 是否可以对运行步骤施加虚拟地址空间上限。
		 * JVM, V8, Julia, Go 运行时启动时预留大量虚拟地址空间, 受限后无法启动, 必须豁免
		 */
		bool cap_address_space;

		/**
		 * @brief 是否可以对运行步骤施加 CPU 秒数与进程数上限
		 */
		bool cap_cpu_and_processes;

		/**
		 * @brief 运行步骤执行的是编译产出的本地可执行文件 (容器后端需要为其提供可执行的 scratch 目录)
		 */
		bool runs_native_binary;

		bool is_compiled() const noexcept
		{
			return build_command.has_value();
		}
};

/**
 * @brief 语言注册表: 语言标识到 LanguageSpec 的静态映射
 * @note 构造完成后只读, 多线程并发查询无需加锁
 */
class LanguageRegistry
{
	private:
		std::map<std::string, LanguageSpec> specs;

	public:
		explicit LanguageRegistry(const std::vector<LanguageSpec> & specs);

		/**
		 * @brief 内置的语言表: python, javascript, r, bash, julia, c, cpp, java, go
		 */
		static const LanguageRegistry & builtin();

		/**
		 * @brief 查询语言。标识忽略大小写与首尾空白
		 * @throws UnsupportedLanguageException 标识不在表中
		 */
		const LanguageSpec & lookup(const std::string & language_id) const;

		/**
		 * @return 找不到时返回 nullptr
		 */
		const LanguageSpec * find(const std::string & language_id) const noexcept;

		std::vector<std::string> language_ids() const;

		size_t size() const noexcept
		{
			return specs.size();
		}

		static std::string normalize_id(const std::string & language_id);
};

#endif /* SRC_ENGINE_LANGUAGEREGISTRY_HPP_ */
