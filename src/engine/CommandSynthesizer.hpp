/*
 * CommandSynthesizer.hpp
 *
 *  Created on: 2026年10月13日
 */

#ifndef SRC_ENGINE_COMMANDSYNTHESIZER_HPP_
#define SRC_ENGINE_COMMANDSYNTHESIZER_HPP_

#include <map>
#include <string>

#include "CommandPlan.hpp"
#include "LanguageRegistry.hpp"

/**
 * @brief 由语言描述与路径布局生成 argv 形式的命令计划
 *
 * 模板中可用的占位符:
 *   {source}    源文件路径
 *   {workdir}   工作目录
 *   {builddir}  编译产物目录
 *   {binary}    编译产出的可执行文件, 即 {builddir}/main
 *   {tmpdir}    可写的临时目录
 *   {memory_mb} 内存上限 (MB)
 *
 * 占位符只在模板元素内部展开一次, 展开出的内容不会被再次解析, 也不会被拼接成 shell 字符串。
 * 源代码本身从不出现在命令中。
 */
class CommandSynthesizer
{
	public:
		CommandPlan build(const LanguageSpec & spec, const PathLayout & layout, const ResourceLimits & limits) const;

		/**
		 * @brief 展开单个模板元素
		 * @throws std::invalid_argument 模板中含有未知的占位符或不成对的花括号
		 */
		static std::string expand(const std::string & templ, const std::map<std::string, std::string> & values);

		static std::string binary_path(const PathLayout & layout);
};

#endif /* SRC_ENGINE_COMMANDSYNTHESIZER_HPP_ */
