/*
 * CommandSynthesizer.cpp
 *
 *  Created on: 2026年10月13日
 */

#include "CommandSynthesizer.hpp"

#include <stdexcept>

#include <boost/lexical_cast.hpp>

namespace
{
	ExecuteArgs expand_command(const CommandTemplate & templ, const std::map<std::string, std::string> & values)
	{
		ExecuteArgs args;
		for (const std::string & element : templ) {
			args.push_back(CommandSynthesizer::expand(element, values));
		}
		return args;
	}

} /* namespace */

std::string CommandSynthesizer::binary_path(const PathLayout & layout)
{
	return layout.builddir + "/main";
}

std::string CommandSynthesizer::expand(const std::string & templ, const std::map<std::string, std::string> & values)
{
	std::string res;
	res.reserve(templ.size());

	std::string::size_type pos = 0;
	while (pos < templ.size()) {
		std::string::size_type open = templ.find('{', pos);
		if (open == std::string::npos) {
			res.append(templ, pos, std::string::npos);
			break;
		}
		std::string::size_type close = templ.find('}', open);
		if (close == std::string::npos) {
			throw std::invalid_argument("Unbalanced brace in command template: " + templ);
		}
		res.append(templ, pos, open - pos);

		std::string name = templ.substr(open + 1, close - open - 1);
		auto it = values.find(name);
		if (it == values.end()) {
			throw std::invalid_argument("Unknown placeholder {" + name + "} in command template: " + templ);
		}
		res += it->second;
		pos = close + 1;
	}
	return res;
}

CommandPlan CommandSynthesizer::build(const LanguageSpec & spec, const PathLayout & layout, const ResourceLimits & limits) const
{
	const std::map<std::string, std::string> values = {
		{ "source", layout.source },
		{ "workdir", layout.workdir },
		{ "builddir", layout.builddir },
		{ "binary", binary_path(layout) },
		{ "tmpdir", layout.tmpdir },
		{ "memory_mb", boost::lexical_cast<std::string>(limits.memory_mb) },
	};

	CommandPlan plan;
	if (spec.build_command.has_value()) {
		plan.compile = expand_command(spec.build_command.value(), values);
	}
	plan.run = expand_command(spec.run_command, values);

	// 不继承宿主机的 TMPDIR 等变量, 统一指向工作区内的临时目录
	plan.environment.emplace_back("TMPDIR", layout.tmpdir);
	for (const auto & [name, value] : spec.environment) {
		plan.environment.emplace_back(name, expand(value, values));
	}
	return plan;
}
