/*
 * ExecuteArgs.cpp
 *
 *  Created on: 2026年10月12日
 */

#include "ExecuteArgs.hpp"

ExecuteArgs::ExecuteArgs()
{
}

ExecuteArgs::ExecuteArgs(std::initializer_list<std::string> list) :
		args(list.begin(), list.end())
{
}

ExecuteArgs::ExecuteArgs(std::vector<std::string> args) :
		args(std::move(args))
{
}

ExecuteArgs& ExecuteArgs::operator=(std::initializer_list<std::string> list)
{
	args.assign(list.begin(), list.end());
	return *this;
}

ExecuteArgs& ExecuteArgs::push_back(std::string arg)
{
	args.push_back(std::move(arg));
	return *this;
}

ExecuteArgs& ExecuteArgs::append(const ExecuteArgs & tail)
{
	args.insert(args.end(), tail.args.begin(), tail.args.end());
	return *this;
}

ExecuteArgs& ExecuteArgs::prepend(const ExecuteArgs & head)
{
	args.insert(args.begin(), head.args.begin(), head.args.end());
	return *this;
}

std::unique_ptr<char*[]> ExecuteArgs::getArgs() const
{
	typedef char * pointer_to_char;
	std::unique_ptr<pointer_to_char[]> res(new char*[args.size() + 1]);
	size_t i = 0;
	for (i = 0; i < args.size(); ++i) {
		res.get()[i] = const_cast<char*>(args[i].c_str());
	}
	res.get()[i] = NULL;
	return res;
}

std::ostream& operator<<(std::ostream & out, const ExecuteArgs & args)
{
	out << '[';
	bool first = true;
	for (const std::string & arg : args) {
		if (!first) {
			out << ", ";
		}
		first = false;
		out << arg;
	}
	return out << ']';
}
