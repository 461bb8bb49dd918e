/*
 * ExecuteArgs.hpp
 *
 *  Created on: 2026年10月12日
 */

#ifndef SRC_ENGINE_EXECUTEARGS_HPP_
#define SRC_ENGINE_EXECUTEARGS_HPP_

#include <vector>
#include <string>
#include <memory>
#include <initializer_list>
#include <ostream>

/**
 * @brief 执行 exec 族的命令行参数。在原本的 Unix 要求中，exec 族函数的命令行参数末尾必须以一个空指针结尾，
 * 这显然十分丑陋不够优雅，也晦涩难读。基于此目的，本处使用了一个类将它封装了起来。
 * @note 每个参数都是独立的元素, 不会经过 shell 拼接
 */
class ExecuteArgs
{
	private:
		std::vector<std::string> args;

	public:
		typedef std::vector<std::string>::const_iterator const_iterator;

		/**
		 * @brief 普通构造函数，一个空列表
		 */
		ExecuteArgs();

		/**
		 * @brief 模板式构造函数，根据参数类型生产对应的构造函数。如 vector 等。
		 * 将其内部内容复制到本类的 args 中作为参数
		 */
		template<typename ForwardIterator>
		ExecuteArgs(ForwardIterator begin, ForwardIterator end) :
				args(begin, end)
		{
		}

		/**
		 * @brief 适配初始化列表样式的构造函数
		 */
		ExecuteArgs(std::initializer_list<std::string> list);

		explicit ExecuteArgs(std::vector<std::string> args);

		/**
		 * @brief 重载 = 运算符，以赋值操作更新 args
		 * @return 新的 ExecuteArgs 的引用
		 */
		ExecuteArgs& operator=(std::initializer_list<std::string> list);

		ExecuteArgs& push_back(std::string arg);

		ExecuteArgs& append(const ExecuteArgs & tail);

		/**
		 * @brief 在开头插入一组参数, 用于给命令加上包装器前缀
		 */
		ExecuteArgs& prepend(const ExecuteArgs & head);

		bool empty() const noexcept
		{
			return args.empty();
		}

		size_t size() const noexcept
		{
			return args.size();
		}

		const std::string & operator[](size_t i) const
		{
			return args[i];
		}

		std::string & operator[](size_t i)
		{
			return args[i];
		}

		const_iterator begin() const noexcept
		{
			return args.begin();
		}

		const_iterator end() const noexcept
		{
			return args.end();
		}

		const std::vector<std::string> & to_vector() const noexcept
		{
			return args;
		}

		/**
		 * @brief 返回命令行参数列表
		 * @return 指向 char * 数组的指针，符合 Unix 的 exec 族函数的参数规范
		 * @warning 返回的指针数组引用本对象内部的字符串, 本对象必须比返回值活得更久
		 */
		std::unique_ptr<char*[]> getArgs() const;

		bool operator==(const ExecuteArgs & with) const
		{
			return args == with.args;
		}

		bool operator!=(const ExecuteArgs & with) const
		{
			return args != with.args;
		}
};

/**
 * @brief 以 [a, b, c] 的形式输出, 仅用于日志
 */
std::ostream& operator<<(std::ostream & out, const ExecuteArgs & args);

#endif /* SRC_ENGINE_EXECUTEARGS_HPP_ */
