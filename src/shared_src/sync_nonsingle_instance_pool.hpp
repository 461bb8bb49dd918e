/*
 * sync_nonsingle_instance_pool.hpp
 *
 *  Created on: 2026年10月16日
 */

#ifndef SRC_SHARED_SRC_SYNC_NONSINGLE_INSTANCE_POOL_HPP_
#define SRC_SHARED_SRC_SYNC_NONSINGLE_INSTANCE_POOL_HPP_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <kerbal/utility/noncopyable.hpp>


class resource_exhausted_exception : public std::runtime_error
{
	public:
		resource_exhausted_exception() :
					std::runtime_error("resource exhausted in instance pool")
		{
		}
};


/**
 * @brief 多实例的同步对象池。借出的实例由句柄持有, 句柄析构时自动归还
 *
 * 池的容量在构造时确定。被 abandon 的实例 (例如断开的连接) 会被销毁,
 * 下一次借出时由工厂函数补齐, 因此池中实例数不会超过容量。
 */
template <typename InstanceType>
class sync_nonsingle_instance_pool : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	public:
		typedef std::function<std::unique_ptr<InstanceType>()> factory_type;

	private:
		std::deque<std::unique_ptr<InstanceType>> idle;
		size_t capacity;
		size_t lent; ///< 已借出的实例数
		factory_type factory;
		std::mutex pool_vis_mtx;
		std::condition_variable pool_cond;

		class __auto_revert_handle: kerbal::utility::noncopyable, kerbal::utility::nonassignable
		{
			private:
				friend class sync_nonsingle_instance_pool;

				std::unique_ptr<InstanceType> instance;
				sync_nonsingle_instance_pool * ptr_to_pool;

				__auto_revert_handle(std::unique_ptr<InstanceType> instance, sync_nonsingle_instance_pool * ptr_to_pool) noexcept :
						instance(std::move(instance)), ptr_to_pool(ptr_to_pool)
				{
				}

			public:
				__auto_revert_handle(__auto_revert_handle && src) noexcept :
						instance(std::move(src.instance)), ptr_to_pool(src.ptr_to_pool)
				{
					src.ptr_to_pool = nullptr;
				}

				~__auto_revert_handle() noexcept
				{
					this->revert();
				}

				bool empty() const noexcept
				{
					return this->instance == nullptr;
				}

				InstanceType& operator*() const
				{
					return *instance;
				}

				InstanceType* operator->() const
				{
					return instance.get();
				}

				void revert() noexcept
				{
					if (ptr_to_pool == nullptr) {
						return;
					}
					ptr_to_pool->revert(std::move(instance));
					ptr_to_pool = nullptr;
				}

				/**
				 * @brief 丢弃实例而不归还, 用于已经失效的实例
				 */
				void abandon() noexcept
				{
					if (ptr_to_pool == nullptr) {
						return;
					}
					instance.reset();
					ptr_to_pool->revert(nullptr);
					ptr_to_pool = nullptr;
				}
		};

		void revert(std::unique_ptr<InstanceType> instance) noexcept
		{
			{
				std::lock_guard<std::mutex> lck(pool_vis_mtx);
				--lent;
				if (instance != nullptr) {
					idle.push_back(std::move(instance));
				}
			}
			pool_cond.notify_one();
		}

	public:

		typedef __auto_revert_handle auto_revert_handle;

		sync_nonsingle_instance_pool(size_t capacity, factory_type factory) :
				capacity(capacity), lent(0), factory(std::move(factory))
		{
			if (capacity == 0) {
				throw std::invalid_argument("instance pool capacity must be positive");
			}
		}

		size_t idle_size()
		{
			std::lock_guard<std::mutex> lck(pool_vis_mtx);
			return idle.size();
		}

		/**
		 * @brief 借出一个实例。池中无空闲实例且未达容量时调用工厂创建, 否则最多等待 timeout
		 * @throws resource_exhausted_exception 等待超时
		 * @throws 工厂函数抛出的异常
		 */
		auto_revert_handle sync_fetch(std::chrono::milliseconds timeout)
		{
			std::unique_lock<std::mutex> lck(pool_vis_mtx);
			if (!pool_cond.wait_for(lck, timeout, [this]() {
				return !idle.empty() || idle.size() + lent < capacity;
			})) {
				throw resource_exhausted_exception();
			}
			if (!idle.empty()) {
				std::unique_ptr<InstanceType> p = std::move(idle.front());
				idle.pop_front();
				++lent;
				return auto_revert_handle(std::move(p), this);
			}
			++lent;
			lck.unlock();
			std::unique_ptr<InstanceType> p;
			try {
				p = factory();
			} catch (...) {
				this->revert(nullptr);
				throw;
			}
			return auto_revert_handle(std::move(p), this);
		}
};

#endif /* SRC_SHARED_SRC_SYNC_NONSINGLE_INSTANCE_POOL_HPP_ */
