#ifndef TIERFS_SRC_ASYNC_IO_MANAGER_HPP_
#define TIERFS_SRC_ASYNC_IO_MANAGER_HPP_

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace TierFS
{

/// Fixed-size worker pool. Destruction drains queued tasks and joins every worker.
class AsyncIoManager
{
    public:
    explicit AsyncIoManager(size_t num_threads = std::thread::hardware_concurrency());
    ~AsyncIoManager();

    AsyncIoManager(const AsyncIoManager&)            = delete;
    AsyncIoManager& operator=(const AsyncIoManager&) = delete;

    template <typename F>
    std::future<std::invoke_result_t<F>> Submit(F&& fn)
    {
        using R       = std::invoke_result_t<F>;
        auto task_ptr = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> future = task_ptr->get_future();
        SubmitTask([task_ptr]() {
            (*task_ptr)();
        });
        return future;
    }

    void SubmitTask(std::function<void()>&& task);

    size_t ThreadCount() const { return workers_.size(); }

    private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

}  // namespace TierFS

#endif  // TIERFS_SRC_ASYNC_IO_MANAGER_HPP_
