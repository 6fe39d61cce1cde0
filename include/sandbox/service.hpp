#pragma once

#include <future>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "sandbox/runner.hpp"

/**
 * 并发执行提交的服务
 * 
 * service 启动固定数量的 worker 线程，所有 worker 共享同一个任务队列。
 * 每个 worker 每次从队列中取出一个提交，在自己的线程中监控一个子进程，
 * 执行完成后通过 promise 返回结果。
 * 提交之间不共享可变状态，因此 worker 之间不需要额外同步。
 */
namespace sandbox {

class service {
public:
    /**
     * @param config 沙箱配置，config.workers 为 worker 数量
     */
    explicit service(const sandbox_config &config);
    service(const service &) = delete;

    /**
     * @brief 停止接收新提交，等待已提交的任务执行完成后退出
     */
    ~service();

    service &operator=(const service &) = delete;

    /**
     * @brief 提交一个请求
     * 服务已经停止时立刻返回 InternalError
     */
    std::future<result> submit(submission_request request);

    /**
     * @brief 停止所有的 worker
     * 调用后 submit 不再接收新请求，队列中剩余的请求仍会被执行。
     */
    void stop();

    std::size_t worker_count() const;

    const sandbox::runner &get_runner() const;

private:
    struct task {
        submission_request request;
        std::promise<result> promise;
    };

    sandbox::runner pipeline;
    concurrent_queue<task> task_queue;
    std::vector<std::thread> workers;

    void worker_loop(std::size_t worker_id);
};

}  // namespace sandbox
