#include "sandbox/service.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>

namespace sandbox {
using namespace std;

service::service(const sandbox_config &config) : pipeline(config) {
    size_t count = max(1u, config.workers);
    for (size_t i = 0; i < count; ++i)
        workers.emplace_back(&service::worker_loop, this, i);
    LOG(INFO) << "started " << count << " sandbox workers";
}

service::~service() {
    stop();
}

future<result> service::submit(submission_request request) {
    task t;
    t.request = move(request);
    future<result> fut = t.promise.get_future();
    if (!task_queue.push(move(t))) {
        // push 失败时 t 没有被移动
        LOG(WARNING) << "service stopped, rejecting submission";
        result res;
        res.status = outcome::internal_error{};
        t.promise.set_value(res);
    }
    return fut;
}

void service::stop() {
    task_queue.close();
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
}

size_t service::worker_count() const {
    return workers.size();
}

const runner &service::get_runner() const {
    return pipeline;
}

void service::worker_loop(size_t worker_id) {
    task t;
    while (task_queue.pop(t)) {
        try {
            t.promise.set_value(pipeline.run(t.request));
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed, " << boost::diagnostic_information(ex);
            t.promise.set_exception(current_exception());
        }
    }
    VLOG(1) << "Worker " << worker_id << " exited";
}

}  // namespace sandbox
