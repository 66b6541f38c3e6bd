#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <iterator>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed set of worker threads draining one FIFO queue. Each task is handed
// the id of the worker running it, in [0, size()). The destructor runs every
// task still queued, then joins the workers.
class worker_pool {
  using task = std::move_only_function<void(int worker_id)>;

  struct {
    std::mutex mutex;
    std::condition_variable more;
    std::queue<task> queue;
    bool done = false;
  } q;

  std::vector<std::jthread> workers;

  void push_task(task t);
  void worker(int worker_id);
  void stop();

public:
  explicit worker_pool(int n_workers);
  // before_start(i) runs on the constructing thread just ahead of starting
  // worker i. If it or a thread start throws, the workers already running are
  // stopped and joined and the exception propagates.
  worker_pool(int n_workers, std::function<void(int)> before_start);
  ~worker_pool();

  worker_pool(const worker_pool&) = delete;
  worker_pool& operator=(const worker_pool&) = delete;

  int size() const { return std::ssize(workers); }

  // fn is called as fn(worker_id). Its result, or the exception it throws,
  // ends up in the returned future.
  template<typename Fn>
  auto submit(Fn fn) -> std::future<std::invoke_result_t<Fn&, int>> {
    using result_type = std::invoke_result_t<Fn&, int>;
    std::packaged_task<result_type(int)> pt(std::move(fn));
    auto future = pt.get_future();
    push_task([pt = std::move(pt)](int worker_id) mutable { pt(worker_id); });
    return future;
  }
};
