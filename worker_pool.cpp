#include "worker_pool.hpp"
#include <cassert>

worker_pool::worker_pool(int n_workers): worker_pool(n_workers, nullptr) {}

worker_pool::worker_pool(int n_workers, std::function<void(int)> before_start) {
  assert(n_workers >= 1);
  try {
    workers.reserve(n_workers);
    for (int i = 0; i < n_workers; ++i) {
      if (before_start) {
        before_start(i);
      }
      workers.emplace_back(&worker_pool::worker, this, i);
    }
  } catch (...) {
    // The destructor does not run for a pool that failed to construct.
    stop();
    throw;
  }
}

worker_pool::~worker_pool() {
  stop();
}

void worker_pool::stop() {
  {
    std::unique_lock lk(q.mutex);
    q.done = true;
  }
  q.more.notify_all();
  workers.clear();
}

void worker_pool::push_task(task t) {
  std::unique_lock lk(q.mutex);
  assert(!q.done);
  q.queue.push(std::move(t));
  q.more.notify_one();
}

void worker_pool::worker(int worker_id) {
  for (;;) {
    task t;
    {
      std::unique_lock lk(q.mutex);
      q.more.wait(lk, [&] { return !q.queue.empty() || q.done; });
      if (q.queue.empty()) {
        return;
      }
      t = std::move(q.queue.front());
      q.queue.pop();
    }
    t(worker_id);
  }
}
