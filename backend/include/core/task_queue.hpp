#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <thread>
#include <vector>
#include <atomic>
#include <memory>
#include <future>
#include <string>

namespace pitchscribe {
namespace core {

enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2
};

/**
 * Unit of background work. The name only appears in logs.
 */
class Task {
public:
    Task(std::string name, TaskPriority priority = TaskPriority::NORMAL)
        : name_(std::move(name)), priority_(priority), sequence_(0) {}

    virtual ~Task() = default;
    virtual void execute() = 0;

    const std::string& getName() const { return name_; }
    TaskPriority getPriority() const { return priority_; }
    uint64_t getSequence() const { return sequence_; }

private:
    friend class TaskQueue;

    std::string name_;
    TaskPriority priority_;
    uint64_t sequence_;
};

class FunctionTask : public Task {
public:
    FunctionTask(std::string name, std::function<void()> func, TaskPriority priority = TaskPriority::NORMAL)
        : Task(std::move(name), priority), func_(std::move(func)) {}

    void execute() override {
        if (func_) {
            func_();
        }
    }

private:
    std::function<void()> func_;
};

/**
 * Higher priority first, FIFO within a priority
 */
struct TaskComparator {
    bool operator()(const std::shared_ptr<Task>& a, const std::shared_ptr<Task>& b) const {
        if (a->getPriority() != b->getPriority()) {
            return static_cast<int>(a->getPriority()) < static_cast<int>(b->getPriority());
        }
        return a->getSequence() > b->getSequence();
    }
};

/**
 * Thread-safe priority queue of tasks
 */
class TaskQueue {
public:
    TaskQueue();
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /**
     * @return false if the queue is shutting down and the task was rejected
     */
    bool enqueue(std::shared_ptr<Task> task);
    bool enqueue(const std::string& name, std::function<void()> func,
                 TaskPriority priority = TaskPriority::NORMAL);

    template<typename F>
    auto enqueueWithFuture(const std::string& name, TaskPriority priority, F&& f)
        -> std::future<typename std::result_of<F()>::type>;

    /**
     * Blocks until a task is available. Returns nullptr once shut down and drained.
     */
    std::shared_ptr<Task> dequeue();
    std::shared_ptr<Task> tryDequeue();

    size_t size() const;
    bool empty() const;
    void clear();

    /**
     * Stop accepting tasks. Queued tasks are still handed out.
     */
    void shutdown();
    bool isShuttingDown() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::priority_queue<std::shared_ptr<Task>, std::vector<std::shared_ptr<Task>>, TaskComparator> queue_;
    std::atomic<bool> shutdown_;
    uint64_t nextSequence_;
};

/**
 * Worker threads draining a TaskQueue
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void start(std::shared_ptr<TaskQueue> task_queue);

    /**
     * Shut the queue down, let workers finish queued tasks and join them
     */
    void stop();

    size_t getNumThreads() const { return num_threads_; }
    size_t getActiveThreads() const;
    size_t getCompletedTasks() const { return completed_tasks_; }
    size_t getFailedTasks() const { return failed_tasks_; }
    bool isRunning() const { return running_; }

private:
    void workerLoop();

    size_t num_threads_;
    std::vector<std::thread> workers_;
    std::shared_ptr<TaskQueue> task_queue_;
    std::atomic<bool> running_;
    std::atomic<size_t> active_threads_;
    std::atomic<size_t> completed_tasks_;
    std::atomic<size_t> failed_tasks_;
};

template<typename F>
auto TaskQueue::enqueueWithFuture(const std::string& name, TaskPriority priority, F&& f)
    -> std::future<typename std::result_of<F()>::type> {

    using return_type = typename std::result_of<F()>::type;

    auto task_ptr = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task_ptr->get_future();

    enqueue(std::make_shared<FunctionTask>(name, [task_ptr]() { (*task_ptr)(); }, priority));
    return result;
}

} // namespace core
} // namespace pitchscribe
