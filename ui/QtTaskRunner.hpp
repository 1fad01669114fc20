// TaskRunner backed by one worker std::thread per job; commits are queued
// back to the application thread.
#pragma once
#include "openzone/TaskRunner.hpp"
#include <QObject>
#include <QPointer>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

class QtTaskRunner : public openzone::TaskRunner {
public:
    // Commits are dropped once context is destroyed.
    explicit QtTaskRunner(QObject *context);
    // Raises the stop flag, then blocks until every running job has returned.
    ~QtTaskRunner() override;

    void post(Job job) override;

private:
    QPointer<QObject> context_;
    std::shared_ptr<std::atomic<bool>> stopping_;
    std::mutex mtx_;
    std::condition_variable idle_;
    int active_ = 0;

    void jobFinished();
};
