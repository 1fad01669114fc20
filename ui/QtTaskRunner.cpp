#include "QtTaskRunner.hpp"
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QMetaObject>
#include <exception>
#include <thread>
#include <utility>

Q_LOGGING_CATEGORY(ozRunner, "openzone.runner")

QtTaskRunner::QtTaskRunner(QObject *context)
    : context_(context),
      stopping_(std::make_shared<std::atomic<bool>>(false)) {}

QtTaskRunner::~QtTaskRunner() {
    // Gateway calls poll this and abort their request.
    stopping_->store(true);
    std::unique_lock<std::mutex> lk(mtx_);
    if (active_ > 0)
        qInfo(ozRunner) << "waiting for" << active_ << "job(s)";
    idle_.wait(lk, [this] { return active_ == 0; });
}

void QtTaskRunner::jobFinished() {
    std::lock_guard<std::mutex> lk(mtx_);
    --active_;
    if (active_ == 0)
        idle_.notify_all();
}

void QtTaskRunner::post(Job job) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        ++active_;
    }
    QPointer<QObject> ctx = context_;
    std::shared_ptr<std::atomic<bool>> stopping = stopping_;
    std::thread([this, ctx, stopping, job = std::move(job)]() {
        const openzone::CancelCheck stopCheck = [stopping] {
            return stopping->load();
        };
        Commit commit;
        try {
            commit = job(stopCheck);
        } catch (const std::exception &ex) {
            qWarning(ozRunner) << "job threw:" << ex.what();
        }
        if (commit && !stopping->load()) {
            const bool queued = QMetaObject::invokeMethod(
                qApp,
                [ctx, stopping, commit = std::move(commit)]() {
                    if (ctx && !stopping->load())
                        commit();
                },
                Qt::QueuedConnection);
            if (!queued)
                qWarning(ozRunner) << "could not queue commit";
        }
        jobFinished();
    }).detach();
}
