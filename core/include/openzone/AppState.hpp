// Everything the UI drives, built once at startup and passed explicitly.
#pragma once
#include "MutationDispatcher.hpp"
#include "NotificationSink.hpp"
#include "RecordWorkflow.hpp"
#include "TaskRunner.hpp"
#include "TreeController.hpp"
#include "TreeStore.hpp"
#include "ZoneGateway.hpp"
#include <memory>
#include <utility>

namespace openzone {

struct AppState {
    AppState(std::unique_ptr<ZoneGateway> gw, std::unique_ptr<TaskRunner> rn,
             NotificationSink &sink, ModalHost &host)
        : gateway(std::move(gw)), runner(std::move(rn)),
          controller(store, *gateway, *runner, sink),
          dispatcher(*gateway, *runner, controller, sink),
          workflow(store, host, dispatcher, sink) {}

    AppState(const AppState &) = delete;
    AppState &operator=(const AppState &) = delete;

    // Declaration order is destruction order in reverse: the runner must
    // finish its jobs while the gateway is still alive.
    std::unique_ptr<ZoneGateway> gateway;
    std::unique_ptr<TaskRunner> runner;
    TreeStore store;
    TreeController controller;
    MutationDispatcher dispatcher;
    RecordWorkflow workflow;
};

} // namespace openzone
