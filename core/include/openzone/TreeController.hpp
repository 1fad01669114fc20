// Lazy loading of the zone tree: root listing and per-zone record listing.
#pragma once
#include "NotificationSink.hpp"
#include "TaskRunner.hpp"
#include "TreeStore.hpp"
#include "ZoneGateway.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace openzone {

class TreeController {
public:
    enum class Activation { Ignored, LoadStarted, EditRequested };

    TreeController(TreeStore &store, ZoneGateway &gateway, TaskRunner &runner,
                   NotificationSink &sink);

    // Fetches the zone list and rebuilds the root's children. Ignored while a
    // root load is already pending.
    void loadRoot();
    bool rootLoading() const { return rootLoading_; }

    // Fetches the records of parentNode. Returns false when the request was
    // ignored (not a parent, or already loading).
    bool loadChildren(TreeNode *parentNode);
    // Used after a mutation: starts a fresh listing even while one is
    // running. The older listing is canceled and its result discarded, so the
    // zone ends up showing state read after the mutation.
    bool reloadParent(const std::string &zoneId);

    // Back to Unloaded with a fresh placeholder; the next expansion reloads.
    bool resetParent(TreeNode *parentNode);

    // Select/activate: parents load, children ask for the edit dialog.
    Activation activate(TreeNode *node);

private:
    TreeStore &store_;
    ZoneGateway &gateway_;
    TaskRunner &runner_;
    NotificationSink &sink_;
    bool rootLoading_ = false;
    // Cancel flag of the listing in flight, per zone id.
    std::map<std::string, std::shared_ptr<std::atomic<bool>>> childLoads_;

    void startChildrenLoad(TreeNode *parentNode);
    void cancelChildLoads();
    void commitRoot(const Result<std::vector<Zone>> &result);
    void commitChildren(const std::string &zoneId, std::uint64_t ticket,
                        const std::shared_ptr<std::atomic<bool>> &flag,
                        const Result<std::vector<Record>> &result);
};

} // namespace openzone
