#include "openzone/TreeController.hpp"
#include <memory>
#include <utility>
#include <vector>

namespace openzone {

TreeController::TreeController(TreeStore &store, ZoneGateway &gateway,
                               TaskRunner &runner, NotificationSink &sink)
    : store_(store), gateway_(gateway), runner_(runner), sink_(sink) {}

void TreeController::loadRoot() {
    if (rootLoading_)
        return;
    rootLoading_ = true;

    ZoneGateway &gateway = gateway_;
    runner_.post([this, &gateway](const CancelCheck &stopping)
                     -> TaskRunner::Commit {
        auto result = std::make_shared<Result<std::vector<Zone>>>(
            gateway.listParents(stopping));
        return [this, result]() { commitRoot(*result); };
    });
}

void TreeController::commitRoot(const Result<std::vector<Zone>> &result) {
    rootLoading_ = false;
    if (!result) {
        // Keep whatever the tree showed before.
        sink_.notify("Could not load zones", result.error().describe(),
                     Severity::Error);
        return;
    }

    // Every zone node is rebuilt; listings still running for the old nodes
    // can only be discarded.
    cancelChildLoads();

    std::vector<std::unique_ptr<TreeNode>> parents;
    parents.reserve(result.value().size());
    for (const Zone &z : result.value())
        parents.push_back(TreeStore::makeParent(z));
    store_.replaceChildren(store_.root(), std::move(parents));
    sink_.notify("Zones loaded",
                 std::to_string(result.value().size()) + " zone(s)",
                 Severity::Info);
}

bool TreeController::loadChildren(TreeNode *parentNode) {
    if (!parentNode || parentNode->kind() != NodeKind::ParentNode)
        return false;
    if (parentNode->loadState() == LoadState::Loading)
        return false;
    startChildrenLoad(parentNode);
    return true;
}

bool TreeController::reloadParent(const std::string &zoneId) {
    TreeNode *parent = store_.findParent(zoneId);
    if (!parent)
        return false;
    startChildrenLoad(parent);
    return true;
}

void TreeController::startChildrenLoad(TreeNode *parentNode) {
    const std::string zoneId = parentNode->id();
    auto flag = std::make_shared<std::atomic<bool>>(false);
    auto prev = childLoads_.find(zoneId);
    if (prev != childLoads_.end())
        prev->second->store(true);
    childLoads_[zoneId] = flag;

    const std::uint64_t ticket = store_.beginLoad(parentNode);
    store_.replaceChildren(parentNode, {});

    ZoneGateway &gateway = gateway_;
    runner_.post([this, &gateway, zoneId, ticket,
                  flag](const CancelCheck &stopping) -> TaskRunner::Commit {
        auto result = std::make_shared<Result<std::vector<Record>>>(
            gateway.listChildren(zoneId, anyOf(flag, stopping)));
        return [this, zoneId, ticket, flag, result]() {
            commitChildren(zoneId, ticket, flag, *result);
        };
    });
}

void TreeController::cancelChildLoads() {
    for (auto &entry : childLoads_)
        entry.second->store(true);
    childLoads_.clear();
}

void TreeController::commitChildren(const std::string &zoneId,
                                    std::uint64_t ticket,
                                    const std::shared_ptr<std::atomic<bool>> &flag,
                                    const Result<std::vector<Record>> &result) {
    auto own = childLoads_.find(zoneId);
    if (own != childLoads_.end() && own->second == flag)
        childLoads_.erase(own);

    // The zone may have been rebuilt by a root refresh while we were away.
    TreeNode *parent = store_.findParent(zoneId);
    if (!parent || parent->loadTicket() != ticket ||
        parent->loadState() != LoadState::Loading)
        return;

    std::vector<std::unique_ptr<TreeNode>> children;
    if (!result) {
        const std::string msg = result.error().describe();
        children.push_back(TreeStore::makeError(zoneId, msg));
        store_.setLoadState(parent, LoadState::Failed);
        store_.replaceChildren(parent, std::move(children));
        sink_.notify("Could not load records of " + parent->label(), msg,
                     Severity::Error);
        return;
    }

    const auto &records = result.value();
    if (records.empty()) {
        children.push_back(TreeStore::makeInfo(zoneId, "No records"));
    } else {
        children.reserve(records.size());
        for (const Record &r : records)
            children.push_back(TreeStore::makeChild(r));
    }
    store_.setLoadState(parent, LoadState::Loaded);
    store_.replaceChildren(parent, std::move(children));
}

bool TreeController::resetParent(TreeNode *parentNode) {
    if (!parentNode || parentNode->kind() != NodeKind::ParentNode)
        return false;
    if (parentNode->loadState() == LoadState::Loading)
        return false;
    std::vector<std::unique_ptr<TreeNode>> seed;
    seed.push_back(TreeStore::makePlaceholder(parentNode->id()));
    store_.setLoadState(parentNode, LoadState::Unloaded);
    store_.replaceChildren(parentNode, std::move(seed));
    return true;
}

TreeController::Activation TreeController::activate(TreeNode *node) {
    if (!node)
        return Activation::Ignored;
    switch (node->kind()) {
    case NodeKind::ParentNode:
        return loadChildren(node) ? Activation::LoadStarted
                                  : Activation::Ignored;
    case NodeKind::ChildNode:
        return Activation::EditRequested;
    case NodeKind::Root:
    case NodeKind::PlaceholderLeaf:
    case NodeKind::ErrorLeaf:
    case NodeKind::InfoLeaf:
        break;
    }
    return Activation::Ignored;
}

} // namespace openzone
