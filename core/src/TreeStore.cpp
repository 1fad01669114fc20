#include "openzone/TreeStore.hpp"
#include <utility>

namespace openzone {

const char *loadStateName(LoadState state) {
    switch (state) {
    case LoadState::Unloaded:
        return "Unloaded";
    case LoadState::Loading:
        return "Loading";
    case LoadState::Loaded:
        return "Loaded";
    case LoadState::Failed:
        return "Failed";
    }
    return "Unknown";
}

TreeNode::TreeNode(NodeKind kind, std::string id, std::string label,
                   Payload payload)
    : kind_(kind), id_(std::move(id)), label_(std::move(label)),
      payload_(std::move(payload)) {}

TreeNode *TreeNode::child(std::size_t row) const {
    if (row >= children_.size())
        return nullptr;
    return children_[row].get();
}

int TreeNode::row() const {
    if (!parent_)
        return -1;
    const auto &siblings = parent_->children_;
    for (std::size_t i = 0; i < siblings.size(); ++i) {
        if (siblings[i].get() == this)
            return static_cast<int>(i);
    }
    return -1;
}

TreeStore::TreeStore()
    : root_(std::make_unique<TreeNode>(NodeKind::Root, "root", "Zones")) {}

void TreeStore::replaceChildren(
    TreeNode *node, std::vector<std::unique_ptr<TreeNode>> newChildren) {
    if (!node)
        return;

    // Old nodes stay alive until the observer has seen the removal.
    std::vector<std::unique_ptr<TreeNode>> old;
    if (!node->children_.empty()) {
        if (observer_)
            observer_->childrenAboutToBeRemoved(*node,
                                                node->children_.size());
        old.swap(node->children_);
        if (observer_)
            observer_->childrenRemoved(*node);
    }

    if (!newChildren.empty()) {
        if (observer_)
            observer_->childrenAboutToBeInserted(*node, newChildren.size());
        for (auto &c : newChildren)
            c->parent_ = node;
        node->children_ = std::move(newChildren);
        if (observer_)
            observer_->childrenInserted(*node);
    }
}

TreeNode *TreeStore::findContainingParent(TreeNode *node) const {
    for (TreeNode *cur = node; cur; cur = cur->parent_) {
        if (cur->kind_ == NodeKind::ParentNode)
            return cur;
    }
    return nullptr;
}

TreeNode *TreeStore::findParent(const std::string &zoneId) const {
    for (const auto &c : root_->children_) {
        if (c->kind_ == NodeKind::ParentNode && c->id_ == zoneId)
            return c.get();
    }
    return nullptr;
}

TreeNode *TreeStore::findChild(const std::string &zoneId,
                               const std::string &recordId) const {
    TreeNode *parent = findParent(zoneId);
    if (!parent)
        return nullptr;
    for (const auto &c : parent->children_) {
        if (c->kind_ == NodeKind::ChildNode && c->id_ == recordId)
            return c.get();
    }
    return nullptr;
}

void TreeStore::setLoadState(TreeNode *node, LoadState state) {
    if (!node || node->loadState_ == state)
        return;
    node->loadState_ = state;
    if (observer_)
        observer_->nodeChanged(*node);
}

std::uint64_t TreeStore::beginLoad(TreeNode *node) {
    node->loadTicket_ = nextTicket_++;
    setLoadState(node, LoadState::Loading);
    return node->loadTicket_;
}

std::unique_ptr<TreeNode> TreeStore::makeParent(const Zone &zone) {
    auto node = std::make_unique<TreeNode>(NodeKind::ParentNode, zone.id,
                                           zone.name, zone);
    auto placeholder = makePlaceholder(zone.id);
    placeholder->parent_ = node.get();
    node->children_.push_back(std::move(placeholder));
    return node;
}

std::unique_ptr<TreeNode> TreeStore::makeChild(const Record &record) {
    return std::make_unique<TreeNode>(NodeKind::ChildNode, record.id,
                                      describeRecord(record), record);
}

std::unique_ptr<TreeNode>
TreeStore::makePlaceholder(const std::string &ownerId) {
    return std::make_unique<TreeNode>(NodeKind::PlaceholderLeaf,
                                      ownerId + "#placeholder", "Loading…");
}

std::unique_ptr<TreeNode> TreeStore::makeError(const std::string &ownerId,
                                               const std::string &message) {
    return std::make_unique<TreeNode>(NodeKind::ErrorLeaf, ownerId + "#error",
                                      "Error: " + message);
}

std::unique_ptr<TreeNode> TreeStore::makeInfo(const std::string &ownerId,
                                              const std::string &message) {
    return std::make_unique<TreeNode>(NodeKind::InfoLeaf, ownerId + "#info",
                                      message);
}

std::string describeRecord(const Record &record) {
    std::string out = record.type + "  " + record.name + "  " + record.content;
    if (isProxiableType(record.type))
        out += record.proxied ? "  [proxied]" : "  [dns only]";
    else
        out += "  ttl " + std::to_string(record.ttl);
    return out;
}

} // namespace openzone
