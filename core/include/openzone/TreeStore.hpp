// In-memory zone/record hierarchy shown by the UI. All mutation happens on the
// UI thread; the attached observer mirrors every structural change.
#pragma once
#include "ZoneTypes.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace openzone {

enum class NodeKind { Root, ParentNode, ChildNode, PlaceholderLeaf, ErrorLeaf, InfoLeaf };

enum class LoadState { Unloaded, Loading, Loaded, Failed };

const char *loadStateName(LoadState state);

class TreeNode {
public:
    using Payload = std::variant<std::monostate, Zone, Record>;

    TreeNode(NodeKind kind, std::string id, std::string label,
             Payload payload = {});

    NodeKind kind() const { return kind_; }
    const std::string &id() const { return id_; }
    const std::string &label() const { return label_; }
    TreeNode *parent() const { return parent_; }

    std::size_t childCount() const { return children_.size(); }
    TreeNode *child(std::size_t row) const;
    // Position of this node in its parent, -1 for the root.
    int row() const;

    LoadState loadState() const { return loadState_; }
    std::uint64_t loadTicket() const { return loadTicket_; }

    const Zone *zone() const { return std::get_if<Zone>(&payload_); }
    const Record *record() const { return std::get_if<Record>(&payload_); }

private:
    friend class TreeStore;

    NodeKind kind_;
    std::string id_;
    std::string label_;
    Payload payload_;
    TreeNode *parent_ = nullptr; // not owned
    std::vector<std::unique_ptr<TreeNode>> children_;
    LoadState loadState_ = LoadState::Unloaded;
    std::uint64_t loadTicket_ = 0;
};

// Display surface notified of structural changes. Remove/insert pairs are
// always delivered inside one replaceChildren() call.
class TreeObserver {
public:
    virtual ~TreeObserver() = default;
    virtual void childrenAboutToBeRemoved(const TreeNode &node,
                                          std::size_t count) = 0;
    virtual void childrenRemoved(const TreeNode &node) = 0;
    virtual void childrenAboutToBeInserted(const TreeNode &node,
                                           std::size_t count) = 0;
    virtual void childrenInserted(const TreeNode &node) = 0;
    virtual void nodeChanged(const TreeNode &node) = 0;
};

class TreeStore {
public:
    TreeStore();

    TreeNode *root() const { return root_.get(); }

    // Non-owning; pass nullptr to detach.
    void setObserver(TreeObserver *observer) { observer_ = observer; }

    // Discards every current child of node and installs newChildren in one
    // step.
    void replaceChildren(TreeNode *node,
                         std::vector<std::unique_ptr<TreeNode>> newChildren);

    // Nearest ancestor (or node itself) of kind ParentNode, nullptr if none.
    TreeNode *findContainingParent(TreeNode *node) const;

    TreeNode *findParent(const std::string &zoneId) const;
    TreeNode *findChild(const std::string &zoneId,
                        const std::string &recordId) const;

    void setLoadState(TreeNode *node, LoadState state);
    // Starts a new load generation for node and returns its ticket.
    std::uint64_t beginLoad(TreeNode *node);

    // Node factories. A new parent comes seeded with its placeholder leaf.
    static std::unique_ptr<TreeNode> makeParent(const Zone &zone);
    static std::unique_ptr<TreeNode> makeChild(const Record &record);
    static std::unique_ptr<TreeNode> makePlaceholder(const std::string &ownerId);
    static std::unique_ptr<TreeNode> makeError(const std::string &ownerId,
                                               const std::string &message);
    static std::unique_ptr<TreeNode> makeInfo(const std::string &ownerId,
                                              const std::string &message);

private:
    std::unique_ptr<TreeNode> root_;
    TreeObserver *observer_ = nullptr; // not owned
    std::uint64_t nextTicket_ = 1;
};

// One-line summary used as a record's label.
std::string describeRecord(const Record &record);

} // namespace openzone
