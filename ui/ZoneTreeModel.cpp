#include "ZoneTreeModel.hpp"
#include <QBrush>
#include <QColor>
#include <QFont>
#include <QVariant>

using openzone::LoadState;
using openzone::NodeKind;
using openzone::TreeNode;

ZoneTreeModel::ZoneTreeModel(openzone::TreeStore *store, QObject *parent)
    : QAbstractItemModel(parent), store_(store) {
    if (store_)
        store_->setObserver(this);
}

ZoneTreeModel::~ZoneTreeModel() {
    if (store_)
        store_->setObserver(nullptr);
}

TreeNode *ZoneTreeModel::nodeAt(const QModelIndex &idx) const {
    if (!idx.isValid())
        return store_ ? store_->root() : nullptr;
    return static_cast<TreeNode *>(idx.internalPointer());
}

QModelIndex ZoneTreeModel::indexFor(const TreeNode *node) const {
    if (!node || node->kind() == NodeKind::Root)
        return {};
    const int row = node->row();
    if (row < 0)
        return {};
    return createIndex(row, 0, const_cast<TreeNode *>(node));
}

QModelIndex ZoneTreeModel::index(int row, int column,
                                 const QModelIndex &parent) const {
    if (column != 0 || row < 0)
        return {};
    TreeNode *p = nodeAt(parent);
    if (!p)
        return {};
    TreeNode *c = p->child(static_cast<std::size_t>(row));
    if (!c)
        return {};
    return createIndex(row, 0, c);
}

QModelIndex ZoneTreeModel::parent(const QModelIndex &child) const {
    if (!child.isValid())
        return {};
    const TreeNode *n = nodeAt(child);
    return indexFor(n ? n->parent() : nullptr);
}

int ZoneTreeModel::rowCount(const QModelIndex &parent) const {
    if (parent.isValid() && parent.column() != 0)
        return 0;
    const TreeNode *n = nodeAt(parent);
    return n ? static_cast<int>(n->childCount()) : 0;
}

int ZoneTreeModel::columnCount(const QModelIndex &) const { return 1; }

QVariant ZoneTreeModel::data(const QModelIndex &index, int role) const {
    if (!index.isValid())
        return {};
    const TreeNode *n = nodeAt(index);
    if (!n)
        return {};

    switch (role) {
    case Qt::DisplayRole: {
        QString text = QString::fromStdString(n->label());
        if (n->kind() == NodeKind::ParentNode &&
            n->loadState() == LoadState::Loading)
            text += tr("  (loading…)");
        return text;
    }
    case Qt::ToolTipRole:
        if (const auto *z = n->zone()) {
            return tr("Zone %1\nStatus: %2\nRecords: %3")
                .arg(QString::fromStdString(z->name),
                     QString::fromStdString(z->status),
                     QString::fromLatin1(openzone::loadStateName(n->loadState())));
        }
        if (const auto *r = n->record()) {
            return tr("%1 %2\n%3\nTTL: %4")
                .arg(QString::fromStdString(r->type),
                     QString::fromStdString(r->name),
                     QString::fromStdString(r->content),
                     r->ttl == 1 ? tr("auto") : QString::number(r->ttl));
        }
        return QString::fromStdString(n->label());
    case Qt::ForegroundRole:
        if (n->kind() == NodeKind::ErrorLeaf)
            return QBrush(QColor(200, 40, 40));
        if (n->kind() == NodeKind::PlaceholderLeaf ||
            n->kind() == NodeKind::InfoLeaf)
            return QBrush(QColor(128, 128, 128));
        return {};
    case Qt::FontRole:
        if (n->kind() == NodeKind::ParentNode) {
            QFont f;
            f.setBold(true);
            return f;
        }
        if (n->kind() == NodeKind::ChildNode)
            return QFont(QStringLiteral("monospace"));
        return {};
    default:
        return {};
    }
}

QVariant ZoneTreeModel::headerData(int section, Qt::Orientation orientation,
                                   int role) const {
    if (section == 0 && orientation == Qt::Horizontal &&
        role == Qt::DisplayRole)
        return tr("Zones and records");
    return {};
}

Qt::ItemFlags ZoneTreeModel::flags(const QModelIndex &index) const {
    if (!index.isValid())
        return Qt::NoItemFlags;
    const TreeNode *n = nodeAt(index);
    if (n && (n->kind() == NodeKind::PlaceholderLeaf ||
              n->kind() == NodeKind::InfoLeaf))
        return Qt::ItemIsEnabled;
    return Qt::ItemIsEnabled | Qt::ItemIsSelectable;
}

void ZoneTreeModel::childrenAboutToBeRemoved(const TreeNode &node,
                                             std::size_t count) {
    beginRemoveRows(indexFor(&node), 0, static_cast<int>(count) - 1);
}

void ZoneTreeModel::childrenRemoved(const TreeNode &) { endRemoveRows(); }

void ZoneTreeModel::childrenAboutToBeInserted(const TreeNode &node,
                                              std::size_t count) {
    beginInsertRows(indexFor(&node), 0, static_cast<int>(count) - 1);
}

void ZoneTreeModel::childrenInserted(const TreeNode &) { endInsertRows(); }

void ZoneTreeModel::nodeChanged(const TreeNode &node) {
    const QModelIndex idx = indexFor(&node);
    if (idx.isValid())
        emit dataChanged(idx, idx);
}
