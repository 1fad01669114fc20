#pragma once
#include "openzone/TreeStore.hpp"
#include <QAbstractItemModel>

// Qt view of the TreeStore. Rows are inserted/removed as the store reports
// them; the model never mutates the store itself.
class ZoneTreeModel : public QAbstractItemModel,
                      public openzone::TreeObserver {
    Q_OBJECT
public:
    explicit ZoneTreeModel(openzone::TreeStore *store,
                           QObject *parent = nullptr);
    ~ZoneTreeModel() override;

    QModelIndex index(int row, int column,
                      const QModelIndex &parent = QModelIndex()) const override;
    QModelIndex parent(const QModelIndex &child) const override;
    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    QVariant headerData(int section, Qt::Orientation orientation,
                        int role) const override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;

    openzone::TreeNode *nodeAt(const QModelIndex &idx) const;
    QModelIndex indexFor(const openzone::TreeNode *node) const;

    // TreeObserver
    void childrenAboutToBeRemoved(const openzone::TreeNode &node,
                                  std::size_t count) override;
    void childrenRemoved(const openzone::TreeNode &node) override;
    void childrenAboutToBeInserted(const openzone::TreeNode &node,
                                   std::size_t count) override;
    void childrenInserted(const openzone::TreeNode &node) override;
    void nodeChanged(const openzone::TreeNode &node) override;

private:
    openzone::TreeStore *store_ = nullptr; // not owned
};
