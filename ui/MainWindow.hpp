#pragma once
#include "openzone/NotificationSink.hpp"
#include "openzone/RecordWorkflow.hpp"
#include <QMainWindow>
#include <memory>

class QAction;
class QCloseEvent;
class QModelIndex;
class QTreeView;
class ZoneTreeModel;
namespace openzone {
struct AppState;
class TreeNode;
class ZoneGateway;
} // namespace openzone

class MainWindow : public QMainWindow,
                   public openzone::NotificationSink,
                   public openzone::ModalHost {
    Q_OBJECT
public:
    MainWindow(std::unique_ptr<openzone::ZoneGateway> gateway,
               const QString &backendName, QWidget *parent = nullptr);
    ~MainWindow() override;

    // NotificationSink
    void notify(const std::string &title, const std::string &message,
                openzone::Severity severity) override;

    // ModalHost
    void confirmDelete(const std::string &recordLabel,
                       openzone::Interaction<bool> reply) override;
    void editRecord(const openzone::EditRequest &request,
                    openzone::Interaction<openzone::MutationPayload> reply)
        override;

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void refreshRoot();   // F5
    void addRecord();     // Ctrl+N
    void editSelected();  // F2
    void deleteSelected(); // Del
    void reloadZone();    // Ctrl+R
    void itemActivated(const QModelIndex &idx);
    void itemExpanded(const QModelIndex &idx);
    void itemCollapsed(const QModelIndex &idx);
    void updateActions();

private:
    std::unique_ptr<openzone::AppState> state_;
    ZoneTreeModel *model_ = nullptr;
    QTreeView *tree_ = nullptr;

    QAction *actRefresh_ = nullptr;
    QAction *actAdd_ = nullptr;
    QAction *actEdit_ = nullptr;
    QAction *actDelete_ = nullptr;
    QAction *actReloadZone_ = nullptr;
    QAction *actQuit_ = nullptr;

    openzone::TreeNode *currentNode() const;
    void restoreUiState();
    void saveUiState() const;
};
