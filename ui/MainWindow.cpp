#include "MainWindow.hpp"
#include "QtTaskRunner.hpp"
#include "RecordDialog.hpp"
#include "UiAlerts.hpp"
#include "ZoneTreeModel.hpp"
#include "openzone/AppState.hpp"
#include "openzone/ZoneGateway.hpp"

#include <QAction>
#include <QCloseEvent>
#include <QHeaderView>
#include <QKeySequence>
#include <QLoggingCategory>
#include <QSettings>
#include <QStatusBar>
#include <QToolBar>
#include <QTreeView>

Q_LOGGING_CATEGORY(ozUi, "openzone.ui")

using openzone::LoadState;
using openzone::NodeKind;
using openzone::Severity;
using openzone::TreeController;
using openzone::TreeNode;

MainWindow::MainWindow(std::unique_ptr<openzone::ZoneGateway> gateway,
                       const QString &backendName, QWidget *parent)
    : QMainWindow(parent) {
    state_ = std::make_unique<openzone::AppState>(
        std::move(gateway), std::make_unique<QtTaskRunner>(this), *this,
        *this);

    model_ = new ZoneTreeModel(&state_->store, this);
    tree_ = new QTreeView(this);
    tree_->setModel(model_);
    tree_->setHeaderHidden(false);
    tree_->setUniformRowHeights(true);
    tree_->setSelectionMode(QAbstractItemView::SingleSelection);
    tree_->setExpandsOnDoubleClick(false);
    tree_->header()->setStretchLastSection(true);
    setCentralWidget(tree_);

    auto *tb = addToolBar("Main");
    tb->setObjectName("mainToolBar");
    actRefresh_ = tb->addAction(tr("Refresh (F5)"), this, &MainWindow::refreshRoot);
    actRefresh_->setShortcut(QKeySequence(Qt::Key_F5));
    actReloadZone_ = tb->addAction(tr("Reload zone"), this, &MainWindow::reloadZone);
    actReloadZone_->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_R));
    tb->addSeparator();
    actAdd_ = tb->addAction(tr("Add record"), this, &MainWindow::addRecord);
    actAdd_->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_N));
    actEdit_ = tb->addAction(tr("Edit (F2)"), this, &MainWindow::editSelected);
    actEdit_->setShortcut(QKeySequence(Qt::Key_F2));
    actDelete_ = tb->addAction(tr("Delete (Del)"), this, &MainWindow::deleteSelected);
    actDelete_->setShortcut(QKeySequence(Qt::Key_Delete));
    tb->addSeparator();
    actQuit_ = tb->addAction(tr("Quit"), this, &QWidget::close);
    actQuit_->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Q));

    connect(tree_, &QTreeView::activated, this, &MainWindow::itemActivated);
    connect(tree_, &QTreeView::expanded, this, &MainWindow::itemExpanded);
    connect(tree_, &QTreeView::collapsed, this, &MainWindow::itemCollapsed);
    connect(tree_->selectionModel(), &QItemSelectionModel::currentChanged,
            this, [this] { updateActions(); });
    connect(model_, &QAbstractItemModel::rowsRemoved, this,
            [this] { updateActions(); });

    setWindowTitle(tr("OpenZone — %1").arg(backendName));
    resize(900, 650);
    restoreUiState();
    updateActions();

    statusBar()->showMessage(tr("Loading zones…"));
    state_->controller.loadRoot();
}

MainWindow::~MainWindow() {
    // The model observes the store; drop it before the store goes away.
    tree_->setModel(nullptr);
    delete model_;
    model_ = nullptr;
    state_.reset();
}

void MainWindow::closeEvent(QCloseEvent *event) {
    saveUiState();
    QMainWindow::closeEvent(event);
}

void MainWindow::restoreUiState() {
    QSettings s("OpenZone", "OpenZone");
    const QByteArray geo = s.value("UI/geometry").toByteArray();
    if (!geo.isEmpty())
        restoreGeometry(geo);
    const QByteArray header = s.value("UI/headerState").toByteArray();
    if (!header.isEmpty())
        tree_->header()->restoreState(header);
}

void MainWindow::saveUiState() const {
    QSettings s("OpenZone", "OpenZone");
    s.setValue("UI/geometry", saveGeometry());
    s.setValue("UI/headerState", tree_->header()->saveState());
}

TreeNode *MainWindow::currentNode() const {
    const QModelIndex idx = tree_->currentIndex();
    if (!idx.isValid())
        return nullptr;
    return model_->nodeAt(idx);
}

void MainWindow::updateActions() {
    TreeNode *n = currentNode();
    const bool onRecord = n && n->kind() == NodeKind::ChildNode;
    const bool inZone = state_->store.findContainingParent(n) != nullptr;
    actAdd_->setEnabled(inZone);
    actReloadZone_->setEnabled(inZone);
    actEdit_->setEnabled(onRecord);
    actDelete_->setEnabled(onRecord);
}

void MainWindow::notify(const std::string &title, const std::string &message,
                        Severity severity) {
    const QString t = QString::fromStdString(title);
    const QString m = QString::fromStdString(message);
    switch (severity) {
    case Severity::Info:
        qInfo(ozUi) << t << m;
        statusBar()->showMessage(t + ": " + m, 4000);
        break;
    case Severity::Warning:
        qWarning(ozUi) << t << m;
        statusBar()->showMessage(t + ": " + m, 6000);
        break;
    case Severity::Error:
        qWarning(ozUi) << "error:" << t << m;
        statusBar()->showMessage(tr("Error — %1: %2").arg(t, m), 10000);
        break;
    }
}

void MainWindow::confirmDelete(const std::string &recordLabel,
                               openzone::Interaction<bool> reply) {
    UiAlerts::openQuestion(
        this, tr("Delete record"),
        tr("Delete this record?\n\n%1")
            .arg(QString::fromStdString(recordLabel)),
        [reply](bool accepted) mutable { reply.resume(accepted); });
}

void MainWindow::editRecord(
    const openzone::EditRequest &request,
    openzone::Interaction<openzone::MutationPayload> reply) {
    auto *dlg = new RecordDialog(QString::fromStdString(request.zoneName),
                                 request.fields,
                                 request.existing.has_value(), this);
    dlg->setAttribute(Qt::WA_DeleteOnClose);
    connect(dlg, &QDialog::finished, this,
            [dlg, reply](int result) mutable {
                if (result == QDialog::Accepted && dlg->payload())
                    reply.resume(*dlg->payload());
                else
                    reply.cancel();
            });
    dlg->open();
}

void MainWindow::refreshRoot() {
    if (state_->controller.rootLoading()) {
        statusBar()->showMessage(tr("Zones are already loading"), 3000);
        return;
    }
    statusBar()->showMessage(tr("Loading zones…"));
    state_->controller.loadRoot();
}

void MainWindow::addRecord() { state_->workflow.addRecord(currentNode()); }

void MainWindow::editSelected() { state_->workflow.editRecord(currentNode()); }

void MainWindow::deleteSelected() {
    state_->workflow.deleteRecord(currentNode());
}

void MainWindow::reloadZone() {
    TreeNode *zone = state_->store.findContainingParent(currentNode());
    if (!zone)
        return;
    if (!state_->controller.loadChildren(zone)) {
        statusBar()->showMessage(tr("Zone is already loading"), 3000);
        return;
    }
    tree_->expand(model_->indexFor(zone));
}

void MainWindow::itemActivated(const QModelIndex &idx) {
    TreeNode *n = model_->nodeAt(idx);
    switch (state_->controller.activate(n)) {
    case TreeController::Activation::LoadStarted:
        tree_->expand(idx);
        break;
    case TreeController::Activation::EditRequested:
        state_->workflow.editRecord(n);
        break;
    case TreeController::Activation::Ignored:
        break;
    }
}

void MainWindow::itemExpanded(const QModelIndex &idx) {
    TreeNode *n = model_->nodeAt(idx);
    if (n && n->kind() == NodeKind::ParentNode &&
        n->loadState() == LoadState::Unloaded)
        state_->controller.loadChildren(n);
}

// Collapsing a failed zone arms it for a retry on the next expansion.
void MainWindow::itemCollapsed(const QModelIndex &idx) {
    TreeNode *n = model_->nodeAt(idx);
    if (n && n->kind() == NodeKind::ParentNode &&
        n->loadState() == LoadState::Failed)
        state_->controller.resetParent(n);
}
