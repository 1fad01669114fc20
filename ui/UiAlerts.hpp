#pragma once

#include <QMessageBox>
#include <functional>

class QString;
class QWidget;

namespace UiAlerts {
void configure(QMessageBox &box,
               Qt::WindowModality modality = Qt::WindowModal);

// Blocking alert, for use before the main window exists.
QMessageBox::StandardButton
critical(QWidget *parent, const QString &title, const QString &text,
         QMessageBox::StandardButtons buttons = QMessageBox::Ok);

// Non-blocking Yes/No question. onAnswer runs exactly once with true only
// when Yes was pressed; closing the box counts as No.
QMessageBox *openQuestion(QWidget *parent, const QString &title,
                          const QString &text,
                          std::function<void(bool accepted)> onAnswer,
                          QMessageBox::StandardButton defaultButton =
                              QMessageBox::No);
} // namespace UiAlerts
