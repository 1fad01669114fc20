#include "UiAlerts.hpp"

#include <memory>
#include <utility>

namespace UiAlerts {
namespace {
QMessageBox::StandardButton
resolveDefaultButton(QMessageBox::StandardButtons buttons,
                     QMessageBox::StandardButton requested) {
    if (requested != QMessageBox::NoButton && buttons.testFlag(requested))
        return requested;

    if (buttons.testFlag(QMessageBox::No))
        return QMessageBox::No;
    if (buttons.testFlag(QMessageBox::Cancel))
        return QMessageBox::Cancel;
    if (buttons.testFlag(QMessageBox::Ok))
        return QMessageBox::Ok;

    return QMessageBox::NoButton;
}
} // namespace

void configure(QMessageBox &box, Qt::WindowModality modality) {
    box.setTextFormat(Qt::PlainText);
    box.setWindowModality(modality);
}

QMessageBox::StandardButton critical(QWidget *parent, const QString &title,
                                     const QString &text,
                                     QMessageBox::StandardButtons buttons) {
    QMessageBox box(parent);
    configure(box, parent ? Qt::WindowModal : Qt::ApplicationModal);
    box.setIcon(QMessageBox::Critical);
    box.setWindowTitle(title);
    box.setText(text);
    box.setStandardButtons(buttons);

    const auto resolvedDefault =
        resolveDefaultButton(buttons, QMessageBox::NoButton);
    if (resolvedDefault != QMessageBox::NoButton)
        box.setDefaultButton(resolvedDefault);

    const int rc = box.exec();
    return static_cast<QMessageBox::StandardButton>(rc);
}

QMessageBox *openQuestion(QWidget *parent, const QString &title,
                          const QString &text,
                          std::function<void(bool accepted)> onAnswer,
                          QMessageBox::StandardButton defaultButton) {
    auto *box = new QMessageBox(parent);
    configure(*box);
    box->setAttribute(Qt::WA_DeleteOnClose);
    box->setIcon(QMessageBox::Question);
    box->setWindowTitle(title);
    box->setText(text);
    const QMessageBox::StandardButtons buttons =
        QMessageBox::Yes | QMessageBox::No;
    box->setStandardButtons(buttons);
    box->setDefaultButton(resolveDefaultButton(buttons, defaultButton));
    box->setEscapeButton(QMessageBox::No);

    auto answer = std::make_shared<std::function<void(bool)>>(
        std::move(onAnswer));
    QObject::connect(box, &QMessageBox::finished, box, [box, answer](int) {
        if (!*answer)
            return;
        auto cb = std::move(*answer);
        *answer = nullptr;
        cb(box->clickedButton() == box->button(QMessageBox::Yes));
    });
    box->open();
    return box;
}
} // namespace UiAlerts
