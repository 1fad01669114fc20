#include "RecordDialog.hpp"
#include <QCheckBox>
#include <QComboBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>

using openzone::RecordFields;
using openzone::ValidationError;

RecordDialog::RecordDialog(const QString &zoneName, const RecordFields &seed,
                           bool editing, QWidget *parent)
    : QDialog(parent), zoneName_(zoneName) {
    setWindowTitle(editing ? tr("Edit record — %1").arg(zoneName)
                           : tr("Add record — %1").arg(zoneName));
    auto *lay = new QFormLayout(this);

    type_ = new QComboBox(this);
    type_->setEditable(true);
    type_->addItems({"A", "AAAA", "CNAME", "MX", "TXT", "NS", "SRV", "CAA"});
    type_->setCurrentText(QString::fromStdString(seed.type));

    name_ = new QLineEdit(QString::fromStdString(seed.name), this);
    name_->setPlaceholderText(tr("@ for %1").arg(zoneName));
    content_ = new QLineEdit(QString::fromStdString(seed.content), this);
    ttl_ = new QLineEdit(QString::fromStdString(seed.ttl), this);
    ttl_->setToolTip(tr("Seconds; 1 means automatic"));
    proxied_ = new QCheckBox(tr("Proxied"), this);
    proxied_->setChecked(seed.proxied);

    error_ = new QLabel(this);
    error_->setStyleSheet("color: #c82828;");
    error_->hide();

    lay->addRow(tr("Type:"), type_);
    lay->addRow(tr("Name:"), name_);
    lay->addRow(tr("Content:"), content_);
    lay->addRow(tr("TTL:"), ttl_);
    lay->addRow(QString(), proxied_);
    lay->addRow(error_);

    auto *bb = new QDialogButtonBox(
        QDialogButtonBox::Save | QDialogButtonBox::Cancel, this);
    lay->addRow(bb);
    connect(bb, &QDialogButtonBox::accepted, this, &RecordDialog::accept);
    connect(bb, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(type_, &QComboBox::currentTextChanged, this,
            [this] { updateProxiedEnabled(); });
    updateProxiedEnabled();

    (editing ? content_ : name_)->setFocus();
}

RecordFields RecordDialog::fields() const {
    RecordFields f;
    f.type = type_->currentText().toStdString();
    f.name = name_->text().toStdString();
    f.content = content_->text().toStdString();
    f.ttl = ttl_->text().toStdString();
    f.proxied = proxied_->isChecked();
    return f;
}

void RecordDialog::accept() {
    const auto packaged =
        openzone::RecordForm::package(zoneName_.toStdString(), fields());
    if (!packaged.ok()) {
        const ValidationError &err = *packaged.error;
        error_->setText(QString::fromStdString(err.message));
        error_->show();
        switch (err.field) {
        case ValidationError::Field::Type:
            type_->setFocus();
            break;
        case ValidationError::Field::Name:
            name_->setFocus();
            break;
        case ValidationError::Field::Content:
            content_->setFocus();
            break;
        }
        return;
    }
    payload_ = packaged.payload;
    QDialog::accept();
}

// The flag is kept as typed; it is only sent for types that support it.
void RecordDialog::updateProxiedEnabled() {
    const QString t = type_->currentText().trimmed().toUpper();
    proxied_->setEnabled(openzone::isProxiableType(t.toStdString()));
}
