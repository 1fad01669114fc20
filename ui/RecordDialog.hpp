#pragma once
#include "openzone/RecordForm.hpp"
#include <QDialog>
#include <optional>

class QCheckBox;
class QComboBox;
class QLabel;
class QLineEdit;

// Create/edit form for one record. Stays open while the input does not
// validate; payload() is set once accepted.
class RecordDialog : public QDialog {
    Q_OBJECT
public:
    RecordDialog(const QString &zoneName, const openzone::RecordFields &seed,
                 bool editing, QWidget *parent = nullptr);

    openzone::RecordFields fields() const;
    const std::optional<openzone::MutationPayload> &payload() const {
        return payload_;
    }

public slots:
    void accept() override;

private:
    QString zoneName_;
    QComboBox *type_ = nullptr;
    QLineEdit *name_ = nullptr;
    QLineEdit *content_ = nullptr;
    QLineEdit *ttl_ = nullptr;
    QCheckBox *proxied_ = nullptr;
    QLabel *error_ = nullptr;
    std::optional<openzone::MutationPayload> payload_;

    void updateProxiedEnabled();
};
