#include "preferences_dialog.hpp"
#include "storage/preferences_store.hpp"
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QMessageBox>
#include <QVBoxLayout>
#include <optional>

namespace gui::dialogs {

PreferencesDialog::PreferencesDialog(const common::Preferences& current, QWidget* parent)
    : QDialog(parent), preferences_(current) {
    setWindowTitle("Preferences");
    resize(380, 180);

    currencyCombo_ = new QComboBox;
    currencyCombo_->setEditable(true);
    for (const auto& symbol : common::kCurrencyOptions) {
        currencyCombo_->addItem(QString::fromStdString(symbol));
    }
    currencyCombo_->setCurrentText(QString::fromStdString(current.currencySymbol));

    budgetEdit_ = new QLineEdit(QString::fromStdString(current.defaultMonthlyBudget.toString()));

    auto* form = new QFormLayout;
    form->addRow("Currency symbol:", currencyCombo_);
    form->addRow("Default monthly budget:", budgetEdit_);

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Save | QDialogButtonBox::Cancel);
    connect(buttons, &QDialogButtonBox::accepted, this, &PreferencesDialog::save);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);

    auto* layout = new QVBoxLayout(this);
    layout->addLayout(form);
    layout->addWidget(buttons);
}

void PreferencesDialog::save() {
    const QString budgetText = budgetEdit_->text().trimmed();
    const auto budget = budgetText.isEmpty() ? std::optional<common::Money>(common::Money())
                                             : common::Money::parse(budgetText.toStdString());
    if (!budget) {
        QMessageBox::critical(this, "Invalid", "Please enter a valid budget amount.");
        return;
    }

    common::Preferences updated;
    updated.currencySymbol = currencyCombo_->currentText().trimmed().toStdString();
    updated.defaultMonthlyBudget = *budget;

    auto status = storage::PreferencesStore::validate(updated);
    if (!common::isSuccess(status)) {
        QMessageBox::critical(this, "Invalid", QString::fromStdString(common::getError(status).message));
        return;
    }

    preferences_ = updated;
    accept();
}

}
