#include "edit_expense_dialog.hpp"
#include "common/strings.hpp"
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QPushButton>
#include <QVBoxLayout>

namespace gui::dialogs {

EditExpenseDialog::EditExpenseDialog(const common::ExpenseRecord& record,
                                     const common::Preferences& preferences, QWidget* parent)
    : QDialog(parent), record_(record) {
    setWindowTitle("Edit Expense");
    resize(480, 360);

    const std::string amountText = common::displaySymbol(record, preferences) + record.amount.toString();

    dateEdit_ = new QLineEdit(QString::fromStdString(record.date.toString()));
    categoryEdit_ = new QLineEdit(QString::fromStdString(record.category));
    amountEdit_ = new QLineEdit(QString::fromStdString(amountText));
    noteEdit_ = new QLineEdit(QString::fromStdString(record.note));

    auto* layout = new QVBoxLayout(this);
    layout->addWidget(new QLabel("Date (YYYY-MM-DD):"));
    layout->addWidget(dateEdit_);
    layout->addWidget(new QLabel("Category:"));
    layout->addWidget(categoryEdit_);
    layout->addWidget(new QLabel("Amount (can include currency symbol):"));
    layout->addWidget(amountEdit_);
    layout->addWidget(new QLabel("Note (optional):"));
    layout->addWidget(noteEdit_);

    auto* buttons = new QHBoxLayout;
    auto* saveButton = new QPushButton("Save");
    auto* deleteButton = new QPushButton("Delete");
    auto* cancelButton = new QPushButton("Cancel");
    buttons->addStretch();
    buttons->addWidget(saveButton);
    buttons->addWidget(deleteButton);
    buttons->addWidget(cancelButton);
    buttons->addStretch();
    layout->addLayout(buttons);

    connect(saveButton, &QPushButton::clicked, this, &EditExpenseDialog::save);
    connect(deleteButton, &QPushButton::clicked, this, &EditExpenseDialog::remove);
    connect(cancelButton, &QPushButton::clicked, this, &QDialog::reject);
}

void EditExpenseDialog::save() {
    const std::string dateText = common::trim(dateEdit_->text().toStdString());
    const std::string category = common::trim(categoryEdit_->text().toStdString());
    const std::string amountText = common::trim(amountEdit_->text().toStdString());
    if (dateText.empty() || category.empty() || amountText.empty()) {
        QMessageBox::critical(this, "Missing", "Date, Category and Amount are required.");
        return;
    }

    const auto date = common::CalendarDate::parse(dateText);
    if (!date || !date->isValid()) {
        QMessageBox::critical(this, "Invalid", "Please enter the date as YYYY-MM-DD.");
        return;
    }
    const auto amount = common::parseLabelledAmount(amountText);
    if (!amount) {
        QMessageBox::critical(this, "Invalid", "Please enter a valid amount (optionally with currency symbol).");
        return;
    }

    record_.date = *date;
    record_.category = category;
    record_.amount = amount->amount;
    if (!amount->symbol.empty()) {
        record_.currencySymbol = amount->symbol;
    }
    record_.note = common::trim(noteEdit_->text().toStdString());

    action_ = Action::Save;
    accept();
}

void EditExpenseDialog::remove() {
    const auto answer = QMessageBox::question(this, "Confirm", "Delete this expense?",
                                              QMessageBox::Yes | QMessageBox::No);
    if (answer != QMessageBox::Yes) {
        return;
    }
    action_ = Action::Delete;
    accept();
}

}
