#include "entry.hpp"
#include "gui/dialogs/edit_expense_dialog.hpp"
#include <QDate>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>
#include <optional>

namespace gui::widgets {

namespace {

constexpr int kIdRole = Qt::UserRole + 1;

QString toQString(const std::string& text) {
    return QString::fromStdString(text);
}

}

EntryWidget::EntryWidget(core::Application& application, QWidget* parent)
    : QWidget(parent), application_(application) {
    setupUI();
    refresh();
}

void EntryWidget::setupUI() {
    auto* layout = new QVBoxLayout(this);

    auto* header = new QLabel("Expense Entry & List");
    QFont headerFont = header->font();
    headerFont.setBold(true);
    headerFont.setPointSize(headerFont.pointSize() + 3);
    header->setFont(headerFont);
    layout->addWidget(header);
    layout->addWidget(new QLabel("Add daily expenses and track income for each month."));

    auto* formGroup = new QGroupBox("New expense");
    auto* form = new QFormLayout(formGroup);

    dateEdit_ = new QDateEdit(QDate::currentDate());
    dateEdit_->setCalendarPopup(true);
    dateEdit_->setDisplayFormat("yyyy-MM-dd");
    form->addRow("Date:", dateEdit_);

    categoryCombo_ = new QComboBox;
    categoryCombo_->setEditable(true);
    for (const auto& category : common::kSuggestedCategories) {
        categoryCombo_->addItem(toQString(category));
    }
    categoryCombo_->setCurrentText("");
    form->addRow("Category:", categoryCombo_);

    auto* amountRow = new QHBoxLayout;
    currencyCombo_ = new QComboBox;
    for (const auto& symbol : common::kCurrencyOptions) {
        currencyCombo_->addItem(toQString(symbol));
    }
    amountEdit_ = new QLineEdit;
    amountEdit_->setPlaceholderText("0.00");
    amountRow->addWidget(currencyCombo_);
    amountRow->addWidget(amountEdit_, 1);
    form->addRow("Amount:", amountRow);

    noteEdit_ = new QLineEdit;
    form->addRow("Note (optional):", noteEdit_);

    auto* buttons = new QHBoxLayout;
    auto* addButton = new QPushButton("Add Expense");
    auto* clearButton = new QPushButton("Clear");
    buttons->addWidget(addButton);
    buttons->addWidget(clearButton);
    buttons->addStretch();
    form->addRow(buttons);
    layout->addWidget(formGroup);

    auto* incomeRow = new QHBoxLayout;
    incomeRow->addWidget(new QLabel("Monthly income (for selected month):"));
    incomeEdit_ = new QLineEdit;
    incomeRow->addWidget(incomeEdit_);
    auto* incomeButton = new QPushButton("Save Income");
    incomeRow->addWidget(incomeButton);
    layout->addLayout(incomeRow);

    expenseTable_ = new QTableWidget(0, 4);
    expenseTable_->setHorizontalHeaderLabels({"Date", "Category", "Amount", "Note"});
    expenseTable_->horizontalHeader()->setStretchLastSection(true);
    expenseTable_->setSelectionBehavior(QAbstractItemView::SelectRows);
    expenseTable_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    expenseTable_->verticalHeader()->setVisible(false);
    layout->addWidget(expenseTable_, 1);

    connect(addButton, &QPushButton::clicked, this, &EntryWidget::addExpense);
    connect(clearButton, &QPushButton::clicked, this, &EntryWidget::clearForm);
    connect(incomeButton, &QPushButton::clicked, this, &EntryWidget::saveIncome);
    connect(expenseTable_, &QTableWidget::cellDoubleClicked, this, &EntryWidget::editExpense);
    connect(dateEdit_, &QDateEdit::dateChanged, this, &EntryWidget::onDateChanged);
}

common::MonthKey EntryWidget::selectedMonth() const {
    const QDate date = dateEdit_->date();
    return common::MonthKey(date.year(), date.month());
}

void EntryWidget::refresh() {
    auto preferences = application_.getPreferences();
    if (!common::isSuccess(preferences)) {
        emit errorOccurred("Preferences", toQString(common::getError(preferences).message));
        return;
    }

    const int index = currencyCombo_->findText(toQString(common::getValue(preferences).currencySymbol));
    if (index >= 0) {
        currencyCombo_->setCurrentIndex(index);
    }
    refreshTable(common::getValue(preferences));
    refreshIncome();
}

void EntryWidget::refreshTable(const common::Preferences& preferences) {
    const auto expenses = application_.getRecords().listExpenses();
    expenseTable_->setRowCount(static_cast<int>(expenses.size()));

    for (std::size_t id = 0; id < expenses.size(); ++id) {
        const auto& record = expenses[id];
        const int row = static_cast<int>(id);

        auto* dateItem = new QTableWidgetItem(toQString(record.date.toString()));
        dateItem->setData(kIdRole, static_cast<qulonglong>(id));
        expenseTable_->setItem(row, 0, dateItem);
        expenseTable_->setItem(row, 1, new QTableWidgetItem(toQString(record.category)));
        auto* amountItem = new QTableWidgetItem(
            toQString(record.amount.format(common::displaySymbol(record, preferences))));
        amountItem->setTextAlignment(Qt::AlignRight | Qt::AlignVCenter);
        expenseTable_->setItem(row, 2, amountItem);
        expenseTable_->setItem(row, 3, new QTableWidgetItem(toQString(record.note)));
    }

    expenseTable_->resizeColumnsToContents();
}

void EntryWidget::refreshIncome() {
    const auto income = application_.getRecords().incomeFor(selectedMonth());
    incomeEdit_->setText(income.isZero() ? QString() : toQString(income.toString()));
}

void EntryWidget::addExpense() {
    const std::string category = categoryCombo_->currentText().trimmed().toStdString();
    const QString amountText = amountEdit_->text().trimmed();
    if (category.empty() || amountText.isEmpty()) {
        emit errorOccurred("Missing", "Category and amount are required.");
        return;
    }

    const auto amount = common::parseLabelledAmount(amountText.toStdString());
    if (!amount) {
        emit errorOccurred("Invalid", "Please enter a valid amount.");
        return;
    }

    const QDate date = dateEdit_->date();
    common::ExpenseRecord record;
    record.date = common::CalendarDate(date.year(), date.month(), date.day());
    record.category = category;
    record.amount = amount->amount;
    record.currencySymbol = amount->symbol.empty() ? currencyCombo_->currentText().toStdString() : amount->symbol;
    record.note = noteEdit_->text().trimmed().toStdString();

    auto id = application_.addExpense(record);
    if (!common::isSuccess(id)) {
        emit errorOccurred("Could not add expense", toQString(common::getError(id).message));
        return;
    }
    clearForm();
}

void EntryWidget::clearForm() {
    categoryCombo_->setCurrentText("");
    amountEdit_->clear();
    noteEdit_->clear();
}

void EntryWidget::saveIncome() {
    const QString text = incomeEdit_->text().trimmed();
    const auto amount = text.isEmpty() ? std::optional<common::LabelledAmount>(common::LabelledAmount{})
                                       : common::parseLabelledAmount(text.toStdString());
    if (!amount) {
        emit errorOccurred("Invalid", "Please enter a valid income amount.");
        return;
    }

    auto status = application_.setIncome(selectedMonth(), amount->amount);
    if (!common::isSuccess(status)) {
        emit errorOccurred("Could not save income", toQString(common::getError(status).message));
    }
}

void EntryWidget::editExpense(int row, int) {
    auto* item = expenseTable_->item(row, 0);
    if (!item) {
        return;
    }
    const auto id = static_cast<storage::RecordId>(item->data(kIdRole).toULongLong());

    auto record = application_.getRecords().getExpense(id);
    auto preferences = application_.getPreferences();
    if (!common::isSuccess(record) || !common::isSuccess(preferences)) {
        emit errorOccurred("Edit Expense", "Selected expense no longer exists.");
        return;
    }

    dialogs::EditExpenseDialog dialog(common::getValue(record), common::getValue(preferences), this);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }

    common::Status status = common::ok();
    if (dialog.getAction() == dialogs::EditExpenseDialog::Action::Delete) {
        status = application_.deleteExpense(id);
    } else if (dialog.getAction() == dialogs::EditExpenseDialog::Action::Save) {
        status = application_.updateExpense(id, dialog.getRecord());
    }
    if (!common::isSuccess(status)) {
        emit errorOccurred("Edit Expense", toQString(common::getError(status).message));
    }
}

void EntryWidget::onDateChanged() {
    refreshIncome();
    emit selectedMonthChanged();
}

}
