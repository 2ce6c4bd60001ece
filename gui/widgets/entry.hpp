#pragma once

#include "core/application.hpp"
#include <QComboBox>
#include <QDateEdit>
#include <QLineEdit>
#include <QTableWidget>
#include <QWidget>

namespace gui::widgets {

class EntryWidget : public QWidget {
    Q_OBJECT

private:
    core::Application& application_;

    QDateEdit* dateEdit_;
    QComboBox* categoryCombo_;
    QLineEdit* amountEdit_;
    QComboBox* currencyCombo_;
    QLineEdit* noteEdit_;
    QLineEdit* incomeEdit_;
    QTableWidget* expenseTable_;

public:
    explicit EntryWidget(core::Application& application, QWidget* parent = nullptr);

    common::MonthKey selectedMonth() const;

public slots:
    void refresh();

signals:
    void selectedMonthChanged();
    void errorOccurred(const QString& title, const QString& message);

private slots:
    void addExpense();
    void clearForm();
    void saveIncome();
    void editExpense(int row, int column);
    void onDateChanged();

private:
    void setupUI();
    void refreshTable(const common::Preferences& preferences);
    void refreshIncome();
};

}
