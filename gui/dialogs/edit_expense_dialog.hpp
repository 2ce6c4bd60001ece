#pragma once

#include "common/types.hpp"
#include <QDialog>
#include <QLineEdit>

namespace gui::dialogs {

class EditExpenseDialog : public QDialog {
    Q_OBJECT

public:
    enum class Action {
        None, Save, Delete
    };

private:
    common::ExpenseRecord record_;
    Action action_ = Action::None;

    QLineEdit* dateEdit_;
    QLineEdit* categoryEdit_;
    QLineEdit* amountEdit_;
    QLineEdit* noteEdit_;

public:
    EditExpenseDialog(const common::ExpenseRecord& record, const common::Preferences& preferences,
                      QWidget* parent = nullptr);

    Action getAction() const { return action_; }
    const common::ExpenseRecord& getRecord() const { return record_; }

private slots:
    void save();
    void remove();
};

}
