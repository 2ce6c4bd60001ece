#pragma once

#include "common/types.hpp"
#include <QComboBox>
#include <QDialog>
#include <QLineEdit>

namespace gui::dialogs {

class PreferencesDialog : public QDialog {
    Q_OBJECT

private:
    common::Preferences preferences_;

    QComboBox* currencyCombo_;
    QLineEdit* budgetEdit_;

public:
    explicit PreferencesDialog(const common::Preferences& current, QWidget* parent = nullptr);

    const common::Preferences& getPreferences() const { return preferences_; }

private slots:
    void save();
};

}
