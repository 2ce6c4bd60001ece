#pragma once

#include <QDialog>
#include <QLineEdit>
#include <QTextEdit>
#include <string>

namespace gui::dialogs {

class SipDialog : public QDialog {
    Q_OBJECT

private:
    std::string currencySymbol_;

    QLineEdit* monthlyEdit_;
    QLineEdit* rateEdit_;
    QLineEdit* yearsEdit_;
    QLineEdit* goalEdit_;
    QTextEdit* resultBox_;

public:
    explicit SipDialog(const std::string& currencySymbol, QWidget* parent = nullptr);

private slots:
    void calculate();
};

}
