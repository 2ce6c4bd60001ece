#include "sip_dialog.hpp"
#include "math/sip/calculator.hpp"
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QPushButton>
#include <QVBoxLayout>
#include <optional>

namespace gui::dialogs {

namespace {

std::optional<double> parseDouble(const QLineEdit* edit) {
    bool ok = false;
    const double value = edit->text().trimmed().toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

}

SipDialog::SipDialog(const std::string& currencySymbol, QWidget* parent)
    : QDialog(parent), currencySymbol_(currencySymbol) {
    setWindowTitle("Start SIP — Savings Calculator");
    resize(440, 420);

    auto* layout = new QVBoxLayout(this);

    auto* title = new QLabel("Systematic Investment Plan (SIP)");
    QFont titleFont = title->font();
    titleFont.setBold(true);
    titleFont.setPointSize(titleFont.pointSize() + 2);
    title->setFont(titleFont);
    layout->addWidget(title);

    const QString symbol = QString::fromStdString(currencySymbol_);
    monthlyEdit_ = new QLineEdit;
    rateEdit_ = new QLineEdit("12");
    yearsEdit_ = new QLineEdit("10");
    goalEdit_ = new QLineEdit;

    auto* form = new QFormLayout;
    form->addRow(QString("Monthly investment (%1):").arg(symbol), monthlyEdit_);
    form->addRow("Expected annual return (%):", rateEdit_);
    form->addRow("Investment period (years):", yearsEdit_);
    form->addRow(QString("Lump-sum goal (optional, %1):").arg(symbol), goalEdit_);
    layout->addLayout(form);

    auto* buttons = new QHBoxLayout;
    auto* calculateButton = new QPushButton("Calculate");
    auto* closeButton = new QPushButton("Close");
    buttons->addStretch();
    buttons->addWidget(calculateButton);
    buttons->addWidget(closeButton);
    layout->addLayout(buttons);

    resultBox_ = new QTextEdit;
    resultBox_->setReadOnly(true);
    layout->addWidget(resultBox_);

    connect(calculateButton, &QPushButton::clicked, this, &SipDialog::calculate);
    connect(closeButton, &QPushButton::clicked, this, &QDialog::accept);
}

void SipDialog::calculate() {
    const auto monthly = common::Money::parse(monthlyEdit_->text().trimmed().toStdString());
    const auto rate = parseDouble(rateEdit_);
    const auto years = parseDouble(yearsEdit_);
    if (!monthly || !rate || !years) {
        QMessageBox::critical(this, "Invalid input", "Please enter valid numeric values.");
        return;
    }

    auto months = math::sip::monthsForYears(*years);
    if (!common::isSuccess(months)) {
        QMessageBox::critical(this, "Invalid input", QString::fromStdString(common::getError(months).message));
        return;
    }

    math::sip::SipParameters parameters;
    parameters.annualRatePercent = *rate;
    parameters.months = common::getValue(months);

    auto projection = math::sip::futureValue(*monthly, parameters);
    if (!common::isSuccess(projection)) {
        QMessageBox::critical(this, "Invalid input", QString::fromStdString(common::getError(projection).message));
        return;
    }

    std::optional<math::sip::SipRequirement> goal;
    const QString goalText = goalEdit_->text().trimmed();
    if (!goalText.isEmpty()) {
        const auto target = common::Money::parse(goalText.toStdString());
        if (!target) {
            QMessageBox::critical(this, "Invalid input", "Please enter a valid goal amount.");
            return;
        }
        auto requirement = math::sip::requiredInvestment(*target, parameters);
        if (!common::isSuccess(requirement)) {
            QMessageBox::critical(this, "Invalid input",
                                  QString::fromStdString(common::getError(requirement).message));
            return;
        }
        goal = common::getValue(requirement);
    }

    resultBox_->setPlainText(QString::fromStdString(
        math::sip::describe(common::getValue(projection), goal, currencySymbol_)));
}

}
