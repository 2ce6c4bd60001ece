/*
 * Filename: main_window.cpp
 * Developer: Benjamin Cance
 * Date: 10/19/2026
 * 
 * Copyright 2026 Open Quant Desk, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "main_window.hpp"
#include "dialogs/preferences_dialog.hpp"
#include "dialogs/sip_dialog.hpp"
#include "report_renderers.hpp"
#include "core/cli.hpp"
#include "report/csv_renderer.hpp"
#include "storage/atomic_file.hpp"
#include <QFileDialog>
#include <QMessageBox>
#include <QMetaObject>
#include <utility>

namespace gui {

MainWindow::MainWindow(std::unique_ptr<core::Application> application, QWidget* parent)
    : QMainWindow(parent), application_(std::move(application)) {
    setWindowTitle("ExpenseDesk — Personal Expense Tracker");
    resize(1100, 760);

    registerQtRenderers(application_->getRenderers());

    setupUI();
    setupMenuBar();
    setupStatusBar();
    connectSignals();
}

MainWindow::~MainWindow() {
    application_->shutdown();
}

void MainWindow::setupUI() {
    centralTabs_ = new QTabWidget(this);

    entryWidget_ = new widgets::EntryWidget(*application_);
    chartsWidget_ = new widgets::ChartsWidget(*application_);
    suggestionsWidget_ = new widgets::SuggestionsWidget(*application_);
    suggestionsWidget_->setMonth(entryWidget_->selectedMonth());

    centralTabs_->addTab(entryWidget_, "Entry");
    centralTabs_->addTab(chartsWidget_, "Charts");
    centralTabs_->addTab(suggestionsWidget_, "Suggestions");

    setCentralWidget(centralTabs_);
}

void MainWindow::setupMenuBar() {
    QMenu* fileMenu = menuBar()->addMenu("&File");
    fileMenu->addAction("&Generate Report...", this, &MainWindow::generateReport);
    fileMenu->addAction("&Export Expenses to CSV...", this, &MainWindow::exportData);
    fileMenu->addSeparator();
    fileMenu->addAction("E&xit", this, &QWidget::close);

    QMenu* toolsMenu = menuBar()->addMenu("&Tools");
    toolsMenu->addAction("Start &SIP...", this, &MainWindow::openSipDialog);
    toolsMenu->addAction("&Preferences...", this, &MainWindow::openPreferencesDialog);

    QMenu* helpMenu = menuBar()->addMenu("&Help");
    helpMenu->addAction("&About", this, &MainWindow::openAboutDialog);
}

void MainWindow::setupStatusBar() {
    statusLabel_ = new QLabel("Ready");
    monthLabel_ = new QLabel;
    statusBar()->addWidget(statusLabel_, 1);
    statusBar()->addPermanentWidget(monthLabel_);
    monthLabel_->setText(QString::fromStdString(entryWidget_->selectedMonth().toString()));
}

void MainWindow::connectSignals() {
    application_->addStatusCallback([this](const std::string& status) {
        const QString text = QString::fromStdString(status);
        QMetaObject::invokeMethod(this, [this, text]() { onStatusUpdated(text); }, Qt::QueuedConnection);
    });
    application_->addDataChangedCallback([this]() {
        QMetaObject::invokeMethod(this, [this]() { refreshAll(); }, Qt::QueuedConnection);
    });

    connect(entryWidget_, &widgets::EntryWidget::selectedMonthChanged, this, &MainWindow::onSelectedMonthChanged);
    connect(entryWidget_, &widgets::EntryWidget::errorOccurred, this, &MainWindow::showError);
    connect(suggestionsWidget_, &widgets::SuggestionsWidget::errorOccurred, this, &MainWindow::showError);
    connect(suggestionsWidget_, &widgets::SuggestionsWidget::sipRequested, this, &MainWindow::openSipDialog);
    connect(suggestionsWidget_, &widgets::SuggestionsWidget::preferencesRequested,
            this, &MainWindow::openPreferencesDialog);
    connect(suggestionsWidget_, &widgets::SuggestionsWidget::reportRequested, this, &MainWindow::generateReport);
}

void MainWindow::onStatusUpdated(const QString& status) {
    statusLabel_->setText(status);
}

void MainWindow::showError(const QString& title, const QString& message) {
    QMessageBox::critical(this, title, message);
}

void MainWindow::refreshAll() {
    entryWidget_->refresh();
    chartsWidget_->refresh();
    suggestionsWidget_->refresh();
}

void MainWindow::onSelectedMonthChanged() {
    const auto month = entryWidget_->selectedMonth();
    monthLabel_->setText(QString::fromStdString(month.toString()));
    suggestionsWidget_->setMonth(month);
}

void MainWindow::openSipDialog() {
    auto preferences = application_->getPreferences();
    const std::string symbol = common::isSuccess(preferences) ? common::getValue(preferences).currencySymbol
                                                             : common::kDefaultCurrencySymbol;
    dialogs::SipDialog dialog(symbol, this);
    dialog.exec();
}

void MainWindow::openPreferencesDialog() {
    auto preferences = application_->getPreferences();
    if (!common::isSuccess(preferences)) {
        showError("Preferences", QString::fromStdString(common::getError(preferences).message));
        return;
    }

    dialogs::PreferencesDialog dialog(common::getValue(preferences), this);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }

    auto status = application_->setPreferences(dialog.getPreferences());
    if (!common::isSuccess(status)) {
        showError("Preferences", QString::fromStdString(common::getError(status).message));
        return;
    }
    QMessageBox::information(this, "Saved", "Preferences saved.");
}

void MainWindow::openAboutDialog() {
    QMessageBox::about(this, "About ExpenseDesk",
                       QString("ExpenseDesk v%1\n\n"
                               "Personal expense tracker with monthly summaries,\n"
                               "suggestions, a SIP calculator and PDF reports.")
                           .arg(QString::fromStdString(core::kVersion)));
}

void MainWindow::generateReport() {
    if (application_->isReportRunning()) {
        showError("Report", "A report is already being generated.");
        return;
    }

    const auto month = entryWidget_->selectedMonth();
    if (application_->aggregateMonth(month).expenseCount == 0) {
        QMessageBox::information(this, "No Data",
                                 QString("No expenses found for %1").arg(QString::fromStdString(month.toString())));
        return;
    }

    QString path = QFileDialog::getSaveFileName(this, "Save PDF report",
                                                QString("expense_report_%1.pdf").arg(QString::fromStdString(month.toString())),
                                                "PDF files (*.pdf)");
    if (path.isEmpty()) {
        return;
    }
    if (!path.endsWith(".pdf", Qt::CaseInsensitive)) {
        path += ".pdf";
    }

    auto status = application_->startReport(month, path.toStdString(), [this](const report::ReportOutcome& outcome) {
        QMetaObject::invokeMethod(this, [this, outcome]() { onReportFinished(outcome); }, Qt::QueuedConnection);
    });
    if (!common::isSuccess(status)) {
        showError("Report", QString::fromStdString(common::getError(status).message));
    }
}

void MainWindow::onReportFinished(const report::ReportOutcome& outcome) {
    switch (outcome.state) {
        case report::JobState::Completed: {
            QString files;
            for (const auto& path : outcome.published) {
                files += "\n" + QString::fromStdString(path.string());
            }
            statusLabel_->setText("Report saved");
            QMessageBox::information(this, "Saved", QString("Report saved:%1").arg(files));
            break;
        }
        case report::JobState::Cancelled:
            statusLabel_->setText("Report cancelled");
            break;
        default:
            statusLabel_->setText("Report failed");
            showError("Report", QString("Failed to create report: %1").arg(QString::fromStdString(outcome.error)));
            break;
    }
}

void MainWindow::exportData() {
    const QString path = QFileDialog::getSaveFileName(this, "Export expenses", "expenses_export.csv",
                                                      "CSV files (*.csv)");
    if (path.isEmpty()) {
        return;
    }

    auto preferences = application_->getPreferences();
    if (!common::isSuccess(preferences)) {
        showError("Export", QString::fromStdString(common::getError(preferences).message));
        return;
    }

    report::ReportPayload payload;
    payload.currencySymbol = common::getValue(preferences).currencySymbol;
    payload.rows = application_->getRecords().listExpenses();

    auto status = storage::writeFileAtomically(path.toStdString(), report::formatReportTable(payload));
    if (!common::isSuccess(status)) {
        showError("Export", QString::fromStdString(common::getError(status).message));
        return;
    }
    statusLabel_->setText(QString("Exported %1 expenses").arg(payload.rows.size()));
}

}
