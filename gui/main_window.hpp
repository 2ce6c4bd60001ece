/*
 * Filename: main_window.hpp
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

#pragma once

#include "core/application.hpp"
#include "widgets/entry.hpp"
#include "widgets/charts.hpp"
#include "widgets/suggestions.hpp"
#include <QMainWindow>
#include <QTabWidget>
#include <QMenuBar>
#include <QStatusBar>
#include <QLabel>
#include <memory>

namespace gui {

class MainWindow : public QMainWindow {
    Q_OBJECT

private:
    std::unique_ptr<core::Application> application_;

    QTabWidget* centralTabs_;
    widgets::EntryWidget* entryWidget_;
    widgets::ChartsWidget* chartsWidget_;
    widgets::SuggestionsWidget* suggestionsWidget_;

    QLabel* statusLabel_;
    QLabel* monthLabel_;

public:
    explicit MainWindow(std::unique_ptr<core::Application> application, QWidget* parent = nullptr);
    ~MainWindow() override;

private slots:
    void onStatusUpdated(const QString& status);
    void showError(const QString& title, const QString& message);

    void refreshAll();
    void onSelectedMonthChanged();

    void openSipDialog();
    void openPreferencesDialog();
    void openAboutDialog();
    void generateReport();
    void exportData();

private:
    void setupUI();
    void setupMenuBar();
    void setupStatusBar();
    void connectSignals();
    void onReportFinished(const report::ReportOutcome& outcome);
};

}
