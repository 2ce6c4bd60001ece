#pragma once

#include "core/application.hpp"
#include <QLabel>
#include <QTextEdit>
#include <QWidget>

namespace gui::widgets {

class SuggestionsWidget : public QWidget {
    Q_OBJECT

private:
    core::Application& application_;
    common::MonthKey month_;

    QLabel* titleLabel_;
    QTextEdit* summaryBox_;

public:
    explicit SuggestionsWidget(core::Application& application, QWidget* parent = nullptr);

public slots:
    void setMonth(const common::MonthKey& month);
    void refresh();

signals:
    void sipRequested();
    void preferencesRequested();
    void reportRequested();
    void errorOccurred(const QString& title, const QString& message);

private slots:
    void openDataFolder();
};

}
