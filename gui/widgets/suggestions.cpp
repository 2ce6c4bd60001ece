#include "suggestions.hpp"
#include <QDesktopServices>
#include <QDir>
#include <QHBoxLayout>
#include <QPushButton>
#include <QUrl>
#include <QVBoxLayout>

namespace gui::widgets {

SuggestionsWidget::SuggestionsWidget(core::Application& application, QWidget* parent)
    : QWidget(parent), application_(application), month_(common::MonthKey::current()) {
    auto* layout = new QVBoxLayout(this);

    titleLabel_ = new QLabel;
    QFont titleFont = titleLabel_->font();
    titleFont.setBold(true);
    titleFont.setPointSize(titleFont.pointSize() + 3);
    titleLabel_->setFont(titleFont);
    layout->addWidget(titleLabel_);

    summaryBox_ = new QTextEdit;
    summaryBox_->setReadOnly(true);
    layout->addWidget(summaryBox_, 1);

    auto* buttons = new QHBoxLayout;
    auto* sipButton = new QPushButton("Start SIP");
    auto* preferencesButton = new QPushButton("Preferences");
    auto* reportButton = new QPushButton("Generate Report");
    auto* folderButton = new QPushButton("Open Data Folder");
    buttons->addWidget(sipButton);
    buttons->addWidget(preferencesButton);
    buttons->addWidget(reportButton);
    buttons->addWidget(folderButton);
    buttons->addStretch();
    layout->addLayout(buttons);

    connect(sipButton, &QPushButton::clicked, this, &SuggestionsWidget::sipRequested);
    connect(preferencesButton, &QPushButton::clicked, this, &SuggestionsWidget::preferencesRequested);
    connect(reportButton, &QPushButton::clicked, this, &SuggestionsWidget::reportRequested);
    connect(folderButton, &QPushButton::clicked, this, &SuggestionsWidget::openDataFolder);

    refresh();
}

void SuggestionsWidget::setMonth(const common::MonthKey& month) {
    month_ = month;
    refresh();
}

void SuggestionsWidget::refresh() {
    titleLabel_->setText(QString("Smart Suggestions — %1").arg(QString::fromStdString(month_.toString())));

    auto text = application_.summaryText(month_);
    if (!common::isSuccess(text)) {
        summaryBox_->setPlainText(QString::fromStdString(common::describe(common::getError(text))));
        return;
    }

    QString summary = QString::fromStdString(common::getValue(text));
    summary += "\nQuick actions:\n"
               "  • Click 'Start SIP' for the investment calculator\n"
               "  • Click 'Generate Report' for a monthly PDF report\n";
    summaryBox_->setPlainText(summary);
}

void SuggestionsWidget::openDataFolder() {
    const QString folder = QDir(QString::fromStdString(application_.getConfig().dataDirectory)).absolutePath();
    if (!QDesktopServices::openUrl(QUrl::fromLocalFile(folder))) {
        emit errorOccurred("Open Data Folder", QString("Cannot open %1").arg(folder));
    }
}

}
