#pragma once

#include "core/application.hpp"
#include <QWidget>

class QChartView;

namespace gui::widgets {

class ChartsWidget : public QWidget {
    Q_OBJECT

private:
    core::Application& application_;

    QChartView* incomeChartView_;
    QChartView* categoryChartView_;
    QChartView* shareChartView_;

public:
    explicit ChartsWidget(core::Application& application, QWidget* parent = nullptr);

public slots:
    void refresh();

private:
    void updateIncomeChart(const std::vector<analytics::MonthlyAggregate>& months);
    void updateCategoryChart(const std::map<std::string, common::Money>& totals);
    void updateShareChart(const std::map<std::string, common::Money>& totals);
};

}
