#include "charts.hpp"
#include "gui/report_renderers.hpp"
#include <QBarCategoryAxis>
#include <QBarSeries>
#include <QBarSet>
#include <QChart>
#include <QChartView>
#include <QGridLayout>
#include <QPieSeries>
#include <QPieSlice>
#include <QValueAxis>
#include <algorithm>

namespace gui::widgets {

namespace {

constexpr std::size_t kTopCategories = 10;

QChartView* makeChartView() {
    auto* view = new QChartView;
    view->setRenderHint(QPainter::Antialiasing);
    return view;
}

}

ChartsWidget::ChartsWidget(core::Application& application, QWidget* parent)
    : QWidget(parent), application_(application) {
    auto* layout = new QGridLayout(this);

    incomeChartView_ = makeChartView();
    shareChartView_ = makeChartView();
    categoryChartView_ = makeChartView();

    layout->addWidget(incomeChartView_, 0, 0);
    layout->addWidget(shareChartView_, 0, 1);
    layout->addWidget(categoryChartView_, 1, 0, 1, 2);

    refresh();
}

void ChartsWidget::refresh() {
    const auto snapshot = application_.getRecords().snapshot();
    auto months = analytics::aggregateAll(snapshot.expenses, snapshot.income);
    if (months.empty()) {
        analytics::MonthlyAggregate current;
        current.month = common::MonthKey::current();
        months.push_back(current);
    }
    const auto totals = analytics::categoryTotals(snapshot.expenses);

    updateIncomeChart(months);
    updateCategoryChart(totals);
    updateShareChart(totals);
}

void ChartsWidget::updateIncomeChart(const std::vector<analytics::MonthlyAggregate>& months) {
    auto* incomeSet = new QBarSet("Income");
    auto* expenseSet = new QBarSet("Expenditure");
    QStringList labels;
    double maximum = 0.0;

    for (const auto& month : months) {
        labels << QString::fromStdString(month.month.toString());
        *incomeSet << month.totalIncome.toDouble();
        *expenseSet << month.totalExpense.toDouble();
        maximum = std::max({maximum, month.totalIncome.toDouble(), month.totalExpense.toDouble()});
    }

    auto* series = new QBarSeries;
    series->append(incomeSet);
    series->append(expenseSet);

    auto* chart = new QChart;
    chart->addSeries(series);
    chart->setTitle("Monthly Income vs Expenditure");

    auto* axisX = new QBarCategoryAxis;
    axisX->append(labels);
    axisX->setLabelsAngle(-45);
    chart->addAxis(axisX, Qt::AlignBottom);
    series->attachAxis(axisX);

    auto* axisY = new QValueAxis;
    axisY->setRange(0.0, maximum > 0.0 ? maximum * 1.1 : 1.0);
    chart->addAxis(axisY, Qt::AlignLeft);
    series->attachAxis(axisY);

    incomeChartView_->setChart(chart);
}

void ChartsWidget::updateCategoryChart(const std::map<std::string, common::Money>& totals) {
    auto* set = new QBarSet("Spent");
    set->setColor(QColor("#74b9ff"));
    QStringList labels;
    double maximum = 0.0;

    for (const auto& entry : analytics::rankCategories(totals, kTopCategories)) {
        labels << QString::fromStdString(entry.category);
        *set << entry.amount.toDouble();
        maximum = std::max(maximum, entry.amount.toDouble());
    }
    if (labels.isEmpty()) {
        labels << "No data";
        *set << 0.0;
    }

    auto* series = new QBarSeries;
    series->append(set);

    auto* chart = new QChart;
    chart->addSeries(series);
    chart->setTitle("Top Categories (All time)");
    chart->legend()->hide();

    auto* axisX = new QBarCategoryAxis;
    axisX->append(labels);
    axisX->setLabelsAngle(-45);
    chart->addAxis(axisX, Qt::AlignBottom);
    series->attachAxis(axisX);

    auto* axisY = new QValueAxis;
    axisY->setRange(0.0, maximum > 0.0 ? maximum * 1.1 : 1.0);
    chart->addAxis(axisY, Qt::AlignLeft);
    series->attachAxis(axisY);

    categoryChartView_->setChart(chart);
}

void ChartsWidget::updateShareChart(const std::map<std::string, common::Money>& totals) {
    auto* series = new QPieSeries;
    series->setPieStartAngle(140);
    series->setPieEndAngle(140 + 360);

    int index = 0;
    for (const auto& slice : analytics::shareSlices(totals)) {
        if (slice.amount.getCents() <= 0) {
            continue;
        }
        QPieSlice* pieSlice = series->append(QString::fromStdString(slice.category), slice.amount.toDouble());
        pieSlice->setColor(sliceColor(index++));
    }
    if (series->count() == 0) {
        series->append("No data", 1.0);
    }
    for (QPieSlice* slice : series->slices()) {
        slice->setLabel(QString("%1 %2%").arg(slice->label()).arg(slice->percentage() * 100.0, 0, 'f', 1));
        slice->setLabelVisible(true);
    }

    auto* chart = new QChart;
    chart->addSeries(series);
    chart->setTitle("Category Share (Top)");
    chart->legend()->hide();

    shareChartView_->setChart(chart);
}

}
