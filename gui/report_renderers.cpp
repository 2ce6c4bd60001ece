#include "report_renderers.hpp"
#include <QFont>
#include <QImage>
#include <QPageLayout>
#include <QPageSize>
#include <QPdfWriter>
#include <algorithm>
#include <cstdint>
#include <memory>

namespace gui {

namespace {

constexpr int kChartWidth = 900;
constexpr int kChartHeight = 600;

QString toQString(const std::string& text) {
    return QString::fromStdString(text);
}

QImage renderChartImage(const report::ReportPayload& payload) {
    QImage image(kChartWidth, kChartHeight, QImage::Format_ARGB32);
    image.fill(Qt::white);

    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing);
    paintSharePie(painter, QRectF(0, 0, kChartWidth, kChartHeight), payload.chartSlices,
                  QString("Category share — %1").arg(toQString(payload.month.toString())));
    painter.end();
    return image;
}

}

QColor sliceColor(int index) {
    static const QColor palette[] = {
        QColor("#0984e3"), QColor("#00b894"), QColor("#fdcb6e"), QColor("#e17055"),
        QColor("#6c5ce7"), QColor("#fd79a8"), QColor("#b2bec3")
    };
    return palette[index % 7];
}

void paintSharePie(QPainter& painter, const QRectF& area,
                   const std::vector<analytics::CategoryAmount>& slices, const QString& title) {
    painter.save();

    QFont titleFont = painter.font();
    titleFont.setBold(true);
    titleFont.setPointSizeF(titleFont.pointSizeF() * 1.4);
    painter.setFont(titleFont);
    const QRectF titleRect(area.left(), area.top(), area.width(), area.height() * 0.1);
    painter.drawText(titleRect, Qt::AlignCenter, title);

    std::int64_t total = 0;
    for (const auto& slice : slices) {
        if (slice.amount.getCents() > 0) {
            total += slice.amount.getCents();
        }
    }

    const qreal side = std::min(area.width() * 0.55, area.height() * 0.8);
    const QRectF pieRect(area.left() + area.width() * 0.05,
                         titleRect.bottom() + (area.height() * 0.9 - side) / 2.0, side, side);

    QFont labelFont = painter.font();
    labelFont.setBold(false);
    labelFont.setPointSizeF(titleFont.pointSizeF() / 1.4);
    painter.setFont(labelFont);

    if (total == 0) {
        painter.setBrush(QColor("#dfe6e9"));
        painter.setPen(Qt::white);
        painter.drawEllipse(pieRect);
        painter.setPen(Qt::black);
        painter.drawText(pieRect, Qt::AlignCenter, "No data");
        painter.restore();
        return;
    }

    int startAngle = 140 * 16;
    int remaining = 360 * 16;
    const qreal legendX = pieRect.right() + area.width() * 0.05;
    qreal legendY = pieRect.top();
    const qreal rowHeight = painter.fontMetrics().height() * 1.6;

    for (std::size_t i = 0; i < slices.size(); ++i) {
        const auto& slice = slices[i];
        if (slice.amount.getCents() <= 0) {
            continue;
        }
        const double fraction = static_cast<double>(slice.amount.getCents()) / static_cast<double>(total);
        const bool last = i + 1 == slices.size();
        const int span = last ? remaining : static_cast<int>(fraction * 360 * 16 + 0.5);
        remaining -= span;

        painter.setPen(Qt::white);
        painter.setBrush(sliceColor(static_cast<int>(i)));
        painter.drawPie(pieRect, startAngle, span);
        startAngle += span;

        painter.setPen(Qt::NoPen);
        painter.drawRect(QRectF(legendX, legendY + rowHeight * 0.2, rowHeight * 0.6, rowHeight * 0.6));
        painter.setPen(Qt::black);
        painter.drawText(QPointF(legendX + rowHeight, legendY + rowHeight * 0.7),
                         QString("%1 (%2%)").arg(toQString(slice.category)).arg(fraction * 100.0, 0, 'f', 1));
        legendY += rowHeight;
    }

    painter.restore();
}

common::Status PngChartRenderer::render(const report::ReportPayload& payload, const report::RenderTargets& targets) {
    if (targets.empty()) {
        return common::fail(common::ErrorKind::Validation, "png renderer needs an output path");
    }

    const QImage image = renderChartImage(payload);
    if (!image.save(QString::fromStdString(targets.front().string()), "PNG")) {
        return common::fail(common::ErrorKind::Storage, "cannot write " + targets.front().string());
    }
    return common::ok();
}

common::Status PdfReportRenderer::render(const report::ReportPayload& payload, const report::RenderTargets& targets) {
    if (targets.empty()) {
        return common::fail(common::ErrorKind::Validation, "pdf renderer needs an output path");
    }

    QPdfWriter writer(QString::fromStdString(targets.front().string()));
    writer.setPageSize(QPageSize(QPageSize::A4));
    writer.setPageMargins(QMarginsF(0, 0, 0, 0), QPageLayout::Point);
    writer.setResolution(72);
    writer.setTitle(toQString(payload.title));

    QPainter painter;
    if (!painter.begin(&writer)) {
        return common::fail(common::ErrorKind::Storage, "cannot write " + targets.front().string());
    }
    painter.setRenderHint(QPainter::Antialiasing);

    const qreal width = writer.width();
    const qreal left = 40;
    qreal y = 60;

    QFont font("Helvetica");
    font.setPixelSize(14);
    font.setBold(true);
    painter.setFont(font);
    painter.drawText(QPointF(left, y), toQString(payload.title));

    font.setPixelSize(10);
    font.setBold(false);
    painter.setFont(font);
    y += 30;
    painter.drawText(QPointF(left, y), QString("Income: %1").arg(toQString(payload.incomeText)));
    painter.drawText(QPointF(left + 160, y), QString("Expenditure: %1").arg(toQString(payload.expenseText)));
    painter.drawText(QPointF(left + 340, y), QString("Balance: %1").arg(toQString(payload.balanceText)));

    y += 20;
    const QImage chart = renderChartImage(payload);
    const QRectF chartRect(left, y, width - 2 * left, (width - 2 * left) * kChartHeight / kChartWidth);
    painter.drawImage(chartRect, chart);
    y = chartRect.bottom() + 20;

    painter.drawText(QPointF(left, y), "Top expenses:");
    for (const auto& line : payload.categories) {
        y += 20;
        painter.drawText(QPointF(left + 10, y), QString("%1. %2: %3 (%4%)")
                                                    .arg(line.rank)
                                                    .arg(toQString(line.category))
                                                    .arg(toQString(line.amountText))
                                                    .arg(line.sharePercent));
    }
    if (payload.noData) {
        y += 20;
        painter.drawText(QPointF(left + 10, y), "No expenses recorded for this month.");
    }

    if (!payload.tips.empty()) {
        y += 30;
        painter.drawText(QPointF(left, y), "Suggestions:");
        for (const auto& tip : payload.tips) {
            y += 16;
            const QRectF textRect(left + 10, y, width - 2 * left - 10, 40);
            QRectF used;
            painter.drawText(textRect, Qt::TextWordWrap, toQString(tip.text), &used);
            y += used.height();
        }
    }

    if (!painter.end()) {
        return common::fail(common::ErrorKind::Storage, "cannot finish " + targets.front().string());
    }
    return common::ok();
}

void registerQtRenderers(report::RendererRegistry& registry) {
    registry.registerRenderer(std::make_unique<report::FunctionRendererFactory>(
        "png", []() { return std::make_unique<PngChartRenderer>(); }));
    registry.registerRenderer(std::make_unique<report::FunctionRendererFactory>(
        "pdf", []() { return std::make_unique<PdfReportRenderer>(); }));
}

}
