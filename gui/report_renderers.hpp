#pragma once

#include "interfaces/renderer.hpp"
#include "report/registry.hpp"
#include <QColor>
#include <QPainter>
#include <QRectF>
#include <QString>
#include <vector>

namespace gui {

// Pie of the category slices with percentage labels. An empty or all-zero
// slice list draws a single "No data" disc.
void paintSharePie(QPainter& painter, const QRectF& area,
                   const std::vector<analytics::CategoryAmount>& slices, const QString& title);

QColor sliceColor(int index);

class PngChartRenderer : public report::IReportRenderer {
public:
    std::string getName() const override { return "png"; }
    std::vector<std::string> getOutputExtensions() const override { return {"png"}; }
    common::Status render(const report::ReportPayload& payload, const report::RenderTargets& targets) override;
    std::string getDescription() const override { return "Category share chart (PNG)"; }
};

class PdfReportRenderer : public report::IReportRenderer {
public:
    std::string getName() const override { return "pdf"; }
    std::vector<std::string> getOutputExtensions() const override { return {"pdf"}; }
    common::Status render(const report::ReportPayload& payload, const report::RenderTargets& targets) override;
    std::string getDescription() const override { return "Monthly report (PDF)"; }
};

// Adds the Qt renderers to `registry`. Needs a running QGuiApplication.
void registerQtRenderers(report::RendererRegistry& registry);

}
