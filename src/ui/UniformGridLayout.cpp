#include "ui/UniformGridLayout.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <cmath>

namespace trellis {

namespace {

double finiteOrZero(double value) {
    return std::isfinite(value) ? value : 0.0;
}

} // anonymous namespace

int UniformGridLayout::columnCount(int childCount, double widthConstraint, double maxChildWidth) const {
    int candidate = 0;
    if (isUnbounded(widthConstraint)) {
        candidate = childCount;
    } else if (maxChildWidth > 0.0 && !std::isnan(widthConstraint)) {
        // Clamp before the int conversion; the quotient can exceed INT_MAX
        double fit = std::trunc(widthConstraint / maxChildWidth);
        fit = std::min(fit, static_cast<double>(childCount));
        candidate = fit > 0.0 ? static_cast<int>(fit) : 0;
    }
    return std::max(std::min(candidate, m_options.maxColumns), 0);
}

int UniformGridLayout::rowCount(int childCount, int columns) const {
    if (columns <= 0) return 0;

    int rows = static_cast<int>(std::ceil(static_cast<double>(childCount) / columns));
    return std::max(std::min(rows, m_options.maxRows), 0);
}

void UniformGridLayout::measureCell(const std::vector<ILayoutChild*>& children) {
    bool anyVisible = false;
    Size largest;

    for (auto* child : children) {
        if (child->getVisibility() != Visibility::Visible) continue;

        Size natural = child->measure(UNBOUNDED, UNBOUNDED);
        if (m_options.cellSizePolicy == CellSizePolicy::LastVisible) {
            m_cellSize = natural;
        } else {
            largest.width = std::max(largest.width, natural.width);
            largest.height = std::max(largest.height, natural.height);
        }
        anyVisible = true;
    }

    if (anyVisible && m_options.cellSizePolicy == CellSizePolicy::LargestVisible) {
        m_cellSize = largest;
    }
}

LayoutPlan UniformGridLayout::plan(const std::vector<ILayoutChild*>& children,
                                   double widthConstraint, double /*heightConstraint*/) {
    measureCell(children);

    LayoutPlan result;
    result.childWidth = m_cellSize.width;
    result.childHeight = m_cellSize.height;
    // Hidden children still take a slot, so the unfiltered count drives the grid
    result.childCount = static_cast<int>(children.size());
    result.columns = columnCount(result.childCount, widthConstraint, result.childWidth);
    result.rows = rowCount(result.childCount, result.columns);

    if (m_options.maxRows <= 0 || m_options.maxColumns <= 0) {
        LAYOUT_LOG_DEBUG("UniformGrid: non-positive cap (rows={}, columns={}) gives an empty layout",
                         m_options.maxRows, m_options.maxColumns);
    }
    return result;
}

Size UniformGridLayout::measure(const std::vector<ILayoutChild*>& children,
                                double widthConstraint, double heightConstraint) {
    LayoutPlan p = plan(children, widthConstraint, heightConstraint);
    Size total = p.totalSize();

    LAYOUT_LOG_TRACE("UniformGrid measure: {} children, cell {}x{}, {} cols x {} rows -> {}x{}",
                     p.childCount, p.childWidth, p.childHeight, p.columns, p.rows,
                     total.width, total.height);
    return total;
}

Size UniformGridLayout::arrange(const std::vector<ILayoutChild*>& children, const Rect& bounds) {
    LayoutPlan p = plan(children, bounds.width, bounds.height);
    return place(children, p, bounds);
}

Size UniformGridLayout::place(const std::vector<ILayoutChild*>& children, const LayoutPlan& plan,
                              const Rect& bounds) const {
    if (plan.columns <= 0) {
        LAYOUT_LOG_TRACE("UniformGrid arrange: no columns, {} children left unplaced",
                         children.size());
        return {0.0, finiteOrZero(plan.childHeight)};
    }

    // An unbounded arrange width cannot be split; fall back to the measured cell
    double cellWidth = std::isfinite(bounds.width)
        ? bounds.width / plan.columns
        : plan.childWidth;
    double cellHeight = plan.childHeight;
    if (!std::isfinite(cellWidth) || !std::isfinite(cellHeight)) {
        LAYOUT_LOG_DEBUG("UniformGrid arrange: cell {}x{} is not finite, {} children left unplaced",
                         cellWidth, cellHeight, children.size());
        return {0.0, finiteOrZero(cellHeight)};
    }

    size_t next = 0;
    for (int row = 0; row < plan.rows && next < children.size(); ++row) {
        for (int col = 0; col < plan.columns && next < children.size(); ++col) {
            children[next]->arrange(Rect(col * cellWidth, row * cellHeight, cellWidth, cellHeight));
            ++next;
        }
    }

    if (next < children.size()) {
        LAYOUT_LOG_DEBUG("UniformGrid arrange: row cap {} left {} of {} children unplaced",
                         m_options.maxRows, children.size() - next, children.size());
    }
    LAYOUT_LOG_TRACE("UniformGrid arrange: placed {} children in {}x{} cells",
                     next, cellWidth, cellHeight);
    return {cellWidth, cellHeight};
}

} // namespace trellis
