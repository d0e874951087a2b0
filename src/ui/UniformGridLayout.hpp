#pragma once

#include "ui/UIElement.hpp"
#include "ui/UniformGridOptions.hpp"

#include <cmath>
#include <vector>

namespace trellis {

/// Result of sizing one layout pass. Measure reports its total size,
/// Arrange places children from it.
struct LayoutPlan {
    double childWidth = 0.0;   // Shared cell width as measured
    double childHeight = 0.0;  // Shared cell height
    int columns = 0;
    int rows = 0;
    int childCount = 0;

    /// columns * childWidth by rows * childHeight. An axis with no columns
    /// (or rows) or a NaN cell dimension is 0.
    Size totalSize() const {
        double w = (columns > 0 && !std::isnan(childWidth)) ? columns * childWidth : 0.0;
        double h = (rows > 0 && !std::isnan(childHeight)) ? rows * childHeight : 0.0;
        return {w, h};
    }
};

/// Uniform-cell grid layout.
/// Every child gets the same cell size; children fill the grid row-major,
/// bounded by the row and column caps in UniformGridOptions.
class UniformGridLayout {
public:
    UniformGridLayout() = default;
    explicit UniformGridLayout(const UniformGridOptions& options) : m_options(options) {}

    int getMaxRows() const { return m_options.maxRows; }
    void setMaxRows(int maxRows) { m_options.maxRows = maxRows; }
    int getMaxColumns() const { return m_options.maxColumns; }
    void setMaxColumns(int maxColumns) { m_options.maxColumns = maxColumns; }
    CellSizePolicy getCellSizePolicy() const { return m_options.cellSizePolicy; }
    void setCellSizePolicy(CellSizePolicy policy) { m_options.cellSizePolicy = policy; }

    /// Number of columns for `childCount` children of width `maxChildWidth`
    /// within `widthConstraint`. An UNBOUNDED width puts every child on one row.
    /// Never negative and never above maxColumns (when maxColumns >= 0).
    int columnCount(int childCount, double widthConstraint, double maxChildWidth) const;

    /// Number of rows needed for `childCount` children in `columns` columns,
    /// capped to maxRows. Zero columns give zero rows.
    int rowCount(int childCount, int columns) const;

    /// Measure the visible children and derive columns/rows for this pass.
    LayoutPlan plan(const std::vector<ILayoutChild*>& children,
                    double widthConstraint, double heightConstraint);

    /// Total size of the grid: columns * cell width by rows * cell height.
    Size measure(const std::vector<ILayoutChild*>& children,
                 double widthConstraint, double heightConstraint);

    /// Re-plan against `bounds` and place the children. Returns the cell size used.
    Size arrange(const std::vector<ILayoutChild*>& children, const Rect& bounds);

    /// Place children row-major according to an existing plan.
    /// Cells are relative to the grid origin. Returns the cell size used.
    /// Nothing is placed when the cell would not be finite.
    Size place(const std::vector<ILayoutChild*>& children, const LayoutPlan& plan,
               const Rect& bounds) const;

    /// Cell size left by the most recent pass
    const Size& getCellSize() const { return m_cellSize; }

private:
    /// Update m_cellSize from the visible children. Leaves it untouched
    /// when no child is visible.
    void measureCell(const std::vector<ILayoutChild*>& children);

    UniformGridOptions m_options;
    Size m_cellSize;
};

} // namespace trellis
