#pragma once

#include "ui/UIElement.hpp"
#include "ui/UniformGridLayout.hpp"

#include <string>

namespace trellis {

/// Box: a leaf whose natural size is its preferred size.
class UIBox : public UIElement {
public:
    explicit UIBox(const std::string& id = "", double width = 0.0, double height = 0.0)
        : UIElement(id)
    {
        setPreferredSize(width, height);
    }
};

/// UniformGrid: a container that gives every child the same cell size and
/// fills the cells row-major.
class UIUniformGrid : public UIElement {
public:
    explicit UIUniformGrid(const std::string& id = "",
                           const UniformGridOptions& options = UniformGridOptions())
        : UIElement(id), m_layout(options) {}

    int getMaxRows() const { return m_layout.getMaxRows(); }
    void setMaxRows(int maxRows) { m_layout.setMaxRows(maxRows); }
    int getMaxColumns() const { return m_layout.getMaxColumns(); }
    void setMaxColumns(int maxColumns) { m_layout.setMaxColumns(maxColumns); }

    CellSizePolicy getCellSizePolicy() const { return m_layout.getCellSizePolicy(); }
    void setCellSizePolicy(CellSizePolicy policy) { m_layout.setCellSizePolicy(policy); }

    const UniformGridLayout& getLayout() const { return m_layout; }

    /// Size of the whole grid under the given constraints
    Size measure(double widthConstraint, double heightConstraint) override;

    /// Take `bounds` and lay the children out inside it
    void arrange(const Rect& bounds) override;

    /// Cell size used by the most recent arrange
    const Size& getArrangedCellSize() const { return m_arrangedCell; }

private:
    UniformGridLayout m_layout;
    Size m_arrangedCell;
};

} // namespace trellis
