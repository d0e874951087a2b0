#include "ui/UIWidgets.hpp"

namespace trellis {

// ============================================================================
// UIUniformGrid
// ============================================================================

Size UIUniformGrid::measure(double widthConstraint, double heightConstraint) {
    return m_layout.measure(layoutChildren(), widthConstraint, heightConstraint);
}

void UIUniformGrid::arrange(const Rect& bounds) {
    UIElement::arrange(bounds);
    m_arrangedCell = m_layout.arrange(layoutChildren(), bounds);
}

} // namespace trellis
