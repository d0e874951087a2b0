#include "ui/UIElement.hpp"

#include <algorithm>

namespace trellis {

UIElement::UIElement(const std::string& id)
    : m_id(id) {}

void UIElement::setPreferredSize(double width, double height) {
    m_preferredWidth = std::max(width, 0.0);
    m_preferredHeight = std::max(height, 0.0);
}

Size UIElement::measure(double /*widthConstraint*/, double /*heightConstraint*/) {
    return {m_preferredWidth, m_preferredHeight};
}

void UIElement::arrange(const Rect& bounds) {
    m_bounds = bounds;
    m_arrangeCount++;
}

void UIElement::addChild(std::shared_ptr<UIElement> child) {
    if (!child) return;
    child->m_parent = this;
    m_children.push_back(std::move(child));
}

void UIElement::removeChild(const std::string& id) {
    auto it = std::remove_if(m_children.begin(), m_children.end(),
        [&id](const auto& child) { return child->getId() == id; });
    for (auto removed = it; removed != m_children.end(); ++removed) {
        (*removed)->m_parent = nullptr;
    }
    m_children.erase(it, m_children.end());
}

void UIElement::clearChildren() {
    for (auto& child : m_children) {
        child->m_parent = nullptr;
    }
    m_children.clear();
}

UIElement* UIElement::findById(const std::string& id) {
    if (m_id == id) return this;
    for (auto& child : m_children) {
        UIElement* found = child->findById(id);
        if (found) return found;
    }
    return nullptr;
}

const UIElement* UIElement::findById(const std::string& id) const {
    if (m_id == id) return this;
    for (const auto& child : m_children) {
        const UIElement* found = child->findById(id);
        if (found) return found;
    }
    return nullptr;
}

std::vector<ILayoutChild*> UIElement::layoutChildren() const {
    std::vector<ILayoutChild*> result;
    result.reserve(m_children.size());
    for (const auto& child : m_children) {
        result.push_back(child.get());
    }
    return result;
}

} // namespace trellis
