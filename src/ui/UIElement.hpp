#pragma once

#include "ui/UITypes.hpp"

#include <string>
#include <vector>
#include <memory>

namespace trellis {

/// Something that can report a natural size.
class ISizable {
public:
    virtual ~ISizable() = default;

    virtual Visibility getVisibility() const = 0;

    /// Size this element would like given the available space.
    /// Either constraint may be UNBOUNDED.
    virtual Size measure(double widthConstraint, double heightConstraint) = 0;
};

/// Something that can be given a final rectangle.
class IPlaceable {
public:
    virtual ~IPlaceable() = default;

    virtual void arrange(const Rect& bounds) = 0;
};

/// A participant in a layout pass. Layout strategies only see this interface.
class ILayoutChild : public ISizable, public IPlaceable {
public:
    ~ILayoutChild() override = default;
};

/// Base class for all elements of the tree.
/// Elements own their children; a child keeps a raw pointer back to its parent.
class UIElement : public ILayoutChild {
public:
    explicit UIElement(const std::string& id = "");
    ~UIElement() override = default;

    // Non-copyable
    UIElement(const UIElement&) = delete;
    UIElement& operator=(const UIElement&) = delete;

    // Identity
    const std::string& getId() const { return m_id; }
    void setId(const std::string& id) { m_id = id; }

    // Visibility
    Visibility getVisibility() const override { return m_visibility; }
    void setVisibility(Visibility visibility) { m_visibility = visibility; }
    bool isVisible() const { return m_visibility == Visibility::Visible; }

    // Preferred size (0 = none)
    double getPreferredWidth() const { return m_preferredWidth; }
    double getPreferredHeight() const { return m_preferredHeight; }
    void setPreferredSize(double width, double height);

    // Layout
    Size measure(double widthConstraint, double heightConstraint) override;
    void arrange(const Rect& bounds) override;
    const Rect& getBounds() const { return m_bounds; }
    int getArrangeCount() const { return m_arrangeCount; }

    // Tree structure
    void addChild(std::shared_ptr<UIElement> child);
    void removeChild(const std::string& id);
    void clearChildren();
    const std::vector<std::shared_ptr<UIElement>>& getChildren() const { return m_children; }
    size_t getChildCount() const { return m_children.size(); }
    UIElement* getParent() const { return m_parent; }

    // Find element by ID in this subtree
    UIElement* findById(const std::string& id);
    const UIElement* findById(const std::string& id) const;

protected:
    /// Collect the children as layout participants, in order.
    std::vector<ILayoutChild*> layoutChildren() const;

    std::string m_id;
    Visibility m_visibility = Visibility::Visible;
    double m_preferredWidth = 0.0;
    double m_preferredHeight = 0.0;
    Rect m_bounds;
    int m_arrangeCount = 0;

    std::vector<std::shared_ptr<UIElement>> m_children;
    UIElement* m_parent = nullptr;
};

} // namespace trellis
