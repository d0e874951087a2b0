#include "engine/Config.hpp"
#include "engine/Log.hpp"
#include "ui/UIWidgets.hpp"

#include <memory>
#include <string>

namespace {

const char* visibilityName(trellis::Visibility visibility) {
    switch (visibility) {
        case trellis::Visibility::Visible:   return "visible";
        case trellis::Visibility::Hidden:    return "hidden";
        case trellis::Visibility::Collapsed: return "collapsed";
    }
    return "visible";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace trellis;

    const std::string configPath = argc > 1 ? argv[1] : "config.json";

    Config config;
    if (!config.loadFromFile(configPath)) {
        LOG_ERROR("Could not load config '{}'", configPath);
        return 1;
    }

    Log::init(config.getString("log.file"), config.getString("log.level", "info"));

    auto grid = std::make_shared<UIUniformGrid>("grid", UniformGridOptions::fromConfig(config));

    int childCount = config.getInt("demo.childCount", 6);
    double childWidth = config.getDouble("demo.childWidth", 100.0);
    double childHeight = config.getDouble("demo.childHeight", 50.0);
    int hiddenEvery = config.getInt("demo.hiddenEvery", 0);

    for (int i = 0; i < childCount; ++i) {
        auto box = std::make_shared<UIBox>("box" + std::to_string(i), childWidth, childHeight);
        if (hiddenEvery > 0 && (i + 1) % hiddenEvery == 0) {
            box->setVisibility(Visibility::Hidden);
        }
        grid->addChild(box);
    }

    double width = config.getExtent("demo.width", 400.0);
    double height = config.getExtent("demo.height", UNBOUNDED);

    LOG_INFO("Uniform grid: {} children, maxRows={}, maxColumns={}, cellSize={}",
             childCount, grid->getMaxRows(), grid->getMaxColumns(),
             cellSizePolicyName(grid->getCellSizePolicy()));

    Size measured = grid->measure(width, height);
    LOG_INFO("Measured {}x{} within {}x{}", measured.width, measured.height, width, height);

    grid->arrange(Rect(0.0, 0.0, width, height));
    const Size& cell = grid->getArrangedCellSize();
    LOG_INFO("Arranged with {}x{} cells", cell.width, cell.height);

    for (const auto& child : grid->getChildren()) {
        if (child->getArrangeCount() == 0) {
            LOG_INFO("  {} [{}] unplaced", child->getId(), visibilityName(child->getVisibility()));
            continue;
        }
        const Rect& b = child->getBounds();
        LOG_INFO("  {} [{}] at ({}, {}) size {}x{}", child->getId(),
                 visibilityName(child->getVisibility()), b.x, b.y, b.width, b.height);
    }

    Log::shutdown();
    return 0;
}
