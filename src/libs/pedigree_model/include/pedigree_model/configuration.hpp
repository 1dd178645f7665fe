#pragma once

#include <string>

namespace pedigree_model {

enum class TextDirection { Ltr, Rtl };

enum class Layout { LeftRight, RightLeft, TopBottom, BottomTop };

struct Labels {
    std::string zoom = "Use Ctrl + scroll to zoom in the view";
    std::string move = "Move the view with two fingers";
};

struct Configuration {
    TextDirection direction = TextDirection::Ltr;
    Labels labels;
    Layout layout = Layout::LeftRight;
    int generations = 4;
    std::string asset_base_url;
    bool show_highlight_images = true;
    double export_width = 1200;
    double export_height = 800;

    bool rtl() const { return direction == TextDirection::Rtl; }
};

} // namespace pedigree_model
