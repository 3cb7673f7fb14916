#ifndef WIDGETS_HPP
#define WIDGETS_HPP

#include <array>        // for array
#include <cstdint>      // for int32_t
#include <functional>   // for function
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <ftxui/component/component_base.hpp>      // for Components
#include <ftxui/component/screen_interactive.hpp>  // for Component
#include <ftxui/dom/elements.hpp>                  // for size, GREATER_THAN

namespace tui {
namespace detail {
    inline constexpr std::string_view kDefaultTitle{"DE Switcher"};

    struct WidgetBoxSize {
        ftxui::Decorator content_size = size(ftxui::HEIGHT, ftxui::GREATER_THAN, 10) | size(ftxui::WIDTH, ftxui::GREATER_THAN, 40);
        ftxui::Decorator text_size    = size(ftxui::HEIGHT, ftxui::GREATER_THAN, 5);
    };
    struct WidgetBoxRes {
        const std::string_view text{};
        const std::string_view title{kDefaultTitle};
    };

    auto centered_widget(ftxui::Component& container, const std::string_view& title, const ftxui::Element& widget) noexcept -> ftxui::Element;
    auto controls_widget(const std::array<std::string_view, 2>&& titles, const std::array<std::function<void()>, 2>&& callbacks) noexcept -> ftxui::Component;
    auto centered_interative_multi(const std::string_view& title, ftxui::Component& widgets) noexcept -> ftxui::Element;
    auto multiline_text(const std::vector<std::string>& lines) noexcept -> ftxui::Element;
    void msgbox_widget(const std::string_view& content, ftxui::Decorator boxsize = ftxui::hcenter | size(ftxui::HEIGHT, ftxui::GREATER_THAN, 5)) noexcept;
    bool yesno_widget(const std::string_view& content, ftxui::Decorator boxsize = size(ftxui::HEIGHT, ftxui::GREATER_THAN, 5)) noexcept;
    bool preview_widget(const std::string_view& content, const WidgetBoxRes& widget_res = {}) noexcept;
    void radiolist_widget(const std::vector<std::string>& entries, const std::function<void()>&& ok_callback, std::int32_t* selected, ftxui::ScreenInteractive* screen, const WidgetBoxRes& widget_res = {}, const WidgetBoxSize widget_sizes = {}) noexcept;
}  // namespace detail
}  // namespace tui

#endif  // WIDGETS_HPP
