#include "widgets.hpp"

// import deswitch
#include "deswitch/string_utils.hpp"  // for make_multiline

#include <algorithm>  // for transform
#include <iterator>   // for back_insert_iterator
#include <memory>     // for shared_ptr, __shar...
#include <ranges>     // for views::split
#include <string>     // for string, allocator
#include <utility>    // for move

#include <ftxui/component/captured_mouse.hpp>      // for ftxui
#include <ftxui/component/component.hpp>           // for Renderer, Vertical
#include <ftxui/component/component_base.hpp>      // for ComponentBase, Com...
#include <ftxui/component/component_options.hpp>   // for ButtonOption
#include <ftxui/component/screen_interactive.hpp>  // for ScreenInteractive
#include <ftxui/dom/elements.hpp>                  // for operator|, Element
#include <ftxui/util/ref.hpp>                      // for Ref

using namespace ftxui;

namespace {

auto text_lines(const std::vector<std::string>& lines) noexcept -> Elements {
    Elements multiline;

    std::transform(lines.cbegin(), lines.cend(), std::back_inserter(multiline),
        [=](const std::string& line) -> Element { return text(line); });
    return multiline;
}

auto make_controls(Component& controls_container) noexcept -> Component {
    return Renderer(controls_container, [controls_container] {
        return controls_container->Render() | hcenter | size(HEIGHT, LESS_THAN, 3) | size(WIDTH, GREATER_THAN, 25);
    });
}

}  // namespace

namespace tui::detail {

Element centered_widget(Component& container, const std::string_view& title, const Element& widget) noexcept {
    return vbox({
        //  -------- Title --------------
        text(std::string{title}) | bold,
        filler(),
        //  -------- Center Menu --------------
        hbox({
            filler(),
            border(vbox({
                widget,
                separator(),
                container->Render() | hcenter | size(HEIGHT, LESS_THAN, 3) | size(WIDTH, GREATER_THAN, 25),
            })),
            filler(),
        }) | center,
        filler(),
    });
}

Component controls_widget(const std::array<std::string_view, 2>&& titles, const std::array<std::function<void()>, 2>&& callbacks) noexcept {
    /* clang-format off */
    auto button_ok       = Button(std::string{titles[0]}, callbacks[0], ButtonOption::WithoutBorder());
    auto button_quit     = Button(std::string{titles[1]}, callbacks[1], ButtonOption::WithoutBorder());
    /* clang-format on */

    auto container = Container::Horizontal({
        button_ok,
        Renderer([] { return filler() | size(WIDTH, GREATER_THAN, 3); }),
        button_quit,
    });

    return container;
}

Element centered_interative_multi(const std::string_view& title, Component& widgets) noexcept {
    return vbox({
        //  -------- Title --------------
        text(std::string{title}) | bold,
        filler(),
        //  -------- Center Menu --------------
        hbox({
            filler(),
            border(vbox({
                widgets->Render(),
            })),
            filler(),
        }) | center,
        filler(),
    });
}

Element multiline_text(const std::vector<std::string>& lines) noexcept {
    return vbox(text_lines(lines)) | frame;
}

void msgbox_widget(const std::string_view& content, Decorator boxsize) noexcept {
    auto screen = ScreenInteractive::Fullscreen();
    /* clang-format off */
    auto button_back = Button("OK", screen.ExitLoopClosure(), ButtonOption::WithoutBorder());

    auto container = Container::Horizontal({button_back});
    auto renderer = Renderer(container, [&] {
        return centered_widget(container, kDefaultTitle, multiline_text(deswitch::utils::make_multiline(content)) | boxsize);
    });
    /* clang-format on */

    screen.Loop(renderer);
}

bool yesno_widget(const std::string_view& content, Decorator boxsize) noexcept {
    auto screen = ScreenInteractive::Fullscreen();

    bool success{};
    auto ok_callback = [&] {
        success = true;
        screen.ExitLoopClosure()();
    };
    auto controls_container = controls_widget({"OK", "Cancel"}, {ok_callback, screen.ExitLoopClosure()});
    auto controls           = make_controls(controls_container);

    auto container = Container::Horizontal({
        controls,
    });

    auto renderer = Renderer(container, [&] {
        return centered_widget(container, kDefaultTitle, multiline_text(deswitch::utils::make_multiline(content)) | hcenter | boxsize);
    });

    screen.Loop(renderer);
    return success;
}

// Scrollable view of a long text with OK/Cancel.
bool preview_widget(const std::string_view& content, const WidgetBoxRes& widget_res) noexcept {
    auto screen = ScreenInteractive::Fullscreen();

    // blank lines separate script sections, keep them
    std::vector<std::string> lines{};
    for (auto&& line : content | std::views::split('\n')) {
        lines.emplace_back(line.begin(), line.end());
    }
    float scroll_y{};
    auto slider = Slider("Scroll", &scroll_y, 0.F, 1.F, 0.05F);

    auto content_view = Renderer([&] {
        return vbox(text_lines(lines)) | focusPositionRelative(0.F, scroll_y) | vscroll_indicator | yframe
            | size(HEIGHT, LESS_THAN, 25) | size(WIDTH, GREATER_THAN, 60);
    });

    bool success{};
    auto ok_callback = [&] {
        success = true;
        screen.ExitLoopClosure()();
    };
    auto controls_container = controls_widget({"OK", "Cancel"}, {ok_callback, screen.ExitLoopClosure()});
    auto controls           = make_controls(controls_container);

    Components children{};
    if (!widget_res.text.empty()) {
        children.emplace_back(Renderer([&] { return multiline_text(deswitch::utils::make_multiline(widget_res.text)); }));
        children.emplace_back(Renderer([] { return separator(); }));
    }
    children.emplace_back(content_view);
    children.emplace_back(Renderer([] { return separator(); }));
    children.emplace_back(slider);
    children.emplace_back(Renderer([] { return separator(); }));
    children.emplace_back(controls);
    auto global{Container::Vertical(children)};

    auto renderer = Renderer(global, [&] {
        return centered_interative_multi(widget_res.title, global);
    });

    screen.Loop(renderer);
    return success;
}

void radiolist_widget(const std::vector<std::string>& entries, const std::function<void()>&& ok_callback, std::int32_t* selected, ScreenInteractive* screen, const WidgetBoxRes& widget_res, const WidgetBoxSize widget_sizes) noexcept {
    auto radiolist = Container::Vertical({
        Radiobox(&entries, selected),
    });

    auto content = Renderer(radiolist, [&] {
        return radiolist->Render() | center | widget_sizes.content_size;
    });

    auto controls_container = controls_widget({"OK", "Cancel"}, {ok_callback, screen->ExitLoopClosure()});
    auto controls           = make_controls(controls_container);

    Components children{};
    if (!widget_res.text.empty()) {
        children = {
            Renderer([&] { return detail::multiline_text(deswitch::utils::make_multiline(widget_res.text)) | widget_sizes.text_size; }),
            Renderer([] { return separator(); }),
            content,
            Renderer([] { return separator(); }),
            controls};
    } else {
        children = {
            content,
            Renderer([] { return separator(); }),
            controls};
    }
    auto global{Container::Vertical(children)};

    auto renderer = Renderer(global, [&] {
        return centered_interative_multi(widget_res.title, global);
    });

    screen->Loop(renderer);
}

}  // namespace tui::detail
