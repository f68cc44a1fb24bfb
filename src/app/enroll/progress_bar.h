#pragma once

/**
 * @file progress_bar.h
 * @brief Terminal gauge for the overall pipeline progress, on top of the `indicators` progress bar.
 */

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#if defined(__has_include) && __has_include(<indicators/progress_bar.hpp>)
    #include <indicators/progress_bar.hpp>
#elif defined(__has_include) && __has_include(<progress_bar.hpp>)
    #include <progress_bar.hpp>
#else
    #error "Indicators 'progress_bar.hpp' header not found"
#endif

namespace bar {

enum class Color {
    green,
    red,
    yellow,
    cyan,
};

inline constexpr indicators::Color to_indicators_color(Color c) noexcept {
    using I = indicators::Color;
    switch (c) {
    case Color::green:
        return I::green;
    case Color::red:
        return I::red;
    case Color::yellow:
        return I::yellow;
    case Color::cyan:
        return I::cyan;
    }
    return I::white;
}

/**
 * @brief Percent gauge whose prefix shows the current pipeline stage.
 *
 * The bar is created lazily on the first update so that a run rejected before any progress
 * prints nothing.
 *
 * @note Not thread-safe.
 */
class StageBar {
  public:
    explicit StageBar(bool enabled, std::size_t width = 40) : enabled_{enabled}, width_{width == 0 ? 1u : width} {}

    StageBar(const StageBar&) = delete;
    StageBar& operator=(const StageBar&) = delete;

    /**
     * @brief Shows @p percent (clamped to [0, 100]) with @p stage as prefix.
     *
     * Progress never moves backwards within one bar; a lower value only updates the label.
     */
    void update(const std::string& stage, double percent, Color color = Color::cyan) {
        if (!enabled_) return;

        std::size_t p = percent <= 0.0 ? 0u : (percent >= 100.0 ? 100u : static_cast<std::size_t>(percent));
        if (p < current_) p = current_;

        if (!bar_ || color != color_ || stage != text_) {
            text_ = stage;
            color_ = color;
            current_ = p;
            rebuild_bar();
            return;
        }
        current_ = p;
        bar_->set_progress(current_);
    }

    /** @brief Completes the bar in @p color (red on rejection). */
    void finish(const std::string& stage, Color color) {
        if (!enabled_ || !bar_) return;
        if (bar_->is_completed() && stage == text_ && color == color_) return;
        text_ = stage;
        color_ = color;
        current_ = 100;
        rebuild_bar();
        if (!bar_->is_completed()) bar_->mark_as_completed();
    }

  private:
    void rebuild_bar() {
        bar_ = std::make_unique<indicators::ProgressBar>(
            indicators::option::BarWidth{width_}, indicators::option::Start{"["}, indicators::option::Fill{"="},
            indicators::option::Lead{">"}, indicators::option::Remainder{" "}, indicators::option::End{"]"},
            indicators::option::ForegroundColor{to_indicators_color(color_)},
            indicators::option::PrefixText{pad_(text_)}, indicators::option::ShowPercentage{true},
            indicators::option::MaxProgress{std::size_t{100}});
        bar_->set_progress(current_);
    }

    static std::string pad_(std::string s) {
        if (s.size() < 16) s.append(16 - s.size(), ' ');
        return s;
    }

    bool enabled_;
    std::size_t width_;
    std::string text_;
    Color color_ = Color::cyan;
    std::size_t current_ = 0;
    std::unique_ptr<indicators::ProgressBar> bar_;
};

} // namespace bar
