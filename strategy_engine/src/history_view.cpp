#include "interfaces.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

HistoryView::HistoryView(const core::TimeSeries<core::Bar>& bars, std::size_t visible_count)
    : bars_(&bars), visible_count_(visible_count)
{
    if (visible_count_ > bars.size()) {
        throw std::out_of_range(fmt::format("HistoryView of {} bars requested over a series of {}.",
                                            visible_count_, bars.size()));
    }
}

const core::Bar& HistoryView::at(std::size_t index) const {
    if (index >= visible_count_) {
        throw std::out_of_range(fmt::format("Bar index {} is outside the visible history (size {}).",
                                            index, visible_count_));
    }
    return (*bars_)[index];
}

const core::Bar& HistoryView::current() const {
    if (empty()) {
        throw std::out_of_range("HistoryView is empty.");
    }
    return (*bars_)[visible_count_ - 1];
}

std::size_t HistoryView::currentIndex() const {
    if (empty()) {
        throw std::out_of_range("HistoryView is empty.");
    }
    return visible_count_ - 1;
}

const core::Bar* HistoryView::previous() const {
    if (visible_count_ < 2) {
        return nullptr;
    }
    return &(*bars_)[visible_count_ - 2];
}

} // namespace strategy_engine
