#pragma once

#include <atomic>
#include <cstddef>

namespace calc {

// Отображение прогресс-бара до достижения completed == total.
// Запускается в отдельном потоке.
void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total);

} // namespace calc
