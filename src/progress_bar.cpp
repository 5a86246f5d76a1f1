#include "progress_bar.hpp"
#include "console.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>

namespace calc {

namespace {
constexpr int kBarWidth = 50;

void drawBar(std::size_t current, std::size_t total) {
    double progress = total == 0 ? 1.0 : static_cast<double>(current) / static_cast<double>(total);
    int pos = static_cast<int>(kBarWidth * progress);

    std::cout << "\r  " << Color::CYAN << "[";
    for (int i = 0; i < kBarWidth; ++i) {
        if (i < pos) std::cout << "█";
        else if (i == pos) std::cout << "▒";
        else std::cout << "░";
    }
    std::cout << "] " << Color::BOLD << std::setw(3) << static_cast<int>(progress * 100.0)
        << "%" << Color::RESET << " (" << current << "/" << total << ")";
    std::cout.flush();
}
}

void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total) {
    while (completed.load() < total) {
        drawBar(completed.load(), total);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    // Финальное обновление до 100%
    std::cout << "\r  " << Color::GREEN << "[";
    for (int i = 0; i < kBarWidth; ++i) std::cout << "█";
    std::cout << "] " << Color::BOLD << "100%" << Color::RESET
        << " (" << total << "/" << total << ")\n";
}

} // namespace calc
