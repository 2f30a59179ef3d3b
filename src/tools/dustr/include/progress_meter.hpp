#pragma once

#include <cstddef>
#include <ostream>

namespace dustr::du
{

// Single-line progress bar redrawn in place with carriage returns.
class ProgressMeter
{
public:
    explicit ProgressMeter(std::ostream &out, int width = 40);

    void update(std::size_t done, std::size_t total);
    // Erases the bar if one is on screen.
    void clear();

private:
    std::ostream &out;
    int width;
    std::size_t lastFilled = static_cast<std::size_t>(-1);
    std::size_t lastDone = 0;
    bool drawn = false;
};

} // namespace dustr::du
