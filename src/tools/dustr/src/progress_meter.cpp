#include "progress_meter.hpp"

#include <algorithm>
#include <string>

namespace dustr::du
{

ProgressMeter::ProgressMeter(std::ostream &out, int width)
    : out(out),
      width(std::max(1, width))
{
}

void ProgressMeter::update(std::size_t done, std::size_t total)
{
    const std::size_t columns = static_cast<std::size_t>(width);
    std::size_t filled = columns;
    if (total > 0)
        filled = std::min(columns, done * columns / total);

    // Redraw when the bar moves, every tenth entry, and at completion.
    if (drawn && filled == lastFilled && done != total && done - lastDone < 10)
        return;
    lastFilled = filled;
    lastDone = done;
    drawn = true;

    out << "\r[" << std::string(filled, '>') << std::string(columns - filled, '-') << "] " << done << '/' << total;
    out.flush();
}

void ProgressMeter::clear()
{
    if (!drawn)
        return;
    // Bar, brackets and a generous allowance for the counters.
    out << '\r' << std::string(static_cast<std::size_t>(width) + 32, ' ') << '\r';
    out.flush();
    drawn = false;
}

} // namespace dustr::du
