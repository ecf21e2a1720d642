/* ===================================================================== *
 *  src/FitHistory.cpp
 * ===================================================================== */
#include "peakquant/FitHistory.hpp"
#include <stdexcept>

namespace peakquant {

FitHistory::FitHistory(std::size_t capacity)
    : slots_(capacity == 0 ? 1 : capacity)
{}

/* -------- recording -------------------------------------------------- */
void FitHistory::reset(const CompositeCurve& initial)
{
    clear();
    push(initial);
}

void FitHistory::push(const CompositeCurve& snapshot)
{
    if (size_ == 0) {
        write_index_ = 0;
    } else {
        /* forget the redo branch: the cursor becomes the head */
        size_       -= read_offset_;
        write_index_ = slot_(read_offset_);
        write_index_ = (write_index_ + 1) % slots_.size();
    }
    read_offset_ = 0;

    slots_[write_index_] = snapshot.clone();
    if (size_ < slots_.size()) ++size_;        // else: oldest overwritten
}

bool FitHistory::record_if_changed(const CompositeCurve& snapshot)
{
    if (!empty()) {
        const CompositeCurve& cur = current();
        if (cur.param_count() == snapshot.param_count() &&
            cur.get_params() == snapshot.get_params())
            return false;
    }
    push(snapshot);
    return true;
}

/* -------- navigation ------------------------------------------------- */
std::optional<CompositeCurve> FitHistory::undo()
{
    if (!can_undo()) return std::nullopt;
    ++read_offset_;
    return current().clone();
}

std::optional<CompositeCurve> FitHistory::redo()
{
    if (!can_redo()) return std::nullopt;
    --read_offset_;
    return current().clone();
}

const CompositeCurve& FitHistory::current() const
{
    if (empty())
        throw std::out_of_range("FitHistory::current(): history is empty");
    return slots_[slot_(read_offset_)];
}

/* -------- house-keeping ---------------------------------------------- */
void FitHistory::clear()
{
    for (auto& s : slots_) s.clear();
    write_index_ = 0;
    read_offset_ = 0;
    size_        = 0;
}

std::size_t FitHistory::slot_(std::size_t back) const
{
    const std::size_t cap = slots_.size();
    return (write_index_ + cap - (back % cap)) % cap;
}

} // namespace peakquant
