/* ===================================================================== *
 *  include/peakquant/FitHistory.hpp   -  bounded undo / redo ring
 * ===================================================================== */
#pragma once
#include "CompositeCurve.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace peakquant {

/*
 * Fixed-capacity ring of CompositeCurve snapshots.
 *
 *   write_index_  slot of the most recent snapshot (the head)
 *   read_offset_  how many steps undo has walked back from the head
 *
 *   • push()  drops every entry ahead of the cursor, then writes a new
 *             head; when full the oldest snapshot is overwritten
 *   • undo()  / redo() move the cursor and hand out a copy of the entry
 *             under it, or std::nullopt at either end (state unchanged)
 *
 * Entries are stored and returned by value, so editing a restored curve
 * never reaches back into the history.
 */
class FitHistory
{
public:
    static constexpr std::size_t kDefaultCapacity = 15;

    explicit FitHistory(std::size_t capacity = kDefaultCapacity);

    /* ------------ recording ---------------------------------------- */
    void reset(const CompositeCurve& initial);     // single entry
    void push(const CompositeCurve& snapshot);

    /* push only if the parameters differ from the entry under the cursor */
    bool record_if_changed(const CompositeCurve& snapshot);

    /* ------------ navigation --------------------------------------- */
    std::optional<CompositeCurve> undo();
    std::optional<CompositeCurve> redo();

    bool can_undo() const { return read_offset_ + 1 < size_; }
    bool can_redo() const { return read_offset_ > 0; }

    /* entry under the cursor; throws std::out_of_range when empty */
    const CompositeCurve& current() const;

    /* ------------ house-keeping ------------------------------------ */
    void        clear();
    bool        empty()       const { return size_ == 0; }
    std::size_t size()        const { return size_; }
    std::size_t capacity()    const { return slots_.size(); }
    std::size_t read_offset() const { return read_offset_; }

private:
    /* slot that lies `back` steps behind the head */
    std::size_t slot_(std::size_t back) const;

    std::vector<CompositeCurve> slots_;
    std::size_t write_index_ = 0;
    std::size_t read_offset_ = 0;
    std::size_t size_        = 0;
};

} // namespace peakquant
