#pragma once
/*
 * Offset table that maps  (curve , local parameter)  to one position in
 * the flat parameter vector of a CompositeCurve.
 *
 * Each curve owns a contiguous block whose length is the curve's arity:
 *
 *      [ y0 | xc₁ A₁ w₁ | xc₂ A₂ w₂ | … ]
 *
 * The table is rebuilt whenever the membership or order of the curves
 * changes, so packing, unpacking and override evaluation all read the
 * block boundaries from here instead of re-deriving them.
 */

#include <vector>
#include <cstddef>

namespace peakquant {

class ParameterLayout {
public:
    /* offset[c] → first global index of curve c, count[c] → its arity */
    std::vector<int> offset;
    std::vector<int> count;

    /* length of the flat parameter vector */
    int total_params = 0;

    int get(int curve, int par) const { return offset[curve] + par; }

    std::size_t size() const { return offset.size(); }

    /* -------------------------------------------------------- */
    /*  build complete mapping                                  */
    /* -------------------------------------------------------- */
    template<typename CurveRangeT>
    void build(const CurveRangeT& curves)
    {
        offset.clear();
        count.clear();
        offset.reserve(curves.size());
        count.reserve(curves.size());

        total_params = 0;
        for (const auto& c : curves) {
            const int n = c.param_count();
            offset.push_back(total_params);
            count.push_back(n);
            total_params += n;
        }
    }
};

} // namespace peakquant
