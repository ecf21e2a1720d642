#pragma once
#include "Types.hpp"
#include "Curve.hpp"
#include "ParameterLayout.hpp"
#include <cstddef>
#include <vector>

namespace peakquant {

/* ------------------------------------------------------------------------- */
/*  Baseline plus N peaks, evaluated and fitted as one parameter vector.     */
/*                                                                           */
/*  get_params(), set_params() and evaluate(x, p) all go through the same    */
/*  ParameterLayout, which is rebuilt on every membership or order change.   */
/*  Editing a member in place through at() never changes its arity, so the  */
/*  layout stays valid.                                                      */
/* ------------------------------------------------------------------------- */
class CompositeCurve {
public:
    CompositeCurve() = default;

    /* empty composite seeded with a single Constant(y0) */
    static CompositeCurve with_baseline(double y0 = 1.0);

    /* ------------ membership ------------------------------------- */
    void        add(Curve c);
    void        remove(std::size_t index);
    void        clear();

    std::size_t size()  const { return curves_.size(); }
    bool        empty() const { return curves_.empty(); }

    const Curve&              at(std::size_t i) const { return curves_.at(i); }
    Curve&                    at(std::size_t i)       { return curves_.at(i); }
    const std::vector<Curve>& curves()          const { return curves_; }

    /* index of the first Constant member, size() if there is none */
    std::size_t baseline_index() const;
    std::size_t peak_count()     const;

    /* ------------ flat parameter vector -------------------------- */
    int    param_count() const { return layout_.total_params; }
    Vector get_params()  const;
    void   set_params(const Vector& p);     // throws on length mismatch

    const ParameterLayout& layout() const { return layout_; }

    /* ------------ evaluation ------------------------------------- */
    double evaluate(double x) const;
    Vector evaluate(const Vector& x) const;

    /* evaluate with an override vector, members are left untouched */
    Vector evaluate(const Vector& x, const Vector& p) const;

    /* ∂model/∂p at every x, (x.size() × param_count()) */
    Matrix jacobian(const Vector& x, const Vector& p) const;

    /* ------------ ordering --------------------------------------- */
    /* stable, by centre; the baseline sentinel keeps it in front   */
    void   sort();

    double area() const;                   // sum of peak areas

    CompositeCurve clone() const { return *this; }

private:
    void rebuild_layout_();
    void check_length_(const Vector& p) const;

    std::vector<Curve> curves_;
    ParameterLayout    layout_;
};

} // namespace peakquant
