#pragma once
#include "Types.hpp"
#include <optional>
#include <variant>
#include <vector>

namespace peakquant {

/* largest arity of any curve variant (Gaussian)                            */
constexpr int kMaxCurveParams = 3;

/* ------------------------------------------------------------------------- */
/*  Baseline                 y(x) = y0                                       */
/* ------------------------------------------------------------------------- */
class Constant {
public:
    static constexpr int    kParamCount = 1;
    static constexpr double kSortCenter = -1.0;   // below any peak centre

    explicit Constant(double y = 1.0) : y_(y) {}

    double y() const { return y_; }
    void   set_params(std::optional<double> y);

    void   get_params(double* out) const { out[0] = y_; }
    void   assign(const double* p) { y_ = p[0]; }

    double center() const { return kSortCenter; }
    double area()   const { return 0.0; }

    static double evaluate(double x, const double* p);
    static Vector evaluate(const Vector& x, const double* p);
    static void   gradient(const Vector& x, const double* p,
                           Eigen::Ref<Matrix> J);

private:
    double y_;
};

/* ------------------------------------------------------------------------- */
/*  Amplitude-form Gaussian                                                  */
/*                                                                           */
/*      y(x) = A · exp( -½ ((x - xc) / w)² )                                 */
/*                                                                           */
/*  Parameter order: xc, A, w.  All three are stored as absolute values.     */
/* ------------------------------------------------------------------------- */
class Gaussian {
public:
    static constexpr int kParamCount = 3;

    explicit Gaussian(double xc = 0.0, double amplitude = 1.0, double width = 1.0);

    double center()    const { return xc_; }
    double amplitude() const { return amp_; }
    double width()     const { return w_; }

    void set_params(std::optional<double> xc,
                    std::optional<double> amplitude = std::nullopt,
                    std::optional<double> width     = std::nullopt);

    void get_params(double* out) const { out[0] = xc_; out[1] = amp_; out[2] = w_; }
    void assign(const double* p);

    /* 2·A·w·sqrt(π/2) */
    double area() const;

    static double evaluate(double x, const double* p);
    static Vector evaluate(const Vector& x, const double* p);

    /* columns: d/dxc, d/dA, d/dw */
    static void   gradient(const Vector& x, const double* p,
                           Eigen::Ref<Matrix> J);

private:
    double xc_;
    double amp_;
    double w_;
};

/* ------------------------------------------------------------------------- */
/*  Closed sum of the curve variants.                                        */
/*                                                                           */
/*  Every operation is dispatched with std::visit, so adding a variant that  */
/*  misses one of them fails to compile.                                     */
/* ------------------------------------------------------------------------- */
class Curve {
public:
    using Variant = std::variant<Constant, Gaussian>;

    Curve(Constant c) : v_(c) {}
    Curve(Gaussian g) : v_(g) {}

    int                 param_count() const;
    std::vector<double> get_params()  const;

    /* p points at param_count() values in get_params() order */
    void   set_params(const double* p);

    double evaluate(double x) const;
    double evaluate(double x, const double* p) const;
    Vector evaluate(const Vector& x) const;
    Vector evaluate(const Vector& x, const double* p) const;

    /* J must be (x.size() × param_count()) */
    void   gradient(const Vector& x, const double* p, Eigen::Ref<Matrix> J) const;

    double area()   const;
    double center() const;                         // sort key
    Curve  clone()  const { return *this; }

    /* draggable point: (xc, A) for peaks, (baseline_x, y0) for the baseline */
    Point  handle(double baseline_x) const;

    bool   is_baseline() const { return std::holds_alternative<Constant>(v_); }

    Constant*       as_constant()       { return std::get_if<Constant>(&v_); }
    const Constant* as_constant() const { return std::get_if<Constant>(&v_); }
    Gaussian*       as_gaussian()       { return std::get_if<Gaussian>(&v_); }
    const Gaussian* as_gaussian() const { return std::get_if<Gaussian>(&v_); }

    const Variant& variant() const { return v_; }

private:
    Variant v_;
};

} // namespace peakquant
