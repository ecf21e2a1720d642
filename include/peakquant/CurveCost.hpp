#pragma once
#include "Types.hpp"
#include "CompositeCurve.hpp"
#include <Eigen/Core>

namespace peakquant {

/* ------------------------------------------------------------------------- */
/*  Residual functor for one profile:                                        */
/*                                                                           */
/*      r_i(p) = model(x_i ; p) - y_i                                        */
/*                                                                           */
/*  The model is the composite curve evaluated with an override vector, so   */
/*  the curve handed in is never modified while the solver explores p.       */
/* ------------------------------------------------------------------------- */
class CurveCost {
public:
    CurveCost(const CompositeCurve& model,
              const Vector&         x,
              const Vector&         y);

    /* number of residuals produced */
    int numResiduals() const { return static_cast<int>(x_.size()); }
    int numParameters() const { return model_.param_count(); }

    /* main entry: returns residuals and (optionally) the analytic Jacobian */
    void operator()(const Eigen::VectorXd& parameters,
                    Eigen::VectorXd*       residuals,
                    Eigen::MatrixXd*       jacobians) const;

private:
    const CompositeCurve& model_;
    const Vector&         x_;
    const Vector&         y_;
};

} // namespace peakquant
